// Copyright 2024 The Weft Authors.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.
#ifndef WEFT_COMMON_FORMATTING_EVENT_LOG_H_
#define WEFT_COMMON_FORMATTING_EVENT_LOG_H_

#include <cstddef>
#include <functional>
#include <iosfwd>
#include <memory>
#include <vector>

#include "weft/common/formatting/writer-event.h"

namespace weft {

// EventLog is the append-only record of every WriterEvent emitted into a
// Context.  Events arrive in chunks: one chunk per emitted event, holding
// that event's normalization (see NormalizeWriterEvent()).
//
// EventLog is a persistent value: Append() returns a new log that shares all
// existing chunks with the original, which stays unchanged.  Forking a log
// for a speculative rendering is a pointer copy, and dropping the fork
// discards everything it appended.
class EventLog {
 public:
  using Chunk = std::vector<WriterEvent>;

  EventLog() = default;

  // Returns a log with 'chunk' appended after all events of this log.
  EventLog Append(Chunk chunk) const;

  // Returns the number of events (not chunks).
  size_t size() const { return last_ == nullptr ? 0 : last_->end_offset; }
  bool empty() const { return size() == 0; }

  size_t NumChunks() const {
    return last_ == nullptr ? 0 : last_->chunk_index + 1;
  }

  // Calls 'visit' on every event, newest first, until 'visit' returns false.
  template <class Visitor>
  void VisitNewestFirst(Visitor visit) const {
    for (const Node *node = last_.get(); node != nullptr;
         node = node->prev.get()) {
      for (auto iter = node->chunk.rbegin(); iter != node->chunk.rend();
           ++iter) {
        if (!visit(*iter)) return;
      }
    }
  }

  // Returns all events, oldest first.  O(N), for diagnostics and tests.
  std::vector<WriterEvent> Events() const;

  // Returns all chunks, oldest first.  O(N), for diagnostics and tests.
  std::vector<Chunk> Chunks() const;

  // Looks for an event satisfying 'pred' among the events after the first
  // 'offset' events, skipping the leading chunks for which 'skip_chunk' is
  // true.  'offset' is normally a size() taken from an earlier version of
  // this log, so it falls on a chunk boundary; otherwise the partial chunk
  // is treated as a chunk of its own.
  bool SkipExists(size_t offset,
                  const std::function<bool(const WriterEvent &)> &pred,
                  const std::function<bool(const Chunk &)> &skip_chunk) const;

 private:
  struct Node {
    Chunk chunk;
    // Mutable only so the destructor can unlink long chains iteratively.
    mutable std::shared_ptr<const Node> prev;
    size_t end_offset;   // events in this node and all predecessors
    size_t chunk_index;  // 0-based position of this chunk

    Node(Chunk c, std::shared_ptr<const Node> p);
    ~Node();
  };

  // Returns the nodes whose events extend past 'offset', oldest first.
  std::vector<const Node *> NodesSince(size_t offset) const;

  std::shared_ptr<const Node> last_;
};

// Prints all events, for debugging.
std::ostream &operator<<(std::ostream &, const EventLog &);

}  // namespace weft

#endif  // WEFT_COMMON_FORMATTING_EVENT_LOG_H_
