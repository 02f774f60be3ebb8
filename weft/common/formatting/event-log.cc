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
#include "weft/common/formatting/event-log.h"

#include <algorithm>
#include <cstddef>
#include <functional>
#include <memory>
#include <ostream>
#include <utility>
#include <vector>

#include "weft/common/formatting/writer-event.h"

namespace weft {

EventLog::Node::Node(Chunk c, std::shared_ptr<const Node> p)
    : chunk(std::move(c)),
      prev(std::move(p)),
      end_offset(chunk.size() + (prev ? prev->end_offset : 0)),
      chunk_index(prev ? prev->chunk_index + 1 : 0) {}

EventLog::Node::~Node() {
  // Release exclusively owned predecessors one at a time instead of through
  // nested destructor calls.
  std::shared_ptr<const Node> next = std::move(prev);
  while (next != nullptr && next.use_count() == 1) {
    next = std::move(next->prev);
  }
}

EventLog EventLog::Append(Chunk chunk) const {
  EventLog result;
  result.last_ = std::make_shared<const Node>(std::move(chunk), last_);
  return result;
}

std::vector<const EventLog::Node *> EventLog::NodesSince(size_t offset) const {
  std::vector<const Node *> nodes;
  for (const Node *node = last_.get(); node != nullptr;
       node = node->prev.get()) {
    if (node->end_offset <= offset) break;
    nodes.push_back(node);
  }
  std::reverse(nodes.begin(), nodes.end());
  return nodes;
}

std::vector<WriterEvent> EventLog::Events() const {
  std::vector<WriterEvent> events;
  events.reserve(size());
  for (const Node *node : NodesSince(0)) {
    events.insert(events.end(), node->chunk.begin(), node->chunk.end());
  }
  return events;
}

std::vector<EventLog::Chunk> EventLog::Chunks() const {
  std::vector<Chunk> chunks;
  for (const Node *node : NodesSince(0)) chunks.push_back(node->chunk);
  return chunks;
}

bool EventLog::SkipExists(
    size_t offset, const std::function<bool(const WriterEvent &)> &pred,
    const std::function<bool(const Chunk &)> &skip_chunk) const {
  bool skipping = true;
  for (const Node *node : NodesSince(offset)) {
    const size_t chunk_begin = node->end_offset - node->chunk.size();
    const auto first = node->chunk.begin() +
                       (offset > chunk_begin ? offset - chunk_begin : 0);
    if (skipping) {
      if (first == node->chunk.begin() ? skip_chunk(node->chunk)
                                       : skip_chunk(Chunk(first,
                                                          node->chunk.end()))) {
        continue;
      }
      skipping = false;
    }
    if (std::any_of(first, node->chunk.end(), pred)) return true;
  }
  return false;
}

std::ostream &operator<<(std::ostream &stream, const EventLog &log) {
  stream << '[';
  bool first = true;
  for (const auto &event : log.Events()) {
    if (!first) stream << ", ";
    first = false;
    stream << event;
  }
  return stream << ']';
}

}  // namespace weft
