#pragma once

#include <string>
#include <vector>

#include "core/message.hpp"

namespace harness {

// Append-only, ordered record of one conversational exchange.
// Not thread-safe: owned by a single chat call while it runs.
class ConversationTranscript {
 public:
  void append(Message msg);

  const std::vector<Message>& messages() const {
    return messages_;
  }

  size_t size() const {
    return messages_.size();
  }

  bool empty() const {
    return messages_.empty();
  }

  const Message& back() const {
    return messages_.back();
  }

  // Messages with the given role, in transcript order
  std::vector<const Message*> with_role(Role role) const;

  // Concatenated text of every assistant message
  std::string assistant_text() const;

  // Text of the last assistant message, empty if there is none
  std::string final_text() const;

  json to_json() const;

 private:
  std::vector<Message> messages_;
};

}  // namespace harness
