#include "core/transcript.hpp"

namespace harness {

void ConversationTranscript::append(Message msg) {
  messages_.push_back(std::move(msg));
}

std::vector<const Message*> ConversationTranscript::with_role(Role role) const {
  std::vector<const Message*> result;
  for (const auto& msg : messages_) {
    if (msg.role() == role) {
      result.push_back(&msg);
    }
  }
  return result;
}

std::string ConversationTranscript::assistant_text() const {
  std::string result;
  for (const auto* msg : with_role(Role::Assistant)) {
    result += msg->text();
  }
  return result;
}

std::string ConversationTranscript::final_text() const {
  for (auto it = messages_.rbegin(); it != messages_.rend(); ++it) {
    if (it->role() == Role::Assistant) {
      return it->text();
    }
  }
  return "";
}

json ConversationTranscript::to_json() const {
  json j = json::array();
  for (const auto& msg : messages_) {
    j.push_back(msg.to_json());
  }
  return j;
}

}  // namespace harness
