#include "RelayCommand.hpp"

namespace tether {
Message RelayCommand::makeChunk(const string& chunk) const {
  STFATAL << describe() << " does not stream output";
  return reply(ErrorPayload());
}

Message RelayCommand::reply(Payload payload, ResponseStatus status) const {
  Message message = Message::create(std::move(payload), status);
  message.requestId = requestId;
  return message;
}
}  // namespace tether
