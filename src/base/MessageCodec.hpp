#ifndef __TETHER_MESSAGE_CODEC__
#define __TETHER_MESSAGE_CODEC__

#include "Headers.hpp"
#include "JsonLib.hpp"
#include "Message.hpp"

namespace tether {
enum class DecodeStatus { OK, UNKNOWN_TYPE, MALFORMED_FRAME, INVALID_PAYLOAD };

string decodeStatusName(DecodeStatus status);

/**
 * @brief Result of decoding one text frame. `message` is set only for OK;
 * `typeName` is filled whenever the frame carried a string `type`.
 */
struct DecodeResult {
  DecodeStatus status = DecodeStatus::MALFORMED_FRAME;
  optional<Message> message;
  string typeName;
  optional<string> requestId;
  string reason;

  bool ok() const { return status == DecodeStatus::OK; }
};

/**
 * @brief JSON wire codec for relay envelopes.
 *
 * Encoding always writes `type` and an RFC 3339 `timestamp`. Decoding
 * validates the payload shape for the tag in `type` and never throws.
 */
class MessageCodec {
 public:
  static string encode(const Message& message);

  static json toJson(const Message& message);

  static DecodeResult decode(const string& frame,
                             int64_t receivedAtMs = currentTimeMillis());

  static DecodeResult fromJson(const json& envelope, int64_t receivedAtMs);
};
}  // namespace tether

#endif  // __TETHER_MESSAGE_CODEC__
