#ifndef __TETHER_PAIRING_URI__
#define __TETHER_PAIRING_URI__

#include "ConnectionDescriptor.hpp"
#include "Headers.hpp"

namespace tether {
enum class PairingError { NONE, MALFORMED_URI, UNSUPPORTED_SCHEME, MISSING_TOKEN };

string pairingErrorName(PairingError error);

/**
 * @brief Outcome of decoding a bootstrap URI. `descriptor` is set if and only
 * if `error` is NONE.
 */
struct PairingResult {
  optional<ConnectionDescriptor> descriptor;
  PairingError error = PairingError::NONE;
  string detail;

  bool ok() const { return error == PairingError::NONE; }
};

/**
 * @brief Converts between a ConnectionDescriptor and the bootstrap URI
 * `ws://host:port/ws?key=TOKEN` that is shown as a QR code.
 */
class PairingUri {
 public:
  static string encode(const ConnectionDescriptor& descriptor);

  static PairingResult decode(const string& uri);

  static string percentEncode(const string& s);

  /**
   * @brief Decodes %XX escapes and '+' as space.
   * @return nullopt on a truncated or non-hex escape.
   */
  static optional<string> percentDecode(const string& s);
};
}  // namespace tether

#endif  // __TETHER_PAIRING_URI__
