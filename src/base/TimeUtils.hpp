#ifndef __TETHER_TIME_UTILS__
#define __TETHER_TIME_UTILS__

#include "Headers.hpp"

namespace tether {
/**
 * @brief Renders epoch milliseconds as RFC 3339 UTC with millisecond
 * precision, e.g. `2024-05-01T12:30:00.250Z`.
 */
string formatTimestamp(int64_t epochMillis);

/**
 * @brief Parses an RFC 3339 timestamp (`Z` or numeric offset, any number of
 * fractional digits) into epoch milliseconds.
 * @return nullopt when the text is not a valid timestamp.
 */
optional<int64_t> parseTimestamp(const string& text);
}  // namespace tether

#endif  // __TETHER_TIME_UTILS__
