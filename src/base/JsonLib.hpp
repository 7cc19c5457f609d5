#ifndef __TETHER_JSON_LIB__
#define __TETHER_JSON_LIB__

#include "nlohmann/json.hpp"

/**
 * @brief Exposes `nlohmann::json` as `json` across the relay code.
 */
using json = nlohmann::json;

#endif  // __TETHER_JSON_LIB__
