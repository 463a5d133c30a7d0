#ifndef __WT_JSON_LIB__
#define __WT_JSON_LIB__

#include "nlohmann/json.hpp"

/**
 * @brief Exposes `nlohmann::json` as `json` for status reports and startup
 * command lists.
 */
using json = nlohmann::json;

#endif  // __WT_JSON_LIB__
