#pragma once

#include "nlohmann/json.hpp"

/**
 * @brief Exposes `nlohmann::json` as `json` for state dumps.
 */
using json = nlohmann::json;
