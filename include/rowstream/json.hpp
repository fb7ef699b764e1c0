#pragma once
/// @file json.hpp
/// @brief JSON library alias for rowstream
///
/// Row cells, pushed records, producer error payloads and diagnostics are
/// all dynamic JSON values. Currently wraps nlohmann/json.

#include <nlohmann/json.hpp>

namespace rowstream {

/// JSON type alias
using json = nlohmann::json;

} // namespace rowstream
