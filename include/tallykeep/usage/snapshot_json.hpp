#pragma once

#include "tallykeep/common/result.hpp"
#include "tallykeep/usage/statistics.hpp"

#include <string>

namespace tallykeep::usage {

/// Render a snapshot as an indented JSON object. `indent` is the nesting depth
/// of the object itself, so it can be embedded in a larger document.
[[nodiscard]] std::string snapshot_to_json(const StatisticsSnapshot &snapshot, int indent = 0);

/// Decode a snapshot object. `null` decodes to an empty snapshot; unknown
/// fields are ignored; a field of the wrong shape fails the whole decode.
[[nodiscard]] common::Result<StatisticsSnapshot> snapshot_from_json(const std::string &json);

} // namespace tallykeep::usage
