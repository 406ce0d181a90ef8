#pragma once

#include "zonal_join/core/types.hpp"
#include "zonal_join/join/join_driver.hpp"

#include <nlohmann/json.hpp>
#include <vector>

namespace zonal_join::io {

using json = nlohmann::json;

// {"min", "max", "median", "sum", "mode", "stddev", "count", "mean",
//  "lowerquart", "upperquart"}; NaN fields are written as null
json to_json(const Statistics& s);

// {"status": ..., "results": [{"index", "id", "stats"}]}. `ids` maps feature
// indices back to caller identifiers and may be shorter than the result.
json to_json(const join::JoinResult& result, const std::vector<json>& ids = {});

json to_json(const std::vector<PixelRange>& ranges);

} // namespace zonal_join::io
