#include "zonal_join/io/result_json.hpp"

#include <cmath>

namespace zonal_join::io {

static json number_or_null(float v) {
    if (std::isnan(v)) return nullptr;
    return v;
}

json to_json(const Statistics& s) {
    return {
        {"min", number_or_null(s.min)},
        {"max", number_or_null(s.max)},
        {"median", number_or_null(s.median)},
        {"sum", number_or_null(s.sum)},
        {"mode", number_or_null(s.mode)},
        {"stddev", number_or_null(s.stddev)},
        {"count", s.count},
        {"mean", number_or_null(s.mean)},
        {"lowerquart", number_or_null(s.lower_quart)},
        {"upperquart", number_or_null(s.upper_quart)}
    };
}

json to_json(const join::JoinResult& result, const std::vector<json>& ids) {
    json out;
    out["status"] = join_status_to_string(result.status);
    out["results"] = json::array();
    for (const auto& [feature, stats] : result.statistics) {
        json entry;
        entry["index"] = feature;
        const size_t i = static_cast<size_t>(feature);
        entry["id"] = (i < ids.size()) ? ids[i] : json();
        entry["stats"] = to_json(stats);
        out["results"].push_back(entry);
    }
    return out;
}

json to_json(const std::vector<PixelRange>& ranges) {
    json out = json::array();
    for (const auto& r : ranges) {
        out.push_back({{"row", r.row}, {"col_start", r.col_start},
                       {"col_end", r.col_end}, {"feature", r.feature}});
    }
    return out;
}

} // namespace zonal_join::io
