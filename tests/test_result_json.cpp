#include "zonal_join/io/result_json.hpp"
#include "zonal_join/stats/statistics.hpp"

#include <vector>

#include <catch2/catch_test_macros.hpp>

using namespace zonal_join;
using json = nlohmann::json;

TEST_CASE("statistics_json_uses_fixed_keys") {
    Statistics s = stats::exact_statistics({1.0f, 2.0f, 3.0f, 4.0f, 5.0f});
    json j = io::to_json(s);

    REQUIRE(j.size() == 10);
    REQUIRE(j["count"] == 5);
    REQUIRE(j["sum"] == 15.0);
    REQUIRE(j["mean"] == 3.0);
    REQUIRE(j["lowerquart"] == 2.0);
    REQUIRE(j["upperquart"] == 4.0);
    REQUIRE(j.contains("stddev"));
    REQUIRE(j.contains("mode"));
}

TEST_CASE("statistics_json_writes_nan_as_null") {
    json empty = io::to_json(empty_statistics());
    REQUIRE(empty["count"] == 0);
    REQUIRE(empty["min"].is_null());
    REQUIRE(empty["mean"].is_null());

    json streamed = io::to_json(stats::streaming_statistics({1.0f, 2.0f}));
    REQUIRE(streamed["median"].is_null());
    REQUIRE(streamed["mode"].is_null());
    REQUIRE(streamed["min"] == 1.0);

    // Must survive a dump without producing invalid JSON
    REQUIRE(json::parse(empty.dump())["max"].is_null());
}

TEST_CASE("join_result_json_pairs_results_with_ids") {
    join::JoinResult result;
    result.status = JoinStatus::Ok;
    result.statistics[0] = stats::exact_statistics({2.0f});
    result.statistics[1] = empty_statistics();
    result.statistics[2] = stats::exact_statistics({4.0f});

    json j = io::to_json(result, {"a", 17});

    REQUIRE(j["status"] == "ok");
    REQUIRE(j["results"].size() == 3);
    REQUIRE(j["results"][0]["index"] == 0);
    REQUIRE(j["results"][0]["id"] == "a");
    REQUIRE(j["results"][1]["id"] == 17);
    REQUIRE(j["results"][1]["stats"]["count"] == 0);
    REQUIRE(j["results"][2]["id"].is_null());
    REQUIRE(j["results"][2]["stats"]["mean"] == 4.0);
}

TEST_CASE("join_result_json_reports_status_without_results") {
    join::JoinResult none;
    none.status = JoinStatus::NoResults;
    REQUIRE(io::to_json(none)["status"] == "no_results");
    REQUIRE(io::to_json(none)["results"].empty());

    join::JoinResult cut;
    cut.status = JoinStatus::Incomplete;
    REQUIRE(io::to_json(cut)["status"] == "incomplete");
}

TEST_CASE("pixel_ranges_json_lists_each_range") {
    std::vector<PixelRange> ranges = {{0, 1, 4, 2}, {3, 0, 2, 0}};
    json j = io::to_json(ranges);

    REQUIRE(j.size() == 2);
    REQUIRE(j[0]["row"] == 0);
    REQUIRE(j[0]["col_start"] == 1);
    REQUIRE(j[0]["col_end"] == 4);
    REQUIRE(j[0]["feature"] == 2);
    REQUIRE(j[1]["row"] == 3);
}
