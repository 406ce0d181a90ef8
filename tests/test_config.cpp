#include "zonal_join/config/configuration.hpp"
#include "zonal_join/core/errors.hpp"
#include "zonal_join/core/utils.hpp"

#include <filesystem>

#include <catch2/catch_test_macros.hpp>
#include <yaml-cpp/yaml.h>

using namespace zonal_join;

TEST_CASE("config_defaults_are_valid") {
    config::Config cfg;

    REQUIRE(cfg.join.band == 1);
    REQUIRE(cfg.join.exact_threshold == 5000000);
    REQUIRE(cfg.limits.timeout_seconds == 0.0);
    REQUIRE(cfg.limits.cancel_check_rows == 1);
    REQUIRE(cfg.logging.events);
    REQUIRE(cfg.output.json_indent == 2);
    REQUIRE_NOTHROW(cfg.validate());
}

TEST_CASE("config_from_yaml_overrides_given_keys_only") {
    auto node = YAML::Load(R"(
join:
  band: 3
limits:
  timeout_seconds: 12.5
logging:
  events: false
)");

    auto cfg = config::Config::from_yaml(node);

    REQUIRE(cfg.join.band == 3);
    REQUIRE(cfg.join.exact_threshold == 5000000);
    REQUIRE(cfg.limits.timeout_seconds == 12.5);
    REQUIRE(cfg.limits.cancel_check_rows == 1);
    REQUIRE_FALSE(cfg.logging.events);
    REQUIRE(cfg.output.json_indent == 2);
}

TEST_CASE("config_from_yaml_wraps_type_errors") {
    auto node = YAML::Load("join:\n  band: first\n");
    REQUIRE_THROWS_AS(config::Config::from_yaml(node), ConfigError);
}

TEST_CASE("config_validate_rejects_out_of_range_values") {
    config::Config cfg;
    cfg.join.band = 0;
    REQUIRE_THROWS_AS(cfg.validate(), ValidationError);

    cfg = config::Config{};
    cfg.join.exact_threshold = 0;
    REQUIRE_THROWS_AS(cfg.validate(), ValidationError);

    cfg = config::Config{};
    cfg.limits.timeout_seconds = -1.0;
    REQUIRE_THROWS_AS(cfg.validate(), ValidationError);

    cfg = config::Config{};
    cfg.limits.cancel_check_rows = 0;
    REQUIRE_THROWS_AS(cfg.validate(), ValidationError);

    cfg = config::Config{};
    cfg.output.json_indent = -2;
    REQUIRE_THROWS_AS(cfg.validate(), ValidationError);

    cfg.output.json_indent = -1;
    REQUIRE_NOTHROW(cfg.validate());
}

TEST_CASE("config_save_then_load_keeps_values") {
    const std::filesystem::path file = std::filesystem::temp_directory_path() / ("zonal_join_cfg_" + core::get_run_id() + ".yaml");

    config::Config cfg;
    cfg.join.band = 2;
    cfg.join.exact_threshold = 1234;
    cfg.limits.timeout_seconds = 30.0;
    cfg.limits.cancel_check_rows = 8;
    cfg.logging.events = false;
    cfg.output.json_indent = -1;
    cfg.save(file);

    auto loaded = config::Config::load(file);
    std::filesystem::remove(file);

    REQUIRE(loaded.join.band == 2);
    REQUIRE(loaded.join.exact_threshold == 1234);
    REQUIRE(loaded.limits.timeout_seconds == 30.0);
    REQUIRE(loaded.limits.cancel_check_rows == 8);
    REQUIRE_FALSE(loaded.logging.events);
    REQUIRE(loaded.output.json_indent == -1);
}

TEST_CASE("config_load_reports_missing_file") {
    REQUIRE_THROWS_AS(config::Config::load("/nonexistent/zonal_join/config.yaml"), ConfigError);
}
