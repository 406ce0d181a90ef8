#include "zonal_join/config/configuration.hpp"
#include "zonal_join/core/errors.hpp"

#include <fstream>

namespace zonal_join::config {

Config Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        throw ConfigError("Config file not found: " + path.string());
    }

    YAML::Node node;
    try {
        node = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw ConfigError("Cannot parse " + path.string() + ": " + e.what());
    }
    return from_yaml(node);
}

Config Config::from_yaml(const YAML::Node& node) {
    Config cfg;

    try {
        if (node["join"]) {
            auto j = node["join"];
            if (j["band"]) cfg.join.band = j["band"].as<int>();
            if (j["exact_threshold"]) cfg.join.exact_threshold = j["exact_threshold"].as<std::int64_t>();
        }

        if (node["limits"]) {
            auto l = node["limits"];
            if (l["timeout_seconds"]) cfg.limits.timeout_seconds = l["timeout_seconds"].as<double>();
            if (l["cancel_check_rows"]) cfg.limits.cancel_check_rows = l["cancel_check_rows"].as<int>();
        }

        if (node["logging"]) {
            auto g = node["logging"];
            if (g["events"]) cfg.logging.events = g["events"].as<bool>();
        }

        if (node["output"]) {
            auto o = node["output"];
            if (o["json_indent"]) cfg.output.json_indent = o["json_indent"].as<int>();
        }
    } catch (const YAML::Exception& e) {
        throw ConfigError(e.what());
    }

    return cfg;
}

void Config::save(const fs::path& path) const {
    YAML::Node node = to_yaml();
    std::ofstream out(path);
    if (!out) {
        throw ConfigError("Cannot write config file: " + path.string());
    }
    out << node;
}

YAML::Node Config::to_yaml() const {
    YAML::Node node;

    node["join"]["band"] = join.band;
    node["join"]["exact_threshold"] = join.exact_threshold;

    node["limits"]["timeout_seconds"] = limits.timeout_seconds;
    node["limits"]["cancel_check_rows"] = limits.cancel_check_rows;

    node["logging"]["events"] = logging.events;

    node["output"]["json_indent"] = output.json_indent;

    return node;
}

void Config::validate() const {
    if (join.band < 1) {
        throw ValidationError("join.band must be >= 1");
    }
    if (join.exact_threshold < 1) {
        throw ValidationError("join.exact_threshold must be >= 1");
    }
    if (limits.timeout_seconds < 0.0) {
        throw ValidationError("limits.timeout_seconds must be >= 0");
    }
    if (limits.cancel_check_rows < 1) {
        throw ValidationError("limits.cancel_check_rows must be >= 1");
    }
    if (output.json_indent < -1) {
        throw ValidationError("output.json_indent must be >= -1");
    }
}

} // namespace zonal_join::config
