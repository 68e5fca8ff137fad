#include "astro_compute/config/configuration.hpp"
#include "astro_compute/core/errors.hpp"
#include "astro_compute/core/utils.hpp"
#include "astro_compute/registration/correlation.hpp"

#include <cmath>
#include <fstream>

namespace astro_compute::config {

static bool is_power_of_two(int v) {
    return v > 0 && (v & (v - 1)) == 0;
}

Config Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        throw ConfigError("Config file not found: " + path.string());
    }

    YAML::Node node;
    try {
        node = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw ConfigError(path.string() + ": " + e.what());
    }
    return from_yaml(node);
}

Config Config::from_yaml(const YAML::Node& node) {
    Config cfg;

    try {
        if (node["compute"]) {
            auto c = node["compute"];
            if (c["backend"]) cfg.compute.backend = core::to_lower(c["backend"].as<std::string>());
            if (c["opencl"]) {
                auto o = c["opencl"];
                if (o["platform_index"]) cfg.compute.opencl.platform_index = o["platform_index"].as<int>();
                if (o["device_type"]) cfg.compute.opencl.device_type = core::to_lower(o["device_type"].as<std::string>());
                if (o["workgroup_size"]) cfg.compute.opencl.workgroup_size = o["workgroup_size"].as<int>();
            }
            if (c["cpu"]) {
                auto p = c["cpu"];
                if (p["workers"]) cfg.compute.cpu.workers = p["workers"].as<int>();
            }
        }

        if (node["stf"]) {
            auto s = node["stf"];
            if (s["target_background"]) cfg.stf.target_background = s["target_background"].as<float>();
            if (s["shadow_k"]) cfg.stf.shadow_k = s["shadow_k"].as<float>();
        }

        if (node["correlation"]) {
            auto r = node["correlation"];
            if (r["max_shift"]) cfg.correlation.max_shift = r["max_shift"].as<int>();
            if (r["pyramid"]) {
                auto p = r["pyramid"];
                if (p["enabled"]) cfg.correlation.pyramid.enabled = p["enabled"].as<bool>();
                if (p["coarse_max_shift"]) cfg.correlation.pyramid.coarse_max_shift = p["coarse_max_shift"].as<int>();
                if (p["mid_max_shift"]) cfg.correlation.pyramid.mid_max_shift = p["mid_max_shift"].as<int>();
                if (p["fine_max_shift"]) cfg.correlation.pyramid.fine_max_shift = p["fine_max_shift"].as<int>();
            }
        }

        if (node["logging"]) {
            auto l = node["logging"];
            if (l["events"]) cfg.logging.events = l["events"].as<bool>();
        }
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("malformed value: ") + e.what());
    }

    return cfg;
}

void Config::save(const fs::path& path) const {
    YAML::Node node = to_yaml();
    std::ofstream out(path);
    if (!out) {
        throw IOError("Cannot write config: " + path.string());
    }
    out << node;
}

YAML::Node Config::to_yaml() const {
    YAML::Node node;

    node["compute"]["backend"] = compute.backend;
    node["compute"]["opencl"]["platform_index"] = compute.opencl.platform_index;
    node["compute"]["opencl"]["device_type"] = compute.opencl.device_type;
    node["compute"]["opencl"]["workgroup_size"] = compute.opencl.workgroup_size;
    node["compute"]["cpu"]["workers"] = compute.cpu.workers;

    node["stf"]["target_background"] = stf.target_background;
    node["stf"]["shadow_k"] = stf.shadow_k;

    node["correlation"]["max_shift"] = correlation.max_shift;
    node["correlation"]["pyramid"]["enabled"] = correlation.pyramid.enabled;
    node["correlation"]["pyramid"]["coarse_max_shift"] = correlation.pyramid.coarse_max_shift;
    node["correlation"]["pyramid"]["mid_max_shift"] = correlation.pyramid.mid_max_shift;
    node["correlation"]["pyramid"]["fine_max_shift"] = correlation.pyramid.fine_max_shift;

    node["logging"]["events"] = logging.events;

    return node;
}

void Config::validate() const {
    if (compute.backend != "auto" && compute.backend != "cpu" && compute.backend != "opencl") {
        throw ValidationError("compute.backend must be 'auto', 'cpu' or 'opencl'");
    }
    if (compute.opencl.platform_index < -1) {
        throw ValidationError("compute.opencl.platform_index must be >= -1");
    }
    if (compute.opencl.device_type != "gpu" && compute.opencl.device_type != "any") {
        throw ValidationError("compute.opencl.device_type must be 'gpu' or 'any'");
    }
    if (!is_power_of_two(compute.opencl.workgroup_size) || compute.opencl.workgroup_size > 1024) {
        throw ValidationError("compute.opencl.workgroup_size must be a power of two in [1, 1024]");
    }
    if (compute.cpu.workers < 0) {
        throw ValidationError("compute.cpu.workers must be >= 0");
    }

    if (!(stf.target_background > 0.0f && stf.target_background < 1.0f)) {
        throw ValidationError("stf.target_background must be in (0, 1)");
    }
    if (!std::isfinite(stf.shadow_k)) {
        throw ValidationError("stf.shadow_k must be finite");
    }

    const int limit = registration::kMaxSearchRadius;
    auto radius_ok = [limit](int r) { return r >= 0 && r <= limit; };
    if (!radius_ok(correlation.max_shift)) {
        throw ValidationError("correlation.max_shift must be in [0, " + std::to_string(limit) + "]");
    }
    const auto& p = correlation.pyramid;
    if (!radius_ok(p.coarse_max_shift) || !radius_ok(p.mid_max_shift) ||
        !radius_ok(p.fine_max_shift)) {
        throw ValidationError("correlation.pyramid.*_max_shift must be in [0, " +
                              std::to_string(limit) + "]");
    }
}

std::string get_schema_json() {
    return R"({
  "$schema": "http://json-schema.org/draft-07/schema#",
  "type": "object",
  "properties": {
    "compute": {
      "type": "object",
      "properties": {
        "backend": {"type": "string", "enum": ["auto", "cpu", "opencl"]},
        "opencl": {
          "type": "object",
          "properties": {
            "platform_index": {"type": "integer", "minimum": -1},
            "device_type": {"type": "string", "enum": ["gpu", "any"]},
            "workgroup_size": {"type": "integer", "minimum": 1, "maximum": 1024}
          }
        },
        "cpu": {
          "type": "object",
          "properties": {
            "workers": {"type": "integer", "minimum": 0}
          }
        }
      }
    },
    "stf": {
      "type": "object",
      "properties": {
        "target_background": {"type": "number", "exclusiveMinimum": 0, "exclusiveMaximum": 1},
        "shadow_k": {"type": "number"}
      }
    },
    "correlation": {
      "type": "object",
      "properties": {
        "max_shift": {"type": "integer", "minimum": 0, "maximum": 1024},
        "pyramid": {
          "type": "object",
          "properties": {
            "enabled": {"type": "boolean"},
            "coarse_max_shift": {"type": "integer", "minimum": 0, "maximum": 1024},
            "mid_max_shift": {"type": "integer", "minimum": 0, "maximum": 1024},
            "fine_max_shift": {"type": "integer", "minimum": 0, "maximum": 1024}
          }
        }
      }
    },
    "logging": {
      "type": "object",
      "properties": {
        "events": {"type": "boolean"}
      }
    }
  }
})";
}

} // namespace astro_compute::config
