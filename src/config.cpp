#include "config.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace toolbelt {

nlohmann::json Config::defaults_json() {
    return {
        {"process", {
            {"default_timeout", 30},
            {"kill_grace_ms", 2000},
            {"mcp_call_timeout_ms", 5000}
        }},
        {"tools", {
            {"bash", {{"type", "bash"}, {"workspace", "."}}},
            {"process", {{"type", "process"}, {"workspace", "."}, {"command", ""}}}
        }}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                      const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (key != "tools" && value.is_object() && merged[key].is_object()) {
            // The tools section belongs to the user; don't resurrect removed tools
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

static std::string setting_string(const nlohmann::json& value) {
    if (value.is_string()) return value.get<std::string>();
    if (value.is_array()) {
        std::vector<std::string> parts;
        for (const auto& item : value) {
            parts.push_back(item.is_string() ? item.get<std::string>() : item.dump());
        }
        return join_shell_args(parts);
    }
    if (value.is_null()) return {};
    return value.dump();
}

static bool env_uint(const char* name, uint32_t& out) {
    const char* v = std::getenv(name);
    if (!v) return false;
    try {
        unsigned long parsed = std::stoul(v);
        out = static_cast<uint32_t>(parsed);
        return true;
    } catch (const std::exception&) {
        std::cerr << "[config] Ignoring " << name << "=" << v << ": not a number\n";
        return false;
    }
}

Config Config::from_json(const nlohmann::json& j) {
    Config cfg;

    if (j.contains("process") && j["process"].is_object()) {
        auto& p = j["process"];
        if (p.contains("default_timeout") && p["default_timeout"].is_number_unsigned())
            cfg.process.default_timeout = p["default_timeout"].get<uint32_t>();
        if (p.contains("kill_grace_ms") && p["kill_grace_ms"].is_number_unsigned())
            cfg.process.kill_grace_ms = p["kill_grace_ms"].get<uint32_t>();
        if (p.contains("mcp_call_timeout_ms") && p["mcp_call_timeout_ms"].is_number_unsigned())
            cfg.process.mcp_call_timeout_ms = p["mcp_call_timeout_ms"].get<uint32_t>();
    }

    if (j.contains("tools") && j["tools"].is_object()) {
        for (auto& [name, obj] : j["tools"].items()) {
            if (!obj.is_object()) continue;
            ToolConfig tc;
            tc.name = name;
            tc.type = obj.contains("type") && obj["type"].is_string()
                ? obj["type"].get<std::string>() : name;
            if (obj.contains("description") && obj["description"].is_string())
                tc.description = obj["description"].get<std::string>();
            for (auto& [key, value] : obj.items()) {
                if (key == "type" || key == "description") continue;
                tc.settings[key] = setting_string(value);
            }
            cfg.tools[name] = std::move(tc);
        }
    }

    return cfg;
}

Config Config::load() {
    std::string config_path = expand_home("~/.toolbelt/config.json");
    nlohmann::json j;

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            j = merge_defaults(original, defaults_json());
            if (j != original) {
                atomic_write_file(config_path, j.dump(4) + "\n");
                std::cerr << "[config] Migrated config with new defaults: "
                          << config_path << "\n";
            }
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Malformed " << config_path << " (" << e.what()
                      << "), using defaults\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(config_path, j.dump(4) + "\n")) {
            std::cerr << "[config] Created default config: " << config_path << "\n";
        }
    }

    Config cfg = from_json(j);

    // Environment variables always override config file
    if (const char* v = std::getenv("TOOLBELT_WORKSPACE")) {
        for (auto& [name, tc] : cfg.tools) {
            tc.settings["workspace"] = v;
        }
    }
    env_uint("TOOLBELT_DEFAULT_TIMEOUT", cfg.process.default_timeout);
    env_uint("TOOLBELT_MCP_TIMEOUT_MS", cfg.process.mcp_call_timeout_ms);

    return cfg;
}

std::vector<ToolConfig> Config::tool_configs() const {
    std::vector<ToolConfig> result;
    result.reserve(tools.size());
    for (const auto& [name, tc] : tools) {
        ToolConfig copy = tc;
        copy.limits = process;
        result.push_back(std::move(copy));
    }
    return result;
}

const ToolConfig* Config::find_tool(const std::string& name) const {
    auto it = tools.find(name);
    if (it != tools.end()) return &it->second;
    return nullptr;
}

} // namespace toolbelt
