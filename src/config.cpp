#include "config.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>

namespace cronrepo {

nlohmann::json Config::defaults_json() {
    return {
        {"trampoline", ""},
        {"skipped_env", {"COLORTERM", "SSH_AGENT_PID", "SSH_AUTH_SOCK",
                         "SSH_CLIENT", "SSH_CONNECTION", "SSH_TTY", "_"}},
        {"time_format", "date=%Y-%m-%d time=%H:%M"},
        {"run", {
            {"log", ""},
            {"notify", ""},
            {"rotate", 5}
        }}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                     const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

std::string Config::default_path() {
    const char* env = std::getenv("CRONREPO_CONFIG");
    if (env && *env) return env;
    return expand_home("~/.cronrepo/config.json");
}

Config Config::load() {
    return load_from(default_path());
}

Config Config::load_from(const std::string& path) {
    nlohmann::json j = defaults_json();

    std::ifstream file(path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            if (original.is_object()) {
                j = merge_defaults(original, defaults_json());
            } else {
                std::cerr << "[config] Ignoring " << path << ": not a JSON object\n";
            }
        } catch (const nlohmann::json::parse_error& e) {
            std::cerr << "[config] Ignoring malformed " << path << ": " << e.what() << "\n";
        }
    }
    return from_json(j);
}

Config Config::from_json(const nlohmann::json& j) {
    Config cfg;

    if (j.contains("trampoline") && j["trampoline"].is_string())
        cfg.trampoline = j["trampoline"].get<std::string>();
    if (j.contains("time_format") && j["time_format"].is_string())
        cfg.time_format = j["time_format"].get<std::string>();

    if (j.contains("skipped_env") && j["skipped_env"].is_array()) {
        cfg.skipped_env.clear();
        for (const auto& item : j["skipped_env"]) {
            if (item.is_string()) cfg.skipped_env.push_back(item.get<std::string>());
        }
    }

    if (j.contains("run") && j["run"].is_object()) {
        auto& r = j["run"];
        if (r.contains("log") && r["log"].is_string())
            cfg.run.log = r["log"].get<std::string>();
        if (r.contains("notify") && r["notify"].is_string())
            cfg.run.notify = r["notify"].get<std::string>();
        if (r.contains("rotate") && r["rotate"].is_number_integer() &&
            r["rotate"].get<int>() >= 0)
            cfg.run.rotate = r["rotate"].get<int>();
    }

    return cfg;
}

} // namespace cronrepo
