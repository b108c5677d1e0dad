#include "Config.hpp"
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <stdexcept>
#include "../src/utils/Logger.hpp"

namespace WebAsset {

namespace {

// Reads [{"<first>": "...", "value": "..."}, ...] preserving order.
std::vector<std::pair<std::string, std::string>> ReadPairs(const nlohmann::json& data, const char* key, const char* first) {
    std::vector<std::pair<std::string, std::string>> out;
    if (!data.contains(key)) return out;
    const auto& arr = data.at(key);
    if (!arr.is_array()) {
        throw std::runtime_error(std::string("Config key '") + key + "' must be an array");
    }
    for (const auto& entry : arr) {
        if (!entry.is_object() || !entry.contains(first) || !entry.at(first).is_string()) {
            throw std::runtime_error(std::string("Config key '") + key + "' entries need a string '" + first + "'");
        }
        std::string value;
        if (entry.contains("value")) {
            const auto& v = entry.at("value");
            if (v.is_string()) {
                value = v.get<std::string>();
            } else if (v.is_number() || v.is_boolean()) {
                value = v.dump();
            } else {
                throw std::runtime_error(std::string("Config key '") + key + "' has a non-scalar value");
            }
        }
        out.emplace_back(entry.at(first).get<std::string>(), std::move(value));
    }
    return out;
}

nlohmann::json WritePairs(const std::vector<std::pair<std::string, std::string>>& pairs, const char* first) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& kv : pairs) {
        arr.push_back({{first, kv.first}, {"value", kv.second}});
    }
    return arr;
}

}

void Config::LoadFromJson(const nlohmann::json& data) {
    asset_folder = data.value("asset_folder", std::string("assets"));
    http_timeout_ms = data.value("http_timeout_ms", 30000L);
    http_connect_timeout_ms = data.value("http_connect_timeout_ms", 10000L);
    http_max_redirects = data.value("http_max_redirects", 10L);
    http_user_agent = data.value("http_user_agent", std::string("WebAsset/1.0"));
    http_verify_tls = data.value("http_verify_tls", true);
    worker_threads = data.value("worker_threads", 0);
    log_level = data.value("log_level", std::string("info"));
    fake_extensions = data.value("fake_extensions", false);
    watch_for_changes = data.value("watch_for_changes", false);
    watch_poll_interval_ms = data.value("watch_poll_interval_ms", 500L);
    if (watch_poll_interval_ms <= 0) {
        throw std::runtime_error("Config key 'watch_poll_interval_ms' must be positive");
    }
    headers = ReadPairs(data, "headers", "name");
    query = ReadPairs(data, "query", "key");
}

void Config::Load(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        throw std::runtime_error("Could not open config file: " + path);
    }
    nlohmann::json data;
    try {
        data = nlohmann::json::parse(f);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Malformed config file " + path + ": " + e.what());
    }
    LoadFromJson(data);

    // Write back missing keys so existing config.json reflects newly added options.
    // Unknown keys are preserved; only missing ones are appended.
    bool changed = false;
    const nlohmann::json defaults = ToJson();
    for (auto it = defaults.begin(); it != defaults.end(); ++it) {
        if (!data.contains(it.key())) {
            data[it.key()] = it.value();
            changed = true;
        }
    }

    if (changed) {
        try {
            std::filesystem::path p(path);
            std::filesystem::path bak = p;
            bak += ".bak";
            std::error_code ec;
            std::filesystem::copy_file(p, bak, std::filesystem::copy_options::overwrite_existing, ec);
            if (ec) {
                Logger::Log(LogLevel::Warn, "Could not back up " + path + ": " + ec.message());
            }

            std::ofstream o(path, std::ios::trunc);
            o << std::setw(4) << data << std::endl;
        } catch (const std::exception& e) {
            // Startup continues with the values already loaded.
            Logger::Log(LogLevel::Warn, "Could not update config file " + path + ": " + e.what());
        }
    }
}

nlohmann::json Config::ToJson() const {
    nlohmann::json data;
    data["asset_folder"] = asset_folder;
    data["http_timeout_ms"] = http_timeout_ms;
    data["http_connect_timeout_ms"] = http_connect_timeout_ms;
    data["http_max_redirects"] = http_max_redirects;
    data["http_user_agent"] = http_user_agent;
    data["http_verify_tls"] = http_verify_tls;
    data["worker_threads"] = worker_threads;
    data["log_level"] = log_level;
    data["fake_extensions"] = fake_extensions;
    data["watch_for_changes"] = watch_for_changes;
    data["watch_poll_interval_ms"] = watch_poll_interval_ms;
    data["headers"] = WritePairs(headers, "name");
    data["query"] = WritePairs(query, "key");
    return data;
}

void Config::CreateDefault(const std::string& path_str) const {
    std::filesystem::path path(path_str);

    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }

    Config defaultConfig;
    std::ofstream o(path);
    if (!o.is_open()) {
        throw std::runtime_error("Could not open config file for writing: " + path_str);
    }
    o << std::setw(4) << defaultConfig.ToJson() << std::endl;
    if (!o.good()) {
        throw std::runtime_error("Failed to write to config file: " + path_str);
    }
}

FetchConfiguration Config::ToFetchConfiguration() const {
    return FetchConfiguration(headers, query, fake_extensions);
}

FetchBackendOptions Config::ToBackendOptions() const {
    FetchBackendOptions options;
    options.timeout_ms = http_timeout_ms;
    options.connect_timeout_ms = http_connect_timeout_ms;
    options.max_redirects = http_max_redirects;
    options.user_agent = http_user_agent;
    options.verify_tls = http_verify_tls;
    return options;
}

}
