#pragma once
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include "../src/core/FetchConfiguration.hpp"
#include "../src/network/FetchBackendOptions.hpp"

namespace WebAsset {
    struct Config {
        std::string asset_folder = "assets";
        long http_timeout_ms = 30000;
        long http_connect_timeout_ms = 10000;
        long http_max_redirects = 10;
        std::string http_user_agent = "WebAsset/1.0";
        bool http_verify_tls = true;
        int worker_threads = 0; // 0 = half of the system cores
        std::string log_level = "info";
        bool fake_extensions = false;
        bool watch_for_changes = false;
        long watch_poll_interval_ms = 500;
        HeaderList headers;  // ordered, duplicates kept
        QueryList query;     // ordered, duplicates kept

        static Config& GetInstance() {
            static Config instance;
            return instance;
        }

        void Load(const std::string& path);
        void LoadFromJson(const nlohmann::json& data);
        void CreateDefault(const std::string& path) const;
        nlohmann::json ToJson() const;

        FetchConfiguration ToFetchConfiguration() const;
        FetchBackendOptions ToBackendOptions() const;
    };
}
