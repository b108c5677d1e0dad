#include <algorithm>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <future>
#include <iostream>
#include <thread>
#include <vector>
#include <curl/curl.h>
#include "../config/Config.hpp"
#include "plugin/WebAssetPlugin.hpp"
#include "storage/FileAssetReader.hpp"
#include "utils/Logger.hpp"
#include "utils/ThreadPool.hpp"

namespace {

volatile std::sig_atomic_t g_interrupted = 0;

void HandleInterrupt(int) {
    g_interrupted = 1;
}

// RAII pairing for curl_global_init / curl_global_cleanup
struct CurlGlobal {
    CurlGlobal() { curl_global_init(CURL_GLOBAL_ALL); }
    ~CurlGlobal() { curl_global_cleanup(); }
};

}

int main(int argc, char* argv[]) {
    if (argc == 0 || argv[0] == nullptr) {
        WebAsset::Logger::Log(WebAsset::LogLevel::Error, "Cannot determine executable path.");
        return 1;
    }
    if (argc < 2) {
        std::cerr << "usage: " << argv[0] << " <identifier>..." << std::endl;
        return 2;
    }
    std::filesystem::path exe_path(argv[0]);
    std::filesystem::path exe_dir = exe_path.parent_path();
    std::filesystem::path config_path = exe_dir / "config" / "config.json";
    const std::string config_path_str = config_path.string();

    CurlGlobal curl_global;

    // Load Config
    auto& config = WebAsset::Config::GetInstance();
    try {
        config.Load(config_path_str);
        WebAsset::Logger::Log(WebAsset::LogLevel::Info, "Configuration loaded from: " + config_path_str);
    } catch (const std::runtime_error& e) {
        std::string error_message = e.what();
        if (error_message.find("Could not open config file") != std::string::npos) {
            WebAsset::Logger::Log(WebAsset::LogLevel::Warn, "config.json not found. Creating a default one at: " + config_path_str);
            try {
                config.CreateDefault(config_path_str);
                WebAsset::Logger::Log(WebAsset::LogLevel::Info, "Default config.json created. Review it and run again.");
                return 0;
            } catch (const std::exception& create_e) {
                WebAsset::Logger::Log(WebAsset::LogLevel::Error, "Failed to create default config: " + std::string(create_e.what()));
                return 1;
            }
        }
        WebAsset::Logger::Log(WebAsset::LogLevel::Error, "Failed to load config: " + error_message);
        return 1;
    }

    WebAsset::Logger::Init(exe_dir.string(), WebAsset::Logger::FromString(config.log_level));

    // Determine thread pool size
    const unsigned int hardware_cores = std::thread::hardware_concurrency();
    unsigned int worker_threads = std::max(1u, hardware_cores / 2);
    if (config.worker_threads < 0) {
        WebAsset::Logger::Log(WebAsset::LogLevel::Error, "Configured worker_threads (" + std::to_string(config.worker_threads) + ") must not be negative.");
        return 1;
    } else if (config.worker_threads > 0) {
        worker_threads = static_cast<unsigned int>(config.worker_threads);
    }
    WebAsset::Logger::Log(WebAsset::LogLevel::Debug, "Using " + std::to_string(worker_threads) + " worker thread(s)");

    std::filesystem::path asset_root(config.asset_folder);
    if (asset_root.is_relative()) {
        asset_root = exe_dir / asset_root;
    }

    int failures = 0;
    {
        WebAsset::ThreadPool thread_pool(worker_threads);
        std::shared_ptr<WebAsset::IAssetReader> reader;
        try {
            auto plugin = WebAsset::WebAssetPlugin::FromConfig(config);
            reader = plugin.CreateReader(std::make_unique<WebAsset::FileAssetReader>(
                asset_root, thread_pool, std::chrono::milliseconds(config.watch_poll_interval_ms)));
        } catch (const std::exception& e) {
            WebAsset::Logger::Log(WebAsset::LogLevel::Error, "Failed to set up asset reader: " + std::string(e.what()));
            return 1;
        }

        std::vector<std::string> identifiers(argv + 1, argv + argc);
        std::vector<std::future<WebAsset::ReadResult>> results;
        WebAsset::CancellationToken no_cancel;
        for (const auto& id : identifiers) {
            auto promise = std::make_shared<std::promise<WebAsset::ReadResult>>();
            results.push_back(promise->get_future());
            reader->Read(id, no_cancel, [promise](WebAsset::ReadResult result) {
                promise->set_value(std::move(result));
            });
        }

        for (size_t i = 0; i < identifiers.size(); ++i) {
            WebAsset::ReadResult result = results[i].get();
            if (result.Ok()) {
                std::cout << identifiers[i] << ": " << result.Size() << " bytes" << std::endl;
            } else {
                std::cout << identifiers[i] << ": " << result.error->Describe() << std::endl;
                ++failures;
            }
        }

        if (config.watch_for_changes) {
            // Report every change below the asset folder with the new size, until Ctrl+C.
            std::weak_ptr<WebAsset::IAssetReader> weak_reader = reader;
            WebAsset::FlagResult watching = reader->WatchForChanges("", [weak_reader](const std::string& path) {
                auto watched_reader = weak_reader.lock();
                if (!watched_reader) return;
                watched_reader->Read(path, WebAsset::CancellationToken(), [path](WebAsset::ReadResult result) {
                    if (result.Ok()) {
                        std::cout << path << ": changed, " << result.Size() << " bytes" << std::endl;
                    } else {
                        std::cout << path << ": changed, " << result.error->Describe() << std::endl;
                    }
                });
            });
            if (!watching.Ok()) {
                WebAsset::Logger::Log(WebAsset::LogLevel::Error, "Cannot watch asset folder: " + watching.error->Describe());
                return 1;
            }
            std::signal(SIGINT, HandleInterrupt);
            WebAsset::Logger::Log(WebAsset::LogLevel::Info, "Watching " + asset_root.string() + " for changes. Press Ctrl+C to stop.");
            while (!g_interrupted) {
                std::this_thread::sleep_for(std::chrono::milliseconds(200));
            }
        }
        // reader and its backend go away before the pool the local source runs on
    }

    return failures == 0 ? 0 : 1;
}
