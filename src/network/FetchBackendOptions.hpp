#pragma once
#include <string>

namespace WebAsset {

struct FetchBackendOptions {
    long timeout_ms = 30000;
    long connect_timeout_ms = 10000;
    long max_redirects = 10;
    std::string user_agent = "WebAsset/1.0";
    bool verify_tls = true;
};

}
