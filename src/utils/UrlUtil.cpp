#include "UrlUtil.hpp"

namespace WebAsset {
namespace UrlUtil {

std::string PercentEncode(const std::string& s) {
    auto is_unreserved = [](unsigned char c) {
        return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.' || c == '~';
    };
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    out.reserve(s.size() * 3);
    for (unsigned char c : s) {
        if (is_unreserved(c)) {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(hex[(c >> 4) & 0xF]);
            out.push_back(hex[c & 0xF]);
        }
    }
    return out;
}

size_t PathBegin(const std::string& url) {
    auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos) return std::string::npos;
    auto pos = url.find_first_of("/?#", scheme_end + 3);
    if (pos == std::string::npos || url[pos] != '/') return std::string::npos;
    return pos;
}

size_t PathEnd(const std::string& url) {
    auto scheme_end = url.find("://");
    size_t from = scheme_end == std::string::npos ? 0 : scheme_end + 3;
    auto pos = url.find_first_of("?#", from);
    return pos == std::string::npos ? url.size() : pos;
}

std::string StripFinalExtension(const std::string& url) {
    const size_t path_begin = PathBegin(url);
    if (path_begin == std::string::npos) return url;
    const size_t path_end = PathEnd(url);

    const size_t slash = url.rfind('/', path_end - 1);
    const size_t segment_begin = slash + 1;
    if (segment_begin >= path_end) return url;

    const size_t dot = url.rfind('.', path_end - 1);
    if (dot == std::string::npos || dot <= segment_begin) return url;

    return url.substr(0, dot) + url.substr(path_end);
}

std::string AppendToPath(const std::string& url, const std::string& suffix) {
    const size_t path_end = PathEnd(url);
    return url.substr(0, path_end) + suffix + url.substr(path_end);
}

std::string AppendQuery(const std::string& url, const std::vector<std::pair<std::string, std::string>>& query) {
    if (query.empty()) return url;

    std::string base = url;
    std::string fragment;
    auto hash = base.find('#');
    if (hash != std::string::npos) {
        fragment = base.substr(hash);
        base.erase(hash);
    }

    std::string encoded;
    for (const auto& kv : query) {
        if (!encoded.empty()) encoded.push_back('&');
        encoded += PercentEncode(kv.first);
        encoded.push_back('=');
        encoded += PercentEncode(kv.second);
    }

    if (base.find('?') == std::string::npos) {
        base.push_back('?');
    } else if (base.back() != '?' && base.back() != '&') {
        base.push_back('&');
    }
    return base + encoded + fragment;
}

}
}
