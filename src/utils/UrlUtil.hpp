#pragma once
#include <string>
#include <utility>
#include <vector>

namespace WebAsset {
namespace UrlUtil {

// Percent-encode everything except RFC 3986 unreserved characters.
std::string PercentEncode(const std::string& s);

// Offset of the first character of the path ("/..."), or npos when the URL
// has no scheme or no path after its authority.
size_t PathBegin(const std::string& url);

// Offset one past the path: the first '?' or '#' after the path, else size().
size_t PathEnd(const std::string& url);

// Remove the last ".suffix" of the final path segment. URLs without a path,
// segments without a dot and dot-files (".hidden") are returned unchanged.
// Any query or fragment is kept.
std::string StripFinalExtension(const std::string& url);

// Insert `suffix` at the end of the path, ahead of any query or fragment.
std::string AppendToPath(const std::string& url, const std::string& suffix);

// Append percent-encoded key=value pairs joined by '&'. Uses '?' when the
// URL has no query yet and '&' otherwise. A fragment stays last.
std::string AppendQuery(const std::string& url, const std::vector<std::pair<std::string, std::string>>& query);

}
}
