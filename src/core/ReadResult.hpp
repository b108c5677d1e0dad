#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace WebAsset {

enum class ReadErrorKind {
    NotFound,
    RequestFailed,
    TransportFailure,
    Cancelled,
    LocalSourceError
};

const char* ToString(ReadErrorKind kind);

struct ReadError {
    ReadErrorKind kind = ReadErrorKind::LocalSourceError;
    std::string path;      // identifier as the caller asked for it
    long status_code = 0;  // HTTP status for network NotFound / RequestFailed
    std::string message;

    // "<kind> (<status>): <path>: <message>", parts omitted when empty
    std::string Describe() const;
};

struct ReadResult {
    std::vector<uint8_t> bytes;
    std::optional<ReadError> error;

    bool Ok() const { return !error.has_value(); }
    size_t Size() const { return bytes.size(); }

    static ReadResult Success(std::vector<uint8_t> data) {
        ReadResult r;
        r.bytes = std::move(data);
        return r;
    }
    static ReadResult Failure(ReadError e) {
        ReadResult r;
        r.error = std::move(e);
        return r;
    }
};

struct FlagResult {
    bool value = false;
    std::optional<ReadError> error;

    bool Ok() const { return !error.has_value(); }
};

struct DirectoryResult {
    std::vector<std::string> entries;
    std::optional<ReadError> error;

    bool Ok() const { return !error.has_value(); }
};

}
