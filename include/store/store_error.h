#pragma once

#include <optional>
#include <string>
#include <utility>

namespace layerstore {

enum class StoreErrorCode : int {
    kOk = 0,
    kUnqualifiedName = 1,
    kNotFound = 2,
    kCorrupt = 3,
    kIoError = 4,
    kInvalidName = 5,
    kInvalidDigest = 6,
};

inline const char* to_string(StoreErrorCode code) {
    switch (code) {
        case StoreErrorCode::kOk:
            return "OK";
        case StoreErrorCode::kUnqualifiedName:
            return "UNQUALIFIED_NAME";
        case StoreErrorCode::kNotFound:
            return "NOT_FOUND";
        case StoreErrorCode::kCorrupt:
            return "CORRUPT";
        case StoreErrorCode::kIoError:
            return "IO_ERROR";
        case StoreErrorCode::kInvalidName:
            return "INVALID_NAME";
        case StoreErrorCode::kInvalidDigest:
            return "INVALID_DIGEST";
    }
    return "UNKNOWN";
}

/// Result of store operations (generic template)
template<typename T>
struct StoreResult {
    StoreErrorCode error{StoreErrorCode::kOk};
    std::string error_message;
    std::optional<T> data;

    bool ok() const { return error == StoreErrorCode::kOk; }

    static StoreResult success(T value) {
        StoreResult r;
        r.data = std::move(value);
        return r;
    }

    static StoreResult failure(StoreErrorCode code, std::string message) {
        StoreResult r;
        r.error = code;
        r.error_message = std::move(message);
        return r;
    }
};

/// Specialization for void type (no data member)
template<>
struct StoreResult<void> {
    StoreErrorCode error{StoreErrorCode::kOk};
    std::string error_message;

    bool ok() const { return error == StoreErrorCode::kOk; }

    static StoreResult success() { return StoreResult{}; }

    static StoreResult failure(StoreErrorCode code, std::string message) {
        StoreResult r;
        r.error = code;
        r.error_message = std::move(message);
        return r;
    }
};

}  // namespace layerstore
