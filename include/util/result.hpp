#pragma once
#include <string>
#include <utility>

namespace ngdp {

enum class ErrorCode : int {
    None = 0,
    InvalidArgument,
    Io,
    NotFound,
    Cancelled,

    // network
    Transport,
    Timeout,
    ServerError,
    HttpError,

    // integrity
    ChecksumMismatch,
    KeyMismatch,

    MissingDecryptionKey,

    // structure
    MalformedHeader,
    ChunkSizeMismatch,
    UnknownEncodingMode,
    DecompressFailed,
    IndexCorrupt,
    CorruptArchive,

    DuplicateKey,
    ResourceExhausted,
};

enum class ErrorKind : int {
    None,
    Transient,
    DataIntegrity,
    MissingKey,
    Corrupt,
    ResourceExhausted,
    NotFound,
    Usage,
};

ErrorKind ErrorKindOf(ErrorCode code);
const char* ToString(ErrorCode code);
const char* ToString(ErrorKind kind);

// Maps an errno value to the closest code. ENOSPC/EMFILE and friends are
// ResourceExhausted, everything unknown is Io.
ErrorCode ErrnoToCode(int e);

struct Result {
    bool ok{true};
    ErrorCode code{ErrorCode::None};
    int err{0};
    std::string msg;

    bool is_ok() const { return ok; }
    const std::string& message() const { return msg; }
    ErrorKind kind() const { return ErrorKindOf(code); }

    static Result Ok() { return {}; }
    static Result Fail(int e, std::string m) {
        return {.ok = false, .code = ErrnoToCode(e), .err = e, .msg = std::move(m)};
    }
    static Result Fail(ErrorCode c, std::string m, int e = 0) {
        return {.ok = false, .code = c, .err = e, .msg = std::move(m)};
    }
};

} // namespace ngdp
