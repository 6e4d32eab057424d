#include "util/result.hpp"

#include <cerrno>

namespace ngdp {

ErrorKind ErrorKindOf(ErrorCode code) {
    switch (code) {
        case ErrorCode::None:
            return ErrorKind::None;
        case ErrorCode::Transport:
        case ErrorCode::Timeout:
        case ErrorCode::ServerError:
            return ErrorKind::Transient;
        case ErrorCode::ChecksumMismatch:
        case ErrorCode::KeyMismatch:
            return ErrorKind::DataIntegrity;
        case ErrorCode::MissingDecryptionKey:
            return ErrorKind::MissingKey;
        case ErrorCode::MalformedHeader:
        case ErrorCode::ChunkSizeMismatch:
        case ErrorCode::UnknownEncodingMode:
        case ErrorCode::DecompressFailed:
        case ErrorCode::IndexCorrupt:
        case ErrorCode::CorruptArchive:
            return ErrorKind::Corrupt;
        case ErrorCode::ResourceExhausted:
            return ErrorKind::ResourceExhausted;
        case ErrorCode::NotFound:
            return ErrorKind::NotFound;
        case ErrorCode::InvalidArgument:
        case ErrorCode::Io:
        case ErrorCode::Cancelled:
        case ErrorCode::HttpError:
        case ErrorCode::DuplicateKey:
            return ErrorKind::Usage;
    }
    return ErrorKind::Usage;
}

const char* ToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::None:                 return "None";
        case ErrorCode::InvalidArgument:      return "InvalidArgument";
        case ErrorCode::Io:                   return "Io";
        case ErrorCode::NotFound:             return "NotFound";
        case ErrorCode::Cancelled:            return "Cancelled";
        case ErrorCode::Transport:            return "Transport";
        case ErrorCode::Timeout:              return "Timeout";
        case ErrorCode::ServerError:          return "ServerError";
        case ErrorCode::HttpError:            return "HttpError";
        case ErrorCode::ChecksumMismatch:     return "ChecksumMismatch";
        case ErrorCode::KeyMismatch:          return "KeyMismatch";
        case ErrorCode::MissingDecryptionKey: return "MissingDecryptionKey";
        case ErrorCode::MalformedHeader:      return "MalformedHeader";
        case ErrorCode::ChunkSizeMismatch:    return "ChunkSizeMismatch";
        case ErrorCode::UnknownEncodingMode:  return "UnknownEncodingMode";
        case ErrorCode::DecompressFailed:     return "DecompressFailed";
        case ErrorCode::IndexCorrupt:         return "IndexCorrupt";
        case ErrorCode::CorruptArchive:       return "CorruptArchive";
        case ErrorCode::DuplicateKey:         return "DuplicateKey";
        case ErrorCode::ResourceExhausted:    return "ResourceExhausted";
    }
    return "Unknown";
}

const char* ToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:              return "None";
        case ErrorKind::Transient:         return "Transient";
        case ErrorKind::DataIntegrity:     return "DataIntegrity";
        case ErrorKind::MissingKey:        return "MissingKey";
        case ErrorKind::Corrupt:           return "Corrupt";
        case ErrorKind::ResourceExhausted: return "ResourceExhausted";
        case ErrorKind::NotFound:          return "NotFound";
        case ErrorKind::Usage:             return "Usage";
    }
    return "Unknown";
}

ErrorCode ErrnoToCode(int e) {
    switch (e) {
        case ENOSPC:
        case EDQUOT:
        case EMFILE:
        case ENFILE:
        case ENOMEM:
            return ErrorCode::ResourceExhausted;
        case ENOENT:
            return ErrorCode::NotFound;
        case EINVAL:
            return ErrorCode::InvalidArgument;
        default:
            return ErrorCode::Io;
    }
}

} // namespace ngdp
