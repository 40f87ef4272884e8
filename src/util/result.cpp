#include "util/result.hpp"

namespace sysupdate {

const char* ToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::None:             return "ok";
        case ErrorCode::NotFound:         return "not found";
        case ErrorCode::BadResponse:      return "bad response";
        case ErrorCode::InvalidResponse:  return "invalid response";
        case ErrorCode::BadSignature:     return "bad signature";
        case ErrorCode::ExtractionFailed: return "extraction failed";
        case ErrorCode::VersionNotFound:  return "version not found";
        case ErrorCode::UnitNotFound:     return "unit not found";
        case ErrorCode::Transport:        return "transport error";
        case ErrorCode::FileCorrupt:      return "file corrupt";
        case ErrorCode::Database:         return "database error";
        case ErrorCode::Io:               return "i/o error";
        case ErrorCode::Config:           return "config error";
        case ErrorCode::Migration:        return "migration failed";
    }
    return "error";
}

} // namespace sysupdate
