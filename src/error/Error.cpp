#include "error/Error.hpp"

namespace fdx::error {

std::string to_string(const ErrorCode code) {
    switch (code) {
        case ErrorCode::EntryNotFound: return "EntryNotFound";
        case ErrorCode::CyclicParent: return "CyclicParent";
        case ErrorCode::UserNotFound: return "UserNotFound";
        case ErrorCode::UserExists: return "UserExists";
        case ErrorCode::InvalidCredentials: return "InvalidCredentials";
        case ErrorCode::SessionNotFound: return "SessionNotFound";
        case ErrorCode::SessionTooLong: return "SessionTooLong";
        case ErrorCode::SessionExpired: return "SessionExpired";
        case ErrorCode::NotAuthor: return "NotAuthor";
        case ErrorCode::PermissionDenied: return "PermissionDenied";
    }
    return "UnknownError";
}

}
