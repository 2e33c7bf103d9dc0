#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace fdx::error {

enum class ErrorCode : uint16_t {
    EntryNotFound = 0x0101,
    CyclicParent = 0x0102,

    UserNotFound = 0x0201,
    UserExists = 0x0202,
    InvalidCredentials = 0x0203,

    SessionNotFound = 0x0301,
    SessionTooLong = 0x0302,
    SessionExpired = 0x0303,

    NotAuthor = 0x0401,
    PermissionDenied = 0x0402
};

std::string to_string(ErrorCode code);

// Domain failures raised by the core. Infrastructure failures (pqxx, filesystem,
// object storage) are never wrapped in this type.
class Error : public std::runtime_error {
public:
    Error(const ErrorCode code, const std::string& detail)
        : std::runtime_error(to_string(code) + (detail.empty() ? "" : ": " + detail)), code_(code) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

#define FDX_DEFINE_ERROR(Name)                                                   \
    class Name final : public Error {                                            \
    public:                                                                      \
        explicit Name(const std::string& detail = {}) : Error(ErrorCode::Name, detail) {} \
    };

FDX_DEFINE_ERROR(EntryNotFound)
FDX_DEFINE_ERROR(CyclicParent)
FDX_DEFINE_ERROR(UserNotFound)
FDX_DEFINE_ERROR(UserExists)
FDX_DEFINE_ERROR(InvalidCredentials)
FDX_DEFINE_ERROR(SessionNotFound)
FDX_DEFINE_ERROR(SessionTooLong)
FDX_DEFINE_ERROR(SessionExpired)
FDX_DEFINE_ERROR(NotAuthor)
FDX_DEFINE_ERROR(PermissionDenied)

#undef FDX_DEFINE_ERROR

}
