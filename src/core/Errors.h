#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace facilitator::core {

enum class ErrorCode {
    Authentication,
    RoomFull,
    RoomNotFound,
    AlreadyMember,
    NotMember,
    RoomAccess,
    Capacity,
    LinkNotFound,
    RetryLimit,
    NotRegistered,
    Protocol,
};

// Wire name of an error code ("room_full", "capacity", ...).
const char* error_code_name(ErrorCode code) noexcept;

class FacilitatorError : public std::runtime_error {
public:
    FacilitatorError(ErrorCode code, const std::string& what)
        : std::runtime_error(what), code_(code) {}

    ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

template <ErrorCode C>
class CodedError : public FacilitatorError {
public:
    explicit CodedError(const std::string& what) : FacilitatorError(C, what) {}
};

using AuthenticationError = CodedError<ErrorCode::Authentication>;
using RoomFullError       = CodedError<ErrorCode::RoomFull>;
using RoomNotFoundError   = CodedError<ErrorCode::RoomNotFound>;
using AlreadyMemberError  = CodedError<ErrorCode::AlreadyMember>;
using NotMemberError      = CodedError<ErrorCode::NotMember>;
using RoomAccessError     = CodedError<ErrorCode::RoomAccess>;
using CapacityError       = CodedError<ErrorCode::Capacity>;
using LinkNotFoundError   = CodedError<ErrorCode::LinkNotFound>;
using RetryLimitError     = CodedError<ErrorCode::RetryLimit>;
using NotRegisteredError  = CodedError<ErrorCode::NotRegistered>;
using ProtocolError       = CodedError<ErrorCode::Protocol>;

std::optional<ErrorCode> error_code_from_name(const std::string& name);

// Throws the typed error for `code`.
[[noreturn]] void throw_error(ErrorCode code, const std::string& what);

} // namespace facilitator::core
