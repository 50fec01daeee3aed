#include "core/Errors.h"

#include <initializer_list>

namespace facilitator::core {

const char* error_code_name(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Authentication: return "auth";
        case ErrorCode::RoomFull:       return "room_full";
        case ErrorCode::RoomNotFound:   return "room_not_found";
        case ErrorCode::AlreadyMember:  return "already_member";
        case ErrorCode::NotMember:      return "not_member";
        case ErrorCode::RoomAccess:     return "access_denied";
        case ErrorCode::Capacity:       return "capacity";
        case ErrorCode::LinkNotFound:   return "link_not_found";
        case ErrorCode::RetryLimit:     return "retry_limit";
        case ErrorCode::NotRegistered:  return "not_registered";
        case ErrorCode::Protocol:       return "protocol";
    }
    return "unknown";
}

std::optional<ErrorCode> error_code_from_name(const std::string& name) {
    for (auto code : {ErrorCode::Authentication, ErrorCode::RoomFull, ErrorCode::RoomNotFound,
                      ErrorCode::AlreadyMember, ErrorCode::NotMember, ErrorCode::RoomAccess,
                      ErrorCode::Capacity, ErrorCode::LinkNotFound, ErrorCode::RetryLimit,
                      ErrorCode::NotRegistered, ErrorCode::Protocol}) {
        if (name == error_code_name(code)) return code;
    }
    return std::nullopt;
}

void throw_error(ErrorCode code, const std::string& what) {
    switch (code) {
        case ErrorCode::Authentication: throw AuthenticationError(what);
        case ErrorCode::RoomFull:       throw RoomFullError(what);
        case ErrorCode::RoomNotFound:   throw RoomNotFoundError(what);
        case ErrorCode::AlreadyMember:  throw AlreadyMemberError(what);
        case ErrorCode::NotMember:      throw NotMemberError(what);
        case ErrorCode::RoomAccess:     throw RoomAccessError(what);
        case ErrorCode::Capacity:       throw CapacityError(what);
        case ErrorCode::LinkNotFound:   throw LinkNotFoundError(what);
        case ErrorCode::RetryLimit:     throw RetryLimitError(what);
        case ErrorCode::NotRegistered:  throw NotRegisteredError(what);
        case ErrorCode::Protocol:       throw ProtocolError(what);
    }
    throw FacilitatorError(code, what);
}

} // namespace facilitator::core
