#include "core/Session.h"

#include <utility>

namespace facilitator::core {

namespace {

bool is_space(char c) noexcept {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

std::string trim_copy(std::string s) {
    std::size_t start = 0;
    while (start < s.size() && is_space(s[start])) ++start;

    std::size_t end = s.size();
    while (end > start && is_space(s[end - 1])) --end;

    if (start == 0 && end == s.size()) return s;
    return s.substr(start, end - start);
}

} // namespace

const char* to_string(SessionState state) noexcept {
    switch (state) {
        case SessionState::Connected:    return "connected";
        case SessionState::Disconnected: return "disconnected";
    }
    return "unknown";
}

std::string sanitize_name(std::string name) {
    name = trim_copy(std::move(name));

    if (name.size() > Session::kMaxNameLen) {
        name.resize(Session::kMaxNameLen);
        name = trim_copy(std::move(name));
    }

    if (name.empty()) name = "guest";
    return name;
}

} // namespace facilitator::core
