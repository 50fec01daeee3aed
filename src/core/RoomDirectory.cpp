#include "core/RoomDirectory.h"

#include "core/Errors.h"

#include <algorithm>
#include <utility>

namespace facilitator::core {

const char* to_string(Visibility v) noexcept {
    switch (v) {
        case Visibility::Public:   return "public";
        case Visibility::Private:  return "private";
        case Visibility::Password: return "password";
    }
    return "public";
}

std::optional<Visibility> visibility_from_string(const std::string& s) {
    if (s == "public")   return Visibility::Public;
    if (s == "private")  return Visibility::Private;
    if (s == "password") return Visibility::Password;
    return std::nullopt;
}

RoomDirectory::RoomDirectory(RoomLimits limits)
    : limits_(limits) {}

Room RoomDirectory::create_room(const RoomConfig& config, Clock::time_point now) {
    Room room;
    room.room_id = idgen_.roomID();
    room.name = config.name.empty() ? room.room_id : config.name;
    room.capacity = config.capacity == 0 ? limits_.default_capacity
                                         : std::min(config.capacity, limits_.max_capacity);
    room.visibility = config.visibility;
    if (room.visibility == Visibility::Password) room.password = config.password;
    room.created_at = now;
    room.empty_since = now;

    std::lock_guard<std::mutex> lk(mu_);
    if (rooms_.size() >= limits_.max_rooms) throw CapacityError("room limit reached");
    return rooms_.emplace(room.room_id, std::move(room)).first->second;
}

Room& RoomDirectory::add_member_locked(Room& room, const std::string& session_id) {
    room.members.push_back(session_id);
    room.empty_since.reset();
    member_of_[session_id] = room.room_id;
    return room;
}

Room RoomDirectory::join_room(const std::string& session_id, const std::string& room_id,
                              const std::string& password) {
    std::lock_guard<std::mutex> lk(mu_);

    auto it = rooms_.find(room_id);
    if (it == rooms_.end()) throw RoomNotFoundError("room " + room_id + " not found");

    auto current = member_of_.find(session_id);
    if (current != member_of_.end()) {
        throw AlreadyMemberError("already a member of " + current->second);
    }

    auto& room = it->second;
    if (room.full()) throw RoomFullError("room " + room_id + " is full");
    if (room.visibility == Visibility::Password && password != room.password) {
        throw RoomAccessError("wrong password for room " + room_id);
    }
    return add_member_locked(room, session_id);
}

Room RoomDirectory::join_matching(const std::string& session_id, const JoinCriteria& criteria) {
    std::lock_guard<std::mutex> lk(mu_);

    auto current = member_of_.find(session_id);
    if (current != member_of_.end()) {
        throw AlreadyMemberError("already a member of " + current->second);
    }

    Room* best = nullptr;
    for (auto& [id, room] : rooms_) {
        if (room.visibility != Visibility::Public || room.full()) continue;
        if (room.name.find(criteria.name) == std::string::npos) continue;
        if (!best || room.created_at < best->created_at ||
            (room.created_at == best->created_at && room.room_id < best->room_id)) {
            best = &room;
        }
    }
    if (!best) throw RoomNotFoundError("no room matches");
    return add_member_locked(*best, session_id);
}

LeaveResult RoomDirectory::leave_room(const std::string& session_id, Clock::time_point now) {
    std::lock_guard<std::mutex> lk(mu_);

    auto current = member_of_.find(session_id);
    if (current == member_of_.end()) throw NotMemberError("not a member of any room");

    auto& room = rooms_.at(current->second);
    member_of_.erase(current);

    const bool was_host = !room.members.empty() && room.members.front() == session_id;
    room.members.erase(std::remove(room.members.begin(), room.members.end(), session_id),
                       room.members.end());

    LeaveResult result;
    if (room.members.empty()) {
        room.empty_since = now;
    } else if (was_host) {
        result.new_host = room.members.front();
    }
    result.room = room;
    return result;
}

std::optional<std::string> RoomDirectory::room_of(const std::string& session_id) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = member_of_.find(session_id);
    if (it == member_of_.end()) return std::nullopt;
    return it->second;
}

std::optional<Room> RoomDirectory::find(const std::string& room_id) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = rooms_.find(room_id);
    if (it == rooms_.end()) return std::nullopt;
    return it->second;
}

std::vector<Room> RoomDirectory::list_rooms(const RoomFilter& filter) const {
    std::vector<Room> out;
    {
        std::lock_guard<std::mutex> lk(mu_);
        for (const auto& [id, room] : rooms_) {
            if (room.visibility == Visibility::Private && !filter.include_private) continue;
            if (filter.has_space && room.full()) continue;
            if (room.name.find(filter.name) == std::string::npos) continue;
            out.push_back(room);
        }
    }
    std::sort(out.begin(), out.end(), [](const Room& a, const Room& b) {
        if (a.created_at != b.created_at) return a.created_at < b.created_at;
        return a.room_id < b.room_id;
    });
    return out;
}

std::size_t RoomDirectory::size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return rooms_.size();
}

std::vector<std::string> RoomDirectory::sweep_empty(Clock::time_point now) {
    std::vector<std::string> destroyed;

    std::lock_guard<std::mutex> lk(mu_);
    for (auto it = rooms_.begin(); it != rooms_.end();) {
        const auto& room = it->second;
        if (room.members.empty() && room.empty_since &&
            now - *room.empty_since >= limits_.empty_room_ttl) {
            destroyed.push_back(it->first);
            it = rooms_.erase(it);
        } else {
            ++it;
        }
    }
    return destroyed;
}

} // namespace facilitator::core
