#pragma once

#include "core/IDGenerator.hpp"

#include <chrono>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace facilitator::core {

enum class Visibility { Public, Private, Password };

const char* to_string(Visibility v) noexcept;
std::optional<Visibility> visibility_from_string(const std::string& s);

struct RoomConfig {
    std::string name;
    std::size_t capacity = 0;  // 0: directory default
    Visibility visibility = Visibility::Public;
    std::string password;
};

struct Room {
    using Clock = std::chrono::steady_clock;

    std::string room_id;
    std::string name;
    std::size_t capacity = 0;
    Visibility visibility = Visibility::Public;
    std::string password;

    std::vector<std::string> members;  // join order; front() is the host
    Clock::time_point created_at{};
    std::optional<Clock::time_point> empty_since;

    bool full() const noexcept { return members.size() >= capacity; }
    std::optional<std::string> host() const {
        if (members.empty()) return std::nullopt;
        return members.front();
    }
};

struct RoomFilter {
    std::string name;  // substring match, empty matches all
    bool has_space = false;
    bool include_private = false;
};

struct JoinCriteria {
    std::string name;  // substring match, empty matches all
};

struct LeaveResult {
    Room room;  // state after the leave
    std::optional<std::string> new_host;  // set when the host left and someone remains
};

struct RoomLimits {
    std::size_t default_capacity = 9;
    std::size_t max_capacity = 64;
    std::size_t max_rooms = 256;
    std::chrono::milliseconds empty_room_ttl{30000};
};

// Rooms and their membership. A session is a member of at most one room.
class RoomDirectory {
public:
    using Clock = Room::Clock;

    explicit RoomDirectory(RoomLimits limits);

    // Throws CapacityError when max_rooms exist.
    Room create_room(const RoomConfig& config, Clock::time_point now);

    // Throws RoomNotFoundError, AlreadyMemberError, RoomFullError or RoomAccessError.
    Room join_room(const std::string& session_id, const std::string& room_id,
                   const std::string& password = {});

    // Joins the oldest public room matching the criteria that has space.
    Room join_matching(const std::string& session_id, const JoinCriteria& criteria);

    // Throws NotMemberError when the session is in no room.
    LeaveResult leave_room(const std::string& session_id, Clock::time_point now);

    std::optional<std::string> room_of(const std::string& session_id) const;
    std::optional<Room> find(const std::string& room_id) const;
    std::vector<Room> list_rooms(const RoomFilter& filter) const;
    std::size_t size() const;

    // Destroys rooms that have been empty for longer than the grace TTL.
    std::vector<std::string> sweep_empty(Clock::time_point now);

private:
    Room& add_member_locked(Room& room, const std::string& session_id);

    const RoomLimits limits_;
    IDGenerator idgen_;

    mutable std::mutex mu_;
    std::unordered_map<std::string, Room> rooms_;
    std::unordered_map<std::string, std::string> member_of_;
};

} // namespace facilitator::core
