#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <random>
#include <string>

namespace facilitator::core {

// Prefixed ULIDs: "<prefix>-<26 Crockford base32 chars>".
// Monotonic within a millisecond, so ids from one generator sort by creation
// order. Session ids are compared lexicographically for the punch tie-break.
class IDGenerator {
public:
    enum class Kind { Session, Room, Link };

    IDGenerator() : rng_(seed()) {}

    std::string make(Kind kind) {
        return std::string(prefix_of(kind)) + "-" + next_ulid();
    }

    std::string sessionID() { return make(Kind::Session); }
    std::string roomID()    { return make(Kind::Room); }
    std::string linkID()    { return make(Kind::Link); }

private:
    static const char* prefix_of(Kind kind) {
        switch (kind) {
            case Kind::Session: return "session";
            case Kind::Room:    return "room";
            case Kind::Link:    return "link";
        }
        return "id";
    }

    std::string next_ulid() {
        const std::uint64_t ts = now_ms() & 0xFFFFFFFFFFFFull;

        std::lock_guard<std::mutex> lk(mu_);
        if (ts != last_ts_) {
            last_ts_ = ts;
            rand_hi_ = static_cast<std::uint16_t>(rng_() >> 48);
            rand_lo_ = rng_();
        } else if (++rand_lo_ == 0) {
            ++rand_hi_;
        }

        std::string out;
        out.reserve(26);
        append_base32(out, ts, 10);                                        // 48-bit time, top 2 bits zero
        append_base32(out, (std::uint64_t(rand_hi_) << 24) | (rand_lo_ >> 40), 8); // next 40 bits
        append_base32(out, rand_lo_ & 0xFFFFFFFFFFull, 8);                   // last 40 bits
        return out;
    }

    // Writes the low 5*chars bits of v, most significant group first.
    static void append_base32(std::string& out, std::uint64_t v, int chars) {
        static constexpr char alphabet[] = "0123456789ABCDEFGHJKMNPQRSTVWXYZ";
        for (int i = chars - 1; i >= 0; --i) {
            out.push_back(alphabet[(v >> (5 * i)) & 0x1F]);
        }
    }

    static std::uint64_t now_ms() {
        using namespace std::chrono;
        return static_cast<std::uint64_t>(
            duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
    }

    static std::mt19937_64 seed() {
        std::random_device rd;
        std::seed_seq seq{rd(), rd(), rd(), rd(),
                          static_cast<unsigned>(std::chrono::steady_clock::now().time_since_epoch().count())};
        return std::mt19937_64(seq);
    }

    std::mt19937_64 rng_;
    std::mutex mu_;
    std::uint64_t last_ts_ = 0;
    std::uint16_t rand_hi_ = 0;
    std::uint64_t rand_lo_ = 0;
};

} // namespace facilitator::core
