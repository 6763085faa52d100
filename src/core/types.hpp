#pragma once

#include <array>
#include <chrono>
#include <compare>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <optional>
#include <random>
#include <sstream>
#include <string>
#include <string_view>

namespace folio {

/**
 * Uuid - 128-bit identifier.
 *
 * Document and folder ids in the manuscript tree, and the foreign UUIDs
 * assigned to binder items on export.
 */
class Uuid {
public:
    static constexpr size_t BYTE_SIZE = 16;
    using Bytes = std::array<uint8_t, BYTE_SIZE>;

    constexpr Uuid() noexcept : bytes_{} {}

    explicit constexpr Uuid(Bytes bytes) noexcept : bytes_(bytes) {}

    /**
     * Generate a new random UUID (version 4).
     */
    [[nodiscard]] static Uuid generate() {
        static thread_local std::random_device rd;
        static thread_local std::mt19937_64 gen(rd());
        static thread_local std::uniform_int_distribution<uint64_t> dist;

        Bytes bytes;
        for (size_t half = 0; half < 2; ++half) {
            auto v = dist(gen);
            for (size_t i = 0; i < 8; ++i) {
                bytes[half * 8 + i] = static_cast<uint8_t>(v >> (i * 8));
            }
        }

        bytes[6] = (bytes[6] & 0x0F) | 0x40;
        bytes[8] = (bytes[8] & 0x3F) | 0x80;

        return Uuid(bytes);
    }

    /**
     * Parse hyphenated or bare hex, either case.
     */
    [[nodiscard]] static std::optional<Uuid> parse(std::string_view str) {
        auto nibble = [](char c) -> int {
            if (c >= '0' && c <= '9') return c - '0';
            if (c >= 'a' && c <= 'f') return c - 'a' + 10;
            if (c >= 'A' && c <= 'F') return c - 'A' + 10;
            return -1;
        };

        Bytes bytes{};
        size_t digits = 0;
        for (char c : str) {
            if (c == '-') continue;
            const int v = nibble(c);
            if (v < 0 || digits >= 32) return std::nullopt;
            if (digits % 2 == 0) {
                bytes[digits / 2] = static_cast<uint8_t>(v << 4);
            } else {
                bytes[digits / 2] |= static_cast<uint8_t>(v);
            }
            ++digits;
        }
        if (digits != 32) return std::nullopt;
        return Uuid(bytes);
    }

    /**
     * xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx, lowercase.
     */
    [[nodiscard]] std::string to_string() const {
        return format("0123456789abcdef");
    }

    /**
     * Uppercase form used by Scrivener in .scrivx files and Files/Data/.
     */
    [[nodiscard]] std::string to_upper_string() const {
        return format("0123456789ABCDEF");
    }

    [[nodiscard]] constexpr bool is_nil() const noexcept {
        for (auto b : bytes_) {
            if (b != 0) return false;
        }
        return true;
    }

    [[nodiscard]] constexpr const Bytes& bytes() const noexcept {
        return bytes_;
    }

    auto operator<=>(const Uuid&) const = default;
    bool operator==(const Uuid&) const = default;

private:
    [[nodiscard]] std::string format(const char* digits) const {
        std::string out;
        out.reserve(36);
        for (size_t i = 0; i < BYTE_SIZE; ++i) {
            if (i == 4 || i == 6 || i == 8 || i == 10) {
                out += '-';
            }
            out += digits[bytes_[i] >> 4];
            out += digits[bytes_[i] & 0x0F];
        }
        return out;
    }

    Bytes bytes_;
};

/**
 * Timestamp - milliseconds since the Unix epoch, UTC.
 */
class Timestamp {
public:
    using Duration = std::chrono::milliseconds;
    using Clock = std::chrono::system_clock;
    using TimePoint = std::chrono::time_point<Clock, Duration>;

    constexpr Timestamp() noexcept : millis_(0) {}

    explicit constexpr Timestamp(int64_t millis) noexcept : millis_(millis) {}

    explicit Timestamp(TimePoint tp) noexcept
        : millis_(std::chrono::duration_cast<Duration>(tp.time_since_epoch()).count()) {}

    [[nodiscard]] static Timestamp now() {
        return Timestamp(std::chrono::time_point_cast<Duration>(Clock::now()));
    }

    [[nodiscard]] constexpr int64_t millis() const noexcept {
        return millis_;
    }

    [[nodiscard]] TimePoint to_time_point() const noexcept {
        return TimePoint(Duration(millis_));
    }

    /**
     * Broken-down UTC time. Thread-safe, unlike std::gmtime.
     */
    [[nodiscard]] std::tm to_utc_tm() const noexcept {
        using namespace std::chrono;
        const auto tp = to_time_point();
        const auto day_point = floor<days>(tp);
        const year_month_day ymd{day_point};
        const hh_mm_ss hms{floor<seconds>(tp - day_point)};

        std::tm tm{};
        tm.tm_year = static_cast<int>(ymd.year()) - 1900;
        tm.tm_mon = static_cast<int>(static_cast<unsigned>(ymd.month())) - 1;
        tm.tm_mday = static_cast<int>(static_cast<unsigned>(ymd.day()));
        tm.tm_hour = static_cast<int>(hms.hours().count());
        tm.tm_min = static_cast<int>(hms.minutes().count());
        tm.tm_sec = static_cast<int>(hms.seconds().count());
        tm.tm_wday = static_cast<int>(weekday{day_point}.c_encoding());
        return tm;
    }

    /**
     * 2024-03-01T09:30:00Z
     */
    [[nodiscard]] std::string to_iso_string() const {
        const auto tm = to_utc_tm();
        std::ostringstream oss;
        oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << 'Z';
        return oss.str();
    }

    /**
     * 2024-03-01 09:30:00 +0000, the form Scrivener writes into .scrivx.
     */
    [[nodiscard]] std::string to_scrivener_string() const {
        const auto tm = to_utc_tm();
        std::ostringstream oss;
        oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << " +0000";
        return oss.str();
    }

    auto operator<=>(const Timestamp&) const = default;
    bool operator==(const Timestamp&) const = default;

    Timestamp operator+(Duration d) const {
        return Timestamp(millis_ + d.count());
    }

    Duration operator-(const Timestamp& other) const {
        return Duration(millis_ - other.millis_);
    }

private:
    int64_t millis_;
};

} // namespace folio

namespace std {
    template<>
    struct hash<folio::Uuid> {
        size_t operator()(const folio::Uuid& uuid) const noexcept {
            const auto& bytes = uuid.bytes();
            size_t h = 0;
            for (size_t i = 0; i < bytes.size(); i += sizeof(size_t)) {
                size_t chunk = 0;
                for (size_t j = 0; j < sizeof(size_t) && i + j < bytes.size(); ++j) {
                    chunk |= static_cast<size_t>(bytes[i + j]) << (j * 8);
                }
                h ^= chunk + 0x9e3779b9 + (h << 6) + (h >> 2);
            }
            return h;
        }
    };
}
