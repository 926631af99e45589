#include "core/types.hpp"

#include <ctime>
#include <iomanip>
#include <random>
#include <sstream>
#include <type_traits>

namespace blockstore {

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // anonymous namespace

Uuid Uuid::generate() {
    static thread_local std::random_device rd;
    static thread_local std::mt19937_64 gen(rd());
    static thread_local std::uniform_int_distribution<uint64_t> dist;

    Bytes bytes;
    for (size_t half = 0; half < 2; ++half) {
        uint64_t word = dist(gen);
        for (size_t i = 0; i < 8; ++i) {
            bytes[half * 8 + i] = static_cast<uint8_t>(word >> (i * 8));
        }
    }

    // Version 4 (random), RFC 4122 variant
    bytes[6] = (bytes[6] & 0x0F) | 0x40;
    bytes[8] = (bytes[8] & 0x3F) | 0x80;

    return Uuid(bytes);
}

std::optional<Uuid> Uuid::parse(std::string_view str) {
    Bytes bytes{};
    size_t nibble = 0;
    for (char c : str) {
        if (c == '-') continue;
        int v = hex_value(c);
        if (v < 0 || nibble >= BYTE_SIZE * 2) return std::nullopt;
        if (nibble % 2 == 0) {
            bytes[nibble / 2] = static_cast<uint8_t>(v << 4);
        } else {
            bytes[nibble / 2] |= static_cast<uint8_t>(v);
        }
        ++nibble;
    }
    if (nibble != BYTE_SIZE * 2) return std::nullopt;
    return Uuid(bytes);
}

std::string Uuid::to_string() const {
    static constexpr char DIGITS[] = "0123456789abcdef";
    std::string out;
    out.reserve(36);
    for (size_t i = 0; i < BYTE_SIZE; ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            out += '-';
        }
        out += DIGITS[bytes_[i] >> 4];
        out += DIGITS[bytes_[i] & 0x0F];
    }
    return out;
}

std::string Timestamp::to_iso_string() const {
    auto time_t = Clock::to_time_t(to_time_point());
    std::tm tm{};
    gmtime_r(&time_t, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    auto ms = ((millis_ % 1000) + 1000) % 1000;
    oss << '.' << std::setfill('0') << std::setw(3) << ms << 'Z';
    return oss.str();
}

static_assert(sizeof(Uuid) == 16, "Uuid should be 16 bytes");
static_assert(std::is_trivially_copyable_v<Uuid>, "Uuid should be trivially copyable");
static_assert(std::is_trivially_copyable_v<Timestamp>, "Timestamp should be trivially copyable");

} // namespace blockstore
