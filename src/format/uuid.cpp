/**
 * @file uuid.cpp
 * @brief Uuid value implementation
 */

#include "typesys/format/identifier_types.h"
#include <iomanip>
#include <random>
#include <sstream>

namespace typesys {
namespace format {

namespace {

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // anonymous namespace

std::optional<Uuid> Uuid::fromString(const std::string& text) {
    if (text.length() != 36) {
        return std::nullopt;
    }

    std::array<uint8_t, 16> bytes{};
    size_t byteIndex = 0;
    for (size_t i = 0; i < text.length(); ) {
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            if (text[i] != '-') {
                return std::nullopt;
            }
            ++i;
            continue;
        }

        int high = hexValue(text[i]);
        int low = hexValue(text[i + 1]);
        if (high < 0 || low < 0) {
            return std::nullopt;
        }
        bytes[byteIndex++] = static_cast<uint8_t>((high << 4) | low);
        i += 2;
    }

    return Uuid(bytes);
}

Uuid Uuid::generateV4() {
    static thread_local std::mt19937_64 gen(std::random_device{}());
    std::uniform_int_distribution<uint64_t> dis;

    uint64_t ab = dis(gen);
    uint64_t cd = dis(gen);

    // Set version to 4 (random)
    ab = (ab & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    // Set variant to RFC 4122
    cd = (cd & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    std::array<uint8_t, 16> bytes{};
    for (int i = 0; i < 8; ++i) {
        bytes[i] = static_cast<uint8_t>(ab >> (56 - 8 * i));
        bytes[8 + i] = static_cast<uint8_t>(cd >> (56 - 8 * i));
    }
    return Uuid(bytes);
}

std::string Uuid::toString() const {
    std::ostringstream ss;
    ss << std::hex << std::setfill('0');

    for (size_t i = 0; i < bytes_.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            ss << '-';
        }
        ss << std::setw(2) << static_cast<int>(bytes_[i]);
    }

    return ss.str();
}

} // namespace format
} // namespace typesys
