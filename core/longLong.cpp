#include "longLong.hpp"
#include "../include/errors.hpp"

#include <string>
#include <charconv>

namespace ml::longlong {

Words encode(uint64_t value) {
    return Words {
        .low = static_cast<uint32_t>(value & 0xFFFFFFFFULL),
        .high = static_cast<uint32_t>(value >> 32)
    };
}

uint64_t decode(uint32_t low, uint32_t high) {
    return static_cast<uint64_t>(low) | (static_cast<uint64_t>(high) << 32);
}

uint64_t decode(std::string_view low, std::string_view high) {
    return decode(parse_word(low), parse_word(high));
}

uint32_t parse_word(std::string_view token) {
    int64_t value = 0;
    const char* first = token.data();
    const char* last = token.data() + token.size();

    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc() || ptr != last || token.empty()) {
        throw ProtocolError("Expected a 32-bit integer token but got '" + std::string(token) + "'");
    }

    // Бэкенд отдаёт младшее слово как знаковый int32
    if (value < INT32_MIN || value > static_cast<int64_t>(UINT32_MAX)) {
        throw ProtocolError("Integer token out of 32-bit range: " + std::string(token));
    }

    if (value < 0) {
        return static_cast<uint32_t>(static_cast<int32_t>(value));
    }
    return static_cast<uint32_t>(value);
}

} // namespace ml::longlong
