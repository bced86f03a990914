#include "domain.hpp"
#include "errors.hpp"
#include "../core/longLong.hpp"

#include <cctype>
#include <charconv>
#include <fmt/chrono.h>
#include <fmt/format.h>

namespace ml {

Program::Program(Tokens fields, double frame_rate)
    : fields_(std::move(fields)), frame_rate_(frame_rate) {}

std::string Program::field(size_t index) const {
    return index < fields_.size() ? fields_[index] : std::string();
}

long long Program::int_field(size_t index, long long fallback) const {
    if (index >= fields_.size()) {
        return fallback;
    }
    const std::string& s = fields_[index];
    long long value = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc() || ptr != s.data() + s.size()) {
        return fallback;
    }
    return value;
}

std::string Program::bare_filename() const {
    std::string name = filename();
    auto slash = name.rfind('/');
    return slash == std::string::npos ? name : name.substr(slash + 1);
}

std::time_t Program::start_time() const {
    return static_cast<std::time_t>(int_field(START_TIME, 0));
}

std::time_t Program::end_time() const {
    return static_cast<std::time_t>(int_field(END_TIME, 0));
}

uint64_t Program::file_size() const {
    if (fields_.size() <= FILESIZE_LOW) {
        return 0;
    }
    return longlong::decode(fields_[FILESIZE_LOW], fields_[FILESIZE_HIGH]);
}

int Program::recording_status() const {
    return static_cast<int>(int_field(REC_STATUS, REC_STATUS_UNKNOWN));
}

namespace upcoming {

StatusFilter scheduled() {
    return { REC_STATUS_WILL_RECORD, REC_STATUS_RECORDING };
}

StatusFilter conflicts() {
    return { REC_STATUS_CONFLICT };
}

StatusFilter all() {
    StatusFilter filter;
    for (int s = REC_STATUS_DELETED; s <= REC_STATUS_OTHER_SHOWING; ++s) {
        filter.push_back(s);
    }
    return filter;
}

} // namespace upcoming

double frames_to_seconds(uint64_t frames, double fps) {
    if (fps <= 0.0) {
        throw ClientError(fmt::format("Invalid frame rate: {}", fps));
    }
    return static_cast<double>(frames) / fps;
}

bool is_ok(const Tokens& reply) {
    if (reply.empty() || reply[0].size() != 2) {
        return false;
    }
    const std::string& t = reply[0];
    return std::toupper(static_cast<unsigned char>(t[0])) == 'O'
        && std::toupper(static_cast<unsigned char>(t[1])) == 'K';
}

std::string create_chain_id(const std::string& hostname, std::time_t now) {
    return fmt::format("live-{}-{:%Y-%m-%dT%H:%M:%S}", hostname, fmt::localtime(now));
}

} // namespace ml
