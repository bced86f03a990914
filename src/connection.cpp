#include "connection.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "signals.hpp"
#include "../core/longLong.hpp"
#include "../core/fileTransfer.hpp"
#include "../core/messageChannel.hpp"
#include "../sdk/cpp/stream.hpp"
#include "../sdk/cpp/database.hpp"

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <charconv>
#include <algorithm>
#include <fmt/format.h>
#include <fmt/ranges.h>

namespace ml {

namespace {

// Смещение кадра миниатюры от начала записи, секунды
constexpr uint64_t kThumbnailOffset = 180;
constexpr int kThumbnailWidth = 640;
constexpr int kThumbnailHeight = 360;

// Поля записи, которые QUERY_GENPIXMAP и QUERY_PIXMAP_LASTMODIFIED ожидают
// очищенными. Набор тот же, что отправляет mythweb.
constexpr std::pair<size_t, const char*> kBlankedFields[] = {
    { 0, " " },  { 1, " " },  { 2, " " },  { 3, " " },
    { 5, " " },  { 6, " " },  { 7, " " },
    { 9, "0" },  { 10, "0" },
    { 13, "0" }, { 14, "1" }, { 15, "0" },
    { 17, "-1" }, { 18, "-1" }, { 19, "-1" },
    { 20, " " }, { 21, " " }, { 22, " " }, { 23, " " },
    { 24, "15" }, { 25, "6" },
    { 28, " " }, { 29, " " }, { 30, " " }, { 31, " " }, { 32, " " },
    { 36, "0" }, { 38, "0" }, { 39, "0" }, { 40, "0" }, { 41, "0" }
};
constexpr size_t kBlankedMinSize = 42;

std::string describe(const Tokens& reply) {
    return fmt::format("[{}]", fmt::join(reply, ", "));
}

std::optional<long long> to_integer(std::string_view token) {
    long long value = 0;
    auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), value);
    if (token.empty() || ec != std::errc() || ptr != token.data() + token.size()) {
        return std::nullopt;
    }
    return value;
}

void require_tokens(const Tokens& reply, size_t count, std::string_view command) {
    if (reply.size() < count) {
        throw ProtocolError(fmt::format("{}: expected at least {} tokens, got {}",
                                        command, count, describe(reply)));
    }
}

long long parse_integer(const Tokens& reply, size_t index, std::string_view command) {
    require_tokens(reply, index + 1, command);
    auto value = to_integer(reply[index]);
    if (!value) {
        throw ProtocolError(fmt::format("{}: '{}' is not a number", command, reply[index]));
    }
    return *value;
}

size_t parse_count(const Tokens& reply, size_t index, std::string_view command) {
    long long count = parse_integer(reply, index, command);
    if (count < 0) {
        throw ProtocolError(fmt::format("{}: negative record count {}", command, count));
    }
    return static_cast<size_t>(count);
}

double parse_double(const std::string& token, std::string_view command) {
    char* end = nullptr;
    double value = std::strtod(token.c_str(), &end);
    if (token.empty() || end != token.c_str() + token.size()) {
        throw ProtocolError(fmt::format("{}: '{}' is not a number", command, token));
    }
    return value;
}

std::string to_upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

std::string recorder(const Tuner& tuner) {
    return fmt::format("QUERY_RECORDER {}", tuner.tuner_id);
}

Tokens blank_program(const Program& program) {
    if (program.size() < kBlankedMinSize) {
        throw ClientError(fmt::format("Program record has {} fields, at least {} required",
                                      program.size(), kBlankedMinSize));
    }
    Tokens fields = program.data();
    for (const auto& [index, value] : kBlankedFields) {
        fields[index] = value;
    }
    return fields;
}

bool is_busy(int state) {
    return state == TV_STATE_WATCHING_LIVETV
        || state == TV_STATE_RECORDING_ONLY
        || state == TV_STATE_WATCHING_PRERECORDED
        || state == TV_STATE_WATCHING_RECORDING;
}

ConnectionContext validated(ConnectionContext context) {
    if (!context.config) {
        throw ClientError("ConnectionContext: config is required");
    }
    if (!context.connector) {
        throw ClientError("ConnectionContext: connector is required");
    }
    if (!context.registry) {
        throw ClientError("ConnectionContext: protocol registry is required");
    }
    if (!context.versions) {
        throw ClientError("ConnectionContext: version cache is required");
    }
    return context;
}

} // namespace

Connection::Connection(ConnectionContext context)
    : context_(validated(std::move(context))),
      negotiator_(*context_.registry, *context_.versions,
                  context_.config->get_or<int>("mythtv.init_version", MLINK_INIT_PROTOCOL_VERSION)),
      host_(context_.config->backend_host()),
      port_(context_.config->backend_port()),
      client_host_(context_.config->client_hostname()) {
    cmd_ = connect(Announce::Playback);
    LOG_INFO("Connected to backend {}:{} as {} (protocol {})",
             host_, port_, client_host_, protocol_->version());
}

Connection::~Connection() {
    close();
}

std::unique_ptr<MessageChannel> Connection::connect(Announce announce, const std::string& target_host) {
    if (announce != Announce::None && announce != Announce::Playback && announce != Announce::Monitor) {
        throw ClientError(fmt::format("Unsupported announce command: {}", static_cast<int>(announce)));
    }

    const std::string& host = target_host.empty() ? host_ : target_host;
    int version = server_version();

    auto channel = std::make_unique<MessageChannel>(context_.connector->open(host, port_));

    // Версию протокола нужно отправлять на каждом новом сокете
    int server = negotiator_.negotiate(*channel, version);
    const Protocol& protocol = negotiator_.resolve(server);
    if (!protocol_) {
        protocol_ = &protocol;
    }

    this->announce(*channel, announce);
    return channel;
}

int Connection::server_version() {
    if (auto cached = context_.versions->get()) {
        return *cached;
    }
    MessageChannel probe(context_.connector->open(host_, port_));
    return negotiator_.server_version(probe);
}

void Connection::announce(MessageChannel& channel, Announce announce) {
    const char* mode = nullptr;
    switch (announce) {
        case Announce::None:
            return;
        case Announce::Playback:
            mode = "Playback";
            break;
        case Announce::Monitor:
            mode = "Monitor";
            break;
    }

    Tokens reply = channel.request({ fmt::format("ANN {} {} 0", mode, client_host_) });
    if (!is_ok(reply)) {
        throw ServerError(fmt::format("Backend {} refused: {}", to_upper(mode), describe(reply)));
    }
}

void Connection::close() {
    if (!cmd_) {
        return;
    }
    say_goodbye(*cmd_);
    cmd_.reset();
    LOG_DEBUG("Connection to {}:{} closed", host_, port_);
}

void Connection::say_goodbye(MessageChannel& channel) {
    if (!channel.is_open()) {
        return;
    }
    try {
        channel.send({ "DONE" });
    } catch (const TransportError& e) {
        LOG_WARN("Cannot say DONE to {}: {}", channel.peer(), e.what());
    }
    channel.close();
}

bool Connection::is_open() const {
    return cmd_ && cmd_->is_open();
}

MessageChannel& Connection::command_channel() {
    if (!cmd_) {
        throw ClientError(fmt::format("Connection to {}:{} is closed", host_, port_));
    }
    return *cmd_;
}

Tokens Connection::request(const Tokens& tokens) {
    return command_channel().request(tokens);
}

bool Connection::is_master(const std::string& backend_host) const {
    return backend_host.empty() || backend_host == host_;
}

Tokens Connection::request_on_host(const std::string& backend_host, const Tokens& tokens) {
    if (is_master(backend_host)) {
        return request(tokens);
    }

    LOG_DEBUG("Backend {} is a slave, opening a new connection", backend_host);
    auto channel = connect(Announce::Playback, backend_host);
    Tokens reply = channel->request(tokens);
    say_goodbye(*channel);
    return reply;
}

IDatabase& Connection::database() {
    if (!context_.database) {
        throw ClientError("No database configured for this connection");
    }
    return *context_.database;
}

void Connection::publish(const Event& event) {
    if (context_.bus) {
        context_.bus->publish(event);
    }
}

// ---------------------------------------------------------------------------
// Тюнеры

int Connection::get_tuner_status(const Tuner& tuner) {
    Tokens reply = request({ fmt::format("QUERY_REMOTEENCODER {}", tuner.tuner_id), "GET_STATE" });
    return static_cast<int>(parse_integer(reply, 0, "GET_STATE"));
}

uint64_t Connection::get_frames_written(const Tuner& tuner) {
    Tokens reply = request({ recorder(tuner), "GET_FRAMES_WRITTEN" });
    require_tokens(reply, 2, "GET_FRAMES_WRITTEN");
    return longlong::decode(reply[1], reply[0]);
}

uint64_t Connection::get_tuner_file_position(const Tuner& tuner) {
    Tokens reply = request({ recorder(tuner), "GET_FILE_POSITION" });
    require_tokens(reply, 2, "GET_FILE_POSITION");
    return longlong::decode(reply[1], reply[0]);
}

double Connection::get_tuner_frame_rate(const Tuner& tuner) {
    Tokens reply = request({ recorder(tuner), "GET_FRAMERATE" });
    require_tokens(reply, 1, "GET_FRAMERATE");
    return parse_double(reply[0], "GET_FRAMERATE");
}

Program Connection::get_current_recording(const Tuner& tuner) {
    return Program(request({ recorder(tuner), "GET_CURRENT_RECORDING" }));
}

int Connection::get_tuner_showing(const std::string& title) {
    LOG_TRACE_ENTER_ARGS("title: {}", title);

    for (const Tuner& tuner : database().get_tuners()) {
        int state = get_tuner_status(tuner);

        if (is_busy(state)) {
            if (get_current_recording(tuner).title() == title) {
                return tuner.tuner_id;
            }
            continue;
        }

        if (state == TV_STATE_ERROR) {
            LOG_WARN("QUERY_REMOTEENCODER {} GET_STATE = Error", tuner.tuner_id);
        }
        // Тюнеры занимаются по порядку: после свободного занятых нет
        break;
    }
    return -1;
}

bool Connection::is_tuner_recording(const Tuner& tuner) {
    Tokens reply = request_on_host(tuner.hostname, { recorder(tuner), "IS_RECORDING" });
    require_tokens(reply, 1, "IS_RECORDING");
    return reply[0] == "1";
}

int Connection::get_num_free_tuners() {
    Tokens reply = request({ "GET_FREE_RECORDER_COUNT" });
    return static_cast<int>(parse_integer(reply, 0, "GET_FREE_RECORDER_COUNT"));
}

FreeTuner Connection::get_free_tuner() {
    Tokens reply = request({ "GET_FREE_RECORDER" });
    require_tokens(reply, 1, "GET_FREE_RECORDER");
    if (reply[0] == "-1") {
        return FreeTuner{ -1, "", -1 };
    }
    return FreeTuner{
        .tuner_id = static_cast<int>(parse_integer(reply, 0, "GET_FREE_RECORDER")),
        .host = reply.size() > 1 ? reply[1] : std::string(),
        .port = static_cast<int>(parse_integer(reply, 2, "GET_FREE_RECORDER"))
    };
}

std::optional<FreeTuner> Connection::get_next_free_tuner(int after_tuner_id) {
    Tokens reply = request({ "GET_NEXT_FREE_RECORDER", std::to_string(after_tuner_id) });
    int tuner_id = static_cast<int>(parse_integer(reply, 0, "GET_NEXT_FREE_RECORDER"));
    if (tuner_id == -1) {
        return std::nullopt;
    }
    return FreeTuner{
        .tuner_id = tuner_id,
        .host = reply.size() > 1 ? reply[1] : std::string(),
        .port = static_cast<int>(parse_integer(reply, 2, "GET_NEXT_FREE_RECORDER"))
    };
}

// ---------------------------------------------------------------------------
// Live TV

std::string Connection::spawn_live_tv(const Tuner& tuner, const std::string& channel_number) {
    std::string chain_id = create_chain_id(client_host_, std::time(nullptr));

    // pip = 0
    Tokens reply = request({ recorder(tuner), "SPAWN_LIVETV", chain_id, "0", channel_number });
    LOG_DEBUG("spawn_live_tv reply = {}", describe(reply));
    if (!is_ok(reply)) {
        throw ServerError(fmt::format("Error spawning live tv on tuner {} with reply {}",
                                      tuner.tuner_id, describe(reply)));
    }
    return chain_id;
}

void Connection::stop_live_tv(const Tuner& tuner) {
    Tokens reply = request({ recorder(tuner), "STOP_LIVETV" });
    LOG_DEBUG("stop_live_tv reply = {}", describe(reply));
    if (!is_ok(reply)) {
        throw ServerError(fmt::format("Error stopping live tv on tuner {} with reply {}",
                                      tuner.tuner_id, describe(reply)));
    }
}

// ---------------------------------------------------------------------------
// Записи

int Connection::delete_recording(const Program& program) {
    Tokens command = program.data();
    command.insert(command.begin(), "DELETE_RECORDING");
    command.emplace_back("0");

    Tokens reply = request(command);
    auto rc = reply.empty() ? std::nullopt : to_integer(reply[0]);
    if (!rc) {
        throw ServerError(reply.empty() ? std::string("Empty DELETE_RECORDING reply") : reply[0]);
    }

    LOG_DEBUG("Deleted recording {} with response {}", program.title(), *rc);
    publish(RecordingDeleted{ program });
    return static_cast<int>(*rc);
}

int Connection::rerecord_recording(const Program& program) {
    int rc = delete_recording(program);

    Tokens command = program.data();
    command.insert(command.begin(), "FORGET_RECORDING");
    command.emplace_back("0");

    Tokens reply = request(command);
    auto forgotten = reply.empty() ? std::nullopt : to_integer(reply[0]);
    if (!forgotten) {
        throw ServerError(reply.empty() ? std::string("Empty FORGET_RECORDING reply") : reply[0]);
    }

    LOG_DEBUG("Allowed re-record of {} with response {}", program.title(), *forgotten);
    return rc;
}

std::vector<Program> Connection::parse_records(const Tokens& reply, size_t offset, size_t count) const {
    const size_t record_size = protocol_->record_size();
    const size_t available = reply.size() > offset ? reply.size() - offset : 0;
    // Делением: count * record_size может переполниться при мусорном count
    if (count > available / record_size) {
        throw ProtocolError(fmt::format(
            "Expected {} records of {} tokens but reply carries only {} tokens",
            count, record_size, available), protocol_->version());
    }

    std::vector<Program> programs;
    programs.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        auto first = reply.begin() + static_cast<std::ptrdiff_t>(offset + i * record_size);
        programs.emplace_back(Tokens(first, first + static_cast<std::ptrdiff_t>(record_size)));
    }
    return programs;
}

std::vector<Program> Connection::query_recordings() {
    Tokens reply = request({ "QUERY_RECORDINGS Play" });
    size_t count = parse_count(reply, 0, "QUERY_RECORDINGS");
    return parse_records(reply, 1, count);
}

std::vector<Program> Connection::get_all_recordings() {
    std::vector<Program> programs = query_recordings();

    std::erase_if(programs, [](const Program& p) { return p.recording_group() == "LiveTV"; });
    std::stable_sort(programs.begin(), programs.end(), [](const Program& a, const Program& b) {
        return a.start_time() > b.start_time();
    });
    return programs;
}

std::vector<Program> Connection::get_recordings(const std::string& group, const std::string& title) {
    const std::string wanted_group = to_upper(group);
    const std::string wanted_title = to_upper(title);

    std::vector<Program> programs = query_recordings();
    std::erase_if(programs, [&](const Program& p) {
        bool group_matches = wanted_group == "ALL GROUPS" || wanted_group == to_upper(p.recording_group());
        bool title_matches = wanted_title == "ALL SHOWS" || wanted_title == to_upper(p.title());
        return !(group_matches && title_matches);
    });
    return programs;
}

std::optional<Program> Connection::get_recording(int channel_id, const std::string& start_ts) {
    Tokens reply = request({ fmt::format("QUERY_RECORDING TIMESLOT {} {}", channel_id, start_ts) });
    if (!is_ok(reply)) {
        LOG_DEBUG("Program not found on channel {} at {}", channel_id, start_ts);
        return std::nullopt;
    }
    return Program(Tokens(reply.begin() + 1, reply.end()));
}

std::vector<Program> Connection::get_scheduled_recordings() {
    Tokens reply = request({ "QUERY_GETALLSCHEDULED" });
    size_t count = parse_count(reply, 0, "QUERY_GETALLSCHEDULED");
    return parse_records(reply, 1, count);
}

std::vector<Program> Connection::get_upcoming_recordings(const StatusFilter& filter) {
    Tokens reply = request({ "QUERY_GETALLPENDING", "2" });
    size_t count = parse_count(reply, 1, "QUERY_GETALLPENDING");

    std::vector<Program> programs = parse_records(reply, 2, count);
    std::erase_if(programs, [&filter](const Program& p) {
        return std::find(filter.begin(), filter.end(), p.recording_status()) == filter.end();
    });
    return programs;
}

// ---------------------------------------------------------------------------
// Закладки и рекламные паузы

uint64_t Connection::get_bookmark(const Program& program) {
    Tokens reply = request({ fmt::format("QUERY_BOOKMARK {} {}", program.channel_id(), program.start_ts()) });
    require_tokens(reply, 2, "QUERY_BOOKMARK");
    uint64_t frame = longlong::decode(reply[1], reply[0]);
    LOG_DEBUG("bookmark = {} {} => {}", reply[0], reply[1], frame);
    return frame;
}

void Connection::set_bookmark(const Program& program, uint64_t frame) {
    longlong::Words words = longlong::encode(frame);
    Tokens reply = request({ fmt::format("SET_BOOKMARK {} {} {} {}",
                                         program.channel_id(), program.start_ts(),
                                         words.high, words.low) });
    require_tokens(reply, 1, "SET_BOOKMARK");

    if (reply[0] == "OK") {
        LOG_DEBUG("Bookmark of {} set to frame {}", program.title(), frame);
    } else if (reply[0] == "FAILED") {
        throw ServerError(fmt::format(
            "Failed to save position in program '{}' to frame {}. Server response: {}",
            program.title(), frame, reply[0]));
    } else {
        throw ProtocolError(fmt::format("Unexpected SET_BOOKMARK reply: {}", reply[0]));
    }
}

std::vector<CommercialBreak> Connection::get_commercial_breaks(const Program& program) {
    Tokens reply = request({ fmt::format("QUERY_COMMBREAK {} {}", program.channel_id(), program.start_ts()) });
    long long count = parse_integer(reply, 0, "QUERY_COMMBREAK");

    std::vector<CommercialBreak> breaks;
    if (count == -1) {
        return breaks;
    }
    if (count < 0) {
        throw ProtocolError(fmt::format("QUERY_COMMBREAK: negative record count {}", count));
    }
    if (count % 2 != 0) {
        throw ClientError(fmt::format(
            "Expected an even number of comm break records but got {} instead", count));
    }

    // Каждая запись: маркер, старшее слово, младшее слово
    constexpr size_t kRecordSize = 3;
    if (static_cast<unsigned long long>(count) > (reply.size() - 1) / kRecordSize) {
        throw ProtocolError(fmt::format("QUERY_COMMBREAK: {} records announced, reply carries {} tokens",
                                        count, reply.size()));
    }

    const double fps = program.frame_rate();
    for (size_t i = 0; i < static_cast<size_t>(count); i += 2) {
        size_t base = 1 + i * kRecordSize;

        long long start_marker = parse_integer(reply, base, "QUERY_COMMBREAK");
        if (start_marker != MLINK_COMM_START) {
            throw ProtocolError(fmt::format(
                "Expected COMM_START for record {} but got {} instead", i + 1, start_marker));
        }
        uint64_t start = longlong::decode(reply[base + 2], reply[base + 1]);

        long long end_marker = parse_integer(reply, base + 3, "QUERY_COMMBREAK");
        if (end_marker != MLINK_COMM_END) {
            throw ProtocolError(fmt::format(
                "Expected COMM_END for record {} but got {} instead", i + 2, end_marker));
        }
        uint64_t end = longlong::decode(reply[base + 5], reply[base + 4]);

        breaks.emplace_back(frames_to_seconds(start, fps), frames_to_seconds(end, fps));
    }

    std::stable_sort(breaks.begin(), breaks.end(), [](const CommercialBreak& a, const CommercialBreak& b) {
        return a.start() < b.start();
    });
    LOG_DEBUG("{} commercials in {}", breaks.size(), program.title());
    return breaks;
}

// ---------------------------------------------------------------------------
// Состояние бэкенда

DiskUsage Connection::get_disk_usage() {
    Tokens reply = request({ "QUERY_FREE_SPACE" });
    require_tokens(reply, 9, "QUERY_FREE_SPACE");

    DiskUsage usage;
    usage.hostname = reply[1];
    usage.directory = reply[2];
    usage.total = longlong::decode(reply[6], reply[5]);
    usage.used = longlong::decode(reply[8], reply[7]);
    usage.free = usage.total >= usage.used ? usage.total - usage.used : 0;
    return usage;
}

LoadAverage Connection::get_load() {
    Tokens reply = request({ "QUERY_LOAD" });
    require_tokens(reply, 3, "QUERY_LOAD");
    return LoadAverage{ reply[0], reply[1], reply[2] };
}

std::optional<std::chrono::seconds> Connection::get_uptime() {
    Tokens reply = request({ "QUERY_UPTIME" });
    // Бэкенд не на unix отвечает не числом
    auto seconds = reply.empty() ? std::nullopt : to_integer(reply[0]);
    if (!seconds) {
        return std::nullopt;
    }
    return std::chrono::seconds(*seconds);
}

Tokens Connection::get_setting(const std::string& key, const std::string& hostname) {
    return request({ fmt::format("QUERY_SETTING {} {}", key, hostname) });
}

std::string Connection::get_guide_data_status() {
    IDatabase& db = database();
    std::string start = db.get_myth_setting("mythfilldatabaseLastRunStart");
    std::string end = db.get_myth_setting("mythfilldatabaseLastRunEnd");
    std::string status = db.get_myth_setting("mythfilldatabaseLastRunStatus");
    return fmt::format("Programming guide info retrieved on {} and ended on {}. {}", start, end, status);
}

// ---------------------------------------------------------------------------
// Миниатюры

bool Connection::generate_thumbnail(const Program& program, const std::string& backend_host) {
    Tokens command = blank_program(program);
    command.insert(command.begin(), "QUERY_GENPIXMAP");

    longlong::Words offset = longlong::encode(kThumbnailOffset);
    command.emplace_back("s");
    command.push_back(std::to_string(offset.high));
    command.push_back(std::to_string(offset.low));
    command.push_back(fmt::format("{}.{}x{}.png", program.bare_filename(), kThumbnailWidth, kThumbnailHeight));
    command.push_back(std::to_string(kThumbnailWidth));
    command.push_back(std::to_string(kThumbnailHeight));

    Tokens reply = request_on_host(backend_host, command);
    LOG_DEBUG("genpixmap reply = {}", describe(reply));
    return is_ok(reply);
}

std::optional<std::time_t> Connection::get_thumbnail_creation_time(const Program& program,
                                                                  const std::string& backend_host) {
    Tokens command = blank_program(program);
    command.insert(command.begin(), "QUERY_PIXMAP_LASTMODIFIED");
    command.emplace_back("");

    Tokens reply = request_on_host(backend_host, command);
    if (reply.empty() || reply[0].empty() || reply[0] == "BAD") {
        return std::nullopt;
    }
    return static_cast<std::time_t>(parse_double(reply[0], "QUERY_PIXMAP_LASTMODIFIED"));
}

// ---------------------------------------------------------------------------
// Расписания

void Connection::reschedule_notify(std::optional<int> schedule_id) {
    int id = schedule_id.value_or(0);
    LOG_DEBUG("reschedule_notify(schedule = {})", id);

    Tokens reply = request({ fmt::format("RESCHEDULE_RECORDINGS {}", id) });
    if (parse_integer(reply, 0, "RESCHEDULE_RECORDINGS") < 0) {
        throw ServerError(fmt::format("Reschedule notify failed: {}", describe(reply)));
    }
}

void Connection::save_schedule(Schedule& schedule) {
    database().save_schedule(schedule);
    reschedule_notify(schedule.schedule_id);
}

void Connection::delete_schedule(const Schedule& schedule) {
    database().delete_schedule(schedule);
    reschedule_notify();
}

std::vector<Channel> Connection::get_channels() {
    return database().get_channels();
}

std::vector<Tuner> Connection::get_tuners() {
    return database().get_tuners();
}

// ---------------------------------------------------------------------------
// Файлы

std::unique_ptr<MessageChannel> Connection::announce_file_transfer(const std::string& backend_host,
                                                                   const std::string& path,
                                                                   FileTransferHandle& handle) {
    LOG_TRACE_ENTER_ARGS("host: {}, path: {}", backend_host, path);

    auto data = connect(Announce::None, backend_host);
    Tokens reply = data->request(protocol_->announce_file_transfer(client_host_, path));
    handle = parse_announce_reply(reply);

    LOG_DEBUG("file = {} handle = {} size = {}", path, handle.id, handle.size);
    return data;
}

uint64_t Connection::get_file_size(const std::string& path, const std::string& backend_host) {
    FileTransferHandle handle;
    auto data = announce_file_transfer(backend_host, path, handle);
    data->close();
    return handle.size;
}

bool Connection::transfer_file(const std::string& path,
                               const std::filesystem::path& dest,
                               const std::string& backend_host) {
    int max_block = context_.config->get_or<int>("transfer.max_block_size", MLINK_MAX_BLOCK_SIZE);
    if (max_block <= 0) {
        throw SettingsError(fmt::format("transfer.max_block_size must be positive, got {}", max_block));
    }

    // Командный сокет другого хоста прощается DONE на любом выходе
    struct SlaveChannel {
        std::unique_ptr<MessageChannel> channel;
        ~SlaveChannel() {
            if (channel) {
                say_goodbye(*channel);
            }
        }
    } slave;

    // С другого хоста блоки запрашиваются через его собственный командный сокет
    MessageChannel* command = nullptr;
    if (is_master(backend_host)) {
        command = &command_channel();
    } else {
        LOG_DEBUG("Requesting file from slave backend: {}", backend_host);
        slave.channel = connect(Announce::Playback, backend_host);
        command = slave.channel.get();
    }

    FileTransferHandle handle;
    auto data = announce_file_transfer(backend_host, path, handle);

    bool transferred = false;
    if (handle.size == 0) {
        LOG_DEBUG("Remote file {} is empty, nothing to transfer", path);
    } else {
        std::ofstream out(dest, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw ClientError(fmt::format("Cannot open {} for writing", dest.string()));
        }

        FileTransfer transfer(*command, *data, handle, static_cast<size_t>(max_block));
        transfer.run([&out, &dest](const char* bytes, size_t size) {
            out.write(bytes, static_cast<std::streamsize>(size));
            if (!out) {
                throw ClientError(fmt::format("Write to {} failed", dest.string()));
            }
        });
        transferred = true;
    }

    data->close();
    return transferred;
}

// ---------------------------------------------------------------------------

void verify_connectivity(const ConnectionContext& context) {
    try {
        Connection session(context);
        session.close();
    } catch (const BackendError& e) {
        LOG_WARN("MythTV connectivity check failed: {}", e.what());
        throw SettingsError(fmt::format("Connection to MythTV failed: {}", e.what()));
    } catch (const TransportError& e) {
        LOG_WARN("MythTV connectivity check failed: {}", e.what());
        throw SettingsError(fmt::format("Connection to MythTV failed: {}", e.what()));
    }
}

} // namespace ml
