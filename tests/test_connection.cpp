#include <gtest/gtest.h>

#include "fakeBackend.hpp"
#include "../sdk/cpp/database.hpp"

#include <map>

using namespace ml;
using namespace ml::test;

namespace {

class FakeDatabase : public IDatabase {
public:
    std::vector<Tuner> tuners;
    std::vector<Channel> channels;
    std::map<std::string, std::string> settings;
    std::vector<std::string> calls;

    std::vector<Channel> get_channels() override { return channels; }
    std::vector<Tuner> get_tuners() override { return tuners; }
    std::vector<Job> get_jobs(const Program&) override { return {}; }

    std::string get_myth_setting(const std::string& key) override {
        return settings[key];
    }

    void save_schedule(Schedule& schedule) override {
        calls.push_back("save");
        if (!schedule.schedule_id) {
            schedule.schedule_id = 12;
        }
    }

    void delete_schedule(const Schedule&) override {
        calls.push_back("delete");
    }
};

struct ConnectionFixture : public ::testing::Test {
    FakeBackend backend;
    std::shared_ptr<FakeDatabase> database = std::make_shared<FakeDatabase>();
    std::shared_ptr<FakeSocket> cmd;
    std::unique_ptr<Connection> conn;

    void SetUp() override {
        backend.database = database;
        cmd = backend.socket();
        conn = std::make_unique<Connection>(backend.context());
    }

    // Последний запрос клиента на командном сокете
    Tokens last_request() const {
        auto frames = cmd->sent();
        return frames.empty() ? Tokens{} : frames.back();
    }

    Program recorded(const std::string& title) const {
        return Program(program_fields(title));
    }
};

} // namespace

// ---------------------------------------------------------------------------
// Жизненный цикл

TEST_F(ConnectionFixture, HandshakeThenPlaybackAnnounce) {
    auto frames = cmd->sent();
    ASSERT_EQ(frames.size(), 2u);
    EXPECT_EQ(frames[0], (Tokens{ "MYTH_PROTO_VERSION 56" }));
    EXPECT_EQ(frames[1], (Tokens{ "ANN Playback frontend 0" }));
    EXPECT_EQ(conn->protocol_version(), 56);
    EXPECT_EQ(conn->protocol().record_size(), 47u);
    EXPECT_TRUE(conn->is_open());
    EXPECT_EQ(backend.connector->opened, (std::vector<std::string>{ "mythbox:6543" }));
}

TEST(ConnectivityTest, SessionOpensAndCloses) {
    FakeBackend backend;
    auto socket = backend.socket();

    EXPECT_NO_THROW(verify_connectivity(backend.context()));
    EXPECT_EQ(socket->sent().back(), (Tokens{ "DONE" }));
    EXPECT_FALSE(socket->open);
}

TEST(ConnectivityTest, UnreachableBackendIsSettingsError) {
    FakeBackend backend;
    try {
        verify_connectivity(backend.context());
        FAIL() << "connectivity check passed without a backend";
    } catch (const SettingsError& e) {
        EXPECT_EQ(std::string(e.what()).rfind("Connection to MythTV failed: ", 0), 0u);
    }
}

TEST(ConnectivityTest, ProtocolMismatchIsSettingsError) {
    FakeBackend backend;
    backend.socket("mythbox", false, 40);
    EXPECT_THROW(verify_connectivity(backend.context()), SettingsError);
}

TEST(ConnectivityTest, RefusedAnnounceIsSettingsError) {
    FakeBackend backend;
    auto socket = backend.connector->script();
    socket->reply({ "ACCEPT", "56" }).reply({ "ERROR" });
    EXPECT_THROW(verify_connectivity(backend.context()), SettingsError);
    EXPECT_FALSE(socket->open);
}

TEST_F(ConnectionFixture, CloseSaysDoneOnce) {
    conn->close();
    conn->close();
    EXPECT_FALSE(conn->is_open());
    EXPECT_EQ(last_request(), (Tokens{ "DONE" }));
    EXPECT_EQ(cmd->sent().size(), 3u);
    EXPECT_EQ(cmd->closes, 1);
    EXPECT_THROW(conn->get_load(), ClientError);
}

TEST_F(ConnectionFixture, UnsupportedAnnounceIsClientError) {
    EXPECT_THROW(conn->connect(static_cast<Announce>(7)), ClientError);
}

TEST_F(ConnectionFixture, MonitorAnnounce) {
    auto monitor = backend.socket();
    auto channel = conn->connect(Announce::Monitor);
    EXPECT_EQ(monitor->sent()[1], (Tokens{ "ANN Monitor frontend 0" }));
}

TEST(ConnectionLifecycleTest, FirstConnectionDiscoversServerVersion) {
    FakeBackend backend(0);
    auto probe = backend.connector->script();
    probe->reply({ "REJECT", "56" });
    backend.socket();

    Connection first(backend.context());
    EXPECT_EQ(probe->sent()[0], (Tokens{ "MYTH_PROTO_VERSION 8" }));
    EXPECT_FALSE(probe->open);
    EXPECT_EQ(backend.versions->get().value_or(0), 56);

    // Второе соединение не зондирует сервер
    backend.socket();
    Connection second(backend.context());
    EXPECT_EQ(backend.connector->opened.size(), 3u);
    EXPECT_EQ(backend.connector->pending(), 0u);
}

TEST(ConnectionLifecycleTest, OlderServerIsProtocolError) {
    FakeBackend backend(56);
    backend.connector->script()->reply({ "REJECT", "50" });
    try {
        Connection conn(backend.context());
        FAIL() << "expected ProtocolError";
    } catch (const ProtocolError& e) {
        EXPECT_EQ(e.protocol_version(), 50);
    }
}

TEST(ConnectionLifecycleTest, UnregisteredVersionIsProtocolError) {
    FakeBackend backend(60);
    backend.socket("mythbox", true, 60);
    EXPECT_THROW(Connection conn(backend.context()), ProtocolError);
}

TEST(ConnectionLifecycleTest, RefusedAnnounceIsServerError) {
    FakeBackend backend;
    backend.connector->script()->reply({ "ACCEPT", "56" }).reply({ "BUSY" });
    EXPECT_THROW(Connection conn(backend.context()), ServerError);
}

TEST(ConnectionLifecycleTest, MissingConnectorIsClientError) {
    FakeBackend backend;
    ConnectionContext context = backend.context();
    context.connector.reset();
    EXPECT_THROW(Connection conn(context), ClientError);
}

// ---------------------------------------------------------------------------
// Тюнеры

TEST_F(ConnectionFixture, FramesWrittenIsHighThenLow) {
    cmd->reply({ "1", "705032704" });
    EXPECT_EQ(conn->get_frames_written(Tuner{ 3, "mythbox", "" }), 5000000000ULL);
    EXPECT_EQ(last_request(), (Tokens{ "QUERY_RECORDER 3", "GET_FRAMES_WRITTEN" }));
}

TEST_F(ConnectionFixture, TunerFilePosition) {
    cmd->reply({ "0", "-1" });
    EXPECT_EQ(conn->get_tuner_file_position(Tuner{ 1, "mythbox", "" }), 0xFFFFFFFFULL);
}

TEST_F(ConnectionFixture, TunerStatusAndFrameRate) {
    cmd->reply({ "6" }).reply({ "29.97" });
    Tuner tuner{ 2, "mythbox", "" };
    EXPECT_EQ(conn->get_tuner_status(tuner), TV_STATE_RECORDING_ONLY);
    EXPECT_EQ(cmd->sent()[2], (Tokens{ "QUERY_REMOTEENCODER 2", "GET_STATE" }));
    EXPECT_DOUBLE_EQ(conn->get_tuner_frame_rate(tuner), 29.97);
}

TEST_F(ConnectionFixture, TunerShowingReturnsFirstMatchingBusyTuner) {
    database->tuners = { { 1, "mythbox", "" }, { 2, "mythbox", "" }, { 3, "mythbox", "" } };
    cmd->reply({ "1" }).reply(program_fields("News"));
    cmd->reply({ "6" }).reply(program_fields("Simpsons"));

    EXPECT_EQ(conn->get_tuner_showing("Simpsons"), 2);
}

TEST_F(ConnectionFixture, TunerShowingStopsAtIdleTuner) {
    database->tuners = { { 1, "mythbox", "" }, { 2, "mythbox", "" } };
    cmd->reply({ "0" });

    EXPECT_EQ(conn->get_tuner_showing("Simpsons"), -1);
    EXPECT_EQ(cmd->sent().size(), 3u);
}

TEST_F(ConnectionFixture, TunerRecordingOnSlaveUsesShortLivedConnection) {
    auto slave = backend.socket("slave1");
    slave->reply({ "1" });

    EXPECT_TRUE(conn->is_tuner_recording(Tuner{ 4, "slave1", "" }));

    auto frames = slave->sent();
    ASSERT_EQ(frames.size(), 4u);
    EXPECT_EQ(frames[2], (Tokens{ "QUERY_RECORDER 4", "IS_RECORDING" }));
    EXPECT_EQ(frames[3], (Tokens{ "DONE" }));
    EXPECT_FALSE(slave->open);
    EXPECT_EQ(backend.connector->opened.back(), "slave1:6543");
    EXPECT_EQ(cmd->sent().size(), 2u);
}

TEST_F(ConnectionFixture, TunerRecordingOnMaster) {
    cmd->reply({ "0" });
    EXPECT_FALSE(conn->is_tuner_recording(Tuner{ 1, "mythbox", "" }));
}

TEST_F(ConnectionFixture, FreeTuners) {
    cmd->reply({ "2" }).reply({ "-1" }).reply({ "3", "mythbox", "6543" });
    EXPECT_EQ(conn->get_num_free_tuners(), 2);

    FreeTuner none = conn->get_free_tuner();
    EXPECT_EQ(none.tuner_id, -1);
    EXPECT_EQ(none.host, "");
    EXPECT_EQ(none.port, -1);

    FreeTuner free = conn->get_free_tuner();
    EXPECT_EQ(free.tuner_id, 3);
    EXPECT_EQ(free.host, "mythbox");
    EXPECT_EQ(free.port, 6543);
}

TEST_F(ConnectionFixture, NextFreeTuner) {
    cmd->reply({ "4", "slave1", "6543" }).reply({ "-1", "", "" });
    auto next = conn->get_next_free_tuner(3);
    ASSERT_TRUE(next.has_value());
    EXPECT_EQ(next->tuner_id, 4);
    EXPECT_EQ(cmd->sent()[2], (Tokens{ "GET_NEXT_FREE_RECORDER", "3" }));
    EXPECT_FALSE(conn->get_next_free_tuner(4).has_value());
}

// ---------------------------------------------------------------------------
// Live TV

TEST_F(ConnectionFixture, SpawnLiveTvReturnsChainId) {
    cmd->reply({ "OK" });
    std::string chain = conn->spawn_live_tv(Tuner{ 2, "mythbox", "" }, "5");

    EXPECT_EQ(chain.rfind("live-frontend-", 0), 0u);
    Tokens request = last_request();
    ASSERT_EQ(request.size(), 5u);
    EXPECT_EQ(request[0], "QUERY_RECORDER 2");
    EXPECT_EQ(request[1], "SPAWN_LIVETV");
    EXPECT_EQ(request[2], chain);
    EXPECT_EQ(request[3], "0");
    EXPECT_EQ(request[4], "5");
}

TEST_F(ConnectionFixture, LiveTvFailuresAreServerErrors) {
    cmd->reply({ "bad" }).reply({ "ERROR" });
    EXPECT_THROW(conn->spawn_live_tv(Tuner{ 2, "mythbox", "" }, "5"), ServerError);
    EXPECT_THROW(conn->stop_live_tv(Tuner{ 2, "mythbox", "" }), ServerError);
}

// ---------------------------------------------------------------------------
// Записи

TEST_F(ConnectionFixture, DeletePublishesAfterServerConfirms) {
    std::vector<std::string> titles;
    backend.bus->connect([&titles](const Event& event) {
        if (auto deleted = std::get_if<RecordingDeleted>(&event)) {
            titles.push_back(deleted->program.title());
        }
    });

    cmd->reply({ "-1" });
    Program program = recorded("Simpsons");
    EXPECT_EQ(conn->delete_recording(program), -1);

    Tokens request = last_request();
    EXPECT_EQ(request.front(), "DELETE_RECORDING");
    EXPECT_EQ(request.back(), "0");
    EXPECT_EQ(request.size(), program.size() + 2);
    EXPECT_EQ(titles, (std::vector<std::string>{ "Simpsons" }));
}

TEST_F(ConnectionFixture, FailedDeletePublishesNothing) {
    int events = 0;
    backend.bus->connect([&events](const Event&) { ++events; });

    cmd->reply({ "ERROR: no such recording" });
    EXPECT_THROW(conn->delete_recording(recorded("Simpsons")), ServerError);
    EXPECT_EQ(events, 0);
}

TEST_F(ConnectionFixture, RerecordDeletesThenForgets) {
    cmd->reply({ "1" }).reply({ "0" });
    EXPECT_EQ(conn->rerecord_recording(recorded("Simpsons")), 1);
    EXPECT_EQ(last_request().front(), "FORGET_RECORDING");
}

TEST_F(ConnectionFixture, AllRecordingsDropLiveTvAndSortNewestFirst) {
    cmd->reply(concat({ { "3" },
                        program_fields("Old", "Default", "100"),
                        program_fields("Live", "LiveTV", "500"),
                        program_fields("New", "Default", "300") }));

    auto programs = conn->get_all_recordings();
    ASSERT_EQ(programs.size(), 2u);
    EXPECT_EQ(programs[0].title(), "New");
    EXPECT_EQ(programs[1].title(), "Old");
    EXPECT_EQ(last_request(), (Tokens{ "QUERY_RECORDINGS Play" }));
}

TEST_F(ConnectionFixture, ShortRecordSetIsProtocolError) {
    Tokens reply = concat({ { "2" }, program_fields("Only one") });
    cmd->reply(reply);
    EXPECT_THROW(conn->get_all_recordings(), ProtocolError);
}

TEST_F(ConnectionFixture, HugeRecordCountIsProtocolError) {
    // 5887258746928580303 * 47 == 1 по модулю 2^64
    cmd->reply({ "5887258746928580303", "x" });
    EXPECT_THROW(conn->get_all_recordings(), ProtocolError);
}

TEST_F(ConnectionFixture, RecordingsFilterIgnoresCase) {
    Tokens reply = concat({ { "3" },
                            program_fields("Simpsons", "Default"),
                            program_fields("News", "Default"),
                            program_fields("Simpsons", "Kids") });
    cmd->reply(reply).reply(reply).reply(reply);

    EXPECT_EQ(conn->get_recordings("default", "simpsons").size(), 1u);
    EXPECT_EQ(conn->get_recordings("All Groups", "SIMPSONS").size(), 2u);
    EXPECT_EQ(conn->get_recordings().size(), 2u);
}

TEST_F(ConnectionFixture, RecordingsDefaultToDefaultGroup) {
    cmd->reply(concat({ { "2" },
                        program_fields("Simpsons", "Kids"),
                        program_fields("News", "default") }));

    auto programs = conn->get_recordings();
    ASSERT_EQ(programs.size(), 1u);
    EXPECT_EQ(programs[0].title(), "News");
}

TEST_F(ConnectionFixture, RecordingByTimeslot) {
    cmd->reply(concat({ { "OK" }, program_fields("Simpsons") })).reply({ "ERROR" });

    auto found = conn->get_recording(1051, "2010-01-01T00:00:00");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->title(), "Simpsons");
    EXPECT_EQ(cmd->sent()[2], (Tokens{ "QUERY_RECORDING TIMESLOT 1051 2010-01-01T00:00:00" }));

    EXPECT_FALSE(conn->get_recording(1051, "2010-01-02T00:00:00").has_value());
}

TEST_F(ConnectionFixture, ScheduledRecordings) {
    cmd->reply(concat({ { "1" }, program_fields("Simpsons") }));
    auto programs = conn->get_scheduled_recordings();
    ASSERT_EQ(programs.size(), 1u);
    EXPECT_EQ(last_request(), (Tokens{ "QUERY_GETALLSCHEDULED" }));
}

TEST_F(ConnectionFixture, UpcomingRecordingsFilteredByStatus) {
    Tokens reply = concat({ { "0", "3" },
                            program_fields("A", "Default", "100", REC_STATUS_WILL_RECORD),
                            program_fields("B", "Default", "200", REC_STATUS_CONFLICT),
                            program_fields("C", "Default", "300", REC_STATUS_RECORDING) });
    cmd->reply(reply).reply(reply);

    auto scheduled = conn->get_upcoming_recordings();
    ASSERT_EQ(scheduled.size(), 2u);
    EXPECT_EQ(scheduled[0].title(), "A");
    EXPECT_EQ(scheduled[1].title(), "C");
    EXPECT_EQ(last_request(), (Tokens{ "QUERY_GETALLPENDING", "2" }));

    auto conflicts = conn->get_upcoming_recordings(upcoming::conflicts());
    ASSERT_EQ(conflicts.size(), 1u);
    EXPECT_EQ(conflicts[0].title(), "B");
}

// ---------------------------------------------------------------------------
// Закладки и рекламные паузы

TEST_F(ConnectionFixture, BookmarkRoundTrip) {
    cmd->reply({ "1", "705032704" }).reply({ "OK" });
    Program program = recorded("Simpsons");

    EXPECT_EQ(conn->get_bookmark(program), 5000000000ULL);
    EXPECT_EQ(cmd->sent()[2], (Tokens{ "QUERY_BOOKMARK 1051 1262304000" }));

    conn->set_bookmark(program, 5000000000ULL);
    EXPECT_EQ(last_request(), (Tokens{ "SET_BOOKMARK 1051 1262304000 1 705032704" }));
}

TEST_F(ConnectionFixture, SetBookmarkFailures) {
    cmd->reply({ "FAILED" }).reply({ "WHAT" });
    Program program = recorded("Simpsons");
    EXPECT_THROW(conn->set_bookmark(program, 10), ServerError);
    EXPECT_THROW(conn->set_bookmark(program, 10), ProtocolError);
}

TEST_F(ConnectionFixture, CommercialBreaksInSeconds) {
    cmd->reply({ "4",
                 "4", "0", "300", "5", "0", "600",
                 "4", "0", "900", "5", "0", "1200" });
    Program program = recorded("Simpsons");
    program.set_frame_rate(30.0);

    auto breaks = conn->get_commercial_breaks(program);
    ASSERT_EQ(breaks.size(), 2u);
    EXPECT_EQ(breaks[0], CommercialBreak(10.0, 20.0));
    EXPECT_EQ(breaks[1], CommercialBreak(30.0, 40.0));
    EXPECT_EQ(last_request(), (Tokens{ "QUERY_COMMBREAK 1051 1262304000" }));
}

TEST_F(ConnectionFixture, NoCommercialBreaks) {
    cmd->reply({ "-1" });
    EXPECT_TRUE(conn->get_commercial_breaks(recorded("Simpsons")).empty());
}

TEST_F(ConnectionFixture, OddCommercialBreakCountIsClientError) {
    cmd->reply({ "3", "4", "0", "300", "5", "0", "600", "4", "0", "900" });
    EXPECT_THROW(conn->get_commercial_breaks(recorded("Simpsons")), ClientError);
}

TEST_F(ConnectionFixture, HugeCommercialBreakCountIsProtocolError) {
    // 6148914691236517206 * 3 == 2 по модулю 2^64
    cmd->reply({ "6148914691236517206", "4", "0" });
    EXPECT_THROW(conn->get_commercial_breaks(recorded("Simpsons")), ProtocolError);
}

TEST_F(ConnectionFixture, TruncatedCommercialBreaksIsProtocolError) {
    cmd->reply({ "2", "4", "0", "300", "5" });
    EXPECT_THROW(conn->get_commercial_breaks(recorded("Simpsons")), ProtocolError);
}

TEST_F(ConnectionFixture, WrongCommercialMarkerIsProtocolError) {
    cmd->reply({ "2", "5", "0", "300", "4", "0", "600" });
    EXPECT_THROW(conn->get_commercial_breaks(recorded("Simpsons")), ProtocolError);
}

// ---------------------------------------------------------------------------
// Состояние бэкенда

TEST_F(ConnectionFixture, DiskUsage) {
    cmd->reply({ "mythbox", "mythbox", "/var/lib/mythtv", "1", "-1",
                 "1", "705032704", "0", "1000000000" });
    DiskUsage usage = conn->get_disk_usage();
    EXPECT_EQ(usage.hostname, "mythbox");
    EXPECT_EQ(usage.directory, "/var/lib/mythtv");
    EXPECT_EQ(usage.total, 5000000000ULL);
    EXPECT_EQ(usage.used, 1000000000ULL);
    EXPECT_EQ(usage.free, 4000000000ULL);
}

TEST_F(ConnectionFixture, LoadAndUptime) {
    cmd->reply({ "0.10", "0.20", "0.30" }).reply({ "3600" }).reply({ "unknown" });

    LoadAverage load = conn->get_load();
    EXPECT_EQ(load.one, "0.10");
    EXPECT_EQ(load.five, "0.20");
    EXPECT_EQ(load.fifteen, "0.30");

    auto uptime = conn->get_uptime();
    ASSERT_TRUE(uptime.has_value());
    EXPECT_EQ(uptime->count(), 3600);
    EXPECT_FALSE(conn->get_uptime().has_value());
}

TEST_F(ConnectionFixture, SettingIsRawReply) {
    cmd->reply({ "/var/lib/mythtv" });
    EXPECT_EQ(conn->get_setting("RecordFilePrefix", "mythbox"), (Tokens{ "/var/lib/mythtv" }));
    EXPECT_EQ(last_request(), (Tokens{ "QUERY_SETTING RecordFilePrefix mythbox" }));
}

TEST_F(ConnectionFixture, GuideDataStatus) {
    database->settings = {
        { "mythfilldatabaseLastRunStart", "2010-01-01 01:00" },
        { "mythfilldatabaseLastRunEnd", "2010-01-01 01:10" },
        { "mythfilldatabaseLastRunStatus", "Successful." }
    };
    EXPECT_EQ(conn->get_guide_data_status(),
              "Programming guide info retrieved on 2010-01-01 01:00 and ended on 2010-01-01 01:10. Successful.");
}

// ---------------------------------------------------------------------------
// Миниатюры

TEST_F(ConnectionFixture, GenerateThumbnailOnMaster) {
    cmd->reply({ "OK" });
    Program program = recorded("Simpsons");
    EXPECT_TRUE(conn->generate_thumbnail(program, "mythbox"));

    Tokens request = last_request();
    ASSERT_EQ(request.size(), 1 + program.size() + 6);
    EXPECT_EQ(request[0], "QUERY_GENPIXMAP");
    EXPECT_EQ(request[1 + Program::TITLE], " ");
    EXPECT_EQ(request[1 + Program::CHANNEL_ID], "1051");
    EXPECT_EQ(request[1 + Program::FILESIZE_HIGH], "0");
    EXPECT_EQ(request[1 + 24], "15");
    EXPECT_EQ(request[1 + 25], "6");

    size_t extras = 1 + program.size();
    EXPECT_EQ(request[extras], "s");
    EXPECT_EQ(request[extras + 1], "0");
    EXPECT_EQ(request[extras + 2], "180");
    EXPECT_EQ(request[extras + 3], "1051_20100101000000.mpg.640x360.png");
    EXPECT_EQ(request[extras + 4], "640");
    EXPECT_EQ(request[extras + 5], "360");
}

TEST_F(ConnectionFixture, ThumbnailCreationTime) {
    cmd->reply({ "1262304000" }).reply({ "BAD" });
    Program program = recorded("Simpsons");

    auto created = conn->get_thumbnail_creation_time(program, "mythbox");
    ASSERT_TRUE(created.has_value());
    EXPECT_EQ(*created, 1262304000);

    Tokens request = last_request();
    EXPECT_EQ(request[0], "QUERY_PIXMAP_LASTMODIFIED");
    EXPECT_EQ(request.back(), "");

    EXPECT_FALSE(conn->get_thumbnail_creation_time(program, "mythbox").has_value());
}

TEST_F(ConnectionFixture, ThumbnailNeedsFullRecord) {
    Program program(Tokens{ "Simpsons", "", "" });
    EXPECT_THROW(conn->generate_thumbnail(program, "mythbox"), ClientError);
}

// ---------------------------------------------------------------------------
// Расписания

TEST_F(ConnectionFixture, SaveScheduleNotifiesBackend) {
    cmd->reply({ "1" });
    Schedule schedule{ std::nullopt, "Simpsons", 1051, 4 };
    conn->save_schedule(schedule);

    EXPECT_EQ(database->calls, (std::vector<std::string>{ "save" }));
    EXPECT_EQ(last_request(), (Tokens{ "RESCHEDULE_RECORDINGS 12" }));
}

TEST_F(ConnectionFixture, DeleteScheduleReschedulesAll) {
    cmd->reply({ "1" });
    conn->delete_schedule(Schedule{ 12, "Simpsons", 1051, 4 });

    EXPECT_EQ(database->calls, (std::vector<std::string>{ "delete" }));
    EXPECT_EQ(last_request(), (Tokens{ "RESCHEDULE_RECORDINGS 0" }));
}

TEST_F(ConnectionFixture, NegativeRescheduleIsServerError) {
    cmd->reply({ "-1" });
    EXPECT_THROW(conn->reschedule_notify(5), ServerError);
}

TEST_F(ConnectionFixture, DatabaseBackedQueries) {
    database->channels = { Channel{ 1051, "5", "WXYZ", "Channel Five", 1 } };
    database->tuners = { Tuner{ 1, "mythbox", "" } };
    EXPECT_EQ(conn->get_channels().size(), 1u);
    EXPECT_EQ(conn->get_tuners().size(), 1u);
}

TEST(ConnectionWithoutDatabaseTest, DatabaseQueriesAreClientErrors) {
    FakeBackend backend;
    backend.socket();
    Connection conn(backend.context());
    EXPECT_THROW(conn.get_channels(), ClientError);
    EXPECT_THROW(conn.get_guide_data_status(), ClientError);
}
