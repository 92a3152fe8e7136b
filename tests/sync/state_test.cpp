#include "upsync/sync/config.hpp"
#include "upsync/sync/journal.hpp"
#include "upsync/sync/state.hpp"

#include "../support/fixtures.hpp"

#include <gtest/gtest.h>

#include <cstdlib>
#include <unistd.h>

using upsync::ErrorKind;
using upsync::sync::CompletionPolicy;
using upsync::sync::LogBuffer;
using upsync::sync::StatusJournal;
using upsync::sync::SyncConfig;
using upsync::sync::SyncState;
using upsync::sync::SyncStateMachine;
using upsync::sync::SyncStatus;
using upsync::test_support::create_temp_dir;
namespace fs = std::filesystem;

// ============================================================================
// State machine
// ============================================================================

TEST(SyncStateMachineTest, HappyPath) {
    SyncStateMachine machine;
    EXPECT_EQ(machine.status(), SyncStatus::Idle);
    EXPECT_TRUE(machine.transition_to(SyncStatus::Loading).is_ok());
    EXPECT_TRUE(machine.transition_to(SyncStatus::Idle).is_ok());
    EXPECT_TRUE(machine.transition_to(SyncStatus::Uploading).is_ok());
    EXPECT_TRUE(machine.transition_to(SyncStatus::Paused).is_ok());
    EXPECT_TRUE(machine.transition_to(SyncStatus::Uploading).is_ok());
    EXPECT_TRUE(machine.transition_to(SyncStatus::Completed).is_ok());
    EXPECT_EQ(machine.status(), SyncStatus::Completed);
}

TEST(SyncStateMachineTest, ErrorRecovery) {
    SyncStateMachine machine;
    ASSERT_TRUE(machine.transition_to(SyncStatus::Uploading).is_ok());
    ASSERT_TRUE(machine.transition_to(SyncStatus::Error).is_ok());
    EXPECT_TRUE(machine.can_transition(SyncStatus::Uploading));
    EXPECT_TRUE(machine.can_transition(SyncStatus::Idle));
    EXPECT_FALSE(machine.can_transition(SyncStatus::Paused));
    EXPECT_FALSE(machine.can_transition(SyncStatus::Completed));
}

TEST(SyncStateMachineTest, IllegalTransitionIsStateError) {
    SyncStateMachine machine;
    auto result = machine.transition_to(SyncStatus::Paused);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::State);
    EXPECT_EQ(machine.status(), SyncStatus::Idle);

    ASSERT_TRUE(machine.transition_to(SyncStatus::Uploading).is_ok());
    EXPECT_FALSE(machine.can_transition(SyncStatus::Uploading));
    EXPECT_FALSE(machine.can_transition(SyncStatus::Loading));
    EXPECT_FALSE(machine.can_transition(SyncStatus::Idle));
}

TEST(SyncStateMachineTest, StatusNamesRoundTrip) {
    for (auto status : {SyncStatus::Idle, SyncStatus::Loading, SyncStatus::Uploading,
                        SyncStatus::Paused, SyncStatus::Completed, SyncStatus::Error}) {
        auto parsed = upsync::sync::status_from_name(upsync::sync::status_name(status));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, status);
    }
    EXPECT_FALSE(upsync::sync::status_from_name("running").has_value());
}

// ============================================================================
// Log buffer
// ============================================================================

TEST(LogBufferTest, DropsOldestBeyondCapacity) {
    LogBuffer logs(3);
    for (int i = 0; i < 5; ++i) {
        logs.append("line " + std::to_string(i));
    }
    auto entries = logs.entries();
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_NE(entries.front().find("line 2"), std::string::npos);
    EXPECT_NE(entries.back().find("line 4"), std::string::npos);
    EXPECT_EQ(entries.back().front(), '[');
}

TEST(LogBufferTest, ZeroCapacityKeepsNothing) {
    LogBuffer logs(0);
    logs.append("ignored");
    EXPECT_EQ(logs.size(), 0u);
}

// ============================================================================
// Config
// ============================================================================

TEST(SyncConfigTest, Defaults) {
    SyncConfig config;
    EXPECT_EQ(config.batch_size, 50u);
    EXPECT_EQ(config.inter_batch_delay, std::chrono::milliseconds(100));
    EXPECT_EQ(config.request_timeout, std::chrono::milliseconds(120000));
    EXPECT_EQ(config.completion_policy, CompletionPolicy::Clear);
    EXPECT_EQ(config.log_capacity, 100u);
    EXPECT_TRUE(config.validate().is_ok());
}

TEST(SyncConfigTest, ParseOverlaysPresentKeys) {
    SyncConfig base;
    base.endpoint = "https://keep.example.com/api/sync/upload";

    auto config = SyncConfig::parse(R"({
        "batch_size": 20,
        "inter_batch_delay_ms": 0,
        "completion_policy": "retain",
        "state_dir": "/tmp/upsync-state"
    })", base);
    ASSERT_TRUE(config.is_ok()) << config.error().message;
    EXPECT_EQ(config.value().endpoint, base.endpoint);
    EXPECT_EQ(config.value().batch_size, 20u);
    EXPECT_EQ(config.value().inter_batch_delay.count(), 0);
    EXPECT_EQ(config.value().completion_policy, CompletionPolicy::Retain);
    EXPECT_EQ(config.value().state_dir, fs::path("/tmp/upsync-state"));
}

TEST(SyncConfigTest, ParseRejectsBadInput) {
    auto not_json = SyncConfig::parse("batch_size=20");
    ASSERT_TRUE(not_json.is_error());
    EXPECT_EQ(not_json.error().kind, ErrorKind::Config);

    auto wrong_type = SyncConfig::parse(R"({"batch_size": "many"})");
    ASSERT_TRUE(wrong_type.is_error());
    EXPECT_EQ(wrong_type.error().kind, ErrorKind::Config);

    auto bad_policy = SyncConfig::parse(R"({"completion_policy": "sometimes"})");
    ASSERT_TRUE(bad_policy.is_error());
    EXPECT_EQ(bad_policy.error().kind, ErrorKind::Config);
}

TEST(SyncConfigTest, ValidateRejectsZeroBatchSize) {
    SyncConfig config;
    config.batch_size = 0;
    auto result = config.validate();
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::Config);

    config.batch_size = 10;
    config.log_level = "verbose";
    EXPECT_TRUE(config.validate().is_error());
}

TEST(SyncConfigTest, EnvironmentFillsOnlyUnsetFields) {
    ::setenv("UPSYNC_TOKEN", "env-token", 1);
    ::setenv("SQLITE_PATH", "/data/env.db", 1);

    SyncConfig unset;
    unset.apply_environment();
    EXPECT_EQ(unset.credential, "env-token");
    EXPECT_EQ(unset.source_path, "/data/env.db");

    SyncConfig explicit_values;
    explicit_values.credential = "flag-token";
    explicit_values.apply_environment();
    EXPECT_EQ(explicit_values.credential, "flag-token");

    ::unsetenv("UPSYNC_TOKEN");
    ::unsetenv("SQLITE_PATH");
}

TEST(SyncConfigTest, LoadFileMissingIsConfigError) {
    auto config = SyncConfig::load_file("/nonexistent/upsync.json");
    ASSERT_TRUE(config.is_error());
    EXPECT_EQ(config.error().kind, ErrorKind::Config);
}

TEST(SyncConfigTest, LoadFileWithAndWithoutBase) {
    const auto dir = create_temp_dir("upsync_config");
    const auto path = dir / "upsync.json";
    upsync::test_support::write_text(path, R"({"endpoint": "http://127.0.0.1:8000/api/sync/upload"})");

    auto defaults = SyncConfig::load_file(path);
    ASSERT_TRUE(defaults.is_ok()) << defaults.error().message;
    EXPECT_EQ(defaults.value().endpoint, "http://127.0.0.1:8000/api/sync/upload");
    EXPECT_EQ(defaults.value().batch_size, 50u);

    SyncConfig base;
    base.batch_size = 7;
    auto overlaid = SyncConfig::load_file(path, base);
    ASSERT_TRUE(overlaid.is_ok());
    EXPECT_EQ(overlaid.value().batch_size, 7u);
    EXPECT_EQ(overlaid.value().endpoint, "http://127.0.0.1:8000/api/sync/upload");

    fs::remove_all(dir);
}

// ============================================================================
// Status journal
// ============================================================================

TEST(StatusJournalTest, WriteThenRead) {
    auto dir = create_temp_dir("upsync_journal");
    StatusJournal journal(dir);

    SyncState state;
    state.status = SyncStatus::Error;
    state.source_path = "/data/snapshot.db";
    state.fingerprint = "snapshot.db";
    state.total_articles = 120;
    state.uploaded_articles = 50;
    state.current_batch = 2;
    state.total_batches = 3;
    state.last_error = upsync::Error{ErrorKind::Server, "HTTP 500: boom"};
    state.logs = {"[10:00:00] Uploading"};

    ASSERT_TRUE(journal.write(state, "https://ingest.example.com/api/sync/upload").is_ok());

    auto entry = journal.read();
    ASSERT_TRUE(entry.is_ok()) << entry.error().message;
    const auto& read = entry.value().state;
    EXPECT_EQ(read.status, SyncStatus::Error);
    EXPECT_EQ(read.source_path, "/data/snapshot.db");
    EXPECT_EQ(read.uploaded_articles, 50u);
    EXPECT_EQ(read.total_batches, 3u);
    ASSERT_TRUE(read.last_error.has_value());
    EXPECT_EQ(read.last_error->kind, ErrorKind::Server);
    EXPECT_EQ(read.logs.size(), 1u);
    EXPECT_EQ(entry.value().endpoint, "https://ingest.example.com/api/sync/upload");
    EXPECT_FALSE(entry.value().pid.has_value());
    fs::remove_all(dir);
}

TEST(StatusJournalTest, ReadWithoutJournalIsStateError) {
    auto dir = create_temp_dir("upsync_journal");
    StatusJournal journal(dir);
    auto entry = journal.read();
    ASSERT_TRUE(entry.is_error());
    EXPECT_EQ(entry.error().kind, ErrorKind::State);
    fs::remove_all(dir);
}

TEST(StatusJournalTest, PidFileTracksLiveProcess) {
    auto dir = create_temp_dir("upsync_journal");
    StatusJournal journal(dir);
    const long self = static_cast<long>(::getpid());

    ASSERT_TRUE(journal.claim_pid(self).is_ok());
    ASSERT_TRUE(journal.running_pid().has_value());
    EXPECT_EQ(*journal.running_pid(), self);

    journal.release_pid();
    EXPECT_FALSE(journal.running_pid().has_value());
    fs::remove_all(dir);
}

TEST(StatusJournalTest, StalePidIsIgnored) {
    auto dir = create_temp_dir("upsync_journal");
    StatusJournal journal(dir);
    // Larger than any pid_max
    upsync::test_support::write_text(journal.pid_path(), "2147483646\n");
    EXPECT_FALSE(journal.running_pid().has_value());
    EXPECT_TRUE(journal.claim_pid(static_cast<long>(::getpid())).is_ok());
    fs::remove_all(dir);
}
