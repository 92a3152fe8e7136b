#include "upsync/events/components.hpp"
#include "upsync/events/event_bus.hpp"
#include "upsync/events/events.hpp"
#include "upsync/source/extractor.hpp"
#include "upsync/sync/checkpoint.hpp"
#include "upsync/sync/config.hpp"
#include "upsync/sync/controller.hpp"
#include "upsync/sync/journal.hpp"
#include "upsync/sync/signal_pause.hpp"
#include "upsync/sync/transport.hpp"

#include <spdlog/spdlog.h>

#include <csignal>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <unistd.h>
#include <unordered_set>

using upsync::Error;
using upsync::ErrorKind;
using upsync::sync::StatusJournal;
using upsync::sync::SyncConfig;
using upsync::sync::SyncController;
using upsync::sync::SyncState;
using upsync::sync::SyncStatus;

namespace fs = std::filesystem;

namespace {

enum ExitCode {
    kExitCompleted = 0,
    kExitFatal = 1,
    kExitIncomplete = 2
};

struct CliOptions {
    std::string command;
    std::optional<std::string> source;
    std::optional<std::string> token;
    std::optional<std::string> endpoint;
    std::optional<std::string> config_file;
    std::optional<std::string> state_dir;
    std::optional<std::string> log_level;
    std::optional<std::size_t> batch_size;
};

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " <command> [options]\n"
              << "\n"
              << "Commands:\n"
              << "  start     extract the snapshot and upload everything not yet confirmed\n"
              << "  pause     stop the running upload after aborting its in-flight batch\n"
              << "  resume    continue a paused upload\n"
              << "  retry     continue an upload that stopped on an error\n"
              << "  status    print the last recorded state\n"
              << "  reset     forget the checkpoint and recorded state\n"
              << "  stats     count local records and, with an endpoint, remote ones\n"
              << "\n"
              << "Options:\n"
              << "  -s, --source <path>      SQLite snapshot (env SQLITE_PATH)\n"
              << "  -t, --token <token>      upload credential (env UPSYNC_TOKEN)\n"
              << "  -e, --endpoint <url>     upload endpoint\n"
              << "  -b, --batch-size <n>     records per batch (default 50)\n"
              << "  -c, --config <file>      JSON config file\n"
              << "      --state-dir <dir>    checkpoint and status directory (default .upsync)\n"
              << "      --log-level <level>  trace|debug|info|warn|error\n"
              << "\n"
              << "Exit codes: 0 completed, 1 fatal error, 2 paused or incomplete\n";
}

std::optional<CliOptions> parse_args(int argc, char* argv[]) {
    if (argc < 2) {
        return std::nullopt;
    }
    CliOptions options;
    options.command = argv[1];
    if (options.command == "-h" || options.command == "--help") {
        return std::nullopt;
    }

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            return std::nullopt;
        }
        if (i + 1 >= argc) {
            spdlog::error("Missing value for {}", arg);
            return std::nullopt;
        }
        std::string value = argv[++i];
        if (arg == "-s" || arg == "--source") {
            options.source = value;
        } else if (arg == "-t" || arg == "--token") {
            options.token = value;
        } else if (arg == "-e" || arg == "--endpoint") {
            options.endpoint = value;
        } else if (arg == "-c" || arg == "--config") {
            options.config_file = value;
        } else if (arg == "--state-dir") {
            options.state_dir = value;
        } else if (arg == "--log-level") {
            options.log_level = value;
        } else if (arg == "-b" || arg == "--batch-size") {
            try {
                long long parsed = std::stoll(value);
                if (parsed <= 0) {
                    spdlog::error("Batch size must be positive, got {}", value);
                    return std::nullopt;
                }
                options.batch_size = static_cast<std::size_t>(parsed);
            } catch (const std::exception&) {
                spdlog::error("Invalid batch size: {}", value);
                return std::nullopt;
            }
        } else {
            spdlog::error("Unknown option: {}", arg);
            return std::nullopt;
        }
    }
    return options;
}

/// Defaults, then config file, then environment, then flags
upsync::Result<SyncConfig> build_config(const CliOptions& options) {
    SyncConfig config;
    if (options.config_file) {
        auto loaded = SyncConfig::load_file(*options.config_file, config);
        if (loaded.is_error()) {
            return loaded;
        }
        config = std::move(loaded.value());
    }
    config.apply_environment();

    if (options.source) config.source_path = *options.source;
    if (options.token) config.credential = *options.token;
    if (options.endpoint) config.endpoint = *options.endpoint;
    if (options.state_dir) config.state_dir = *options.state_dir;
    if (options.log_level) config.log_level = *options.log_level;
    if (options.batch_size) config.batch_size = *options.batch_size;

    auto valid = config.validate();
    if (valid.is_error()) {
        return upsync::Err<SyncConfig>(valid.error());
    }
    return upsync::Ok(std::move(config));
}

int exit_code_for(const SyncState& state) {
    switch (state.status) {
        case SyncStatus::Completed:
            return kExitCompleted;
        case SyncStatus::Error:
            if (state.last_error && (state.last_error->is_fatal() || state.last_error->kind == ErrorKind::Io)) {
                return kExitFatal;
            }
            return kExitIncomplete;
        default:
            return kExitIncomplete;
    }
}

int fail(const Error& error) {
    spdlog::error("{}", upsync::describe(error));
    return error.is_fatal() || error.kind == ErrorKind::Io || error.kind == ErrorKind::State ? kExitFatal
                                                                                           : kExitIncomplete;
}

void print_state(const SyncState& state, const std::string& endpoint, std::optional<long> pid) {
    std::cout << "Status:    " << upsync::sync::status_name(state.status);
    if (pid) {
        std::cout << " (running, pid " << *pid << ")";
    }
    std::cout << "\n";
    if (!state.source_path.empty()) {
        std::cout << "Source:    " << state.source_path << "\n";
    }
    if (!endpoint.empty()) {
        std::cout << "Endpoint:  " << endpoint << "\n";
    }
    std::cout << "Articles:  " << state.uploaded_articles << " / " << state.total_articles << "\n"
              << "Creators:  " << state.uploaded_creators << " / " << state.total_creators << "\n"
              << "Batch:     " << state.current_batch << " / " << state.total_batches;
    if (state.skipped_batches > 0) {
        std::cout << " (" << state.skipped_batches << " skipped)";
    }
    std::cout << "\n"
              << "Inserted:  " << state.inserted << ", updated: " << state.updated << "\n";
    if (state.last_error) {
        std::cout << "Error:     " << upsync::describe(*state.last_error) << "\n";
    }
    if (!state.logs.empty()) {
        std::cout << "\nRecent log:\n";
        const std::size_t tail = state.logs.size() > 10 ? state.logs.size() - 10 : 0;
        for (std::size_t i = tail; i < state.logs.size(); ++i) {
            std::cout << "  " << state.logs[i] << "\n";
        }
    }
}

// ──────────────────────────────────────────────────────────
// Upload (start / resume / retry)
// ──────────────────────────────────────────────────────────

int run_upload(const SyncConfig& config, const std::string& source_path) {
    if (config.credential.empty()) {
        return fail(Error{ErrorKind::Config, "No upload token; pass --token or set UPSYNC_TOKEN"});
    }
    if (source_path.empty()) {
        return fail(Error{ErrorKind::Config, "No source; pass --source or set SQLITE_PATH"});
    }

    upsync::sync::TransportOptions transport_options;
    transport_options.timeout = config.request_timeout;
    auto transport = upsync::sync::HttpBatchTransport::create(config.endpoint, transport_options);
    if (transport.is_error()) {
        return fail(transport.error());
    }

    StatusJournal journal(config.state_dir);
    auto claimed = journal.claim_pid(static_cast<long>(::getpid()));
    if (claimed.is_error()) {
        return fail(claimed.error());
    }

    upsync::events::EventBus bus;
    upsync::events::LoggerComponent logger(bus);
    bus.subscribe<upsync::events::StateChangedEvent>([&](const upsync::events::StateChangedEvent& event) {
        auto written = journal.write(event.snapshot, config.endpoint);
        if (written.is_error()) {
            spdlog::warn("Status journal not updated: {}", written.error().message);
        }
    });

    SyncController controller(config, std::move(transport.value()), bus);

    // Ctrl-C and `upsync pause` both land here
    upsync::sync::SignalPauser pauser(controller, {SIGINT, SIGTERM});

    int code = kExitIncomplete;
    auto started = controller.start(source_path);
    if (started.is_error()) {
        code = fail(started.error());
    } else {
        auto uploading = controller.start_upload(config.credential);
        if (uploading.is_error()) {
            code = fail(uploading.error());
        } else {
            auto deferred = pauser.apply_pending();
            if (deferred.is_error()) {
                spdlog::debug("Deferred pause not applied: {}", deferred.error().message);
            }
            controller.wait();
            code = exit_code_for(controller.snapshot());
        }
    }

    const auto final_state = controller.snapshot();
    auto written = journal.write(final_state, config.endpoint);
    if (written.is_error()) {
        spdlog::warn("Status journal not updated: {}", written.error().message);
    }
    journal.release_pid();

    switch (final_state.status) {
        case SyncStatus::Completed:
            spdlog::info("Upload complete: {} articles, {} creators ({} inserted, {} updated)",
                         final_state.uploaded_articles,
                         final_state.uploaded_creators,
                         final_state.inserted,
                         final_state.updated);
            break;
        case SyncStatus::Paused:
            spdlog::info("Paused at {}/{} articles, {}/{} creators; run `upsync resume` to continue",
                         final_state.uploaded_articles,
                         final_state.total_articles,
                         final_state.uploaded_creators,
                         final_state.total_creators);
            break;
        case SyncStatus::Error:
            if (final_state.last_error && !final_state.last_error->is_fatal()) {
                spdlog::info("Run `upsync retry` once the service is reachable");
            }
            break;
        default:
            break;
    }
    return code;
}

/// Shared by resume and retry: continue what the journal recorded
int continue_upload(const CliOptions& options, SyncConfig config, SyncStatus expected) {
    StatusJournal journal(config.state_dir);
    auto entry = journal.read();
    if (entry.is_error()) {
        return fail(entry.error());
    }
    if (entry.value().pid) {
        return fail(Error{ErrorKind::State, "An upload is already running (pid " +
                                                std::to_string(*entry.value().pid) + ")"});
    }
    const auto& recorded = entry.value().state;
    if (recorded.status != expected) {
        return fail(Error{ErrorKind::State, std::string("Cannot ") + options.command + " an upload that is " +
                                                upsync::sync::status_name(recorded.status)});
    }

    if (!options.endpoint && !entry.value().endpoint.empty()) {
        config.endpoint = entry.value().endpoint;
    }
    const std::string source = options.source ? *options.source : recorded.source_path;
    spdlog::info("Continuing {} ({} of {} articles, {} of {} creators confirmed)",
                 source,
                 recorded.uploaded_articles,
                 recorded.total_articles,
                 recorded.uploaded_creators,
                 recorded.total_creators);
    return run_upload(config, source);
}

// ──────────────────────────────────────────────────────────
// Other commands
// ──────────────────────────────────────────────────────────

int pause_running(const SyncConfig& config) {
    StatusJournal journal(config.state_dir);
    auto pid = journal.running_pid();
    if (!pid) {
        return fail(Error{ErrorKind::State, "No upload is running"});
    }
    if (::kill(static_cast<pid_t>(*pid), SIGINT) != 0) {
        return fail(Error{ErrorKind::State, "Cannot signal pid " + std::to_string(*pid)});
    }
    spdlog::info("Pause requested for pid {}", *pid);

    // The uploader aborts its in-flight request, so this is bounded by one request timeout
    const auto deadline = std::chrono::steady_clock::now() + config.request_timeout + std::chrono::seconds(5);
    while (journal.running_pid() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    if (journal.running_pid()) {
        spdlog::warn("Pid {} has not exited yet", *pid);
        return kExitIncomplete;
    }

    auto entry = journal.read();
    if (entry.is_error()) {
        return fail(entry.error());
    }
    print_state(entry.value().state, entry.value().endpoint, std::nullopt);
    return exit_code_for(entry.value().state);
}

int show_status(const SyncConfig& config) {
    StatusJournal journal(config.state_dir);
    auto entry = journal.read();
    if (entry.is_error()) {
        if (entry.error().kind == ErrorKind::State) {
            std::cout << "Status:    idle (nothing recorded in " << config.state_dir.string() << ")\n";
            return kExitCompleted;
        }
        return fail(entry.error());
    }
    print_state(entry.value().state, entry.value().endpoint, entry.value().pid);
    return kExitCompleted;
}

int reset_state(const CliOptions& options, const SyncConfig& config) {
    StatusJournal journal(config.state_dir);
    if (auto pid = journal.running_pid()) {
        return fail(Error{ErrorKind::State, "Pause the running upload (pid " + std::to_string(*pid) + ") first"});
    }

    std::string fingerprint;
    auto entry = journal.read();
    if (entry.is_ok()) {
        fingerprint = entry.value().state.fingerprint;
    }
    if (options.source) {
        fingerprint = fs::path(*options.source).filename().string();
    }

    if (!fingerprint.empty()) {
        upsync::sync::CheckpointStore checkpoint(config.state_dir);
        auto cleared = checkpoint.clear(fingerprint);
        if (cleared.is_error()) {
            return fail(cleared.error());
        }
        spdlog::info("Checkpoint for {} cleared", fingerprint);
    }
    auto removed = journal.remove();
    if (removed.is_error()) {
        return fail(removed.error());
    }
    spdlog::info("State reset");
    return kExitCompleted;
}

int show_stats(const SyncConfig& config) {
    std::string source_path = config.source_path;
    std::string endpoint = config.endpoint;
    StatusJournal journal(config.state_dir);
    if (auto entry = journal.read(); entry.is_ok()) {
        if (source_path.empty()) source_path = entry.value().state.source_path;
        if (endpoint.empty()) endpoint = entry.value().endpoint;
    }
    if (source_path.empty()) {
        return fail(Error{ErrorKind::Config, "No source; pass --source or set SQLITE_PATH"});
    }

    auto extractor = upsync::source::SourceExtractor::open(source_path);
    if (extractor.is_error()) {
        return fail(extractor.error());
    }
    auto articles = extractor.value().count_content();
    if (articles.is_error()) {
        return fail(articles.error());
    }
    auto creators = extractor.value().count_creators();
    if (creators.is_error()) {
        return fail(creators.error());
    }

    upsync::sync::CheckpointStore checkpoint(config.state_dir);
    auto confirmed = checkpoint.load(extractor.value().fingerprint());
    if (confirmed.is_error()) {
        return fail(confirmed.error());
    }

    std::cout << "Source:    " << source_path << "\n"
              << "Articles:  " << articles.value() << " ("
              << confirmed.value().size(upsync::source::EntityType::Content) << " confirmed)\n"
              << "Creators:  " << creators.value() << " ("
              << confirmed.value().size(upsync::source::EntityType::Creator) << " confirmed)\n";

    if (endpoint.empty() || config.credential.empty()) {
        spdlog::debug("No endpoint or token; skipping remote statistics");
        return kExitCompleted;
    }

    upsync::sync::TransportOptions transport_options;
    transport_options.timeout = config.request_timeout;
    auto transport = upsync::sync::HttpBatchTransport::create(endpoint, transport_options);
    if (transport.is_error()) {
        return fail(transport.error());
    }
    upsync::CancellationToken cancel;
    auto remote = transport.value()->fetch_status(config.credential, cancel);
    if (remote.is_error()) {
        return fail(remote.error());
    }

    const std::unordered_set<std::string> existing(remote.value().existing_content_ids.begin(),
                                                   remote.value().existing_content_ids.end());
    std::size_t already_remote = 0;
    auto stream = extractor.value().extract_content();
    if (stream.is_error()) {
        return fail(stream.error());
    }
    auto records = upsync::source::collect_unique(stream.value());
    if (records.is_error()) {
        return fail(records.error());
    }
    for (const auto& record : records.value()) {
        if (existing.count(record.content_id) > 0) {
            ++already_remote;
        }
    }

    std::cout << "Remote:    " << remote.value().article_count << " articles, "
              << remote.value().creator_count << " creators\n"
              << "On remote: " << already_remote << " of " << records.value().size() << " local articles\n";
    return kExitCompleted;
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    auto options = parse_args(argc, argv);
    if (!options) {
        print_usage(argv[0]);
        return kExitFatal;
    }

    auto config = build_config(*options);
    if (config.is_error()) {
        return fail(config.error());
    }
    spdlog::set_level(spdlog::level::from_str(config.value().log_level));

    const auto& command = options->command;
    if (command == "start") {
        return run_upload(config.value(), config.value().source_path);
    }
    if (command == "resume") {
        return continue_upload(*options, config.value(), SyncStatus::Paused);
    }
    if (command == "retry") {
        return continue_upload(*options, config.value(), SyncStatus::Error);
    }
    if (command == "pause") {
        return pause_running(config.value());
    }
    if (command == "status") {
        return show_status(config.value());
    }
    if (command == "reset") {
        return reset_state(*options, config.value());
    }
    if (command == "stats") {
        return show_stats(config.value());
    }

    spdlog::error("Unknown command: {}", command);
    print_usage(argv[0]);
    return kExitFatal;
}
