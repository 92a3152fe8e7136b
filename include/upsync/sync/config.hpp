#pragma once

#include "upsync/core/result.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

namespace upsync::sync {

/// What happens to the checkpoint once every pending record is confirmed
enum class CompletionPolicy {
    Clear,
    Retain
};

const char* completion_policy_name(CompletionPolicy policy);

/**
 * @brief Runtime settings of an upload
 *
 * Sources, lowest precedence first: built-in defaults, a JSON config file,
 * environment (UPSYNC_TOKEN, SQLITE_PATH), command-line flags.
 *
 * JSON keys mirror the field names:
 *   { "endpoint": "https://host/api/upload", "batch_size": 50,
 *     "inter_batch_delay_ms": 100, "request_timeout_ms": 120000,
 *     "state_dir": ".upsync", "completion_policy": "clear",
 *     "log_capacity": 100, "log_level": "info" }
 */
struct SyncConfig {
    std::string endpoint;
    std::string credential;
    std::string source_path;
    std::size_t batch_size = 50;
    std::chrono::milliseconds inter_batch_delay{100};
    std::chrono::milliseconds request_timeout{120000};
    std::filesystem::path state_dir = ".upsync";
    CompletionPolicy completion_policy = CompletionPolicy::Clear;
    std::size_t log_capacity = 100;
    std::string log_level = "info";

    /// Overlay the keys present in a JSON document onto @p base
    static Result<SyncConfig> load_file(const std::filesystem::path& path, SyncConfig base);
    static Result<SyncConfig> parse(const std::string& json_text, SyncConfig base);

    /// Same, starting from the built-in defaults
    static Result<SyncConfig> load_file(const std::filesystem::path& path);
    static Result<SyncConfig> parse(const std::string& json_text);

    /// Fill credential/source_path from UPSYNC_TOKEN/SQLITE_PATH when unset
    void apply_environment();

    /// Structural checks only; a missing credential is checked at upload time
    [[nodiscard]] Result<void> validate() const;
};

} // namespace upsync::sync
