#include "upsync/sync/config.hpp"

#include "upsync/core/file_io.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <cstdlib>

namespace upsync::sync {
using json = nlohmann::json;

namespace {

std::optional<CompletionPolicy> policy_from_name(const std::string& name) {
    if (name == "clear") {
        return CompletionPolicy::Clear;
    }
    if (name == "retain") {
        return CompletionPolicy::Retain;
    }
    return std::nullopt;
}

bool is_known_level(const std::string& level) {
    for (const char* known : {"trace", "debug", "info", "warn", "error", "critical", "off"}) {
        if (level == known) {
            return true;
        }
    }
    return false;
}

} // namespace

const char* completion_policy_name(CompletionPolicy policy) {
    return policy == CompletionPolicy::Clear ? "clear" : "retain";
}

Result<SyncConfig> SyncConfig::load_file(const std::filesystem::path& path) {
    return load_file(path, SyncConfig{});
}

Result<SyncConfig> SyncConfig::parse(const std::string& json_text) {
    return parse(json_text, SyncConfig{});
}

Result<SyncConfig> SyncConfig::load_file(const std::filesystem::path& path, SyncConfig base) {
    auto contents = read_file(path);
    if (contents.is_error()) {
        return Err<SyncConfig>(ErrorKind::Config, "Cannot read config file: " + contents.error().message);
    }
    return parse(contents.value(), std::move(base));
}

Result<SyncConfig> SyncConfig::parse(const std::string& json_text, SyncConfig base) {
    SyncConfig config = std::move(base);
    try {
        const auto doc = json::parse(json_text);
        if (!doc.is_object()) {
            return Err<SyncConfig>(ErrorKind::Config, "Config must be a JSON object");
        }

        if (doc.contains("endpoint")) {
            config.endpoint = doc.at("endpoint").get<std::string>();
        }
        if (doc.contains("credential")) {
            config.credential = doc.at("credential").get<std::string>();
        }
        if (doc.contains("source_path")) {
            config.source_path = doc.at("source_path").get<std::string>();
        }
        if (doc.contains("batch_size")) {
            config.batch_size = doc.at("batch_size").get<std::size_t>();
        }
        if (doc.contains("inter_batch_delay_ms")) {
            config.inter_batch_delay = std::chrono::milliseconds(doc.at("inter_batch_delay_ms").get<std::int64_t>());
        }
        if (doc.contains("request_timeout_ms")) {
            config.request_timeout = std::chrono::milliseconds(doc.at("request_timeout_ms").get<std::int64_t>());
        }
        if (doc.contains("state_dir")) {
            config.state_dir = doc.at("state_dir").get<std::string>();
        }
        if (doc.contains("completion_policy")) {
            const auto name = doc.at("completion_policy").get<std::string>();
            auto policy = policy_from_name(name);
            if (!policy) {
                return Err<SyncConfig>(ErrorKind::Config, "Unknown completion_policy: " + name);
            }
            config.completion_policy = *policy;
        }
        if (doc.contains("log_capacity")) {
            config.log_capacity = doc.at("log_capacity").get<std::size_t>();
        }
        if (doc.contains("log_level")) {
            config.log_level = doc.at("log_level").get<std::string>();
        }
    } catch (const json::exception& e) {
        return Err<SyncConfig>(ErrorKind::Config, std::string("Invalid config: ") + e.what());
    }
    return Ok(std::move(config));
}

void SyncConfig::apply_environment() {
    if (credential.empty()) {
        if (const char* token = std::getenv("UPSYNC_TOKEN")) {
            credential = token;
        }
    }
    if (source_path.empty()) {
        if (const char* path = std::getenv("SQLITE_PATH")) {
            source_path = path;
        }
    }
}

Result<void> SyncConfig::validate() const {
    if (batch_size == 0) {
        return Err<void>(ErrorKind::Config, "batch_size must be > 0");
    }
    if (inter_batch_delay.count() < 0) {
        return Err<void>(ErrorKind::Config, "inter_batch_delay must not be negative");
    }
    if (request_timeout.count() <= 0) {
        return Err<void>(ErrorKind::Config, "request_timeout must be > 0");
    }
    if (state_dir.empty()) {
        return Err<void>(ErrorKind::Config, "state_dir must not be empty");
    }
    if (!is_known_level(log_level)) {
        return Err<void>(ErrorKind::Config, "Unknown log_level: " + log_level);
    }
    return Ok();
}

} // namespace upsync::sync
