#pragma once

#include "upsync/server/ingest_service.hpp"
#include "upsync/sync/transport.hpp"
#include "upsync/sync/wire.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace upsync::test_support {

/**
 * @brief Scripted BatchTransport
 *
 * Calls are numbered from 1. A call can be scripted to fail with a given
 * error or to hang until its cancellation token fires. Every other call
 * is acknowledged as all-inserted.
 */
class FakeTransport : public sync::BatchTransport {
public:
    struct Call {
        std::string batch_id;
        std::vector<std::string> ids;
        std::string credential;
    };

    void fail_call(std::size_t call, Error error) {
        std::lock_guard lock(mutex_);
        failures_[call] = std::move(error);
    }

    void hang_call(std::size_t call) {
        std::lock_guard lock(mutex_);
        hangs_.push_back(call);
    }

    /// Only this credential is accepted once set
    void require_credential(std::string credential) {
        std::lock_guard lock(mutex_);
        required_credential_ = std::move(credential);
    }

    Result<sync::BatchAck> send(const sync::Batch& batch,
                                const std::string& credential,
                                const CancellationToken& cancel) override {
        std::size_t number = 0;
        bool hang = false;
        std::optional<Error> failure;
        {
            std::lock_guard lock(mutex_);
            calls_.push_back(Call{batch.batch_id(), batch.ids(), credential});
            number = calls_.size();
            for (auto call : hangs_) {
                hang = hang || call == number;
            }
            if (auto it = failures_.find(number); it != failures_.end()) {
                failure = it->second;
            }
            if (!required_credential_.empty() && credential != required_credential_) {
                failure = Error{ErrorKind::Auth, "HTTP 401: Invalid upload token"};
            }
            hanging_ = hang;
        }
        cv_.notify_all();

        if (hang) {
            while (!cancel.wait_for(std::chrono::milliseconds(50))) {
            }
            std::lock_guard lock(mutex_);
            hanging_ = false;
            return Err<sync::BatchAck>(ErrorKind::Cancelled, "Request aborted");
        }
        if (failure) {
            return Err<sync::BatchAck>(*failure);
        }
        return Ok(sync::BatchAck{batch.size(), 0});
    }

    /// Block until a scripted hang is in progress
    bool wait_until_hanging(std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        std::unique_lock lock(mutex_);
        return cv_.wait_for(lock, timeout, [this]() { return hanging_; });
    }

    std::vector<Call> calls() const {
        std::lock_guard lock(mutex_);
        return calls_;
    }

    std::size_t call_count() const {
        std::lock_guard lock(mutex_);
        return calls_.size();
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<Call> calls_;
    std::map<std::size_t, Error> failures_;
    std::vector<std::size_t> hangs_;
    std::string required_credential_;
    bool hanging_ = false;
};

/**
 * @brief BatchTransport that applies batches to an in-process IngestService
 */
class LoopbackTransport : public sync::BatchTransport {
public:
    explicit LoopbackTransport(server::IngestService& service) : service_(service) {}

    Result<sync::BatchAck> send(const sync::Batch& batch,
                                const std::string&,
                                const CancellationToken& cancel) override {
        if (cancel.is_cancelled()) {
            return Err<sync::BatchAck>(ErrorKind::Cancelled, "Request aborted");
        }
        auto payload = sync::decode_upload(sync::encode_batch(batch));
        if (payload.is_error()) {
            return Err<sync::BatchAck>(payload.error());
        }
        const auto counts = service_.upsert(payload.value());
        return Ok(sync::BatchAck{counts.articles_inserted + counts.creators_inserted,
                                 counts.articles_updated + counts.creators_updated});
    }

private:
    server::IngestService& service_;
};

} // namespace upsync::test_support
