// src/session_sweeper.cpp
// Background expiry sweep

#include "sessiondb/session_sweeper.hpp"
#include "sessiondb/errors.hpp"
#include "sessiondb/utils.hpp"

namespace sessiondb {

SessionSweeper::SessionSweeper(std::shared_ptr<SessionDataStore> store, const SessionContext& context,
                               std::chrono::milliseconds interval)
    : store_(std::move(store))
    , context_(context)
    , interval_(interval) {
    if (!store_) {
        throw ConfigError(ErrorCode::INVALID_CONFIG, "store", "Sweeper requires a session store");
    }
    if (interval_.count() <= 0) {
        throw ConfigError(ErrorCode::INVALID_CONFIG, "sweep_interval", "Sweep interval must be positive");
    }
}

SessionSweeper::~SessionSweeper() {
    stop();
}

void SessionSweeper::start() {
    if (running_.exchange(true)) {
        return;
    }
    sweep_thread_ = std::thread(&SessionSweeper::sweep_loop, this);
    Utils::log(SystemLogLevel::INFO, "SessionSweeper", "started for " + context_.to_string());
}

void SessionSweeper::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(sweep_mutex_);
    }
    sweep_cv_.notify_all();

    if (sweep_thread_.joinable()) {
        sweep_thread_.join();
    }
    Utils::log(SystemLogLevel::INFO, "SessionSweeper", "stopped for " + context_.to_string());
}

void SessionSweeper::set_interval(std::chrono::milliseconds interval) {
    if (interval.count() <= 0) {
        throw ConfigError(ErrorCode::INVALID_CONFIG, "sweep_interval", "Sweep interval must be positive");
    }
    std::lock_guard<std::mutex> lock(sweep_mutex_);
    interval_ = interval;
}

std::chrono::milliseconds SessionSweeper::interval() const {
    std::lock_guard<std::mutex> lock(sweep_mutex_);
    return interval_;
}

void SessionSweeper::set_expired_callback(ExpiredCallback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    expired_callback_ = std::move(callback);
}

void SessionSweeper::set_candidate_provider(CandidateProvider provider) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    candidate_provider_ = std::move(provider);
}

size_t SessionSweeper::run_once(Timestamp now) {
    ExpiredCallback callback;
    CandidateProvider provider;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback = expired_callback_;
        provider = candidate_provider_;
    }

    std::set<SessionId> candidates;
    if (provider) {
        candidates = provider();
    }

    size_t removed = 0;
    for (const SessionId& id : store_->get_expired(candidates, context_, now)) {
        // Another node may have claimed it first
        if (store_->remove(id, context_)) {
            removed++;
        }
        if (callback) {
            callback(id);
        }
    }

    sweep_count_++;
    total_swept_ += removed;
    return removed;
}

void SessionSweeper::sweep_loop() {
    while (running_) {
        try {
            run_once(Utils::now_milliseconds());
        } catch (const Error& e) {
            failed_sweeps_++;
            Utils::log(SystemLogLevel::WARN, "SessionSweeper",
                       "sweep of " + context_.to_string() + " failed: " + e.what());
        } catch (const std::exception& e) {
            failed_sweeps_++;
            Utils::log(SystemLogLevel::ERROR, "SessionSweeper",
                       "sweep of " + context_.to_string() + " failed: " + e.what());
        }

        std::unique_lock<std::mutex> lock(sweep_mutex_);
        sweep_cv_.wait_for(lock, interval_, [this] { return !running_; });
    }
}

} // namespace sessiondb
