// include/sessiondb/session_sweeper.hpp
// Purpose: Background expiry sweep for one scope on this node

#pragma once

#include "session_context.hpp"
#include "session_data_store.hpp"
#include "types.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <thread>

namespace sessiondb {

class SessionSweeper {
public:
    using ExpiredCallback = std::function<void(const SessionId&)>;
    using CandidateProvider = std::function<std::set<SessionId>()>;

    SessionSweeper(std::shared_ptr<SessionDataStore> store, const SessionContext& context,
                   std::chrono::milliseconds interval);
    ~SessionSweeper();

    SessionSweeper(const SessionSweeper&) = delete;
    SessionSweeper& operator=(const SessionSweeper&) = delete;

    void start();
    void stop();
    bool is_running() const { return running_; }

    // One sweep: find expired ids, delete each, report each removed id.
    // Returns the number of rows removed. Storage errors propagate.
    size_t run_once(Timestamp now);

    void set_interval(std::chrono::milliseconds interval);
    std::chrono::milliseconds interval() const;

    // Invoked once per expired session id, including rows another node removed first
    void set_expired_callback(ExpiredCallback callback);

    // Ids the caller holds in memory; verified against the table on each sweep
    void set_candidate_provider(CandidateProvider provider);

    uint64_t total_swept() const { return total_swept_.load(); }
    uint64_t sweep_count() const { return sweep_count_.load(); }
    uint64_t failed_sweeps() const { return failed_sweeps_.load(); }

private:
    std::shared_ptr<SessionDataStore> store_;
    SessionContext context_;

    std::atomic<bool> running_{false};
    std::thread sweep_thread_;
    mutable std::mutex sweep_mutex_;
    std::condition_variable sweep_cv_;
    std::chrono::milliseconds interval_;

    std::mutex callback_mutex_;
    ExpiredCallback expired_callback_;
    CandidateProvider candidate_provider_;

    std::atomic<uint64_t> total_swept_{0};
    std::atomic<uint64_t> sweep_count_{0};
    std::atomic<uint64_t> failed_sweeps_{0};

    void sweep_loop();
};

} // namespace sessiondb
