#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <exception>
#include <functional>
#include <mutex>
#include <thread>

namespace trialflow::core {

/// @brief Background FIFO executor for write jobs.
/// @ingroup core_storage
///
/// Jobs are run one at a time on a single worker thread, strictly in the
/// order they were submitted: job N has finished before job N+1 starts.
/// This is what lets a later file safely reference an earlier one.
///
/// drain() is a barrier. It blocks until every job submitted before the
/// call has completed; jobs submitted concurrently by other threads
/// after the call are not waited for.
///
/// A job that throws does not stop the queue. The first failure is kept
/// and rethrown by the next drain() or end(), once the queue has run.
///
/// Non-copyable and non-movable because the worker thread captures `this`.
///
/// @code
/// PersistenceWorker worker;
/// worker.begin();
/// worker.submit([] { write_file_a(); });
/// worker.submit([] { write_file_b(); });  // starts after a is written
/// worker.end();                           // both written, thread joined
/// @endcode
///
/// @see DataHandler, Session::end
class PersistenceWorker {
public:
    /// @brief A unit of work. Must own (copy) everything it touches.
    using Job = std::function<void()>;

    PersistenceWorker() = default;

    /// @brief Joins the worker thread after running all queued jobs.
    ///
    /// Pending job failures are discarded here; call end() to observe them.
    ~PersistenceWorker();

    PersistenceWorker(const PersistenceWorker&) = delete;
    PersistenceWorker& operator=(const PersistenceWorker&) = delete;
    PersistenceWorker(PersistenceWorker&&) = delete;
    PersistenceWorker& operator=(PersistenceWorker&&) = delete;

    /// @brief Start the worker thread. No-op if already active.
    void begin();

    /// @brief Queue @p job for execution on the worker thread.
    /// @throws UninitializedUseError if the worker is not active.
    void submit(Job job);

    /// @brief Block until every job submitted before this call has run.
    /// @throws The first exception raised by a job since the last drain.
    void drain();

    /// @brief Drain, then stop and join the worker thread.
    ///
    /// The worker may be started again with begin(). No-op if not active.
    ///
    /// @throws The first exception raised by a job since the last drain.
    void end();

    /// @brief Returns true between begin() and end().
    [[nodiscard]] bool active() const;

    /// @brief Number of jobs queued or running.
    [[nodiscard]] std::size_t pending() const;

private:
    void run();
    void wait_for(uint64_t ticket, std::unique_lock<std::mutex>& lock);
    void rethrow_failure(std::unique_lock<std::mutex>& lock);

    mutable std::mutex mutex_;
    std::condition_variable work_available_;
    std::condition_variable job_finished_;
    std::deque<Job> queue_;
    uint64_t submitted_{0};
    uint64_t completed_{0};
    bool active_{false};
    bool stopping_{false};
    std::exception_ptr failure_;
    std::thread thread_;
};

} // namespace trialflow::core
