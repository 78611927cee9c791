#include <trialflow/core/persistence_worker.hpp>
#include <trialflow/core/error.hpp>

#include <utility>

namespace trialflow::core {

PersistenceWorker::~PersistenceWorker() {
    std::unique_lock lock(mutex_);
    if (!active_) {
        return;
    }
    wait_for(submitted_, lock);
    stopping_ = true;
    lock.unlock();
    work_available_.notify_all();
    thread_.join();
}

void PersistenceWorker::begin() {
    std::lock_guard lock(mutex_);
    if (active_) {
        return;
    }
    active_ = true;
    stopping_ = false;
    thread_ = std::thread([this] { run(); });
}

void PersistenceWorker::submit(Job job) {
    {
        std::lock_guard lock(mutex_);
        if (!active_) {
            throw UninitializedUseError("cannot submit a write job: persistence worker is not active");
        }
        queue_.push_back(std::move(job));
        ++submitted_;
    }
    work_available_.notify_one();
}

void PersistenceWorker::drain() {
    std::unique_lock lock(mutex_);
    wait_for(submitted_, lock);
    rethrow_failure(lock);
}

void PersistenceWorker::end() {
    std::unique_lock lock(mutex_);
    if (!active_) {
        return;
    }
    wait_for(submitted_, lock);
    stopping_ = true;
    lock.unlock();
    work_available_.notify_all();
    thread_.join();

    lock.lock();
    active_ = false;
    stopping_ = false;
    rethrow_failure(lock);
}

bool PersistenceWorker::active() const {
    std::lock_guard lock(mutex_);
    return active_;
}

std::size_t PersistenceWorker::pending() const {
    std::lock_guard lock(mutex_);
    return static_cast<std::size_t>(submitted_ - completed_);
}

void PersistenceWorker::wait_for(uint64_t ticket, std::unique_lock<std::mutex>& lock) {
    job_finished_.wait(lock, [this, ticket] { return completed_ >= ticket; });
}

void PersistenceWorker::rethrow_failure(std::unique_lock<std::mutex>& lock) {
    if (failure_) {
        std::exception_ptr failure = std::exchange(failure_, nullptr);
        lock.unlock();
        std::rethrow_exception(failure);
    }
}

void PersistenceWorker::run() {
    std::unique_lock lock(mutex_);
    while (true) {
        work_available_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
        if (queue_.empty()) {
            // stopping_ and nothing left to do
            return;
        }

        Job job = std::move(queue_.front());
        queue_.pop_front();
        lock.unlock();

        std::exception_ptr error;
        try {
            job();
        } catch (...) {
            error = std::current_exception();
        }

        lock.lock();
        if (error && !failure_) {
            failure_ = error;
        }
        ++completed_;
        job_finished_.notify_all();
    }
}

} // namespace trialflow::core
