#include "partvault/transfer/job_queue.hpp"

namespace partvault::transfer {

bool JobQueue::push(JobDescriptor descriptor) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return false;
        }
        jobs_.push_back(std::move(descriptor));
    }
    available_.notify_one();
    return true;
}

std::optional<JobDescriptor> JobQueue::pop() {
    std::unique_lock<std::mutex> lock(mutex_);
    available_.wait(lock, [this] { return !jobs_.empty() || closed_; });

    if (jobs_.empty()) {
        return std::nullopt;
    }

    auto descriptor = std::move(jobs_.front());
    jobs_.pop_front();
    return descriptor;
}

void JobQueue::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    available_.notify_all();
}

size_t JobQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return jobs_.size();
}

} // namespace partvault::transfer
