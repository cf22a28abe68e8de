#pragma once

#include "transfer_types.hpp"
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace partvault::transfer {

// Hand-off point between whoever produces job descriptors and the dispatcher
class JobQueue {
public:
    // false once the queue is closed
    bool push(JobDescriptor descriptor);

    // Blocks until a descriptor is available; nullopt once closed and drained
    std::optional<JobDescriptor> pop();

    void close();
    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable available_;
    std::deque<JobDescriptor> jobs_;
    bool closed_ = false;
};

} // namespace partvault::transfer
