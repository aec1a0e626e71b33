#include "frame_scheduler.h"

#include <algorithm>
#include <exception>
#include <iostream>
#include <utility>

namespace plexus {

FrameScheduler::RequestId FrameScheduler::request_frame(FrameCallback callback) {
    const RequestId id = next_id_++;
    queue_.push_back(Request{id, std::move(callback)});
    return id;
}

void FrameScheduler::cancel_frame(RequestId id) {
    queue_.erase(std::remove_if(queue_.begin(), queue_.end(), [id](const Request& request) {
                     return request.id == id;
                 }),
                 queue_.end());
    for (Request& request : running_) {
        if (request.id == id) {
            request.callback = nullptr;
        }
    }
}

std::size_t FrameScheduler::run_frame(double timestamp_ms) {
    running_.clear();
    running_.swap(queue_);

    std::size_t invoked = 0;
    for (std::size_t i = 0; i < running_.size(); ++i) {
        // Moved out so a callback cancelling itself cannot destroy the running closure.
        FrameCallback callback = std::move(running_[i].callback);
        if (!callback) {
            continue;
        }
        ++invoked;
        try {
            callback(timestamp_ms);
        } catch (const std::exception& ex) {
            std::cerr << "[scheduler] frame callback " << running_[i].id << " failed: " << ex.what() << std::endl;
        }
    }
    running_.clear();
    return invoked;
}

} // namespace plexus
