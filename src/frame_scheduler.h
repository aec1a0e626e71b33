#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

namespace plexus {

// Host frame-callback queue, the terminal equivalent of requestAnimationFrame.
// Callbacks requested while a frame runs are deferred to the next frame.
class FrameScheduler {
public:
    using FrameCallback = std::function<void(double timestamp_ms)>;
    using RequestId = std::uint64_t;

    RequestId request_frame(FrameCallback callback);
    void cancel_frame(RequestId id);

    // Runs every callback queued before this call. A callback that throws is
    // reported on std::cerr and does not prevent the others from running.
    // Returns the number of callbacks invoked.
    std::size_t run_frame(double timestamp_ms);

    std::size_t pending() const { return queue_.size(); }

private:
    struct Request {
        RequestId id = 0;
        FrameCallback callback;
    };

    std::vector<Request> queue_;
    std::vector<Request> running_; // Batch being delivered by run_frame()
    RequestId next_id_ = 1;
};

} // namespace plexus
