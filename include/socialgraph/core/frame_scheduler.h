#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>

namespace socialgraph {
namespace core {

using FrameRequestId = std::uint64_t;
using FrameCallback = std::function<void(double timestamp_seconds)>;

// Host frame-scheduling primitive: one-shot callbacks run on the next frame.
class FrameScheduler {
public:
    virtual ~FrameScheduler() = default;

    virtual FrameRequestId RequestFrame(FrameCallback callback) = 0;
    // Cancelling an id that already ran or was cancelled is a no-op.
    virtual void CancelFrame(FrameRequestId id) = 0;
};

/*
 * FrameScheduler pumped explicitly by the host: the desktop viewer calls
 * RunPendingFrames() once per GLFW frame, the console and the tests step it
 * by hand. Callbacks requested while frames are running are deferred to the
 * next pump, and callbacks cancelled mid-pump never run.
 */
class QueuedFrameScheduler : public FrameScheduler {
public:
    FrameRequestId RequestFrame(FrameCallback callback) override;
    void CancelFrame(FrameRequestId id) override;

    // Runs the callbacks pending at call time. Returns how many ran.
    std::size_t RunPendingFrames(double timestamp_seconds);

    std::size_t PendingCount() const { return pending_.size(); }

private:
    FrameRequestId next_id_ = 1;
    std::map<FrameRequestId, FrameCallback> pending_;
};

} // namespace core
} // namespace socialgraph
