#include <socialgraph/core/frame_scheduler.h>

#include <vector>

namespace socialgraph {
namespace core {

FrameRequestId QueuedFrameScheduler::RequestFrame(FrameCallback callback) {
    const FrameRequestId id = next_id_++;
    pending_.emplace(id, std::move(callback));
    return id;
}

void QueuedFrameScheduler::CancelFrame(FrameRequestId id) {
    pending_.erase(id);
}

std::size_t QueuedFrameScheduler::RunPendingFrames(double timestamp_seconds) {
    std::vector<FrameRequestId> due;
    due.reserve(pending_.size());
    for (const auto& entry : pending_) {
        due.push_back(entry.first);
    }

    std::size_t ran = 0;
    for (FrameRequestId id : due) {
        auto it = pending_.find(id);
        if (it == pending_.end()) continue; // cancelled by an earlier callback
        FrameCallback callback = std::move(it->second);
        pending_.erase(it);
        callback(timestamp_seconds);
        ++ran;
    }
    return ran;
}

} // namespace core
} // namespace socialgraph
