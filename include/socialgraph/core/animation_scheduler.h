#pragma once

#include <socialgraph/core/frame_scheduler.h>
#include <socialgraph/graph/simulation_context.h>

#include <cstdint>
#include <optional>

namespace socialgraph {

namespace graph {
class ForceDirectedLayout;
class GraphRenderer;
class DrawSurface;
}

namespace core {

/*
 * Per-frame loop coupling the force simulation and the renderer.
 *
 * While Running exactly one frame request is kept in flight; each frame
 * advances the simulation once and draws. Pausing stops re-requesting, and
 * RequestRedraw() schedules a single draw-only frame. Teardown() cancels the
 * outstanding request so no callback can touch the graph or surface after
 * disposal. A frame that throws is logged and skipped.
 */
class AnimationScheduler {
public:
    AnimationScheduler(FrameScheduler& frames,
                       graph::SimulationContext& context,
                       graph::ForceDirectedLayout& layout,
                       graph::GraphRenderer& renderer,
                       graph::DrawSurface& surface);
    ~AnimationScheduler();

    AnimationScheduler(const AnimationScheduler&) = delete;
    AnimationScheduler& operator=(const AnimationScheduler&) = delete;

    void Start();
    void Pause();
    // Paused -> Running -> Paused. Returns the new state.
    graph::SimulationState Toggle();
    bool IsRunning() const { return context_.IsRunning(); }

    void RequestRedraw();
    void Teardown();

    bool IsTornDown() const { return torn_down_; }
    bool HasPendingFrame() const { return pending_request_.has_value(); }
    std::uint64_t GetFrameCount() const { return frame_count_; }
    std::uint64_t GetSkippedFrames() const { return skipped_frames_; }

private:
    void ScheduleFrame();
    void OnFrame(double timestamp_seconds);

    FrameScheduler& frames_;
    graph::SimulationContext& context_;
    graph::ForceDirectedLayout& layout_;
    graph::GraphRenderer& renderer_;
    graph::DrawSurface& surface_;

    std::optional<FrameRequestId> pending_request_;
    bool torn_down_ = false;
    std::uint64_t frame_count_ = 0;
    std::uint64_t skipped_frames_ = 0;
};

} // namespace core
} // namespace socialgraph
