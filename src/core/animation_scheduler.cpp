#include <socialgraph/core/animation_scheduler.h>
#include <socialgraph/graph/layout/force_directed_layout.h>
#include <socialgraph/graph/render/draw_surface.h>
#include <socialgraph/graph/render/graph_renderer.h>

#include <exception>
#include <iostream>

namespace socialgraph {
namespace core {

AnimationScheduler::AnimationScheduler(FrameScheduler& frames,
                                       graph::SimulationContext& context,
                                       graph::ForceDirectedLayout& layout,
                                       graph::GraphRenderer& renderer,
                                       graph::DrawSurface& surface)
    : frames_(frames), context_(context), layout_(layout), renderer_(renderer), surface_(surface) {}

AnimationScheduler::~AnimationScheduler() {
    Teardown();
}

void AnimationScheduler::Start() {
    if (torn_down_) return;
    context_.state = graph::SimulationState::Running;
    ScheduleFrame();
}

void AnimationScheduler::Pause() {
    context_.state = graph::SimulationState::Paused;
}

graph::SimulationState AnimationScheduler::Toggle() {
    if (context_.IsRunning()) {
        Pause();
    } else {
        Start();
    }
    return context_.state;
}

void AnimationScheduler::RequestRedraw() {
    if (torn_down_) return;
    ScheduleFrame();
}

void AnimationScheduler::Teardown() {
    if (torn_down_) return;
    torn_down_ = true;
    context_.state = graph::SimulationState::Paused;
    if (pending_request_) {
        frames_.CancelFrame(*pending_request_);
        pending_request_.reset();
    }
}

void AnimationScheduler::ScheduleFrame() {
    if (pending_request_) return; // one request in flight at most
    pending_request_ = frames_.RequestFrame([this](double timestamp_seconds) {
        OnFrame(timestamp_seconds);
    });
}

void AnimationScheduler::OnFrame(double timestamp_seconds) {
    pending_request_.reset();
    if (torn_down_) return;

    try {
        layout_.Update(context_);
        renderer_.Draw(context_, surface_);
    } catch (const std::exception& e) {
        ++skipped_frames_;
        std::cerr << "Frame " << frame_count_ << " at " << timestamp_seconds
                  << "s skipped: " << e.what() << std::endl;
    }
    ++frame_count_;

    if (context_.IsRunning() && !torn_down_) {
        ScheduleFrame();
    }
}

} // namespace core
} // namespace socialgraph
