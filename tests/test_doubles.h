#pragma once

#include <socialgraph/core/frame_scheduler.h>
#include <socialgraph/core/ui_interface.h>
#include <socialgraph/graph/data/relationship_source.h>
#include <socialgraph/graph/graph_types.h>
#include <socialgraph/graph/render/draw_surface.h>

#include <atomic>
#include <future>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace socialgraph {
namespace test_support {

// 150 connections: 75 followers, 50 following, 25 mutual, no plain friends.
inline graph::RelationshipData SampleRelationshipData() {
    graph::RelationshipData data;
    data.stats.total_connections = 150;
    data.stats.followers = 75;
    data.stats.following = 50;
    data.stats.mutual_connections = 25;
    for (int i = 0; i < 25; ++i) {
        graph::MutualConnection connection;
        connection.id = "mutual-" + std::to_string(i);
        connection.username = "friend" + std::to_string(i);
        if (i % 2 == 0) connection.display_name = "Friend Number " + std::to_string(i);
        data.mutual_connections.push_back(std::move(connection));
    }
    return data;
}

// Serves fixed data, or fails every call when `fail` is set.
class ScriptedRelationshipSource : public graph::RelationshipSource {
public:
    explicit ScriptedRelationshipSource(graph::RelationshipData data = SampleRelationshipData())
        : data_(std::move(data)) {}

    graph::NetworkStats GetNetworkStats(const std::string& subject_id) override {
        ++stats_calls;
        if (fail) throw graph::DataFetchError("stats unavailable for " + subject_id);
        return data_.stats;
    }

    std::vector<graph::MutualConnection> GetMutualConnections(const std::string& subject_id, int max_count) override {
        ++mutual_calls;
        last_max_count = max_count;
        if (fail) throw graph::DataFetchError("mutual connections unavailable for " + subject_id);
        return data_.mutual_connections;
    }

    std::atomic<bool> fail{false};
    std::atomic<int> stats_calls{0};
    std::atomic<int> mutual_calls{0};
    std::atomic<int> last_max_count{0};

private:
    graph::RelationshipData data_;
};

// Holds requests for `gated_subject` until Release() is called.
class GatedRelationshipSource : public ScriptedRelationshipSource {
public:
    explicit GatedRelationshipSource(std::string gated_subject)
        : gated_subject_(std::move(gated_subject)), gate_(release_.get_future().share()) {}

    graph::NetworkStats GetNetworkStats(const std::string& subject_id) override {
        if (subject_id == gated_subject_) gate_.wait();
        return ScriptedRelationshipSource::GetNetworkStats(subject_id);
    }

    void Release() {
        if (!released_) {
            released_ = true;
            release_.set_value();
        }
    }

private:
    std::string gated_subject_;
    std::promise<void> release_;
    std::shared_future<void> gate_;
    bool released_ = false;
};

// Records every draw call as a short tag, e.g. "clear", "text:You".
class RecordingSurface : public graph::DrawSurface {
public:
    bool IsAvailable() const override { return available; }
    void SetScale(float device_pixel_ratio) override {
        scales.push_back(device_pixel_ratio);
        calls.push_back("scale");
    }
    void Clear(ImU32) override {
        calls.push_back("clear");
        if (throw_on_clear) throw std::runtime_error("surface lost");
    }
    void StrokePath(const std::vector<ImVec2>& points, ImU32, float thickness) override {
        calls.push_back("path");
        paths.push_back(points);
        thicknesses.push_back(thickness);
    }
    void FillCircle(const ImVec2& center, float radius, ImU32) override {
        calls.push_back("circle");
        circles.emplace_back(center, radius);
    }
    void StrokeCircle(const ImVec2&, float radius, ImU32, float) override {
        calls.push_back("ring");
        ring_radii.push_back(radius);
    }
    void DrawText(const ImVec2&, ImU32, const std::string& text) override {
        calls.push_back("text:" + text);
        ++text_calls;
    }

    int CountCalls(const std::string& tag) const {
        int count = 0;
        for (const auto& call : calls) {
            if (call == tag) ++count;
        }
        return count;
    }

    void Reset() {
        calls.clear();
        scales.clear();
        paths.clear();
        thicknesses.clear();
        circles.clear();
        ring_radii.clear();
        text_calls = 0;
    }

    bool available = true;
    bool throw_on_clear = false;
    std::vector<std::string> calls;
    std::vector<float> scales;
    std::vector<std::vector<ImVec2>> paths;
    std::vector<float> thicknesses;
    std::vector<std::pair<ImVec2, float>> circles;
    std::vector<float> ring_radii;
    int text_calls = 0;
};

// Counts frame requests and cancellations on top of the queued scheduler.
class SpyFrameScheduler : public core::QueuedFrameScheduler {
public:
    core::FrameRequestId RequestFrame(core::FrameCallback callback) override {
        ++requests;
        return core::QueuedFrameScheduler::RequestFrame(std::move(callback));
    }
    void CancelFrame(core::FrameRequestId id) override {
        ++cancellations;
        core::QueuedFrameScheduler::CancelFrame(id);
    }

    int requests = 0;
    int cancellations = 0;
};

// Captures everything the engine reports to the front end.
class RecordingUserInterface : public UserInterface {
public:
    struct Notification {
        std::string message;
        Severity severity;
    };

    void displayOutput(const std::string& output) override { outputs.push_back(output); }
    void displayStatus(const std::string& status) override { statuses.push_back(status); }
    void notify(const std::string& message, Severity severity) override {
        notifications.push_back({message, severity});
    }
    void showNodeDetails(const graph::GraphNode* node) override {
        ++details_calls;
        if (node) {
            details_id = node->id;
        } else {
            details_id.reset();
        }
    }
    void initialize() override {}
    void shutdown() override {}

    int CountNotifications(Severity severity) const {
        int count = 0;
        for (const auto& n : notifications) {
            if (n.severity == severity) ++count;
        }
        return count;
    }

    std::vector<std::string> outputs;
    std::vector<std::string> statuses;
    std::vector<Notification> notifications;
    std::optional<std::string> details_id;
    int details_calls = 0;
};

// Solid-colour RGBA frame.
class FixedPixelSource : public graph::PixelSource {
public:
    FixedPixelSource(int width, int height) {
        graph::PixelBuffer buffer;
        buffer.width = width;
        buffer.height = height;
        buffer.rgba.assign(static_cast<size_t>(width) * static_cast<size_t>(height) * 4, 0);
        for (size_t i = 0; i < buffer.rgba.size(); i += 4) {
            buffer.rgba[i] = 10;
            buffer.rgba[i + 1] = 12;
            buffer.rgba[i + 2] = 20;
            buffer.rgba[i + 3] = 255;
        }
        pixels = std::move(buffer);
    }
    FixedPixelSource() = default;

    std::optional<graph::PixelBuffer> ReadPixels() override {
        ++reads;
        return pixels;
    }

    std::optional<graph::PixelBuffer> pixels;
    int reads = 0;
};

} // namespace test_support
} // namespace socialgraph
