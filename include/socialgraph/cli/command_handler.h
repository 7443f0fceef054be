#pragma once

#include <socialgraph/core/ui_interface.h>

#include <string>
#include <vector>

namespace socialgraph {

namespace core { class QueuedFrameScheduler; }
namespace graph { class GraphManager; }

namespace cli {

/**
 * CommandHandler processes the console's slash commands:
 * - /load <subject>            - Load the graph for a subject
 * - /filter <all|friends|followers|following>
 * - /mode <network|circle|hierarchy>
 * - /strength <0.1..1.0>       - Physics force strength
 * - /labels                    - Toggle labels
 * - /run, /pause               - Control the animation loop
 * - /step [n]                  - Pump n frames (default 1)
 * - /stats, /nodes             - Print the statistics or the node list
 * - /click <x> <y>             - Pointer-down in canvas coordinates
 * - /select <id>               - Select a node by id
 * - /quit
 */
class CommandHandler {
public:
    // Logical frame interval used as the timestamp step for /step.
    static constexpr double kFrameInterval = 1.0 / 60.0;

    CommandHandler(graph::GraphManager& manager_ref,
                   core::QueuedFrameScheduler& frames_ref,
                   UserInterface& ui_ref);

    // Handles one input line. Returns false when the console should exit.
    bool handleCommand(const std::string& input);

    // Pumps `count` frames. A paused simulation gets one redraw per frame.
    void stepFrames(int count);

private:
    graph::GraphManager& manager;
    core::QueuedFrameScheduler& frames;
    UserInterface& ui;
    double clock = 0.0;

    void handleLoadCommand(const std::vector<std::string>& args);
    void handleFilterCommand(const std::vector<std::string>& args);
    void handleModeCommand(const std::vector<std::string>& args);
    void handleStrengthCommand(const std::vector<std::string>& args);
    void handleStepCommand(const std::vector<std::string>& args);
    void handleStatsCommand();
    void handleNodesCommand();
    void handleClickCommand(const std::vector<std::string>& args);
    void handleHelp(bool unknown_command);
};

} // namespace cli
} // namespace socialgraph
