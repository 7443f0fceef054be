#include <socialgraph/cli/command_handler.h>
#include <socialgraph/core/frame_scheduler.h>
#include <socialgraph/graph/data/graph_stats.h>
#include <socialgraph/graph/graph_manager.h>

#include <iomanip>
#include <optional>
#include <sstream>
#include <stdexcept>

namespace socialgraph {
namespace cli {

namespace {

std::vector<std::string> tokenize(const std::string& input) {
    std::istringstream stream(input);
    std::vector<std::string> tokens;
    std::string token;
    while (stream >> token) {
        tokens.push_back(token);
    }
    return tokens;
}

} // anonymous namespace

CommandHandler::CommandHandler(graph::GraphManager& manager_ref,
                               core::QueuedFrameScheduler& frames_ref,
                               UserInterface& ui_ref)
    : manager(manager_ref), frames(frames_ref), ui(ui_ref) {
}

bool CommandHandler::handleCommand(const std::string& input) {
    std::vector<std::string> tokens = tokenize(input);
    if (tokens.empty()) {
        return true;
    }
    const std::string command = tokens.front();
    std::vector<std::string> args(tokens.begin() + 1, tokens.end());

    if (command == "/quit" || command == "/exit") {
        return false;
    } else if (command == "/load") {
        handleLoadCommand(args);
    } else if (command == "/filter") {
        handleFilterCommand(args);
    } else if (command == "/mode") {
        handleModeCommand(args);
    } else if (command == "/strength") {
        handleStrengthCommand(args);
    } else if (command == "/labels") {
        manager.ToggleLabels();
        ui.displayStatus(std::string("Labels ") + (manager.GetContext().settings.show_labels ? "on" : "off"));
    } else if (command == "/run") {
        manager.Start();
        ui.displayStatus("Animation running");
    } else if (command == "/pause") {
        manager.Pause();
        ui.displayStatus("Animation paused");
    } else if (command == "/step") {
        handleStepCommand(args);
    } else if (command == "/stats") {
        handleStatsCommand();
    } else if (command == "/nodes") {
        handleNodesCommand();
    } else if (command == "/click") {
        handleClickCommand(args);
    } else if (command == "/select") {
        if (args.size() != 1) {
            ui.notify("Usage: /select <node-id>", Severity::Error);
        } else {
            manager.SelectNode(args[0]);
        }
    } else if (command == "/help") {
        handleHelp(false);
    } else {
        handleHelp(true);
    }
    return true;
}

void CommandHandler::stepFrames(int count) {
    for (int i = 0; i < count; ++i) {
        if (!manager.IsRunning()) {
            manager.RequestRedraw();
        }
        clock += kFrameInterval;
        frames.RunPendingFrames(clock);
    }
}

void CommandHandler::handleLoadCommand(const std::vector<std::string>& args) {
    if (args.size() != 1) {
        ui.notify("Usage: /load <subject-id>", Severity::Error);
        return;
    }
    manager.LoadSubject(args[0]);
    // The console has no idle loop, so loads complete synchronously here.
    manager.WaitForLoads();
    manager.PollLoads();
}

void CommandHandler::handleFilterCommand(const std::vector<std::string>& args) {
    std::optional<graph::FilterType> filter;
    if (args.size() == 1) {
        filter = graph::ParseFilterType(args[0]);
    }
    if (!filter) {
        ui.notify("Usage: /filter <all|friends|followers|following>", Severity::Error);
        return;
    }
    manager.SetFilter(*filter);
    manager.WaitForLoads();
    manager.PollLoads();
}

void CommandHandler::handleModeCommand(const std::vector<std::string>& args) {
    std::optional<graph::ViewMode> mode;
    if (args.size() == 1) {
        mode = graph::ParseViewMode(args[0]);
    }
    if (!mode) {
        ui.notify("Usage: /mode <network|circle|hierarchy>", Severity::Error);
        return;
    }
    manager.SetViewMode(*mode);
    ui.displayStatus(std::string("View mode: ") + graph::DisplayName(*mode));
}

void CommandHandler::handleStrengthCommand(const std::vector<std::string>& args) {
    if (args.size() != 1) {
        ui.notify("Usage: /strength <0.1..1.0>", Severity::Error);
        return;
    }
    try {
        manager.SetForceStrength(std::stof(args[0]));
    } catch (const std::invalid_argument&) {
        ui.notify("Invalid force strength: '" + args[0] + "'", Severity::Error);
        return;
    } catch (const std::out_of_range&) {
        ui.notify("Force strength out of range: '" + args[0] + "'", Severity::Error);
        return;
    }
    std::ostringstream oss;
    oss << "Force strength: " << std::fixed << std::setprecision(1) << manager.GetForceStrength();
    ui.displayStatus(oss.str());
}

void CommandHandler::handleStepCommand(const std::vector<std::string>& args) {
    int count = 1;
    if (!args.empty()) {
        try {
            count = std::stoi(args[0]);
        } catch (const std::exception&) {
            ui.notify("Usage: /step [frames]", Severity::Error);
            return;
        }
    }
    if (count < 1) {
        ui.notify("Frame count must be positive", Severity::Error);
        return;
    }
    stepFrames(count);
    ui.displayStatus("Stepped " + std::to_string(count) + " frame(s), state " +
                     graph::ToString(manager.GetContext().state) +
                     (manager.GetLayout().IsSettled() ? ", settled" : ""));
}

void CommandHandler::handleStatsCommand() {
    const graph::GraphStats& stats = manager.GetContext().stats;
    std::ostringstream oss;
    oss << "Total Connections: " << stats.total_connections << '\n'
        << "Mutual Connections: " << stats.mutual_connections << '\n'
        << "Clusters: " << stats.clusters << '\n'
        << "Network Density: " << graph::FormatDensity(stats.density);
    ui.displayOutput(oss.str());
}

void CommandHandler::handleNodesCommand() {
    const graph::SocialGraph& g = manager.GetContext().graph;
    if (g.Empty()) {
        ui.displayOutput("No graph loaded.");
        return;
    }
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1);
    for (const graph::GraphNode& node : g.GetNodes()) {
        oss << std::left << std::setw(16) << node.id << ' '
            << std::setw(10) << graph::ToString(node.type) << ' '
            << '(' << node.position.x << ", " << node.position.y << ")  "
            << node.label << '\n';
    }
    oss << g.NodeCount() << " nodes, " << g.EdgeCount() << " edges";
    ui.displayOutput(oss.str());
}

void CommandHandler::handleClickCommand(const std::vector<std::string>& args) {
    if (args.size() != 2) {
        ui.notify("Usage: /click <x> <y>", Severity::Error);
        return;
    }
    float x = 0.0f;
    float y = 0.0f;
    try {
        x = std::stof(args[0]);
        y = std::stof(args[1]);
    } catch (const std::exception&) {
        ui.notify("Invalid coordinates: '" + args[0] + " " + args[1] + "'", Severity::Error);
        return;
    }
    // Console clicks are in canvas coordinates, so the canvas sits at the origin.
    manager.OnPointerDown(ImVec2(x, y), ImVec2(0.0f, 0.0f));
}

void CommandHandler::handleHelp(bool unknown_command) {
    ui.displayOutput(std::string(unknown_command ? "\nUnknown command. " : "\n") +
                     "Available commands:\n"
                     "  /load <subject-id> - Load the graph for a subject\n"
                     "  /filter <all|friends|followers|following> - Filter connections\n"
                     "  /mode <network|circle|hierarchy> - Change the view mode\n"
                     "  /strength <0.1..1.0> - Set the physics force strength\n"
                     "  /labels - Toggle node labels\n"
                     "  /run, /pause - Start or pause the animation\n"
                     "  /step [n] - Advance n frames\n"
                     "  /stats - Show network statistics\n"
                     "  /nodes - List nodes and positions\n"
                     "  /click <x> <y> - Click the canvas at (x, y)\n"
                     "  /select <node-id> - Select a node\n"
                     "  /quit - Exit\n");
}

} // namespace cli
} // namespace socialgraph
