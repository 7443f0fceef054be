#pragma once

#include <string>

namespace socialgraph {

namespace graph {
struct GraphNode;
}

enum class Severity {
    Info,
    Warning,
    Error
};

// Abstract base class defining the contract between the graph engine and the
// front end hosting it (console or desktop window).
class UserInterface {
public:
    // Displays regular output to the user.
    virtual void displayOutput(const std::string& output) = 0;

    // Displays status messages (loading progress, export location, ...).
    virtual void displayStatus(const std::string& status) = 0;

    // Surfaces a user-facing notification; the desktop viewer shows it as a toast.
    virtual void notify(const std::string& message, Severity severity) = 0;

    // Info panel hook. Called with the newly selected node, or nullptr when the
    // selection is cleared. The pointer is only valid for the duration of the call.
    virtual void showNodeDetails(const graph::GraphNode* node) = 0;

    virtual void initialize() = 0;
    virtual void shutdown() = 0;

    virtual ~UserInterface() = default;
};

} // namespace socialgraph
