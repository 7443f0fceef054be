#pragma once

#include <socialgraph/core/ui_interface.h>

#include <optional>
#include <string>

namespace socialgraph {
namespace cli {

// Concrete implementation of UserInterface for a command-line environment.
class CliInterface : public UserInterface {
public:
    CliInterface() = default;
    ~CliInterface() override = default;

    // Reads one line with readline. Returns nullopt on EOF (Ctrl+D).
    std::optional<std::string> promptUserInput();

    // Implementation of the UserInterface contract
    void displayOutput(const std::string& output) override;
    void displayStatus(const std::string& status) override;
    void notify(const std::string& message, Severity severity) override;
    void showNodeDetails(const graph::GraphNode* node) override;
    void initialize() override;
    void shutdown() override;
};

} // namespace cli
} // namespace socialgraph
