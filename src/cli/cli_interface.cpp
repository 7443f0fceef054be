#include <socialgraph/cli/cli_interface.h>
#include <socialgraph/graph/graph_types.h>

#include <cmath>
#include <cstdlib> // For free()
#include <iostream>
#include <readline/history.h>
#include <readline/readline.h>

namespace socialgraph {
namespace cli {

namespace {

void writeLine(std::ostream& out, const std::string& prefix, const std::string& text) {
    out << prefix << text;
    // Add newline if text doesn't already end with one
    if (text.empty() || text.back() != '\n') {
        out << '\n';
    }
    out.flush();
}

} // anonymous namespace

// Readline initializes itself implicitly on first use.
void CliInterface::initialize() {
}

void CliInterface::shutdown() {
}

// Handles Ctrl+D (returns nullopt) and adds non-empty input to history.
std::optional<std::string> CliInterface::promptUserInput() {
    char* input_cstr = readline("> ");
    if (!input_cstr) {
        std::cout << std::endl; // Print a newline after Ctrl+D for cleaner terminal output
        return std::nullopt;
    }
    std::string input(input_cstr);
    free(input_cstr); // Free memory allocated by readline

    if (!input.empty()) {
        add_history(input.c_str());
    }
    return input;
}

void CliInterface::displayOutput(const std::string& output) {
    writeLine(std::cout, "", output);
}

void CliInterface::displayStatus(const std::string& status) {
    writeLine(std::cout, "[Status] ", status);
}

// Errors go to stderr; warnings and info stay on stdout.
void CliInterface::notify(const std::string& message, Severity severity) {
    switch (severity) {
        case Severity::Error:
            writeLine(std::cerr, "Error: ", message);
            break;
        case Severity::Warning:
            writeLine(std::cout, "Warning: ", message);
            break;
        case Severity::Info:
            writeLine(std::cout, "", message);
            break;
    }
}

void CliInterface::showNodeDetails(const graph::GraphNode* node) {
    if (!node) {
        writeLine(std::cout, "", "Selection cleared.");
        return;
    }
    std::cout << "Selected: " << node->label << " (" << node->id << ")\n"
              << "  Type: " << graph::DisplayName(node->type) << '\n'
              << "  Connections: " << node->connection_count << '\n'
              << "  Influence: " << std::lround(node->influence * 100.0f) << "%" << std::endl;
}

} // namespace cli
} // namespace socialgraph
