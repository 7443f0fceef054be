#include <socialgraph/cli/cli_interface.h>
#include <socialgraph/cli/command_handler.h>
#include <socialgraph/config.h>
#include <socialgraph/core/frame_scheduler.h>
#include <socialgraph/db/settings_store.h>
#include <socialgraph/db/sqlite_connection.h>
#include <socialgraph/db/view_settings_store.h>
#include <socialgraph/graph/data/http_relationship_source.h>
#include <socialgraph/graph/graph_manager.h>
#include <socialgraph/graph/render/draw_surface.h>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

using namespace socialgraph;

int main(int argc, char** argv) {
    cli::CliInterface cli_ui;
    try {
        cli_ui.initialize();

        std::unique_ptr<db::SQLiteConnection> db_conn;
        std::unique_ptr<db::SettingsStore> settings_store;
        graph::ViewSettings initial_settings;
        try {
            db_conn = std::make_unique<db::SQLiteConnection>();
            settings_store = std::make_unique<db::SettingsStore>(*db_conn);
            initial_settings = db::ViewSettingsStore(*settings_store).load();
        } catch (const std::exception& e) {
            std::cerr << "Warning: Failed to load view settings from database: " << e.what() << std::endl;
        }

        graph::HttpRelationshipSource source(graph::HttpRelationshipSource::ResolveBaseUrl(),
                                             graph::HttpRelationshipSource::ResolveToken());
        core::QueuedFrameScheduler frames;
        // The console renders nothing; frames still run the physics step.
        graph::NullDrawSurface surface;

        graph::GraphManager manager(source, frames, surface, cli_ui);
        manager.ApplySettings(initial_settings);

        std::string subject = SOCIALGRAPH_DEFAULT_SUBJECT_ID;
        if (argc > 1 && argv[1][0] != '\0') {
            subject = argv[1];
        } else if (const char* env = std::getenv("SOCIALGRAPH_SUBJECT_ID"); env && *env) {
            subject = env;
        }

        cli::CommandHandler handler(manager, frames, cli_ui);
        handler.handleCommand("/load " + subject);
        cli_ui.displayOutput("Type /help for the list of commands.");

        while (true) {
            std::optional<std::string> line = cli_ui.promptUserInput();
            if (!line) break;
            if (!handler.handleCommand(*line)) break;
        }

        manager.Teardown();
        manager.WaitForLoads();
        if (settings_store) {
            try {
                db::ViewSettingsStore(*settings_store).save(manager.GetContext().settings);
            } catch (const std::exception& e) {
                std::cerr << "Warning: Failed to save view settings: " << e.what() << std::endl;
            }
        }

        cli_ui.shutdown();
        cli_ui.displayOutput("\nExiting...\n");
    } catch (const std::exception& e) {
        std::cerr << "Fatal Error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
