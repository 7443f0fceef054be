#include <socialgraph/config.h>
#include <socialgraph/core/frame_scheduler.h>
#include <socialgraph/db/settings_store.h>
#include <socialgraph/db/sqlite_connection.h>
#include <socialgraph/db/view_settings_store.h>
#include <socialgraph/graph/data/http_relationship_source.h>
#include <socialgraph/graph/graph_manager.h>
#include <socialgraph/gui/render/imgui_draw_surface.h>
#include <socialgraph/gui/views/graph_view.h>
#include <socialgraph/gui/views/gui_interface.h>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

using namespace socialgraph;

namespace {

std::string resolveSubjectId(int argc, char** argv) {
    if (argc > 1 && argv[1][0] != '\0') {
        return argv[1];
    }
    if (const char* env = std::getenv("SOCIALGRAPH_SUBJECT_ID"); env && *env) {
        return env;
    }
    return SOCIALGRAPH_DEFAULT_SUBJECT_ID;
}

} // anonymous namespace

int main(int argc, char** argv) {
    // --- Preferences ---
    std::unique_ptr<db::SQLiteConnection> db_conn;
    std::unique_ptr<db::SettingsStore> settings_store;
    graph::ViewSettings initial_settings;
    try {
        db_conn = std::make_unique<db::SQLiteConnection>();
        settings_store = std::make_unique<db::SettingsStore>(*db_conn);
        initial_settings = db::ViewSettingsStore(*settings_store).load();
    } catch (const std::exception& e) {
        std::cerr << "Warning: Failed to load view settings from database: " << e.what() << std::endl;
        // Continue with defaults
    }

    // --- GUI Initialization ---
    gui::GuiInterface gui_ui;
    try {
        gui_ui.initialize();
    } catch (const std::exception& e) {
        std::cerr << "GUI Initialization failed: " << e.what() << std::endl;
        return 1;
    }

    graph::HttpRelationshipSource source(graph::HttpRelationshipSource::ResolveBaseUrl(),
                                         graph::HttpRelationshipSource::ResolveToken());
    core::QueuedFrameScheduler frames;
    gui::ImGuiDrawSurface surface;
    gui::GraphWindowState view_state;

    {
        graph::GraphManager manager(source, frames, surface, gui_ui);
        manager.ApplySettings(initial_settings);
        manager.LoadSubject(resolveSubjectId(argc, argv));

        // --- Main Loop ---
        while (!gui_ui.shouldClose()) {
            gui_ui.beginFrame();
            manager.PollLoads();

            gui::drawGraphWindow(manager, gui_ui, frames, surface, view_state);
            gui::drawToasts(gui_ui);

            gui_ui.endFrame();

            // The back buffer holds the finished frame until the swap.
            if (view_state.export_requested) {
                view_state.export_requested = false;
                manager.ExportSnapshot(surface);
            }

            gui_ui.present();
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
    }

    gui_ui.shutdown();
    return 0;
}
