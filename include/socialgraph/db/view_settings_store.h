#pragma once

#include <socialgraph/db/settings_store.h>
#include <socialgraph/graph/simulation_context.h>

namespace socialgraph {
namespace db {

/*
 * Persists the viewer preferences (view mode, filter, force strength, label
 * toggle) through the key/value settings table. Layout state is never stored.
 * Missing or unreadable values keep the defaults.
 */
class ViewSettingsStore {
public:
    static constexpr const char* kViewModeKey = "view_mode";
    static constexpr const char* kFilterKey = "filter";
    static constexpr const char* kForceStrengthKey = "force_strength";
    static constexpr const char* kShowLabelsKey = "show_labels";

    explicit ViewSettingsStore(SettingsStore& settings);

    graph::ViewSettings load();
    void save(const graph::ViewSettings& settings);

private:
    SettingsStore& m_settings;
};

} // namespace db
} // namespace socialgraph
