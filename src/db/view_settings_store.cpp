#include <socialgraph/db/view_settings_store.h>

#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

namespace socialgraph {
namespace db {

ViewSettingsStore::ViewSettingsStore(SettingsStore& settings) : m_settings(settings) {}

graph::ViewSettings ViewSettingsStore::load() {
    graph::ViewSettings result;

    if (auto value = m_settings.loadSetting(kViewModeKey)) {
        if (auto mode = graph::ParseViewMode(*value)) {
            result.view_mode = *mode;
        } else {
            std::cerr << "Warning: Ignoring unknown stored view mode '" << *value << "'" << std::endl;
        }
    }

    if (auto value = m_settings.loadSetting(kFilterKey)) {
        if (auto filter = graph::ParseFilterType(*value)) {
            result.filter = *filter;
        } else {
            std::cerr << "Warning: Ignoring unknown stored filter '" << *value << "'" << std::endl;
        }
    }

    if (auto value = m_settings.loadSetting(kForceStrengthKey)) {
        try {
            result.force_strength = graph::SnapForceStrength(std::stof(*value));
        } catch (const std::exception& e) {
            std::cerr << "Warning: Ignoring stored force strength '" << *value << "': " << e.what() << std::endl;
        }
    }

    if (auto value = m_settings.loadSetting(kShowLabelsKey)) {
        result.show_labels = (*value != "0" && *value != "false");
    }
    return result;
}

void ViewSettingsStore::save(const graph::ViewSettings& settings) {
    std::ostringstream strength;
    strength << std::fixed << std::setprecision(1) << graph::SnapForceStrength(settings.force_strength);

    m_settings.saveSetting(kViewModeKey, graph::ToString(settings.view_mode));
    m_settings.saveSetting(kFilterKey, graph::ToString(settings.filter));
    m_settings.saveSetting(kForceStrengthKey, strength.str());
    m_settings.saveSetting(kShowLabelsKey, settings.show_labels ? "1" : "0");
}

} // namespace db
} // namespace socialgraph
