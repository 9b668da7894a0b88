#pragma once

#include <optional>

#include "roomboard/core/BusinessWindow.hpp"

class QSettings;

namespace roomboard {
namespace core {

struct Settings
{
    BusinessWindow window;
    LoadThresholds thresholds;
    int maxSuggestions = 4;
    // Tick intervals for whoever drives refresh(); the engine has no timers.
    int statusRefreshMs = 60000;
    int countdownRefreshMs = 1000;
    // Lifts the opening hours to 00:00-24:00 for testing.
    bool developerMode = false;

    // The window the engine should be given.
    BusinessWindow effectiveWindow() const;
    // Window for a room with an optional own opening hours. Developer mode
    // still lifts the hours to 00:00-24:00.
    BusinessWindow windowFor(const std::optional<BusinessWindow> &roomWindow) const;

    static Settings load(const QSettings &store);
    void save(QSettings &store) const;
};

} // namespace core
} // namespace roomboard
