#include "roomboard/core/Settings.hpp"

#include <QSettings>
#include <QVariant>

#include "roomboard/core/ConfigurationError.hpp"
#include "roomboard/core/Logging.hpp"

namespace roomboard {
namespace core {

namespace {
const auto KEY_OPEN = QStringLiteral("window/open");
const auto KEY_CLOSE = QStringLiteral("window/close");
const auto KEY_GRANULARITY = QStringLiteral("window/granularityMinutes");
const auto KEY_DURATION = QStringLiteral("window/defaultDurationMinutes");
const auto KEY_LOAD_COUNT = QStringLiteral("load/bookingCount");
const auto KEY_LOAD_FRACTION = QStringLiteral("load/bookedFraction");
const auto KEY_MAX_SUGGESTIONS = QStringLiteral("suggestions/maxResults");
const auto KEY_STATUS_REFRESH = QStringLiteral("refresh/statusIntervalMs");
const auto KEY_COUNTDOWN_REFRESH = QStringLiteral("refresh/countdownIntervalMs");
const auto KEY_DEVELOPER = QStringLiteral("developer/enabled");

int readInt(const QSettings &store, const QString &key, int fallback)
{
    const QVariant value = store.value(key, fallback);
    bool ok = false;
    const int result = value.toInt(&ok);
    if (!ok) {
        throw ConfigurationError(QStringLiteral("setting %1 is not an integer: '%2'").arg(key, value.toString()));
    }
    return result;
}

double readDouble(const QSettings &store, const QString &key, double fallback)
{
    const QVariant value = store.value(key, fallback);
    bool ok = false;
    const double result = value.toDouble(&ok);
    if (!ok) {
        throw ConfigurationError(QStringLiteral("setting %1 is not a number: '%2'").arg(key, value.toString()));
    }
    return result;
}
} // namespace

BusinessWindow Settings::effectiveWindow() const
{
    if (developerMode) {
        return BusinessWindow::allDay(window.granularityMinutes(), window.defaultDurationMinutes());
    }
    return window;
}

BusinessWindow Settings::windowFor(const std::optional<BusinessWindow> &roomWindow) const
{
    if (developerMode || !roomWindow) {
        return effectiveWindow();
    }
    return *roomWindow;
}

Settings Settings::load(const QSettings &store)
{
    Settings settings;
    const BusinessWindow defaults;

    const int open = BusinessWindow::parseMinuteOfDay(
        store.value(KEY_OPEN, BusinessWindow::formatMinuteOfDay(defaults.openMinute())).toString());
    const int close = BusinessWindow::parseMinuteOfDay(
        store.value(KEY_CLOSE, BusinessWindow::formatMinuteOfDay(defaults.closeMinute())).toString());
    settings.window = BusinessWindow(open,
                                     close,
                                     readInt(store, KEY_GRANULARITY, defaults.granularityMinutes()),
                                     readInt(store, KEY_DURATION, defaults.defaultDurationMinutes()));

    settings.thresholds.bookingCount = readInt(store, KEY_LOAD_COUNT, settings.thresholds.bookingCount);
    settings.thresholds.bookedFraction = readDouble(store, KEY_LOAD_FRACTION, settings.thresholds.bookedFraction);
    if (settings.thresholds.bookingCount <= 0) {
        throw ConfigurationError(QStringLiteral("%1 must be positive").arg(KEY_LOAD_COUNT));
    }
    if (settings.thresholds.bookedFraction <= 0.0 || settings.thresholds.bookedFraction > 1.0) {
        throw ConfigurationError(QStringLiteral("%1 must be within (0, 1]").arg(KEY_LOAD_FRACTION));
    }

    settings.maxSuggestions = readInt(store, KEY_MAX_SUGGESTIONS, settings.maxSuggestions);
    if (settings.maxSuggestions < 0) {
        throw ConfigurationError(QStringLiteral("%1 must not be negative").arg(KEY_MAX_SUGGESTIONS));
    }
    settings.statusRefreshMs = qMax(1000, readInt(store, KEY_STATUS_REFRESH, settings.statusRefreshMs));
    settings.countdownRefreshMs = qMax(100, readInt(store, KEY_COUNTDOWN_REFRESH, settings.countdownRefreshMs));
    settings.developerMode = store.value(KEY_DEVELOPER, false).toBool();

    qCDebug(lcCore) << "settings loaded: window" << settings.effectiveWindow().toString()
                    << "granularity" << settings.window.granularityMinutes()
                    << "developer mode" << settings.developerMode;
    return settings;
}

void Settings::save(QSettings &store) const
{
    store.setValue(KEY_OPEN, BusinessWindow::formatMinuteOfDay(window.openMinute()));
    store.setValue(KEY_CLOSE, BusinessWindow::formatMinuteOfDay(window.closeMinute()));
    store.setValue(KEY_GRANULARITY, window.granularityMinutes());
    store.setValue(KEY_DURATION, window.defaultDurationMinutes());
    store.setValue(KEY_LOAD_COUNT, thresholds.bookingCount);
    store.setValue(KEY_LOAD_FRACTION, thresholds.bookedFraction);
    store.setValue(KEY_MAX_SUGGESTIONS, maxSuggestions);
    store.setValue(KEY_STATUS_REFRESH, statusRefreshMs);
    store.setValue(KEY_COUNTDOWN_REFRESH, countdownRefreshMs);
    store.setValue(KEY_DEVELOPER, developerMode);
}

} // namespace core
} // namespace roomboard
