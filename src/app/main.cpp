#include <QCommandLineParser>
#include <QCoreApplication>
#include <QSettings>
#include <QString>
#include <QStringList>
#include <QTextStream>
#include <vector>

#include "roomboard/core/BusinessWindow.hpp"
#include "roomboard/core/Clock.hpp"
#include "roomboard/core/ConfigurationError.hpp"
#include "roomboard/core/Settings.hpp"
#include "roomboard/data/Booking.hpp"
#include "roomboard/data/Room.hpp"
#include "roomboard/engine/BlockMerger.hpp"
#include "roomboard/engine/ConflictChecker.hpp"
#include "roomboard/engine/SlotFinder.hpp"
#include "roomboard/engine/StatusEngine.hpp"
#include "roomboard/engine/Timeline.hpp"

using namespace roomboard;

namespace {
constexpr int EXIT_CONFLICT = 1;
constexpr int EXIT_BAD_INPUT = 2;

// Full date/time, or "HH:mm" on `day`.
core::TimePoint parsePoint(const QString &value, const QDate &day)
{
    if (const auto parsed = core::TimePoint::tryParse(value)) {
        return *parsed;
    }
    const int minute = core::BusinessWindow::parseMinuteOfDay(value);
    return core::TimePoint::atMinuteOfDay(day, minute);
}

core::Interval parseRange(const QString &value, const QDate &day, QString *title = nullptr)
{
    const QStringList parts = value.split(QLatin1Char('/'));
    if (parts.size() < 2) {
        throw core::ConfigurationError(QStringLiteral("expected <start>/<end>, got '%1'").arg(value));
    }
    if (title) {
        *title = parts.mid(2).join(QLatin1Char('/'));
    }
    return core::Interval(parsePoint(parts.at(0), day), parsePoint(parts.at(1), day));
}

int parseCount(const QString &name, const QString &value)
{
    bool ok = false;
    const int result = value.toInt(&ok);
    if (!ok) {
        throw core::ConfigurationError(QStringLiteral("--%1 expects an integer, got '%2'").arg(name, value));
    }
    return result;
}

QString formatRange(const core::Interval &interval)
{
    return QStringLiteral("%1-%2").arg(interval.start().toHHMM(), interval.end().toHHMM());
}
} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication::setOrganizationName(QStringLiteral("RoomBoard"));
    QCoreApplication::setApplicationName(QStringLiteral("roomboard"));
    QCoreApplication app(argc, argv);

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Room availability and slot suggestions for one room-day."));
    parser.addHelpOption();
    const QCommandLineOption settingsOption(QStringLiteral("settings"), QStringLiteral("INI file with engine settings."), QStringLiteral("file"));
    const QCommandLineOption nowOption(QStringLiteral("now"), QStringLiteral("Current time (yyyy-MM-dd HH:mm[:ss]); defaults to the local clock."), QStringLiteral("datetime"));
    const QCommandLineOption dayOption(QStringLiteral("day"), QStringLiteral("Day to inspect (yyyy-MM-dd); defaults to today."), QStringLiteral("date"));
    const QCommandLineOption bookingOption(QStringLiteral("booking"), QStringLiteral("Existing booking <start>/<end>[/title]; repeatable."), QStringLiteral("range"));
    const QCommandLineOption stateOption(QStringLiteral("state"), QStringLiteral("Room state: none, maintenance, inactive, night_rest."), QStringLiteral("state"), QStringLiteral("none"));
    const QCommandLineOption durationOption(QStringLiteral("duration"), QStringLiteral("Slot duration in minutes."), QStringLiteral("minutes"));
    const QCommandLineOption maxOption(QStringLiteral("max"), QStringLiteral("Maximum number of slots."), QStringLiteral("count"));
    const QCommandLineOption developerOption(QStringLiteral("developer"), QStringLiteral("Lift opening hours to 00:00-24:00."));
    parser.addOptions({settingsOption, nowOption, dayOption, bookingOption, stateOption, durationOption, maxOption, developerOption});
    parser.addPositionalArgument(QStringLiteral("command"), QStringLiteral("status | slots | conflict | blocks"));
    parser.addPositionalArgument(QStringLiteral("proposed"), QStringLiteral("Range <start>/<end> for the conflict command."), QStringLiteral("[proposed]"));
    parser.process(app);

    QTextStream out(stdout);
    QTextStream err(stderr);

    const QStringList positional = parser.positionalArguments();
    if (positional.isEmpty()) {
        err << "missing command\n";
        return EXIT_BAD_INPUT;
    }
    const QString command = positional.first();

    try {
        core::Settings settings;
        if (parser.isSet(settingsOption)) {
            const QSettings store(parser.value(settingsOption), QSettings::IniFormat);
            settings = core::Settings::load(store);
        } else {
            const QSettings store;
            settings = core::Settings::load(store);
        }
        if (parser.isSet(developerOption)) {
            settings.developerMode = true;
        }
        const core::BusinessWindow window = settings.effectiveWindow();

        const core::TimePoint now = parser.isSet(nowOption)
            ? core::TimePoint::fromString(parser.value(nowOption))
            : core::SystemClock().now();
        QDate day = now.date();
        if (parser.isSet(dayOption)) {
            day = QDate::fromString(parser.value(dayOption), Qt::ISODate);
            if (!day.isValid()) {
                throw core::ConfigurationError(QStringLiteral("invalid day '%1'").arg(parser.value(dayOption)));
            }
        }

        std::vector<data::Booking> bookings;
        qint64 nextId = 1;
        for (const QString &value : parser.values(bookingOption)) {
            QString title;
            const core::Interval interval = parseRange(value, day, &title);
            bookings.push_back(data::Booking{nextId++, 0, interval, title});
        }

        if (command == QLatin1String("status")) {
            const engine::StatusResult status = engine::computeStatus(now,
                                                                      data::specialStateFromString(parser.value(stateOption)),
                                                                      bookings,
                                                                      window,
                                                                      settings.thresholds);
            out << engine::statusKindToString(status.kind) << '\t' << status.label << '\n';
            if (status.progressFraction) {
                out << "progress\t" << QString::number(*status.progressFraction, 'f', 3) << '\n';
            }
            if (status.remainingSeconds) {
                out << "remaining\t" << core::formatCountdown(*status.remainingSeconds) << '\n';
            }
            if (status.minutesUntilNext) {
                out << "minutesUntilNext\t" << *status.minutesUntilNext << '\n';
            }
            if (!status.isUnavailable()) {
                if (const auto timeline = engine::buildTimeline(now, bookings)) {
                    for (std::size_t i = 0; i < timeline->segments.size(); ++i) {
                        const engine::TimelineSegment &segment = timeline->segments[i];
                        out << (static_cast<int>(i) == timeline->currentSegmentIndex ? "> " : "  ")
                            << formatRange(segment.interval) << ' ' << segment.title << '\n';
                    }
                }
            }
            return 0;
        }

        if (command == QLatin1String("slots")) {
            const int duration = parser.isSet(durationOption)
                ? parseCount(durationOption.names().first(), parser.value(durationOption))
                : window.defaultDurationMinutes();
            const int maxResults = parser.isSet(maxOption)
                ? parseCount(maxOption.names().first(), parser.value(maxOption))
                : settings.maxSuggestions;
            const auto slots = engine::findNextSlots(now, day, window, duration, maxResults, bookings);
            if (slots.empty()) {
                out << "no free slot on " << day.toString(Qt::ISODate) << '\n';
                return 0;
            }
            bool first = true;
            for (const core::Interval &slot : slots) {
                out << (first ? "* " : "  ") << formatRange(slot) << '\n';
                first = false;
            }
            return 0;
        }

        if (command == QLatin1String("conflict")) {
            if (positional.size() < 2) {
                throw core::ConfigurationError(QStringLiteral("conflict needs a proposed <start>/<end> range"));
            }
            const core::Interval proposed = parseRange(positional.at(1), day);
            if (const auto conflict = engine::findConflictingBooking(proposed, bookings)) {
                out << "conflict\t" << formatRange(conflict->interval) << ' ' << conflict->title << '\n';
                return EXIT_CONFLICT;
            }
            out << "no conflict\n";
            return 0;
        }

        if (command == QLatin1String("blocks")) {
            for (const engine::Block &block : engine::mergeBlocks(bookings)) {
                out << formatRange(block.interval()) << '\t' << block.bookingIds.size() << '\n';
            }
            return 0;
        }

        err << "unknown command '" << command << "'\n";
        return EXIT_BAD_INPUT;
    } catch (const core::ConfigurationError &error) {
        err << error.what() << '\n';
        return EXIT_BAD_INPUT;
    }
}
