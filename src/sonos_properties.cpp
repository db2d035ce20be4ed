#include "sonos_properties.h"

#include <limits>

#include <QStringList>

namespace sonoswatch {

std::optional<TransportState> transportStateFromString(const QString &text)
{
    const QString state = text.trimmed().toUpper();
    if (state == QLatin1String("PLAYING"))
        return TransportState::Playing;
    if (state == QLatin1String("PAUSED_PLAYBACK") || state == QLatin1String("PAUSED"))
        return TransportState::Paused;
    if (state == QLatin1String("STOPPED"))
        return TransportState::Stopped;
    if (state == QLatin1String("TRANSITIONING"))
        return TransportState::Transitioning;
    return std::nullopt;
}

QString transportStateName(TransportState state)
{
    switch (state) {
    case TransportState::Playing:
        return QStringLiteral("PLAYING");
    case TransportState::Paused:
        return QStringLiteral("PAUSED_PLAYBACK");
    case TransportState::Stopped:
        return QStringLiteral("STOPPED");
    case TransportState::Transitioning:
        return QStringLiteral("TRANSITIONING");
    }
    return QStringLiteral("STOPPED");
}

bool isKnownPlayMode(const QString &mode)
{
    static const QStringList modes = {
        QStringLiteral("NORMAL"),
        QStringLiteral("REPEAT_ALL"),
        QStringLiteral("REPEAT_ONE"),
        QStringLiteral("SHUFFLE_NOREPEAT"),
        QStringLiteral("SHUFFLE"),
        QStringLiteral("SHUFFLE_REPEAT_ONE"),
    };
    return modes.contains(mode);
}

std::optional<int> parseDurationSeconds(const QString &text)
{
    QString trimmed = text.trimmed();
    const int dot = trimmed.indexOf(QLatin1Char('.'));
    if (dot >= 0)
        trimmed.truncate(dot);

    const QStringList parts = trimmed.split(QLatin1Char(':'));
    if (parts.size() != 3)
        return std::nullopt;

    qint64 total = 0;
    for (int i = 0; i < parts.size(); ++i) {
        bool ok = false;
        const qint64 part = parts.at(i).toLongLong(&ok);
        if (!ok || part < 0)
            return std::nullopt;
        if (i > 0 && part > 59)
            return std::nullopt;
        if (total > (std::numeric_limits<int>::max() - part) / 60)
            return std::nullopt;
        total = total * 60 + part;
    }
    return static_cast<int>(total);
}

void registerMetaTypes()
{
    qRegisterMetaType<SubscriptionKey>();
    qRegisterMetaType<ChangeEvent>();
    qRegisterMetaType<Volume>();
    qRegisterMetaType<Mute>();
    qRegisterMetaType<Bass>();
    qRegisterMetaType<Treble>();
    qRegisterMetaType<Loudness>();
    qRegisterMetaType<PlaybackState>();
    qRegisterMetaType<CurrentTrackUri>();
    qRegisterMetaType<PlayMode>();
    qRegisterMetaType<TrackDuration>();
}

} // namespace sonoswatch
