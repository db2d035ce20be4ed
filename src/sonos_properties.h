#pragma once

#include <optional>

#include <QMetaType>
#include <QString>

#include "sonos_types.h"

namespace sonoswatch {

// Every property type carries its store key and owning service.

struct Volume {
    static constexpr const char *key = "volume";
    static constexpr Service service = Service::RenderingControl;
    int value = 0;

    bool operator==(const Volume &other) const { return value == other.value; }
    bool operator!=(const Volume &other) const { return !(*this == other); }
};

struct Mute {
    static constexpr const char *key = "mute";
    static constexpr Service service = Service::RenderingControl;
    bool value = false;

    bool operator==(const Mute &other) const { return value == other.value; }
    bool operator!=(const Mute &other) const { return !(*this == other); }
};

struct Bass {
    static constexpr const char *key = "bass";
    static constexpr Service service = Service::RenderingControl;
    int value = 0;

    bool operator==(const Bass &other) const { return value == other.value; }
    bool operator!=(const Bass &other) const { return !(*this == other); }
};

struct Treble {
    static constexpr const char *key = "treble";
    static constexpr Service service = Service::RenderingControl;
    int value = 0;

    bool operator==(const Treble &other) const { return value == other.value; }
    bool operator!=(const Treble &other) const { return !(*this == other); }
};

struct Loudness {
    static constexpr const char *key = "loudness";
    static constexpr Service service = Service::RenderingControl;
    bool value = false;

    bool operator==(const Loudness &other) const { return value == other.value; }
    bool operator!=(const Loudness &other) const { return !(*this == other); }
};

enum class TransportState {
    Playing,
    Paused,
    Stopped,
    Transitioning
};

struct PlaybackState {
    static constexpr const char *key = "playback_state";
    static constexpr Service service = Service::AVTransport;
    TransportState value = TransportState::Stopped;

    bool operator==(const PlaybackState &other) const { return value == other.value; }
    bool operator!=(const PlaybackState &other) const { return !(*this == other); }
};

struct CurrentTrackUri {
    static constexpr const char *key = "current_track_uri";
    static constexpr Service service = Service::AVTransport;
    QString value;

    bool operator==(const CurrentTrackUri &other) const { return value == other.value; }
    bool operator!=(const CurrentTrackUri &other) const { return !(*this == other); }
};

struct PlayMode {
    static constexpr const char *key = "play_mode";
    static constexpr Service service = Service::AVTransport;
    QString value;

    bool operator==(const PlayMode &other) const { return value == other.value; }
    bool operator!=(const PlayMode &other) const { return !(*this == other); }
};

struct TrackDuration {
    static constexpr const char *key = "track_duration";
    static constexpr Service service = Service::AVTransport;
    int seconds = 0;

    bool operator==(const TrackDuration &other) const { return seconds == other.seconds; }
    bool operator!=(const TrackDuration &other) const { return !(*this == other); }
};

std::optional<TransportState> transportStateFromString(const QString &text);
QString transportStateName(TransportState state);
bool isKnownPlayMode(const QString &mode);
// "H:MM:SS" or "H:MM:SS.mmm"; fractional part is dropped.
std::optional<int> parseDurationSeconds(const QString &text);

void registerMetaTypes();

} // namespace sonoswatch

Q_DECLARE_METATYPE(sonoswatch::Volume)
Q_DECLARE_METATYPE(sonoswatch::Mute)
Q_DECLARE_METATYPE(sonoswatch::Bass)
Q_DECLARE_METATYPE(sonoswatch::Treble)
Q_DECLARE_METATYPE(sonoswatch::Loudness)
Q_DECLARE_METATYPE(sonoswatch::PlaybackState)
Q_DECLARE_METATYPE(sonoswatch::CurrentTrackUri)
Q_DECLARE_METATYPE(sonoswatch::PlayMode)
Q_DECLARE_METATYPE(sonoswatch::TrackDuration)
