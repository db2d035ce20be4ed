#include <atomic>
#include <csignal>
#include <iostream>

#include <QCoreApplication>
#include <QEventLoop>
#include <QStringList>

#include "sonos_config.h"
#include "sonos_event_manager.h"
#include "sonos_properties.h"

namespace {

using namespace sonoswatch;

std::atomic_bool g_running{true};

void handleSignal(int)
{
    g_running.store(false);
}

QString describeChange(EventManager &manager, const ChangeEvent &change)
{
    if (change.key == QLatin1String(Volume::key)) {
        if (const auto volume = manager.get<Volume>(change.entity))
            return QString::number(volume->value);
    } else if (change.key == QLatin1String(PlaybackState::key)) {
        if (const auto playback = manager.get<PlaybackState>(change.entity))
            return transportStateName(playback->value);
    }
    return QStringLiteral("?");
}

} // namespace

int main(int argc, char **argv)
{
    QCoreApplication app(argc, argv);

    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);

    QStringList args = app.arguments().mid(1);
    EngineConfig config;
    if (!args.isEmpty() && args.first().endsWith(QLatin1String(".json"))) {
        QString error;
        if (!loadEngineConfig(args.takeFirst(), &config, &error)) {
            std::cerr << "failed to load config: " << error.toStdString() << '\n';
            return 1;
        }
    }

    if (args.isEmpty()) {
        std::cerr << "usage: sonoswatchd [config.json] <device-host>..." << '\n';
        return 2;
    }

    std::cerr << "starting sonoswatchd for " << args.size() << " device(s)" << '\n';

    EventManager manager(config);
    manager.registerDefaultProviders();
    for (const QString &host : args)
        manager.addDevice(DeviceDescriptor{host, host, 1400});

    QString error;
    if (!manager.start(&error)) {
        std::cerr << "failed to start event manager: " << error.toStdString() << '\n';
        return 1;
    }

    ChangeIterator changes = manager.iterateChanges();
    for (const QString &host : args) {
        EnsureResult result = manager.watch<Volume>(host);
        if (!result.ok)
            std::cerr << "cannot watch volume on " << host.toStdString() << ": " << result.error.toStdString() << '\n';
        result = manager.watch<PlaybackState>(host);
        if (!result.ok)
            std::cerr << "cannot watch playback on " << host.toStdString() << ": " << result.error.toStdString() << '\n';
    }

    while (g_running.load()) {
        if (const auto change = changes.nextFor(250)) {
            std::cout << change->entity.toStdString() << ' ' << change->key.toStdString() << '='
                      << describeChange(manager, *change).toStdString() << std::endl;
        } else if (changes.isClosed()) {
            break;
        }

        QCoreApplication::processEvents(QEventLoop::AllEvents, 5);
    }

    manager.shutdown();
    std::cerr << "stopping sonoswatchd" << '\n';
    return 0;
}
