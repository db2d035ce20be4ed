#pragma once

#include <atomic>
#include <functional>
#include <stdexcept>

#include <QCoreApplication>
#include <QDeadlineTimer>
#include <QEventLoop>
#include <QMutex>
#include <QThread>

#include "sonos_decoders.h"
#include "sonos_provider.h"
#include "sonos_types.h"

namespace sonoswatch::testing {

class ManualClock
{
public:
    explicit ManualClock(qint64 startMs = 1000000)
        : m_now(startMs)
    {
    }

    Clock clock()
    {
        return [this]() { return m_now.load(); };
    }

    qint64 now() const { return m_now.load(); }
    void advance(qint64 ms) { m_now += ms; }
    void set(qint64 ms) { m_now = ms; }

private:
    std::atomic<qint64> m_now;
};

// Scriptable provider that records every remote call.
class FakeProvider final : public ServiceProvider
{
public:
    explicit FakeProvider(Service service, bool polling = true)
        : m_service(service)
        , m_polling(polling)
    {
    }

    Service service() const override { return m_service; }

    SubscribeResult subscribe(const DeviceDescriptor &device, const QString &callbackUrl, int timeoutSec) override
    {
        const int call = ++subscribeCalls;
        if (subscribeDelayMs > 0)
            QThread::msleep(static_cast<unsigned long>(subscribeDelayMs.load()));

        SubscribeResult result;
        {
            QMutexLocker locker(&m_mutex);
            m_lastCallbackUrl = callbackUrl;
        }
        if (failSubscribe) {
            result.error = QStringLiteral("connection refused");
            return result;
        }
        result.ok = true;
        result.token = QStringLiteral("uuid:%1-%2-%3").arg(device.id, serviceName(m_service)).arg(call);
        result.timeoutSec = grantedTimeoutSec > 0 ? grantedTimeoutSec.load() : timeoutSec;
        return result;
    }

    RenewResult renew(const DeviceDescriptor &device, const QString &token, int timeoutSec) override
    {
        Q_UNUSED(device);
        Q_UNUSED(token);
        ++renewCalls;

        RenewResult result;
        if (rejectRenewals) {
            result.retryable = false;
            result.error = QStringLiteral("HTTP 412");
            return result;
        }
        if (failRenewals != 0) {
            if (failRenewals > 0)
                --failRenewals;
            result.error = QStringLiteral("timeout");
            return result;
        }
        result.ok = true;
        result.timeoutSec = timeoutSec;
        return result;
    }

    bool unsubscribe(const DeviceDescriptor &device, const QString &token, QString *error) override
    {
        Q_UNUSED(device);
        Q_UNUSED(token);
        ++unsubscribeCalls;
        if (failUnsubscribe) {
            if (error)
                *error = QStringLiteral("host unreachable");
            return false;
        }
        return true;
    }

    bool supportsPolling() const override { return m_polling; }

    PollResult poll(const DeviceDescriptor &device, const std::atomic_bool *cancelled = nullptr) override
    {
        Q_UNUSED(device);
        ++pollCalls;
        PollResult result;
        // Models a device that answers slowly; gives up as soon as the poll is cancelled.
        QDeadlineTimer answerAt(pollDelayMs.load());
        while (!answerAt.hasExpired()) {
            if (cancelled && cancelled->load()) {
                ++cancelledPolls;
                result.error = QStringLiteral("cancelled");
                return result;
            }
            QThread::msleep(5);
        }
        if (failPolls) {
            result.error = QStringLiteral("poll failed");
            return result;
        }
        QMutexLocker locker(&m_mutex);
        result.ok = true;
        result.payload = m_pollPayload;
        return result;
    }

    QList<DecodedProperty> decode(const QByteArray &payload) const override
    {
        if (throwOnDecode)
            throw std::runtime_error("decoder failure");
        if (throwNonStandardOnDecode)
            throw 42;
        switch (m_service) {
        case Service::RenderingControl:
            return upnp::decodeRenderingControl(payload);
        case Service::AVTransport:
            return upnp::decodeAvTransport(payload);
        default:
            return {};
        }
    }

    void setPollPayload(const QByteArray &payload)
    {
        QMutexLocker locker(&m_mutex);
        m_pollPayload = payload;
    }

    QString lastCallbackUrl() const
    {
        QMutexLocker locker(&m_mutex);
        return m_lastCallbackUrl;
    }

    std::atomic<int> subscribeCalls{0};
    std::atomic<int> renewCalls{0};
    std::atomic<int> unsubscribeCalls{0};
    std::atomic<int> pollCalls{0};
    std::atomic<int> cancelledPolls{0};

    std::atomic<bool> failSubscribe{false};
    std::atomic<int> subscribeDelayMs{0};
    std::atomic<int> grantedTimeoutSec{0};
    // Number of upcoming renewals that fail; negative fails forever.
    std::atomic<int> failRenewals{0};
    std::atomic<bool> rejectRenewals{false};
    std::atomic<bool> failUnsubscribe{false};
    std::atomic<bool> failPolls{false};
    std::atomic<int> pollDelayMs{0};
    std::atomic<bool> throwOnDecode{false};
    std::atomic<bool> throwNonStandardOnDecode{false};

private:
    const Service m_service;
    const bool m_polling;

    mutable QMutex m_mutex;
    QByteArray m_pollPayload;
    QString m_lastCallbackUrl;
};

inline QByteArray propertySet(const QString &eventNamespace, const QList<upnp::StateVariable> &variables)
{
    const QString event = QString::fromUtf8(upnp::buildEventDocument(eventNamespace, variables));
    return QByteArrayLiteral("<?xml version=\"1.0\"?>"
                             "<e:propertyset xmlns:e=\"urn:schemas-upnp-org:event-1-0\"><e:property><LastChange>")
        + event.toHtmlEscaped().toUtf8()
        + QByteArrayLiteral("</LastChange></e:property></e:propertyset>");
}

inline QByteArray renderingEvent(const QList<upnp::StateVariable> &variables)
{
    return propertySet(QStringLiteral("urn:schemas-upnp-org:metadata-1-0/RCS/"), variables);
}

inline QByteArray transportEvent(const QList<upnp::StateVariable> &variables)
{
    return propertySet(QStringLiteral("urn:schemas-upnp-org:metadata-1-0/AVT/"), variables);
}

inline QByteArray volumeEvent(int volume)
{
    return renderingEvent({upnp::StateVariable{QStringLiteral("Volume"), QStringLiteral("Master"), QString::number(volume)}});
}

// Spins the event loop until the predicate holds or the timeout passes.
inline bool waitUntil(const std::function<bool()> &predicate, int timeoutMs = 3000)
{
    QDeadlineTimer deadline(timeoutMs);
    while (!predicate()) {
        if (deadline.hasExpired())
            return false;
        QCoreApplication::processEvents(QEventLoop::AllEvents, 5);
        QThread::msleep(5);
    }
    return true;
}

} // namespace sonoswatch::testing
