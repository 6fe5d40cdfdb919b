// LivenessProbe.cpp
//
// Each connect attempt runs on the probe's own pool and owns everything it
// touches (config, VM snapshot, abort flag, outcome) through a shared
// ProbeAttempt. The caller waits on a semaphore with the wall-clock bound;
// when it expires the attempt is tripped and left behind. Whatever it still
// holds (a half-open socket, a session being closed) is released by the
// attempt itself when it gets there.

#include "LivenessProbe.h"

#include "ConnectionManager.h"
#include "PortResolver.h"

#include <QDebug>
#include <QSemaphore>
#include <QThread>

#include <exception>
#include <limits>
#include <memory>

namespace
{
struct ProbeAttempt {
    ConnectionConfig   config;
    VmHandle           vm;
    int                maxTries = 1;
    ConnectAbort       abort;
    QSemaphore         finished;
    std::exception_ptr failure;   // written before finished is released
};
} // namespace

LivenessProbe::LivenessProbe(ConnectionManager& connections)
    : m_connections(connections)
{
    // Abandoned attempts keep their thread until they return; leave room
    // for fresh probes next to them.
    m_pool.setMaxThreadCount(qMax(4, QThread::idealThreadCount()));
}

LivenessProbe::~LivenessProbe()
{
    m_pool.waitForDone();
}

int LivenessProbe::timeoutMsFor(int timeoutSec)
{
    const qint64 ms = qint64(qMax(1, timeoutSec)) * 1000;
    return int(qMin<qint64>(ms, std::numeric_limits<int>::max()));
}

bool LivenessProbe::isUp()
{
    const VmHandle& vm = m_connections.vm();

    // Everything that reads VM configuration happens here, before the
    // time-boxed part.
    SshOverrides overrides;
    overrides.port       = PortResolver::resolve(vm);
    overrides.timeoutSec = vm.ssh.timeoutSec;

    auto attempt = std::make_shared<ProbeAttempt>();
    attempt->config   = m_connections.prepare(overrides);
    attempt->vm       = vm;
    attempt->maxTries = vm.ssh.maxTries;

    const int timeoutMs = timeoutMsFor(vm.ssh.timeoutSec);

    ConnectionManager& connections = m_connections;
    m_pool.start([&connections, attempt]() {
        try {
            SshSession session(connections.connect(attempt->config, attempt->maxTries,
                                                   &attempt->abort),
                               attempt->vm);
        } catch (...) {
            attempt->failure = std::current_exception();   // rethrown on the caller's thread
        }
        attempt->finished.release();
    });

    if (!attempt->finished.tryAcquire(1, timeoutMs)) {
        qInfo().noquote() << QString("[SSH-UP] no answer from %1:%2 within %3 s, abandoning attempt")
                             .arg(attempt->config.host)
                             .arg(attempt->config.port)
                             .arg(vm.ssh.timeoutSec);
        attempt->abort.trip();
        return false;
    }

    if (!attempt->failure) {
        qInfo().noquote() << QString("[SSH-UP] %1:%2 is up")
                             .arg(attempt->config.host)
                             .arg(attempt->config.port);
        return true;
    }

    try {
        std::rethrow_exception(attempt->failure);
    } catch (const SshConnectionRefused&) {
        qInfo().noquote() << "[SSH-UP] connection refused -> down";
        return false;
    } catch (const TransientConnectionError& e) {
        qInfo().noquote() << QString("[SSH-UP] %1 -> down").arg(QString::fromLocal8Bit(e.what()));
        return false;
    } catch (const TransportTimeoutError& e) {
        qInfo().noquote() << QString("[SSH-UP] %1 -> down").arg(QString::fromLocal8Bit(e.what()));
        return false;
    }
    // SshAuthenticationFailed and unclassified errors leave through the
    // rethrow above.
}
