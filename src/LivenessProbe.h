#pragma once

#include <QThreadPool>

class ConnectionManager;

// Answers "is the guest's SSH endpoint answering right now?" within
// vm.ssh.timeoutSec of wall-clock time.
//
//   reachable                          -> true
//   refused / disconnected / timed out -> false
//   key rejected                       -> SshAuthenticationFailed (host is up)
//   anything else                      -> propagated unchanged
//
// An attempt still running at the deadline is abandoned: isUp() returns
// false right away and the attempt finishes on the probe's pool. The
// destructor waits for abandoned attempts, so the ConnectionManager must
// outlive the probe.
class LivenessProbe
{
public:
    explicit LivenessProbe(ConnectionManager& connections);
    ~LivenessProbe();

    bool isUp();

    // Wall-clock bound in ms for a timeout in seconds; at least 1 s, clamped
    // to what QThreadPool/QSemaphore accept.
    static int timeoutMsFor(int timeoutSec);

private:
    ConnectionManager& m_connections;
    QThreadPool m_pool;
};
