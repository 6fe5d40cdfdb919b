// LibsshErrors.cpp
#include "LibsshErrors.h"

void throwLibsshFailure(const QString& stage, const QString& detail)
{
    const QString msg = QString("%1: %2").arg(stage, detail);
    const QString d = detail.toLower();

    // "Socket error: Connection refused" must not fall through to the
    // generic socket-error rule below.
    if (d.contains("connection refused"))
        throw ConnectionRefusedError(msg);

    // Also ahead of "socket error": a timed-out socket is not retried.
    if (d.contains("timeout") || d.contains("timed out"))
        throw TransportTimeoutError(msg);

    if (d.contains("disconnect") ||
        d.contains("connection reset") ||
        d.contains("connection closed") ||
        d.contains("remote host closed") ||
        d.contains("broken pipe") ||
        d.contains("socket error"))
        throw DisconnectError(msg);

    throw TransportError(msg);
}
