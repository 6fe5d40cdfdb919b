// LibsshErrors.h
//
// libssh only reports failures as text (ssh_get_error). This maps the
// messages of interest onto the TransportError family; the result decides
// what ConnectionManager retries and what LivenessProbe reports as down.
//
// Order of checks:
//   "connection refused"                      -> ConnectionRefusedError
//   "timeout" / "timed out"                   -> TransportTimeoutError
//   disconnect / reset / closed / broken pipe
//   / "socket error"                          -> DisconnectError
//   anything else                             -> TransportError

#pragma once

#include <QString>

#include "SshTransport.h"

// Throws the classified error with message "<stage>: <detail>".
[[noreturn]] void throwLibsshFailure(const QString& stage, const QString& detail);
