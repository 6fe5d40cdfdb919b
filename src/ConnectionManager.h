// ConnectionManager.h
//
// Purpose:
//   Opens one authenticated transport per call and hands it to a
//   continuation wrapped in an SshSession. Nothing is pooled: every call
//   resolves the port, checks the key and connects from scratch.
//
// Retry policy:
//   Up to vm.ssh.maxTries connect attempts, retrying only on
//   TransientConnectionError (connection refused, unexpected disconnect).
//   Exhausting the budget raises SshConnectionRefused; a rejected key raises
//   SshAuthenticationFailed; anything else escapes after one attempt.

#pragma once

#include <memory>
#include <utility>

#include "SshErrors.h"
#include "SshSession.h"
#include "SshTransport.h"
#include "VmHandle.h"

class KeyPermissionGuard;

class ConnectionManager
{
public:
    ConnectionManager(const VmHandle& vm,
                      SshTransportFactory& factory,
                      KeyPermissionGuard& keyGuard);

    // Resolve port, ensure key permissions and snapshot the connection
    // settings. Reads the VM configuration, so call it on the caller's thread.
    ConnectionConfig prepare(const SshOverrides& overrides);

    // Connect with the retry policy above. Touches no VM state and may run on
    // a worker thread.
    std::unique_ptr<SshTransport> connect(const ConnectionConfig& config,
                                          int maxTries,
                                          const ConnectAbort* abort = nullptr);

    // prepare() + connect(), then fn(session). The session is torn down when
    // fn returns or throws. A connection refusal raised from inside fn is
    // reported as SshConnectionRefused as well.
    template <typename Fn>
    auto open(const SshOverrides& overrides, Fn&& fn)
        -> decltype(fn(std::declval<SshSession&>()))
    {
        const ConnectionConfig config = prepare(overrides);
        SshSession session(connect(config, m_vm.ssh.maxTries), m_vm);

        try {
            return fn(session);
        } catch (const ConnectionRefusedError&) {
            throw SshConnectionRefused();
        }
    }

    const VmHandle& vm() const { return m_vm; }

private:
    const VmHandle& m_vm;
    SshTransportFactory& m_factory;
    KeyPermissionGuard& m_keyGuard;
};
