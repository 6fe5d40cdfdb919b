// GuestSsh.h
//
// Purpose:
//   Entry point used by the command and provisioner layers to reach a guest
//   VM over SSH. Composes PortResolver, KeyPermissionGuard,
//   ConnectionManager, FileTransferer, LivenessProbe and
//   InteractiveLauncher around one VmHandle.
//
// Operations:
//   execute()            open a session, run the continuation, close it
//   upload()             copy a file or buffer to an absolute remote path
//   isUp()               bounded reachability check
//   launchInteractive()  exec the native ssh client; never returns

#pragma once

#include "ConnectionManager.h"
#include "FileTransferer.h"
#include "InteractiveLauncher.h"
#include "KeyPermissionGuard.h"
#include "LivenessProbe.h"
#include "SshSession.h"
#include "SshTransport.h"
#include "VmHandle.h"

class GuestSsh
{
public:
    // vm and factory must outlive this object.
    GuestSsh(const VmHandle& vm, SshTransportFactory& factory);

    // For tests and embedders that substitute the key or client backends.
    GuestSsh(const VmHandle& vm,
             SshTransportFactory& factory,
             KeyFileModes* keyModes,
             bool enforceKeyModes,
             ClientPlatform platform,
             InteractiveLauncher::ExecFn exec);

    GuestSsh(const GuestSsh&) = delete;
    GuestSsh& operator=(const GuestSsh&) = delete;

    template <typename Fn>
    auto execute(const SshOverrides& overrides, Fn&& fn)
        -> decltype(fn(std::declval<SshSession&>()))
    {
        return m_connections.open(overrides, std::forward<Fn>(fn));
    }

    void upload(const UploadSource& source, const QString& destinationPath);

    bool isUp();

    [[noreturn]] void launchInteractive(const SshOverrides& overrides = SshOverrides());

private:
    KeyPermissionGuard  m_keyGuard;
    ConnectionManager   m_connections;
    FileTransferer      m_transfers;
    LivenessProbe       m_probe;
    InteractiveLauncher m_launcher;
};
