// InteractiveLauncher.h
//
// Purpose:
//   Hands the terminal to the native OpenSSH client by replacing the current
//   process image. Terminal rendering, PTY handling and escape sequences
//   are entirely the client's business.
//
// This is a terminal operation: launch() never returns. If exec itself
// fails the process exits with status 127.

#pragma once

#include <QString>
#include <QStringList>

#include <functional>

#include "VmHandle.h"

class KeyPermissionGuard;

// What the platform offers for the hand-off.
struct ClientPlatform {
    bool    nativeClientSupported = true;
    QString clientProgram;            // absolute path to ssh, empty if not found

    static ClientPlatform detect();
};

// Everything that ends up on the client command line.
struct ClientInvocation {
    QString host;
    QString user;
    QString keyPath;
    int     port = 22;
    bool    forwardAgent = false;
    bool    forwardX11   = false;
};

// argv without the program name, in OpenSSH option order:
//   -p PORT -o UserKnownHostsFile=/dev/null -o StrictHostKeyChecking=no
//   -o IdentitiesOnly=yes -i KEY -o LogLevel=ERROR
//   [-o ForwardAgent=yes] [-o ForwardX11=yes -o ForwardX11Trusted=yes]
//   USER@HOST
QStringList buildClientArguments(const ClientInvocation& inv);

class InteractiveLauncher
{
public:
    // Replaces the process image. Only returns if exec failed.
    using ExecFn = std::function<void(const QString& program, const QStringList& args)>;

    InteractiveLauncher(const VmHandle& vm,
                        KeyPermissionGuard& keyGuard,
                        ClientPlatform platform = ClientPlatform::detect(),
                        ExecFn exec = ExecFn());

    // Throws SshUnavailableWindows / SshUnavailable / SshKeyBadPermissions /
    // SshPortNotDetected before anything irreversible happens.
    [[noreturn]] void launch(const SshOverrides& overrides);

    // The invocation launch() would exec, after the same precondition checks.
    ClientInvocation prepare(const SshOverrides& overrides);

private:
    const VmHandle& m_vm;
    KeyPermissionGuard& m_keyGuard;
    ClientPlatform m_platform;
    ExecFn m_exec;
};
