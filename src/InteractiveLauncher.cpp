// InteractiveLauncher.cpp
#include "InteractiveLauncher.h"

#include "KeyPermissionGuard.h"
#include "PortResolver.h"
#include "SshErrors.h"

#include <QDebug>
#include <QFile>
#include <QStandardPaths>

#include <cerrno>
#include <cstring>
#include <utility>
#include <vector>

#include <unistd.h>

// ------------------------------------------------------------
// Default exec: execv() with argv[0] = program
// ------------------------------------------------------------
static void execProcess(const QString& program, const QStringList& args)
{
    std::vector<QByteArray> storage;
    storage.reserve(static_cast<size_t>(args.size()) + 1);
    storage.push_back(QFile::encodeName(program));
    for (const QString& a : args)
        storage.push_back(a.toLocal8Bit());

    std::vector<char*> argv;
    argv.reserve(storage.size() + 1);
    for (QByteArray& b : storage)
        argv.push_back(b.data());
    argv.push_back(nullptr);

    ::execv(argv[0], argv.data());
}

ClientPlatform ClientPlatform::detect()
{
    ClientPlatform p;
#ifdef Q_OS_WIN
    p.nativeClientSupported = false;
#else
    p.nativeClientSupported = true;
    p.clientProgram = QStandardPaths::findExecutable(QStringLiteral("ssh"));
#endif
    return p;
}

QStringList buildClientArguments(const ClientInvocation& inv)
{
    QStringList args;
    args << "-p" << QString::number(inv.port);
    args << "-o" << "UserKnownHostsFile=/dev/null";
    args << "-o" << "StrictHostKeyChecking=no";
    args << "-o" << "IdentitiesOnly=yes";
    args << "-i" << inv.keyPath;
    args << "-o" << "LogLevel=ERROR";

    if (inv.forwardAgent)
        args << "-o" << "ForwardAgent=yes";

    // Both are required so that no warnings are shown regarding X11.
    if (inv.forwardX11) {
        args << "-o" << "ForwardX11=yes";
        args << "-o" << "ForwardX11Trusted=yes";
    }

    args << QString("%1@%2").arg(inv.user, inv.host);
    return args;
}

InteractiveLauncher::InteractiveLauncher(const VmHandle& vm,
                                         KeyPermissionGuard& keyGuard,
                                         ClientPlatform platform,
                                         ExecFn exec)
    : m_vm(vm)
    , m_keyGuard(keyGuard)
    , m_platform(std::move(platform))
    , m_exec(exec ? std::move(exec) : ExecFn(execProcess))
{
}

ClientInvocation InteractiveLauncher::prepare(const SshOverrides& overrides)
{
    ClientInvocation inv;
    inv.keyPath = resolvedPrivateKeyPath(m_vm, overrides.privateKeyPath);

    if (!m_platform.nativeClientSupported)
        throw SshUnavailableWindows(inv.keyPath, PortResolver::resolve(m_vm, overrides.port));

    if (m_platform.clientProgram.isEmpty())
        throw SshUnavailable();

    inv.port = PortResolver::resolve(m_vm, overrides.port);
    inv.host = overrides.host.trimmed().isEmpty() ? m_vm.ssh.host : overrides.host.trimmed();
    inv.user = overrides.username.trimmed().isEmpty() ? m_vm.ssh.username : overrides.username.trimmed();
    inv.forwardAgent = m_vm.ssh.forwardAgent;
    inv.forwardX11   = m_vm.ssh.forwardX11;

    m_keyGuard.ensure(inv.keyPath);
    return inv;
}

void InteractiveLauncher::launch(const SshOverrides& overrides)
{
    const ClientInvocation inv = prepare(overrides);
    const QStringList args = buildClientArguments(inv);

    qInfo().noquote() << QString("[SSH] invoking: %1 %2")
                         .arg(m_platform.clientProgram, args.join(' '));

    m_exec(m_platform.clientProgram, args);

    // Only reached when exec failed; there is nothing to go back to.
    const int e = errno;
    qCritical().noquote() << QString("[SSH] exec of '%1' failed: %2")
                             .arg(m_platform.clientProgram,
                                  QString::fromLocal8Bit(std::strerror(e)));
    ::_exit(127);
}
