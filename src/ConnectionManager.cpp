// ConnectionManager.cpp
#include "ConnectionManager.h"

#include "KeyPermissionGuard.h"
#include "PortResolver.h"
#include "Retryable.h"

#include <QDebug>

ConnectionManager::ConnectionManager(const VmHandle& vm,
                                     SshTransportFactory& factory,
                                     KeyPermissionGuard& keyGuard)
    : m_vm(vm)
    , m_factory(factory)
    , m_keyGuard(keyGuard)
{
}

ConnectionConfig ConnectionManager::prepare(const SshOverrides& overrides)
{
    ConnectionConfig c;
    c.port    = PortResolver::resolve(m_vm, overrides.port);
    c.keyPath = resolvedPrivateKeyPath(m_vm, overrides.privateKeyPath);

    // Key is checked before any network traffic.
    m_keyGuard.ensure(c.keyPath);

    c.host = overrides.host.trimmed().isEmpty() ? m_vm.ssh.host : overrides.host.trimmed();
    c.user = overrides.username.trimmed().isEmpty() ? m_vm.ssh.username : overrides.username.trimmed();
    c.timeoutSec   = (overrides.timeoutSec > 0) ? overrides.timeoutSec : m_vm.ssh.timeoutSec;
    c.forwardAgent = m_vm.ssh.forwardAgent;
    return c;
}

std::unique_ptr<SshTransport> ConnectionManager::connect(const ConnectionConfig& config,
                                                         int maxTries,
                                                         const ConnectAbort* abort)
{
    qInfo().noquote() << QString("[SSH] connecting user='%1' host='%2' port=%3 tries=%4")
                         .arg(config.user, config.host)
                         .arg(config.port)
                         .arg(maxTries);

    try {
        return retryable<TransientConnectionError>(maxTries, "SSH", [&]() {
            return m_factory.connect(config, abort);
        });
    } catch (const TransientConnectionError&) {
        throw SshConnectionRefused();
    } catch (const AuthenticationError& e) {
        qWarning().noquote() << QString("[SSH] auth FAILED user='%1' host='%2': %3")
                                .arg(config.user, config.host, QString::fromLocal8Bit(e.what()));
        throw SshAuthenticationFailed();
    }
}
