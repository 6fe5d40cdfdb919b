// SshSession.cpp
#include "SshSession.h"

#include <QDebug>

#include <utility>

SshSession::SshSession(std::unique_ptr<SshTransport> transport, const VmHandle& vm)
    : m_transport(std::move(transport))
    , m_vm(vm)
{
}

SshSession::~SshSession()
{
    if (!m_transport)
        return;

    // Destructors must not throw; a failing close only leaves a log line.
    try {
        m_transport->close();
    } catch (const std::exception& e) {
        qWarning().noquote() << QString("[SSH] close failed: %1").arg(QString::fromLocal8Bit(e.what()));
    }
}

CommandResult SshSession::exec(const QString& command)
{
    qDebug().noquote() << QString("[SSH] exec: %1").arg(command);
    return m_transport->exec(command);
}
