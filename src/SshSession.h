#pragma once

#include <QString>

#include <memory>

#include "SshTransport.h"

struct VmHandle;

// One live transport bound to the VM it was opened for. Only valid inside
// the ConnectionManager::open() continuation that received it; the
// transport is closed when the session is destroyed.
class SshSession
{
public:
    SshSession(std::unique_ptr<SshTransport> transport, const VmHandle& vm);
    ~SshSession();

    SshSession(const SshSession&) = delete;
    SshSession& operator=(const SshSession&) = delete;

    // Runs a remote command and returns exit status plus captured output.
    CommandResult exec(const QString& command);

    const VmHandle& vm() const { return m_vm; }
    SshTransport& transport() { return *m_transport; }

private:
    std::unique_ptr<SshTransport> m_transport;
    const VmHandle& m_vm;
};
