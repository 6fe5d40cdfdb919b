// LibsshTransport.h
//
// Purpose:
//   libssh implementation of the transport seam:
//     - key-only publickey authentication with the configured private key
//     - no host-key verification, no known_hosts, no ssh_config processing,
//       no agent identities
//     - remote exec over a session channel (optional agent forwarding)
//     - whole-buffer upload over SFTP
//
// Design boundary:
//   Interactive terminals never go through libssh; InteractiveLauncher
//   execs OpenSSH for that.

#pragma once

#include "SshTransport.h"

// Forward-declare libssh session type to avoid pulling libssh headers into the header.
struct ssh_session_struct;
using ssh_session = ssh_session_struct*;

class LibsshTransport : public SshTransport
{
public:
    // Takes ownership of an authenticated session.
    LibsshTransport(ssh_session session, bool forwardAgent);
    ~LibsshTransport() override;

    LibsshTransport(const LibsshTransport&) = delete;
    LibsshTransport& operator=(const LibsshTransport&) = delete;

    CommandResult exec(const QString& command) override;
    void upload(const QByteArray& data, const QString& remotePath) override;
    void close() override;

private:
    ssh_session m_session = nullptr;
    bool m_forwardAgent = false;
};

class LibsshTransportFactory : public SshTransportFactory
{
public:
    std::unique_ptr<SshTransport> connect(const ConnectionConfig& config,
                                          const ConnectAbort* abort) override;
};
