// SshTransport.h
//
// Transport seam between the connection logic and libssh.
//
//   SshTransportFactory::connect()  -> one authenticated connection
//   SshTransport                    -> exec / upload / close on it
//
// Implementations report failures with the TransportError family below so
// retry and classification code never has to look at libssh return codes.

#pragma once

#include <QByteArray>
#include <QString>

#include <atomic>
#include <memory>
#include <stdexcept>

// ------------------------------------------------------------
// Low-level transport failures
// ------------------------------------------------------------
class TransportError : public std::runtime_error
{
public:
    explicit TransportError(const QString& msg)
        : std::runtime_error(msg.toStdString()) {}
};

// Conditions that are expected while a guest boots and are safe to retry.
class TransientConnectionError : public TransportError
{
public:
    using TransportError::TransportError;
};

class ConnectionRefusedError : public TransientConnectionError
{
public:
    using TransientConnectionError::TransientConnectionError;
};

class DisconnectError : public TransientConnectionError
{
public:
    using TransientConnectionError::TransientConnectionError;
};

class AuthenticationError : public TransportError
{
public:
    using TransportError::TransportError;
};

// I/O failure while moving file content.
class TransferIoError : public TransportError
{
public:
    using TransportError::TransportError;
};

class TransportTimeoutError : public TransportError
{
public:
    using TransportError::TransportError;
};

// Raised inside an attempt that a watchdog abandoned.
class TransportAbortedError : public TransportError
{
public:
    using TransportError::TransportError;
};

// ------------------------------------------------------------
// Value types
// ------------------------------------------------------------

// Snapshot built fresh for each connect call.
struct ConnectionConfig {
    QString host;
    QString user;
    QString keyPath;
    int     port       = 22;
    int     timeoutSec = 30;
    bool    forwardAgent = false;
};

struct CommandResult {
    int        exitStatus = -1;
    QByteArray stdoutText;
    QByteArray stderrText;
};

// Set from another thread to make an in-flight connect give up.
class ConnectAbort
{
public:
    void trip() { m_tripped.store(true); }
    bool isTripped() const { return m_tripped.load(); }

private:
    std::atomic_bool m_tripped{false};
};

// ------------------------------------------------------------
// Interfaces
// ------------------------------------------------------------
class SshTransport
{
public:
    virtual ~SshTransport() = default;

    virtual CommandResult exec(const QString& command) = 0;

    // Writes the whole buffer to remotePath, replacing it.
    virtual void upload(const QByteArray& data, const QString& remotePath) = 0;

    // Safe to call more than once.
    virtual void close() = 0;
};

class SshTransportFactory
{
public:
    virtual ~SshTransportFactory() = default;

    // abort may be null. Throws TransportError on failure.
    virtual std::unique_ptr<SshTransport> connect(const ConnectionConfig& config,
                                                  const ConnectAbort* abort) = 0;
};
