// SshErrors.h
//
// Failure kinds surfaced by the guest SSH layer. Everything the caller is
// expected to report to the user derives from SshError; unfamiliar
// conditions are not wrapped and keep their own type.

#pragma once

#include <QString>
#include <stdexcept>

class SshError : public std::runtime_error
{
public:
    explicit SshError(const QString& msg)
        : std::runtime_error(msg.toStdString()) {}
};

// No native ssh client on PATH.
class SshUnavailable : public SshError
{
public:
    SshUnavailable()
        : SshError(QStringLiteral(
              "`ssh` binary could not be found. Is an SSH client installed?")) {}
};

// The platform cannot hand off to a native client at all. Carries what the
// user needs to connect with a third-party client instead.
class SshUnavailableWindows : public SshError
{
public:
    SshUnavailableWindows(const QString& keyPath, int port)
        : SshError(QStringLiteral(
              "SSH is not available on this platform. Connect manually with "
              "host port %1 and private key '%2'.").arg(port).arg(keyPath))
        , m_keyPath(keyPath)
        , m_port(port) {}

    const QString& keyPath() const { return m_keyPath; }
    int port() const { return m_port; }

private:
    QString m_keyPath;
    int     m_port = 0;
};

class SshKeyBadPermissions : public SshError
{
public:
    explicit SshKeyBadPermissions(const QString& keyPath)
        : SshError(QStringLiteral(
              "The private key '%1' has insecure permissions and could not be "
              "fixed to 0600.").arg(keyPath))
        , m_keyPath(keyPath) {}

    const QString& keyPath() const { return m_keyPath; }

private:
    QString m_keyPath;
};

class SshPortNotDetected : public SshError
{
public:
    SshPortNotDetected()
        : SshError(QStringLiteral(
              "The host port forwarded to the guest SSH daemon could not be "
              "detected. Set the ssh port explicitly.")) {}
};

class SshConnectionRefused : public SshError
{
public:
    SshConnectionRefused()
        : SshError(QStringLiteral(
              "SSH connection was refused. The guest may still be booting or "
              "the SSH daemon is not running.")) {}
};

class SshAuthenticationFailed : public SshError
{
public:
    SshAuthenticationFailed()
        : SshError(QStringLiteral(
              "SSH authentication failed. The guest is reachable but rejected "
              "the configured private key.")) {}
};
