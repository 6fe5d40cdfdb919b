// VmHandle.h
//
// Read-only view of a guest VM as seen by the SSH layer: the ssh settings
// block plus the forwarded-port table of every network adapter.
// Owned by the caller; nothing in vmssh mutates it.

#pragma once

#include <QString>
#include <QVector>

// -----------------------------
// Forwarded ports (per adapter)
// -----------------------------
struct ForwardedPort {
    QString name;        // e.g. "ssh"
    int     guestPort = 0;
    int     hostPort  = 0;
};

struct NetworkAdapter {
    QVector<ForwardedPort> forwardedPorts;   // in driver order
};

// -----------------------------
// config.ssh
// -----------------------------
struct SshSettings {
    QString host           = "127.0.0.1";
    QString username       = "vagrant";
    QString privateKeyPath = "keys/vagrant";   // relative => against VmHandle::rootPath

    int     port = 0;                          // 0 => not configured, discover it

    QString forwardedPortKey         = "ssh";
    int     forwardedPortDestination = 22;

    int     maxTries   = 10;
    int     timeoutSec = 30;

    bool    forwardAgent = false;
    bool    forwardX11   = false;
};

struct VmHandle {
    QString rootPath;
    SshSettings ssh;
    QVector<NetworkAdapter> networkAdapters;
};

// Per-call overrides. Empty strings / non-positive numbers mean "use config".
struct SshOverrides {
    int     port       = 0;
    int     timeoutSec = 0;
    QString host;
    QString username;
    QString privateKeyPath;
};

// Expands "~/" and resolves a relative key path against vm.rootPath.
QString resolvedPrivateKeyPath(const VmHandle& vm, const QString& overridePath = QString());
