// PortResolver.cpp
#include "PortResolver.h"

#include "SshErrors.h"

#include <QDebug>

int PortResolver::resolve(const VmHandle& vm, int overridePort)
{
    if (overridePort > 0)
        return overridePort;

    if (vm.ssh.port > 0)
        return vm.ssh.port;

    const ForwardedPort* byName = nullptr;
    const ForwardedPort* byDestination = nullptr;

    // A name match ends the scan; later adapters are not looked at.
    // The destination match is only a fallback and keeps the first hit.
    for (const NetworkAdapter& na : vm.networkAdapters) {
        for (const ForwardedPort& fp : na.forwardedPorts) {
            if (!byName && fp.name == vm.ssh.forwardedPortKey)
                byName = &fp;
            if (!byDestination && fp.guestPort == vm.ssh.forwardedPortDestination)
                byDestination = &fp;
        }

        if (byName)
            break;
    }

    if (byName) {
        qDebug().noquote() << QString("[SSH-PORT] '%1' -> host port %2")
                              .arg(byName->name)
                              .arg(byName->hostPort);
        return byName->hostPort;
    }

    if (byDestination) {
        qDebug().noquote() << QString("[SSH-PORT] guest %1 -> host port %2")
                              .arg(byDestination->guestPort)
                              .arg(byDestination->hostPort);
        return byDestination->hostPort;
    }

    qWarning().noquote() << QString("[SSH-PORT] no forwarded port named '%1' or to guest port %2")
                            .arg(vm.ssh.forwardedPortKey)
                            .arg(vm.ssh.forwardedPortDestination);
    throw SshPortNotDetected();
}
