#pragma once

#include "VmHandle.h"

// Picks the host-side port that reaches the guest's SSH daemon.
//
// Precedence:
//   1) overridePort (> 0)
//   2) vm.ssh.port  (> 0)
//   3) forwarded-port table: first entry named vm.ssh.forwardedPortKey,
//      otherwise first entry whose guest port is forwardedPortDestination.
//
// Throws SshPortNotDetected when nothing matches.
class PortResolver
{
public:
    static int resolve(const VmHandle& vm, int overridePort = 0);
};
