// GuestSsh.cpp
#include "GuestSsh.h"

#include <utility>

GuestSsh::GuestSsh(const VmHandle& vm, SshTransportFactory& factory)
    : m_keyGuard()
    , m_connections(vm, factory, m_keyGuard)
    , m_transfers(m_connections)
    , m_probe(m_connections)
    , m_launcher(vm, m_keyGuard)
{
}

GuestSsh::GuestSsh(const VmHandle& vm,
                   SshTransportFactory& factory,
                   KeyFileModes* keyModes,
                   bool enforceKeyModes,
                   ClientPlatform platform,
                   InteractiveLauncher::ExecFn exec)
    : m_keyGuard(keyModes, enforceKeyModes)
    , m_connections(vm, factory, m_keyGuard)
    , m_transfers(m_connections)
    , m_probe(m_connections)
    , m_launcher(vm, m_keyGuard, std::move(platform), std::move(exec))
{
}

void GuestSsh::upload(const UploadSource& source, const QString& destinationPath)
{
    m_transfers.upload(source, destinationPath);
}

bool GuestSsh::isUp()
{
    return m_probe.isUp();
}

void GuestSsh::launchInteractive(const SshOverrides& overrides)
{
    m_launcher.launch(overrides);
}
