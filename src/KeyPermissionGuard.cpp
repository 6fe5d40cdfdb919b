// KeyPermissionGuard.cpp
#include "KeyPermissionGuard.h"

#include "SshErrors.h"

#include <QDebug>
#include <QFile>
#include <QtGlobal>

#include <cerrno>
#include <system_error>

#include <sys/stat.h>
#include <unistd.h>

static bool isPermissionDenied(int e)
{
    return e == EPERM || e == EACCES;
}

// ------------------------------------------------------------
// PosixKeyFileModes
// ------------------------------------------------------------
int PosixKeyFileModes::stat(const QString& path, Stat* out)
{
    struct ::stat st {};
    const QByteArray p = QFile::encodeName(path);
    if (::stat(p.constData(), &st) != 0)
        return errno;

    if (out) {
        out->owner = st.st_uid;
        out->mode  = static_cast<unsigned>(st.st_mode);
    }
    return 0;
}

int PosixKeyFileModes::chmod(const QString& path, unsigned mode)
{
    const QByteArray p = QFile::encodeName(path);
    if (::chmod(p.constData(), static_cast<mode_t>(mode)) != 0)
        return errno;
    return 0;
}

uid_t PosixKeyFileModes::effectiveUser()
{
    return ::geteuid();
}

// ------------------------------------------------------------
// KeyPermissionGuard
// ------------------------------------------------------------
bool KeyPermissionGuard::platformHasFileModes()
{
#ifdef Q_OS_WIN
    return false;
#else
    return true;
#endif
}

KeyPermissionGuard::KeyPermissionGuard()
    : m_modes(&m_posix)
    , m_enforce(platformHasFileModes())
{
}

KeyPermissionGuard::KeyPermissionGuard(KeyFileModes* modes, bool enforce)
    : m_modes(modes ? modes : &m_posix)
    , m_enforce(enforce)
{
}

QString KeyPermissionGuard::permsString(unsigned mode)
{
    return QString::number(mode & 0777u, 8).rightJustified(3, '0');
}

KeyFileModes::Stat KeyPermissionGuard::statOrThrow(const QString& keyPath)
{
    KeyFileModes::Stat st;
    const int e = m_modes->stat(keyPath, &st);
    if (e == 0)
        return st;

    if (isPermissionDenied(e))
        throw SshKeyBadPermissions(keyPath);

    throw std::system_error(e, std::generic_category(),
                            QString("stat '%1'").arg(keyPath).toStdString());
}

void KeyPermissionGuard::ensure(const QString& keyPath)
{
    if (!m_enforce)
        return;

    qInfo().noquote() << QString("[SSH-KEY] checking key permissions: %1").arg(keyPath);

    const KeyFileModes::Stat st = statOrThrow(keyPath);

    // Not ours: nothing we are allowed to repair, and no error either.
    if (st.owner != m_modes->effectiveUser())
        return;

    if (permsString(st.mode) == "600")
        return;

    qInfo().noquote() << QString("[SSH-KEY] mode %1 -> attempting to correct to 0600")
                         .arg(permsString(st.mode));

    const int e = m_modes->chmod(keyPath, 0600);
    if (e != 0) {
        if (isPermissionDenied(e))
            throw SshKeyBadPermissions(keyPath);
        throw std::system_error(e, std::generic_category(),
                                QString("chmod '%1'").arg(keyPath).toStdString());
    }

    const KeyFileModes::Stat after = statOrThrow(keyPath);
    if (permsString(after.mode) != "600") {
        qWarning().noquote() << QString("[SSH-KEY] mode still %1 after chmod: %2")
                                .arg(permsString(after.mode), keyPath);
        throw SshKeyBadPermissions(keyPath);
    }
}
