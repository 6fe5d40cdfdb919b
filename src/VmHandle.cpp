// VmHandle.cpp
#include "VmHandle.h"

#include <QDir>
#include <QFileInfo>

QString resolvedPrivateKeyPath(const VmHandle& vm, const QString& overridePath)
{
    QString p = overridePath.trimmed().isEmpty()
                    ? vm.ssh.privateKeyPath.trimmed()
                    : overridePath.trimmed();

    if (p == "~")
        p = QDir::homePath();
    else if (p.startsWith("~/"))
        p = QDir::homePath() + p.mid(1);

    if (QFileInfo(p).isAbsolute())
        return QDir::cleanPath(p);

    const QString base = vm.rootPath.trimmed().isEmpty()
                             ? QDir::currentPath()
                             : vm.rootPath.trimmed();

    return QDir::cleanPath(QDir(base).absoluteFilePath(p));
}
