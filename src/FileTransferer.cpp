// FileTransferer.cpp
#include "FileTransferer.h"

#include "ConnectionManager.h"
#include "Retryable.h"

#include <QDebug>
#include <QFile>

static QByteArray readSource(const UploadSource& source)
{
    if (source.kind == UploadSource::Kind::Bytes)
        return source.bytes;

    QFile f(source.localPath);
    if (!f.open(QIODevice::ReadOnly))
        throw UploadSourceError(QString("Cannot open '%1' for upload: %2")
                                    .arg(source.localPath, f.errorString()));
    return f.readAll();
}

FileTransferer::FileTransferer(ConnectionManager& connections)
    : m_connections(connections)
{
}

void FileTransferer::upload(const UploadSource& source, const QString& destinationPath)
{
    const QString what = (source.kind == UploadSource::Kind::LocalFile)
                             ? source.localPath
                             : QString("<%1 bytes>").arg(source.bytes.size());

    qInfo().noquote() << QString("[SCP] upload %1 -> %2").arg(what, destinationPath);

    retryable<TransferIoError>(kMaxAttempts, "SCP", [&]() {
        m_connections.open(SshOverrides{}, [&](SshSession& session) {
            // No resume: every attempt sends the whole payload again.
            const QByteArray data = readSource(source);
            session.transport().upload(data, destinationPath);
        });
    });

    qInfo().noquote() << QString("[SCP] upload OK -> %1").arg(destinationPath);
}
