#pragma once

#include <QByteArray>
#include <QString>

#include <stdexcept>

class ConnectionManager;

// What to upload: a local file (read again for each attempt) or bytes
// already in memory.
struct UploadSource {
    enum class Kind { LocalFile, Bytes };

    Kind       kind = Kind::Bytes;
    QString    localPath;
    QByteArray bytes;

    static UploadSource fromFile(const QString& path)
    {
        UploadSource s;
        s.kind = Kind::LocalFile;
        s.localPath = path;
        return s;
    }

    static UploadSource fromBytes(const QByteArray& data)
    {
        UploadSource s;
        s.kind = Kind::Bytes;
        s.bytes = data;
        return s;
    }
};

// Thrown when a LocalFile source cannot be read. Not retried.
class UploadSourceError : public std::runtime_error
{
public:
    explicit UploadSourceError(const QString& msg)
        : std::runtime_error(msg.toStdString()) {}
};

// Copies content to an absolute remote path. Each attempt is a full
// open + transfer cycle; a TransferIoError starts a new cycle, up to
// kMaxAttempts in total. Connection retries happen inside each cycle.
class FileTransferer
{
public:
    static constexpr int kMaxAttempts = 5;

    explicit FileTransferer(ConnectionManager& connections);

    void upload(const UploadSource& source, const QString& destinationPath);

private:
    ConnectionManager& m_connections;
};
