// LibsshTransport.cpp
//
// Notes:
//   - Connect and authentication run with the session in non-blocking mode.
//     Each SSH_AGAIN round sleeps one tick and checks both the handshake
//     deadline and the ConnectAbort flag, so an abandoned attempt frees its
//     session within a tick instead of sitting in a blocking read.
//   - libssh only reports failures as text; throwLibsshFailure() in
//     LibsshErrors.cpp maps them onto the TransportError family.
//   - Never log key material. The key path is fine, the key is not.

#include "LibsshTransport.h"

#include "LibsshErrors.h"

#include <QDebug>
#include <QElapsedTimer>
#include <QFile>
#include <QThread>

#include <libssh/libssh.h>
#include <libssh/sftp.h>

#include <fcntl.h>

#include <memory>

static constexpr unsigned long kPollTickMs = 20;

// ------------------------------------------------------------
// Small helper to turn libssh's last error into QString
// ------------------------------------------------------------
static QString libsshError(ssh_session s)
{
    if (!s) return QStringLiteral("libssh: null session");
    return QString::fromLocal8Bit(ssh_get_error(s));
}

// ------------------------------------------------------------
// Free a session that never made it into a LibsshTransport.
// ------------------------------------------------------------
struct PendingSession {
    ssh_session s = nullptr;

    ~PendingSession()
    {
        if (!s) return;
        ssh_disconnect(s);
        ssh_free(s);
    }

    ssh_session release()
    {
        ssh_session out = s;
        s = nullptr;
        return out;
    }
};

static void waitTick(const QElapsedTimer& timer, int timeoutSec,
                     const ConnectAbort* abort, const char* stage)
{
    if (abort && abort->isTripped())
        throw TransportAbortedError(QString("%1: attempt abandoned").arg(QLatin1String(stage)));

    if (timeoutSec > 0 && timer.elapsed() > qint64(timeoutSec) * 1000)
        throw TransportTimeoutError(QString("%1: timed out after %2 s")
                                        .arg(QLatin1String(stage))
                                        .arg(timeoutSec));

    QThread::msleep(kPollTickMs);
}

// ============================================================
// LibsshTransportFactory
// ============================================================
std::unique_ptr<SshTransport> LibsshTransportFactory::connect(const ConnectionConfig& config,
                                                              const ConnectAbort* abort)
{
    PendingSession pending;
    pending.s = ssh_new();
    if (!pending.s)
        throw TransportError(QStringLiteral("ssh_new() failed."));

    ssh_session s = pending.s;

    auto optSet = [&](enum ssh_options_e opt, const void* val, const char* what) {
        if (ssh_options_set(s, opt, val) != SSH_OK)
            throw TransportError(QString("ssh_options_set(%1) failed: %2")
                                     .arg(QLatin1String(what), libsshError(s)));
    };

    const QByteArray host = config.host.toUtf8();
    const QByteArray user = config.user.toUtf8();
    const int port = config.port;
    const long timeoutSec = config.timeoutSec > 0 ? config.timeoutSec : 30;
    bool processConfig = false;

    optSet(SSH_OPTIONS_HOST, host.constData(), "HOST");
    optSet(SSH_OPTIONS_USER, user.constData(), "USER");
    optSet(SSH_OPTIONS_PORT, &port, "PORT");
    optSet(SSH_OPTIONS_TIMEOUT, &timeoutSec, "TIMEOUT");

    // No ~/.ssh/config, no known_hosts bookkeeping.
    optSet(SSH_OPTIONS_PROCESS_CONFIG, &processConfig, "PROCESS_CONFIG");
    optSet(SSH_OPTIONS_KNOWNHOSTS, "/dev/null", "KNOWNHOSTS");
    optSet(SSH_OPTIONS_GLOBAL_KNOWNHOSTS, "/dev/null", "GLOBAL_KNOWNHOSTS");

    QElapsedTimer timer;
    timer.start();

    // Network connect
    ssh_set_blocking(s, 0);
    int rc = SSH_AGAIN;
    while ((rc = ssh_connect(s)) == SSH_AGAIN)
        waitTick(timer, config.timeoutSec, abort, "ssh_connect");

    if (rc != SSH_OK)
        throwLibsshFailure(QStringLiteral("ssh_connect"), libsshError(s));

    qDebug().noquote() << QString("[SSH] ssh_connect OK host='%1' port=%2").arg(config.host).arg(port);

    // No host-key verification (paranoid off).

    ssh_key rawKey = nullptr;
    const QByteArray keyPath = QFile::encodeName(config.keyPath);
    if (ssh_pki_import_privkey_file(keyPath.constData(), nullptr, nullptr, nullptr, &rawKey) != SSH_OK || !rawKey)
        throw TransportError(QString("Cannot load private key '%1'.").arg(config.keyPath));

    std::unique_ptr<ssh_key_struct, decltype(&ssh_key_free)> key(rawKey, &ssh_key_free);

    while ((rc = ssh_userauth_publickey(s, nullptr, key.get())) == SSH_AUTH_AGAIN)
        waitTick(timer, config.timeoutSec, abort, "ssh_userauth_publickey");
    key.reset();

    if (rc == SSH_AUTH_DENIED || rc == SSH_AUTH_PARTIAL)
        throw AuthenticationError(QString("publickey rejected for user '%1': %2")
                                      .arg(config.user, libsshError(s)));
    if (rc != SSH_AUTH_SUCCESS)
        throwLibsshFailure(QStringLiteral("ssh_userauth_publickey"), libsshError(s));

    ssh_set_blocking(s, 1);

    qInfo().noquote() << QString("[SSH] auth OK user='%1' host='%2' port=%3")
                         .arg(config.user, config.host)
                         .arg(port);

    return std::unique_ptr<SshTransport>(new LibsshTransport(pending.release(), config.forwardAgent));
}

// ============================================================
// LibsshTransport
// ============================================================
LibsshTransport::LibsshTransport(ssh_session session, bool forwardAgent)
    : m_session(session)
    , m_forwardAgent(forwardAgent)
{
}

LibsshTransport::~LibsshTransport()
{
    // Ensure we never leak sessions.
    close();
}

void LibsshTransport::close()
{
    if (!m_session)
        return;

    qDebug().noquote() << "[SSH] disconnect (ssh_disconnect + free)";
    ssh_disconnect(m_session);
    ssh_free(m_session);
    m_session = nullptr;
}

// ------------------------------------------------------------
// exec(): run one command, collect stdout/stderr and exit status
// ------------------------------------------------------------
CommandResult LibsshTransport::exec(const QString& command)
{
    if (!m_session)
        throw TransportError(QStringLiteral("Not connected."));

    ssh_channel ch = ssh_channel_new(m_session);
    if (!ch)
        throwLibsshFailure(QStringLiteral("ssh_channel_new"), libsshError(m_session));

    auto cleanup = [&]() {
        if (ssh_channel_is_open(ch)) {
            ssh_channel_send_eof(ch);
            ssh_channel_close(ch);
        }
        ssh_channel_free(ch);
        ch = nullptr;
    };

    auto fail = [&](const char* stage) {
        const QString e = libsshError(m_session);
        cleanup();
        throwLibsshFailure(QLatin1String(stage), e);
    };

    if (ssh_channel_open_session(ch) != SSH_OK)
        fail("ssh_channel_open_session");

    if (m_forwardAgent && ssh_channel_request_auth_agent(ch) != SSH_OK) {
        qWarning().noquote() << QString("[SSH] agent forwarding request refused: %1")
                                .arg(libsshError(m_session));
    }

    if (ssh_channel_request_exec(ch, command.toUtf8().constData()) != SSH_OK)
        fail("ssh_channel_request_exec");

    CommandResult result;
    char buf[4096];

    auto readAvailable = [&](int isStderr) -> bool {
        while (true) {
            const int avail = ssh_channel_poll_timeout(ch, 0, isStderr);
            if (avail == SSH_ERROR)
                return false;
            if (avail <= 0)
                return true;

            const int n = ssh_channel_read(ch, buf, sizeof(buf), isStderr);
            if (n == SSH_ERROR)
                return false;
            if (n <= 0)
                return true;

            if (isStderr) result.stderrText.append(buf, n);
            else          result.stdoutText.append(buf, n);
        }
    };

    while (true) {
        // Wait up to 50ms for stdout activity (this is our main "tick")
        const int availOut = ssh_channel_poll_timeout(ch, 50, 0);
        if (availOut == SSH_ERROR)
            fail("ssh_channel_poll_timeout(stdout)");

        if (!readAvailable(0))
            fail("ssh_channel_read(stdout)");
        if (!readAvailable(1))
            fail("ssh_channel_read(stderr)");

        if (ssh_channel_is_eof(ch)) {
            // Drain whatever arrived together with EOF.
            if (!readAvailable(0) || !readAvailable(1))
                fail("ssh_channel_read(drain)");
            break;
        }

        if (ssh_channel_is_closed(ch))
            break;
    }

    ssh_channel_send_eof(ch);
    ssh_channel_close(ch);
    result.exitStatus = ssh_channel_get_exit_status(ch);
    ssh_channel_free(ch);
    ch = nullptr;

    qDebug().noquote() << QString("[SSH] exec done exit=%1 out=%2B err=%3B")
                          .arg(result.exitStatus)
                          .arg(result.stdoutText.size())
                          .arg(result.stderrText.size());
    return result;
}

// ------------------------------------------------------------
// upload(): SFTP write of the whole buffer, truncating the target
// ------------------------------------------------------------
void LibsshTransport::upload(const QByteArray& data, const QString& remotePath)
{
    if (!m_session)
        throw TransportError(QStringLiteral("Not connected."));

    sftp_session sftp = sftp_new(m_session);
    if (!sftp)
        throw TransferIoError(QString("sftp_new failed: %1").arg(libsshError(m_session)));

    if (sftp_init(sftp) != SSH_OK) {
        const QString e = libsshError(m_session);
        sftp_free(sftp);
        throw TransferIoError(QString("sftp_init failed: %1").arg(e));
    }

    const QByteArray path = remotePath.toUtf8();
    sftp_file f = sftp_open(sftp, path.constData(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (!f) {
        const QString e = libsshError(m_session);
        sftp_free(sftp);
        throw TransferIoError(QString("sftp_open failed for '%1': %2").arg(remotePath, e));
    }

    const char* ptr = data.constData();
    qint64 remaining = data.size();

    while (remaining > 0) {
        const size_t chunk = static_cast<size_t>(qMin<qint64>(remaining, 32 * 1024));
        const ssize_t written = sftp_write(f, ptr, chunk);
        if (written < 0) {
            const QString e = libsshError(m_session);
            sftp_close(f);
            sftp_free(sftp);
            throw TransferIoError(QString("sftp_write failed for '%1': %2").arg(remotePath, e));
        }
        ptr += written;
        remaining -= written;
    }

    if (sftp_close(f) != SSH_OK) {
        const QString e = libsshError(m_session);
        sftp_free(sftp);
        throw TransferIoError(QString("sftp_close failed for '%1': %2").arg(remotePath, e));
    }
    sftp_free(sftp);

    qInfo().noquote() << QString("[SCP] wrote %1 bytes to '%2'").arg(data.size()).arg(remotePath);
}
