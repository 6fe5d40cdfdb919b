// VmStore.cpp
//
// VmStore is the configuration boundary of vmssh: it turns a VM descriptor
// file into the VmHandle every other component reads.
//
// Non-responsibilities:
// - No SSH/network operations
// - No validation of reachability (LivenessProbe does that)

#include "VmStore.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QJsonValue>

#include <climits>

// -----------------------------
// Helpers: JSON -> structs
// -----------------------------
static ForwardedPort forwardedPortFromJson(const QJsonObject& o)
{
    ForwardedPort fp;
    fp.name      = o.value("name").toString().trimmed();
    fp.guestPort = o.value("guest_port").toInt(0);
    fp.hostPort  = o.value("host_port").toInt(0);
    return fp;
}

static NetworkAdapter adapterFromJson(const QJsonObject& o)
{
    NetworkAdapter na;
    const QJsonArray ports = o.value("forwarded_ports").toArray();
    na.forwardedPorts.reserve(ports.size());
    for (const auto& v : ports) {
        if (!v.isObject()) continue;
        na.forwardedPorts.push_back(forwardedPortFromJson(v.toObject()));
    }
    return na;
}

// Integer field: absent or null keeps fallback, anything but a whole number
// is an error.
static bool readInt(const QJsonObject& o, const char* key, int fallback,
                    int* out, QString* err)
{
    const QJsonValue v = o.value(QLatin1String(key));
    if (v.isUndefined() || v.isNull()) {
        *out = fallback;
        return true;
    }

    const double d = v.toDouble();
    if (!v.isDouble() || d != double(qint64(d)) || d < INT_MIN || d > INT_MAX) {
        if (err) *err = QString("Invalid VM descriptor: ssh.%1 must be an integer.")
                            .arg(QLatin1String(key));
        return false;
    }

    *out = int(d);
    return true;
}

static bool sshFromJson(const QJsonObject& o, SshSettings* out, QString* err)
{
    SshSettings s;   // start from defaults, override what is present

    if (o.contains("host"))             s.host = o.value("host").toString(s.host).trimmed();
    if (o.contains("username"))         s.username = o.value("username").toString(s.username).trimmed();
    if (o.contains("private_key_path")) s.privateKeyPath = o.value("private_key_path").toString(s.privateKeyPath);

    if (!readInt(o, "port", 0, &s.port, err))
        return false;
    if (s.port < 0) s.port = 0;

    if (o.contains("forwarded_port_key"))
        s.forwardedPortKey = o.value("forwarded_port_key").toString(s.forwardedPortKey);

    if (!readInt(o, "forwarded_port_destination", s.forwardedPortDestination,
                 &s.forwardedPortDestination, err) ||
        !readInt(o, "max_tries", s.maxTries, &s.maxTries, err) ||
        !readInt(o, "timeout", s.timeoutSec, &s.timeoutSec, err))
        return false;

    s.maxTries   = qMax(1, s.maxTries);
    s.timeoutSec = qMax(1, s.timeoutSec);

    s.forwardAgent = o.value("forward_agent").toBool(s.forwardAgent);
    s.forwardX11   = o.value("forward_x11").toBool(s.forwardX11);

    *out = s;
    return true;
}

VmHandle VmStore::defaults()
{
    VmHandle vm;
    vm.rootPath = QDir::currentPath();
    return vm;
}

bool VmStore::parse(const QByteArray& json, const QString& baseDir,
                    VmHandle* out, QString* err)
{
    if (err) err->clear();
    if (!out) {
        if (err) *err = "VmStore::parse: out is null.";
        return false;
    }

    QJsonParseError pe{};
    const QJsonDocument doc = QJsonDocument::fromJson(json, &pe);
    if (pe.error != QJsonParseError::NoError) {
        if (err) *err = QString("Invalid VM descriptor JSON: %1 (offset %2)")
                            .arg(pe.errorString())
                            .arg(pe.offset);
        return false;
    }
    if (!doc.isObject()) {
        if (err) *err = "Invalid VM descriptor: top-level value is not an object.";
        return false;
    }

    const QJsonObject root = doc.object();

    VmHandle vm;

    const QString anchor = baseDir.isEmpty() ? QDir::currentPath() : baseDir;
    const QString rp = root.value("root_path").toString().trimmed();
    if (rp.isEmpty())
        vm.rootPath = QDir::cleanPath(anchor);
    else if (QFileInfo(rp).isAbsolute())
        vm.rootPath = QDir::cleanPath(rp);
    else
        vm.rootPath = QDir::cleanPath(QDir(anchor).absoluteFilePath(rp));

    if (!sshFromJson(root.value("ssh").toObject(), &vm.ssh, err))
        return false;

    const QJsonArray adapters = root.value("network_adapters").toArray();
    vm.networkAdapters.reserve(adapters.size());
    for (const auto& v : adapters) {
        if (!v.isObject()) continue;
        vm.networkAdapters.push_back(adapterFromJson(v.toObject()));
    }

    *out = vm;
    return true;
}

bool VmStore::load(const QString& path, VmHandle* out, QString* err)
{
    if (err) err->clear();

    QFile f(path);
    if (!f.open(QIODevice::ReadOnly)) {
        if (err) *err = QString("Cannot open VM descriptor '%1': %2").arg(path, f.errorString());
        qWarning().noquote() << QString("[VM] load FAILED: %1").arg(err ? *err : path);
        return false;
    }

    const QByteArray data = f.readAll();
    f.close();

    const bool ok = parse(data, QFileInfo(path).absolutePath(), out, err);
    if (ok) {
        qInfo().noquote() << QString("[VM] loaded descriptor '%1' adapters=%2")
                             .arg(path)
                             .arg(out->networkAdapters.size());
    } else {
        qWarning().noquote() << QString("[VM] load FAILED '%1': %2")
                                .arg(path, err ? *err : QString("parse error"));
    }
    return ok;
}
