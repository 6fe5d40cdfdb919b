#include "ConnectionManager.h"
#include "FileTransferer.h"
#include "KeyPermissionGuard.h"
#include "MockTransport.h"
#include "SshErrors.h"

#include <QFile>
#include <QTemporaryDir>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <functional>

using namespace testing;

namespace
{
struct FileTransfererTest : public Test
{
    FileTransfererTest()
    {
        vm.rootPath = "/project";
        vm.ssh.port = 2222;
        vm.ssh.maxTries = 2;
    }

    // Transport whose upload fails with an I/O error `failures` times across
    // successive connects, then succeeds. Records every payload it sees.
    std::function<std::unique_ptr<SshTransport>(const ConnectionConfig&, const ConnectAbort*)>
    flakyUploads(int failures)
    {
        return [this, failures](const ConnectionConfig&, const ConnectAbort*) -> std::unique_ptr<SshTransport> {
            auto t = std::make_unique<NiceMock<MockTransport>>();
            const bool fail = uploadsSeen++ < failures;
            ON_CALL(*t, upload(_, _))
                .WillByDefault([this, fail](const QByteArray& data, const QString& dest) {
                    payloads.push_back(data);
                    destinations.push_back(dest);
                    if (fail)
                        throw TransferIoError("sftp_write failed: broken pipe");
                });
            return t;
        };
    }

    VmHandle vm;
    StrictMock<MockTransportFactory> factory;
    KeyPermissionGuard keyGuard{nullptr, false};
    ConnectionManager connections{vm, factory, keyGuard};
    FileTransferer transfers{connections};

    int uploadsSeen = 0;
    std::vector<QByteArray> payloads;
    std::vector<QString> destinations;
};
} // namespace

TEST_F(FileTransfererTest, uploadsBytesOnFirstAttempt)
{
    EXPECT_CALL(factory, connect(_, _)).Times(1).WillOnce(flakyUploads(0));

    transfers.upload(UploadSource::fromBytes("#!/bin/sh\necho hi\n"), "/tmp/provision.sh");

    ASSERT_EQ(payloads.size(), 1u);
    EXPECT_EQ(payloads[0], QByteArray("#!/bin/sh\necho hi\n"));
    EXPECT_EQ(destinations[0], QString("/tmp/provision.sh"));
}

TEST_F(FileTransfererTest, retriesWholeCycleOnIoFailure)
{
    EXPECT_CALL(factory, connect(_, _)).Times(3).WillRepeatedly(flakyUploads(2));

    transfers.upload(UploadSource::fromBytes("payload"), "/tmp/x");

    // Every attempt opened its own connection and re-sent everything.
    ASSERT_EQ(payloads.size(), 3u);
    for (const auto& p : payloads)
        EXPECT_EQ(p, QByteArray("payload"));
}

TEST_F(FileTransfererTest, succeedsOnFifthAttempt)
{
    EXPECT_CALL(factory, connect(_, _)).Times(5).WillRepeatedly(flakyUploads(4));
    EXPECT_NO_THROW(transfers.upload(UploadSource::fromBytes("x"), "/tmp/x"));
}

TEST_F(FileTransfererTest, givesUpAfterFiveAttempts)
{
    EXPECT_CALL(factory, connect(_, _)).Times(5).WillRepeatedly(flakyUploads(100));
    EXPECT_THROW(transfers.upload(UploadSource::fromBytes("x"), "/tmp/x"), TransferIoError);
}

TEST_F(FileTransfererTest, connectionRetriesRunInsideEachAttempt)
{
    auto flaky = flakyUploads(1);
    EXPECT_CALL(factory, connect(_, _))
        .WillOnce(Throw(ConnectionRefusedError("Connection refused")))
        .WillOnce(flaky)
        .WillOnce(Throw(ConnectionRefusedError("Connection refused")))
        .WillOnce(flaky);

    transfers.upload(UploadSource::fromBytes("x"), "/tmp/x");
    EXPECT_EQ(payloads.size(), 2u);
}

TEST_F(FileTransfererTest, exhaustedConnectionIsNotRetriedAsTransfer)
{
    EXPECT_CALL(factory, connect(_, _))
        .Times(2)
        .WillRepeatedly(Throw(ConnectionRefusedError("Connection refused")));

    EXPECT_THROW(transfers.upload(UploadSource::fromBytes("x"), "/tmp/x"), SshConnectionRefused);
}

TEST_F(FileTransfererTest, readsLocalFileForEachAttempt)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString local = dir.filePath("Vagrantfile");
    {
        QFile f(local);
        ASSERT_TRUE(f.open(QIODevice::WriteOnly));
        f.write("Vagrant::Config.run do |config|\nend\n");
    }

    EXPECT_CALL(factory, connect(_, _)).Times(2).WillRepeatedly(flakyUploads(1));

    transfers.upload(UploadSource::fromFile(local), "/vagrant/Vagrantfile");

    ASSERT_EQ(payloads.size(), 2u);
    EXPECT_EQ(payloads[1], QByteArray("Vagrant::Config.run do |config|\nend\n"));
}

TEST_F(FileTransfererTest, unreadableLocalFileIsNotRetried)
{
    EXPECT_CALL(factory, connect(_, _)).Times(1).WillOnce(flakyUploads(0));

    EXPECT_THROW(transfers.upload(UploadSource::fromFile("/nonexistent/file"), "/tmp/x"),
                 UploadSourceError);
    EXPECT_TRUE(payloads.empty());
}
