#include "FakeKeyFileModes.h"
#include "GuestSsh.h"
#include "MockTransport.h"
#include "SshErrors.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

using namespace testing;

namespace
{
struct ExecCalled
{
    QString program;
    QStringList args;
};

struct GuestSshTest : public Test
{
    GuestSshTest()
    {
        vm.rootPath = "/project";
        vm.ssh.maxTries = 2;
        vm.ssh.timeoutSec = 2;

        NetworkAdapter na;
        na.forwardedPorts.push_back({"ssh", 22, 2222});
        vm.networkAdapters.push_back(na);

        platform.nativeClientSupported = true;
        platform.clientProgram = "/usr/bin/ssh";
    }

    std::unique_ptr<GuestSsh> make()
    {
        return std::make_unique<GuestSsh>(
            vm, factory, &modes, true, platform,
            [](const QString& program, const QStringList& args) {
                throw ExecCalled{program, args};
            });
    }

    VmHandle vm;
    StrictMock<MockTransportFactory> factory;
    FakeKeyFileModes modes;
    ClientPlatform platform;
};
} // namespace

TEST_F(GuestSshTest, executeRunsContinuationOnDiscoveredPort)
{
    auto guest = make();

    EXPECT_CALL(factory, connect(_, _)).WillOnce([](const ConnectionConfig& c, const ConnectAbort*) {
        EXPECT_EQ(c.port, 2222);
        auto t = std::make_unique<NiceMock<MockTransport>>();
        ON_CALL(*t, exec(QString("hostname"))).WillByDefault(Return(CommandResult{0, "guest\n", ""}));
        return std::unique_ptr<SshTransport>(std::move(t));
    });

    const QByteArray out = guest->execute(SshOverrides{}, [](SshSession& ssh) {
        return ssh.exec("hostname").stdoutText;
    });

    EXPECT_EQ(out, QByteArray("guest\n"));
    // The loose default key mode was repaired on the way in.
    EXPECT_EQ(modes.mode & 0777u, 0600u);
}

TEST_F(GuestSshTest, uploadSendsBytes)
{
    auto guest = make();

    EXPECT_CALL(factory, connect(_, _)).WillOnce([](const ConnectionConfig&, const ConnectAbort*) {
        auto t = std::make_unique<NiceMock<MockTransport>>();
        EXPECT_CALL(*t, upload(QByteArray("data"), QString("/tmp/data"))).Times(1);
        return std::unique_ptr<SshTransport>(std::move(t));
    });

    guest->upload(UploadSource::fromBytes("data"), "/tmp/data");
}

TEST_F(GuestSshTest, isUpReflectsReachability)
{
    auto guest = make();

    EXPECT_CALL(factory, connect(_, _))
        .WillOnce([](const ConnectionConfig&, const ConnectAbort*) { return makeNiceTransport(); })
        .WillOnce(Throw(ConnectionRefusedError("Connection refused")))
        .WillOnce(Throw(ConnectionRefusedError("Connection refused")));

    EXPECT_TRUE(guest->isUp());
    EXPECT_FALSE(guest->isUp());
}

TEST_F(GuestSshTest, launchInteractiveHandsOffToClient)
{
    auto guest = make();
    EXPECT_CALL(factory, connect(_, _)).Times(0);

    try {
        guest->launchInteractive();
        FAIL() << "launchInteractive returned";
    } catch (const ExecCalled& e) {
        EXPECT_EQ(e.program, QString("/usr/bin/ssh"));
        EXPECT_EQ(e.args.last(), QString("vagrant@127.0.0.1"));
        EXPECT_TRUE(e.args.contains("2222"));
    }
}

TEST_F(GuestSshTest, unfixableKeyBlocksEveryOperation)
{
    modes.chmodSticks = false;
    auto guest = make();
    EXPECT_CALL(factory, connect(_, _)).Times(0);

    EXPECT_THROW(guest->execute(SshOverrides{}, [](SshSession&) {}), SshKeyBadPermissions);
    EXPECT_THROW(guest->upload(UploadSource::fromBytes("x"), "/tmp/x"), SshKeyBadPermissions);
    EXPECT_THROW(guest->launchInteractive(), SshKeyBadPermissions);
}
