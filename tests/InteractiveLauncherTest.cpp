#include "FakeKeyFileModes.h"
#include "InteractiveLauncher.h"
#include "KeyPermissionGuard.h"
#include "SshErrors.h"

#include <gtest/gtest.h>

namespace
{
// Thrown by the capturing exec so launch() can return control to the test.
struct ExecCalled
{
    QString program;
    QStringList args;
};

ClientPlatform posixWithSsh()
{
    ClientPlatform p;
    p.nativeClientSupported = true;
    p.clientProgram = "/usr/bin/ssh";
    return p;
}

void captureExec(const QString& program, const QStringList& args)
{
    throw ExecCalled{program, args};
}

struct InteractiveLauncherTest : public ::testing::Test
{
    InteractiveLauncherTest()
    {
        vm.rootPath = "/project";
        vm.ssh.port = 2222;
        vm.ssh.privateKeyPath = "keys/vagrant";
    }

    VmHandle vm;
    KeyPermissionGuard keyGuard{nullptr, false};
};
} // namespace

TEST(ClientArguments, fixedOptionOrder)
{
    ClientInvocation inv;
    inv.host = "127.0.0.1";
    inv.user = "vagrant";
    inv.keyPath = "/project/keys/vagrant";
    inv.port = 2222;

    const QStringList expected = {
        "-p", "2222",
        "-o", "UserKnownHostsFile=/dev/null",
        "-o", "StrictHostKeyChecking=no",
        "-o", "IdentitiesOnly=yes",
        "-i", "/project/keys/vagrant",
        "-o", "LogLevel=ERROR",
        "vagrant@127.0.0.1",
    };
    EXPECT_EQ(buildClientArguments(inv), expected);
}

TEST(ClientArguments, forwardingOptionsPrecedeDestination)
{
    ClientInvocation inv;
    inv.host = "10.0.0.5";
    inv.user = "ops";
    inv.keyPath = "/k";
    inv.port = 22;
    inv.forwardAgent = true;
    inv.forwardX11 = true;

    const QStringList args = buildClientArguments(inv);
    ASSERT_GE(args.size(), 7);
    EXPECT_EQ(args.last(), QString("ops@10.0.0.5"));

    const QStringList tail = args.mid(args.size() - 7, 6);
    const QStringList expected = {
        "-o", "ForwardAgent=yes",
        "-o", "ForwardX11=yes",
        "-o", "ForwardX11Trusted=yes",
    };
    EXPECT_EQ(tail, expected);
}

TEST(ClientArguments, agentWithoutX11)
{
    ClientInvocation inv;
    inv.host = "h";
    inv.user = "u";
    inv.keyPath = "/k";
    inv.forwardAgent = true;

    const QStringList args = buildClientArguments(inv);
    EXPECT_TRUE(args.contains("ForwardAgent=yes"));
    EXPECT_FALSE(args.contains("ForwardX11=yes"));
    EXPECT_FALSE(args.contains("ForwardX11Trusted=yes"));
}

TEST_F(InteractiveLauncherTest, execsClientWithBuiltArguments)
{
    vm.ssh.forwardAgent = true;
    InteractiveLauncher launcher(vm, keyGuard, posixWithSsh(), captureExec);

    try {
        launcher.launch(SshOverrides{});
        FAIL() << "launch returned";
    } catch (const ExecCalled& e) {
        EXPECT_EQ(e.program, QString("/usr/bin/ssh"));
        EXPECT_EQ(e.args.first(), QString("-p"));
        EXPECT_EQ(e.args.at(1), QString("2222"));
        EXPECT_TRUE(e.args.contains("/project/keys/vagrant"));
        EXPECT_TRUE(e.args.contains("ForwardAgent=yes"));
        EXPECT_EQ(e.args.last(), QString("vagrant@127.0.0.1"));
    }
}

TEST_F(InteractiveLauncherTest, unsupportedPlatformReportsKeyAndPort)
{
    ClientPlatform p;
    p.nativeClientSupported = false;
    InteractiveLauncher launcher(vm, keyGuard, p, captureExec);

    try {
        launcher.launch(SshOverrides{});
        FAIL() << "expected SshUnavailableWindows";
    } catch (const SshUnavailableWindows& e) {
        EXPECT_EQ(e.keyPath(), QString("/project/keys/vagrant"));
        EXPECT_EQ(e.port(), 2222);
    }
}

TEST_F(InteractiveLauncherTest, missingClientIsUnavailable)
{
    ClientPlatform p;
    p.nativeClientSupported = true;
    InteractiveLauncher launcher(vm, keyGuard, p, captureExec);

    EXPECT_THROW(launcher.launch(SshOverrides{}), SshUnavailable);
}

TEST_F(InteractiveLauncherTest, badKeyStopsBeforeExec)
{
    FakeKeyFileModes modes;
    modes.chmodSticks = false;
    KeyPermissionGuard strict(&modes, true);

    bool execed = false;
    InteractiveLauncher launcher(vm, strict, posixWithSsh(),
                                 [&](const QString&, const QStringList&) { execed = true; });

    EXPECT_THROW(launcher.launch(SshOverrides{}), SshKeyBadPermissions);
    EXPECT_FALSE(execed);
}

TEST_F(InteractiveLauncherTest, overridesReplaceConfiguredValues)
{
    InteractiveLauncher launcher(vm, keyGuard, posixWithSsh(), captureExec);

    SshOverrides o;
    o.host = "192.168.33.10";
    o.username = "root";
    o.port = 22;
    o.privateKeyPath = "/home/me/.ssh/id_ed25519";

    const ClientInvocation inv = launcher.prepare(o);
    EXPECT_EQ(inv.host, QString("192.168.33.10"));
    EXPECT_EQ(inv.user, QString("root"));
    EXPECT_EQ(inv.port, 22);
    EXPECT_EQ(inv.keyPath, QString("/home/me/.ssh/id_ed25519"));
}

TEST_F(InteractiveLauncherTest, undetectablePortStopsBeforeExec)
{
    vm.ssh.port = 0;
    InteractiveLauncher launcher(vm, keyGuard, posixWithSsh(), captureExec);

    EXPECT_THROW(launcher.launch(SshOverrides{}), SshPortNotDetected);
}
