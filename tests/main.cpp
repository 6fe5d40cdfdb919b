#include "Logger.h"

#include <QCoreApplication>
#include <QDir>

#include <gmock/gmock.h>

int main(int argc, char* argv[])
{
    ::testing::InitGoogleMock(&argc, argv);

    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName("vmssh");
    QCoreApplication::setApplicationName("vmssh-tests");

    Logger::setLogFilePathOverride(QDir::tempPath() + "/vmssh-tests/vmssh-tests.log");
    Logger::install("vmssh-tests");

    return RUN_ALL_TESTS();
}
