#include <QtTest/QtTest>

#include "common/errors.hpp"
#include "core/platform_detector.hpp"

#include "fake_transport.hpp"

using patchfleet::ProviderKind;
using patchfleet::testing::FakeHostScript;
using patchfleet::testing::FakeTransportFactory;
using patchfleet::testing::linuxHost;

namespace {

constexpr std::chrono::seconds kTimeout{5};

patchfleet::PlatformInfo detect(FakeHostScript script)
{
    FakeTransportFactory factory;
    factory.script("target-1", std::move(script));

    patchfleet::HostConfig config;
    config.name = "target-1";
    config.address = "192.0.2.10";
    auto transport = factory.create(config);
    transport->connect(kTimeout);
    return patchfleet::detectPlatform(*transport, kTimeout);
}

} // namespace

class PlatformDetectorTests : public QObject
{
    Q_OBJECT
private slots:
    void testOsReleaseValue();
    void testUbuntu();
    void testDebianDerivativeViaIdLike();
    void testRhelWithDnf();
    void testCentosWithOnlyYum();
    void testUnsupportedLinuxFlavor();
    void testFreeBsd();
    void testOpenBsd();
    void testOtherPosixKernel();
    void testNonPosixAnswer();
    void testUnameFailure();
};

void PlatformDetectorTests::testOsReleaseValue()
{
    QCOMPARE(QString::fromStdString(patchfleet::osReleaseValue("ID=ubuntu")), QStringLiteral("ubuntu"));
    QCOMPARE(QString::fromStdString(patchfleet::osReleaseValue("VERSION_ID=\"22.04\"")),
             QStringLiteral("22.04"));
    QCOMPARE(QString::fromStdString(patchfleet::osReleaseValue("ID='Fedora'")),
             QStringLiteral("fedora"));
    QVERIFY(patchfleet::osReleaseValue("").empty());
}

void PlatformDetectorTests::testUbuntu()
{
    const auto info = detect(linuxHost("ubuntu", "22.04"));
    QCOMPARE(info.provider, ProviderKind::Apt);
    QCOMPARE(QString::fromStdString(info.os.kind), QStringLiteral("linux"));
    QCOMPARE(QString::fromStdString(info.os.flavor), QStringLiteral("ubuntu"));
    QCOMPARE(QString::fromStdString(info.os.version), QStringLiteral("22.04"));
    QVERIFY(info.unsupportedReason.empty());
}

void PlatformDetectorTests::testDebianDerivativeViaIdLike()
{
    const auto info = detect(linuxHost("linuxmint", "21.2", "ubuntu debian"));
    QCOMPARE(info.provider, ProviderKind::Apt);
    QCOMPARE(QString::fromStdString(info.os.flavor), QStringLiteral("ubuntu"));
}

void PlatformDetectorTests::testRhelWithDnf()
{
    const auto info = detect(linuxHost("rhel", "9.3"));
    QCOMPARE(info.provider, ProviderKind::Dnf);
}

void PlatformDetectorTests::testCentosWithOnlyYum()
{
    FakeHostScript script = linuxHost("centos", "7");
    script.on("command -v dnf", 1);
    const auto info = detect(script);
    QCOMPARE(info.provider, ProviderKind::Yum);
    QCOMPARE(QString::fromStdString(info.os.version), QStringLiteral("7"));
}

void PlatformDetectorTests::testUnsupportedLinuxFlavor()
{
    const auto info = detect(linuxHost("arch", ""));
    QCOMPARE(info.provider, ProviderKind::None);
    QCOMPARE(QString::fromStdString(info.os.flavor), QStringLiteral("arch"));
    QVERIFY(!info.unsupportedReason.empty());
}

void PlatformDetectorTests::testFreeBsd()
{
    FakeHostScript script;
    script.on("uname -s", 0, "FreeBSD\n").on("uname -r", 0, "14.0-RELEASE-p3\n");
    const auto info = detect(script);
    QCOMPARE(info.provider, ProviderKind::Pkg);
    QCOMPARE(QString::fromStdString(info.os.flavor), QStringLiteral("freebsd"));
    QCOMPARE(QString::fromStdString(info.os.version), QStringLiteral("14.0-RELEASE-p3"));
}

void PlatformDetectorTests::testOpenBsd()
{
    FakeHostScript script;
    script.on("uname -s", 0, "OpenBSD\n").on("uname -r", 0, "7.4\n");
    const auto info = detect(script);
    QCOMPARE(info.provider, ProviderKind::PkgAdd);
    QCOMPARE(QString::fromStdString(info.os.version), QStringLiteral("7.4"));
}

void PlatformDetectorTests::testOtherPosixKernel()
{
    FakeHostScript script;
    script.on("uname -s", 0, "Darwin\n").on("uname -r", 0, "23.2.0\n");
    const auto info = detect(script);
    QCOMPARE(info.provider, ProviderKind::None);
    QCOMPARE(QString::fromStdString(info.os.kind), QStringLiteral("darwin"));
    QVERIFY(!info.unsupportedReason.empty());
}

void PlatformDetectorTests::testNonPosixAnswer()
{
    FakeHostScript script;
    script.on("uname -s", 0, "'uname' is not recognized as an internal or external command,\n");
    QVERIFY_THROWS_EXCEPTION(patchfleet::UnsupportedPlatformError, detect(script));
}

void PlatformDetectorTests::testUnameFailure()
{
    // Unscripted: the fake answers 127.
    QVERIFY_THROWS_EXCEPTION(patchfleet::UnsupportedPlatformError, detect(FakeHostScript()));
}

QTEST_MAIN(PlatformDetectorTests)
#include "test_platform_detector.moc"
