#include <QtTest/QtTest>

#include "common/errors.hpp"
#include "providers/apt_provider.hpp"

#include "fake_transport.hpp"

using patchfleet::AptProvider;
using patchfleet::CommandContext;
using patchfleet::StepStatus;
using patchfleet::SudoPolicy;
using patchfleet::testing::FakeHostScript;
using patchfleet::testing::FakeTransportFactory;

namespace {

const char *const kSimulation =
    "Reading package lists...\n"
    "Building dependency tree...\n"
    "Reading state information...\n"
    "Calculating upgrade...\n"
    "The following NEW packages will be installed:\n"
    "  linux-image-6.5.0-27-generic\n"
    "The following packages will be upgraded:\n"
    "  netdata openssl\n"
    "2 upgraded, 1 newly installed, 0 to remove and 0 not upgraded.\n"
    "Inst netdata [2.6.3] (2.7.0 netdata-stable:stable [amd64])\n"
    "Inst openssl [3.0.2-0ubuntu1.10] (3.0.2-0ubuntu1.12 Ubuntu:22.04/jammy-updates,"
    " Ubuntu:22.04/jammy-security [amd64])\n"
    "Inst linux-image-6.5.0-27-generic (6.5.0-27.28~22.04.1 Ubuntu:22.04/jammy-updates [amd64])\n"
    "Conf netdata (2.7.0 netdata-stable:stable [amd64])\n"
    "Conf openssl (3.0.2-0ubuntu1.12 Ubuntu:22.04/jammy-security [amd64])\n";

patchfleet::HostConfig hostConfig()
{
    patchfleet::HostConfig config;
    config.name = "web-1";
    config.address = "10.0.0.5";
    return config;
}

} // namespace

class AptProviderTests : public QObject
{
    Q_OBJECT
private slots:
    void testParseRegularUpgrade();
    void testParseNewPackage();
    void testParseSecuritySource();
    void testNonInstLinesIgnored();
    void testMalformedInstLineThrows();
    void testFetchUpdates();
    void testFetchSecurityUpdatesIsSubset();
    void testFetchFailureThrows();
    void testSyncSkippedUnderSkipPolicy();
    void testSyncRunsWithSudo();
    void testSudoRefusalIsPrivilegeError();
};

void AptProviderTests::testParseRegularUpgrade()
{
    const auto update = AptProvider::parseInstLine(
        "Inst netdata [2.6.3] (2.7.0 netdata-stable:stable [amd64])");
    QVERIFY(update.has_value());
    QCOMPARE(QString::fromStdString(update->packageName()), QStringLiteral("netdata"));
    QCOMPARE(QString::fromStdString(update->currentVersion().value_or("")), QStringLiteral("2.6.3"));
    QCOMPARE(QString::fromStdString(update->newVersion()), QStringLiteral("2.7.0"));
    QVERIFY(!update->security());
    QCOMPARE(QString::fromStdString(update->source()), QStringLiteral("netdata-stable:stable"));
}

void AptProviderTests::testParseNewPackage()
{
    const auto update = AptProvider::parseInstLine(
        "Inst linux-image-6.5.0-27-generic (6.5.0-27.28~22.04.1 Ubuntu:22.04/jammy-updates [amd64])");
    QVERIFY(update.has_value());
    QVERIFY(update->isNewPackage());
    QVERIFY(!update->currentVersion().has_value());
    QCOMPARE(QString::fromStdString(update->newVersion()), QStringLiteral("6.5.0-27.28~22.04.1"));
}

void AptProviderTests::testParseSecuritySource()
{
    const auto update = AptProvider::parseInstLine(
        "Inst libssl3 [3.0.2-0ubuntu1.10] (3.0.2-0ubuntu1.12 Ubuntu:22.04/jammy-updates,"
        " Ubuntu:22.04/jammy-security [amd64]) []");
    QVERIFY(update.has_value());
    QVERIFY(update->security());
    QCOMPARE(QString::fromStdString(update->source()),
             QStringLiteral("Ubuntu:22.04/jammy-updates, Ubuntu:22.04/jammy-security"));
}

void AptProviderTests::testNonInstLinesIgnored()
{
    QVERIFY(!AptProvider::parseInstLine("Conf netdata (2.7.0 netdata-stable:stable [amd64])")
                 .has_value());
    QVERIFY(!AptProvider::parseInstLine("Calculating upgrade...").has_value());
    QVERIFY(AptProvider::parseSimulation("0 upgraded, 0 newly installed.\n").empty());
}

void AptProviderTests::testMalformedInstLineThrows()
{
    QVERIFY_THROWS_EXCEPTION(patchfleet::ParseError,
                             AptProvider::parseInstLine("Inst netdata"));
}

void AptProviderTests::testFetchUpdates()
{
    FakeTransportFactory factory;
    factory.host("web-1").on("apt-get dist-upgrade -s", 0, kSimulation);
    auto transport = factory.create(hostConfig());
    transport->connect(std::chrono::seconds(1));

    AptProvider provider;
    CommandContext context(*transport, SudoPolicy::Skip, std::chrono::seconds(5), "web-1");
    const auto result = provider.fetchUpdates(context);

    QCOMPARE(result.status, StepStatus::Ok);
    QCOMPARE(result.updates.size(), size_t(3));

    const patchfleet::Update expected("netdata", std::string("2.6.3"), "2.7.0", false,
                                      "netdata-stable:stable");
    QVERIFY(result.updates[0] == expected);
    QVERIFY(result.updates[1].security());
    QVERIFY(result.updates[2].isNewPackage());
}

void AptProviderTests::testFetchSecurityUpdatesIsSubset()
{
    FakeTransportFactory factory;
    factory.host("web-1").on("apt-get dist-upgrade -s", 0, kSimulation);
    auto transport = factory.create(hostConfig());
    transport->connect(std::chrono::seconds(1));

    AptProvider provider;
    CommandContext context(*transport, SudoPolicy::Skip, std::chrono::seconds(5), "web-1");
    const auto all = provider.fetchUpdates(context);
    const auto security = provider.fetchSecurityUpdates(context);

    const auto flagged = std::count_if(all.updates.begin(), all.updates.end(),
                                       [](const patchfleet::Update &u) { return u.security(); });
    QCOMPARE(security.updates.size(), static_cast<size_t>(flagged));
    QCOMPARE(QString::fromStdString(security.updates.front().packageName()),
             QStringLiteral("openssl"));
}

void AptProviderTests::testFetchFailureThrows()
{
    FakeTransportFactory factory;
    factory.host("web-1").on("apt-get dist-upgrade -s", 100, {},
                             "E: Could not get lock /var/lib/dpkg/lock-frontend\n");
    auto transport = factory.create(hostConfig());
    transport->connect(std::chrono::seconds(1));

    AptProvider provider;
    CommandContext context(*transport, SudoPolicy::Skip, std::chrono::seconds(5), "web-1");
    try {
        provider.fetchUpdates(context);
        QFAIL("expected CommandFailedError");
    } catch (const patchfleet::CommandFailedError &ex) {
        QCOMPARE(ex.exitCode(), 100);
        QVERIFY(ex.stderrText().find("lock-frontend") != std::string::npos);
    }
}

void AptProviderTests::testSyncSkippedUnderSkipPolicy()
{
    FakeTransportFactory factory;
    factory.host("web-1").on("sudo -n apt-get update", 0);
    auto transport = factory.create(hostConfig());
    transport->connect(std::chrono::seconds(1));

    AptProvider provider;
    CommandContext context(*transport, SudoPolicy::Skip, std::chrono::seconds(5), "web-1");
    const auto result = provider.syncRepositories(context);

    QCOMPARE(result.status, StepStatus::SkippedPrivileged);
    QVERIFY(!result.message.empty());
    // Nothing is attempted on the host.
    QVERIFY(factory.commandsRun("web-1").empty());
}

void AptProviderTests::testSyncRunsWithSudo()
{
    FakeTransportFactory factory;
    factory.host("web-1").on("sudo -n apt-get update", 0);
    auto transport = factory.create(hostConfig());
    transport->connect(std::chrono::seconds(1));

    AptProvider provider;
    CommandContext context(*transport, SudoPolicy::Nopasswd, std::chrono::seconds(5), "web-1");
    const auto result = provider.syncRepositories(context);

    QCOMPARE(result.status, StepStatus::Ok);
    QVERIFY(factory.ran("web-1", "sudo -n apt-get update"));
}

void AptProviderTests::testSudoRefusalIsPrivilegeError()
{
    FakeTransportFactory factory;
    factory.host("web-1").on("sudo -n apt-get update", 1, {},
                             "sudo: a password is required\n");
    auto transport = factory.create(hostConfig());
    transport->connect(std::chrono::seconds(1));

    AptProvider provider;
    CommandContext context(*transport, SudoPolicy::Nopasswd, std::chrono::seconds(5), "web-1");
    QVERIFY_THROWS_EXCEPTION(patchfleet::PrivilegeError, provider.syncRepositories(context));
}

QTEST_MAIN(AptProviderTests)
#include "test_apt_provider.moc"
