#include <QtTest/QtTest>

#include "common/errors.hpp"
#include "providers/pkg_provider.hpp"

#include "fake_transport.hpp"

using patchfleet::CommandContext;
using patchfleet::PkgProvider;
using patchfleet::ProviderKind;
using patchfleet::StepStatus;
using patchfleet::SudoPolicy;
using patchfleet::testing::FakeTransportFactory;

namespace {

const char *const kUpgradePlan =
    "Updating FreeBSD repository catalogue...\n"
    "FreeBSD repository is up to date.\n"
    "All repositories are up to date.\n"
    "Checking for upgrades (3 candidates): .......... done\n"
    "Processing candidates (3 candidates): .......... done\n"
    "The following 3 package(s) will be affected (of 0 checked):\n"
    "\n"
    "New packages to be INSTALLED:\n"
    "\tpy311-packaging: 23.2 [FreeBSD]\n"
    "\n"
    "Installed packages to be UPGRADED:\n"
    "\tcurl: 8.4.0 -> 8.5.0 [FreeBSD]\n"
    "\tsudo: 1.9.14p3 -> 1.9.15p2\n"
    "\n"
    "Number of packages to be installed: 1\n"
    "Number of packages to be upgraded: 2\n"
    "\n"
    "The process will require 2 MiB more space.\n";

const char *const kPkgAddOutput =
    "quirks-6.42 signed on 2023-10-15T12:10:33Z\n"
    "Update candidates: quirks-6.42 -> quirks-6.50\n"
    "Update candidates: curl-8.4.0 -> curl-8.5.0\n"
    "Update candidates: gnupg-2.4.3 -> gnupg-2.4.3\n"
    "Update candidates: python-3.10.13 -> python3-3.11.6\n"
    "Update candidates: py3-cryptography-41.0.4 -> py3-cryptography-41.0.5\n";

patchfleet::HostConfig hostConfig()
{
    patchfleet::HostConfig config;
    config.name = "bsd-1";
    config.address = "10.0.0.9";
    return config;
}

} // namespace

class PkgProviderTests : public QObject
{
    Q_OBJECT
private slots:
    void testParseUpgradePlan();
    void testParseAudit();
    void testFreeBsdFetchAttributesAudit();
    void testFreeBsdNonZeroExitWithoutStderrIsFine();
    void testFreeBsdFailureWithStderr();
    void testFreeBsdSyncPolicy();
    void testParsePkgAddCandidates();
    void testOpenBsdFetch();
    void testOpenBsdSyncIsNoOp();
};

void PkgProviderTests::testParseUpgradePlan()
{
    const auto updates = PkgProvider::parseUpgradePlan(kUpgradePlan);
    QCOMPARE(updates.size(), size_t(3));

    QCOMPARE(QString::fromStdString(updates[0].packageName()), QStringLiteral("py311-packaging"));
    QVERIFY(updates[0].isNewPackage());
    QCOMPARE(QString::fromStdString(updates[0].newVersion()), QStringLiteral("23.2"));
    QCOMPARE(QString::fromStdString(updates[0].source()), QStringLiteral("FreeBSD"));

    QCOMPARE(QString::fromStdString(updates[1].packageName()), QStringLiteral("curl"));
    QCOMPARE(QString::fromStdString(updates[1].currentVersion().value_or("")),
             QStringLiteral("8.4.0"));
    QCOMPARE(QString::fromStdString(updates[1].newVersion()), QStringLiteral("8.5.0"));

    // No repository named: the default mirror.
    QCOMPARE(QString::fromStdString(updates[2].source()), QStringLiteral("Packages Mirror"));
}

void PkgProviderTests::testParseAudit()
{
    const auto vulnerable = PkgProvider::parseAudit("curl-8.4.0\nlibxml2-2.10.4\n\n");
    QCOMPARE(vulnerable.size(), size_t(2));
    QCOMPARE(QString::fromStdString(vulnerable[1]), QStringLiteral("libxml2-2.10.4"));
}

void PkgProviderTests::testFreeBsdFetchAttributesAudit()
{
    FakeTransportFactory factory;
    factory.host("bsd-1")
        .on("pkg upgrade -n", 1, kUpgradePlan)
        .on("pkg audit -q", 1, "curl-8.4.0\nlibxml2-2.10.4\n");
    auto transport = factory.create(hostConfig());
    transport->connect(std::chrono::seconds(1));

    PkgProvider provider;
    CommandContext context(*transport, SudoPolicy::Skip, std::chrono::seconds(5), "bsd-1");
    const auto result = provider.fetchUpdates(context);

    QCOMPARE(result.updates.size(), size_t(3));
    QVERIFY(!result.updates[0].security());
    QVERIFY(result.updates[1].security());
    QVERIFY(!result.updates[2].security());

    const auto security = provider.fetchSecurityUpdates(context);
    QCOMPARE(security.updates.size(), size_t(1));
}

void PkgProviderTests::testFreeBsdNonZeroExitWithoutStderrIsFine()
{
    FakeTransportFactory factory;
    factory.host("bsd-1")
        .on("pkg upgrade -n", 1, "Your packages are up to date.\n")
        .on("pkg audit -q", 1);
    auto transport = factory.create(hostConfig());
    transport->connect(std::chrono::seconds(1));

    PkgProvider provider;
    CommandContext context(*transport, SudoPolicy::Skip, std::chrono::seconds(5), "bsd-1");
    QVERIFY(provider.fetchUpdates(context).updates.empty());
}

void PkgProviderTests::testFreeBsdFailureWithStderr()
{
    FakeTransportFactory factory;
    factory.host("bsd-1").on("pkg upgrade -n", 3, {},
                             "pkg: Repository FreeBSD cannot be opened.\n");
    auto transport = factory.create(hostConfig());
    transport->connect(std::chrono::seconds(1));

    PkgProvider provider;
    CommandContext context(*transport, SudoPolicy::Skip, std::chrono::seconds(5), "bsd-1");
    QVERIFY_THROWS_EXCEPTION(patchfleet::CommandFailedError, provider.fetchUpdates(context));
}

void PkgProviderTests::testFreeBsdSyncPolicy()
{
    FakeTransportFactory factory;
    factory.host("bsd-1").on("sudo -n pkg update", 0);
    auto transport = factory.create(hostConfig());
    transport->connect(std::chrono::seconds(1));

    PkgProvider provider;
    QCOMPARE(provider.privilegedCommands().size(), size_t(1));

    CommandContext skipped(*transport, SudoPolicy::Skip, std::chrono::seconds(5), "bsd-1");
    QCOMPARE(provider.syncRepositories(skipped).status, StepStatus::SkippedPrivileged);
    QVERIFY(factory.commandsRun("bsd-1").empty());

    CommandContext allowed(*transport, SudoPolicy::Nopasswd, std::chrono::seconds(5), "bsd-1");
    QCOMPARE(provider.syncRepositories(allowed).status, StepStatus::Ok);
    QVERIFY(factory.ran("bsd-1", "sudo -n pkg update"));
}

void PkgProviderTests::testParsePkgAddCandidates()
{
    const auto updates = PkgProvider::parsePkgAddCandidates(kPkgAddOutput);
    QCOMPARE(updates.size(), size_t(3));
    QCOMPARE(QString::fromStdString(updates[0].packageName()), QStringLiteral("quirks"));
    QCOMPARE(QString::fromStdString(updates[1].currentVersion().value_or("")),
             QStringLiteral("8.4.0"));
    QCOMPARE(QString::fromStdString(updates[2].packageName()),
             QStringLiteral("py3-cryptography"));
    QCOMPARE(QString::fromStdString(updates[2].newVersion()), QStringLiteral("41.0.5"));
}

void PkgProviderTests::testOpenBsdFetch()
{
    FakeTransportFactory factory;
    factory.host("bsd-1").on("/usr/sbin/pkg_add -u -v -x -n", 0, kPkgAddOutput);
    auto transport = factory.create(hostConfig());
    transport->connect(std::chrono::seconds(1));

    PkgProvider provider(ProviderKind::PkgAdd);
    QCOMPARE(QString::fromStdString(provider.displayName()), QStringLiteral("pkg_add"));

    CommandContext context(*transport, SudoPolicy::Skip, std::chrono::seconds(5), "bsd-1");
    const auto result = provider.fetchUpdates(context);
    QCOMPARE(result.updates.size(), size_t(3));
    for (const auto &update : result.updates) {
        QVERIFY(!update.security());
    }
}

void PkgProviderTests::testOpenBsdSyncIsNoOp()
{
    FakeTransportFactory factory;
    auto transport = factory.create(hostConfig());
    transport->connect(std::chrono::seconds(1));

    PkgProvider provider(ProviderKind::PkgAdd);
    CommandContext context(*transport, SudoPolicy::Skip, std::chrono::seconds(5), "bsd-1");
    QCOMPARE(provider.syncRepositories(context).status, StepStatus::Ok);
    QVERIFY(factory.commandsRun("bsd-1").empty());
}

QTEST_MAIN(PkgProviderTests)
#include "test_pkg_provider.moc"
