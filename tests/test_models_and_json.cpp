#include <QtTest/QtTest>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "store/cache_store.hpp"

class ModelsJsonTests : public QObject
{
    Q_OBJECT
private slots:
    void testUpdateToJson();
    void testNewPackageUpdate();
    void testUpdateMissingFieldsRejected();
    void testWithSecurityKeepsFields();
    void testIsoRoundTripKeepsMilliseconds();
    void testNaiveTimestampIsLocalTime();
    void testInvalidTimestamp();
    void testEnumStrings();
};

void ModelsJsonTests::testUpdateToJson()
{
    const patchfleet::Update update("openssl", std::string("3.0.2-0ubuntu1.10"),
                                    "3.0.2-0ubuntu1.12", true, "Ubuntu:22.04/jammy-security");

    const nlohmann::json j = update;
    QCOMPARE(QString::fromStdString(j.value("package_name", "")), QStringLiteral("openssl"));
    QCOMPARE(QString::fromStdString(j.value("current_version", "")),
             QStringLiteral("3.0.2-0ubuntu1.10"));
    QCOMPARE(QString::fromStdString(j.value("new_version", "")),
             QStringLiteral("3.0.2-0ubuntu1.12"));
    QVERIFY(j.value("security", false));

    const auto parsed = patchfleet::CacheStore::deserializeUpdate(j);
    QVERIFY(parsed == update);
}

void ModelsJsonTests::testNewPackageUpdate()
{
    const patchfleet::Update update("linux-image-6.1", std::nullopt, "6.1.0-18", false, "main");
    QVERIFY(update.isNewPackage());

    const nlohmann::json j = update;
    QVERIFY(j.at("current_version").is_null());

    const auto parsed = patchfleet::CacheStore::deserializeUpdate(j);
    QVERIFY(parsed.isNewPackage());
    QCOMPARE(QString::fromStdString(parsed.newVersion()), QStringLiteral("6.1.0-18"));
}

void ModelsJsonTests::testUpdateMissingFieldsRejected()
{
    const nlohmann::json complete = {
        {"package_name", "curl"},
        {"current_version", nullptr},
        {"new_version", "8.5.0"},
        {"security", false},
        {"source", "FreeBSD"}
    };
    QVERIFY(patchfleet::CacheStore::deserializeUpdate(complete).isNewPackage());

    for (const char *key : {"package_name", "current_version", "new_version", "security", "source"}) {
        nlohmann::json partial = complete;
        partial.erase(key);
        QVERIFY_THROWS_EXCEPTION(patchfleet::CacheCorruptionError,
                                 patchfleet::CacheStore::deserializeUpdate(partial));
    }

    nlohmann::json numericVersion = complete;
    numericVersion["current_version"] = 8.4;
    QVERIFY_THROWS_EXCEPTION(patchfleet::CacheCorruptionError,
                             patchfleet::CacheStore::deserializeUpdate(numericVersion));

    nlohmann::json textFlag = complete;
    textFlag["security"] = "no";
    QVERIFY_THROWS_EXCEPTION(patchfleet::CacheCorruptionError,
                             patchfleet::CacheStore::deserializeUpdate(textFlag));
}

void ModelsJsonTests::testWithSecurityKeepsFields()
{
    const patchfleet::Update plain("bash", std::string("5.1"), "5.2", false, "updates");
    const patchfleet::Update flagged = plain.withSecurity(true);

    QVERIFY(!plain.security());
    QVERIFY(flagged.security());
    QCOMPARE(flagged.packageName(), plain.packageName());
    QCOMPARE(flagged.currentVersion(), plain.currentVersion());
    QCOMPARE(flagged.newVersion(), plain.newVersion());
    QCOMPARE(flagged.source(), plain.source());
}

void ModelsJsonTests::testIsoRoundTripKeepsMilliseconds()
{
    const auto now = patchfleet::nowUtc();
    const std::string iso = patchfleet::toIso8601Utc(now);
    QVERIFY(iso.back() == 'Z');

    const auto parsed = patchfleet::fromIso8601Utc(iso);
    QVERIFY(parsed.has_value());
    QVERIFY(*parsed == now);
}

void ModelsJsonTests::testNaiveTimestampIsLocalTime()
{
    const auto naive = patchfleet::fromIso8601Utc("2023-11-02T08:15:30");
    QVERIFY(naive.has_value());

    const QDateTime local(QDate(2023, 11, 2), QTime(8, 15, 30), Qt::LocalTime);
    QCOMPARE(QString::fromStdString(patchfleet::toIso8601Utc(*naive)),
             local.toUTC().toString(Qt::ISODateWithMs));

    const auto zoned = patchfleet::fromIso8601Utc("2023-11-02T08:15:30+02:00");
    QVERIFY(zoned.has_value());
    QCOMPARE(QString::fromStdString(patchfleet::toIso8601Utc(*zoned)),
             QStringLiteral("2023-11-02T06:15:30.000Z"));
}

void ModelsJsonTests::testInvalidTimestamp()
{
    QVERIFY(!patchfleet::fromIso8601Utc("yesterday").has_value());
    QVERIFY(!patchfleet::fromIso8601Utc("").has_value());
}

void ModelsJsonTests::testEnumStrings()
{
    using patchfleet::ProviderKind;
    for (ProviderKind kind : {ProviderKind::None, ProviderKind::Apt, ProviderKind::Dnf,
                              ProviderKind::Yum, ProviderKind::Pkg, ProviderKind::PkgAdd}) {
        const auto parsed = patchfleet::parseProviderString(patchfleet::toProviderString(kind));
        QVERIFY(parsed.has_value());
        QCOMPARE(*parsed, kind);
    }
    QVERIFY(!patchfleet::parseProviderString("pacman").has_value());

    QCOMPARE(*patchfleet::parseStateString("discovered"), patchfleet::DiscoveryState::Discovered);
    // The transient state is never read back from disk.
    QVERIFY(!patchfleet::parseStateString("discovering").has_value());

    QCOMPARE(*patchfleet::parseSudoPolicyString("nopasswd"), patchfleet::SudoPolicy::Nopasswd);
    QVERIFY(!patchfleet::parseSudoPolicyString("always").has_value());

    QCOMPARE(QString::fromStdString(patchfleet::toErrorKindString(patchfleet::ErrorKind::Busy)),
             QStringLiteral("busy"));
}

QTEST_MAIN(ModelsJsonTests)
#include "test_models_and_json.moc"
