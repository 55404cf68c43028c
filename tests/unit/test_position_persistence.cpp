// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file test_position_persistence.cpp
 * @brief Unit tests for PositionPersistence
 *
 * Tests cover:
 * 1. Record JSON shape and validation
 * 2. Malformed entries skipped, non-array documents rejected
 * 3. Save/load through a KConfig file in a temporary directory
 * 4. Debounced save after store mutations
 * 5. Loading does not write back
 */

#include <QTest>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTemporaryDir>

#include <KConfigGroup>
#include <KSharedConfig>

#include "core/constants.h"
#include "core/positionpersistence.h"
#include "core/positionstore.h"

using namespace Greenhouse;

class TestPositionPersistence : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void init();

    // JSON
    void testRecordToJson_Keys();
    void testRecordFromJson_Valid();
    void testRecordFromJson_Rejects();
    void testRecordFromJson_BadScaleFallsBack();
    void testRecordsFromJson_SkipsMalformed();
    void testRecordsFromJson_NotAnArray();
    void testRecordsToJson_Compact();

    // KConfig
    void testSaveThenLoad_PreservesOrder();
    void testDebouncedSave();
    void testLoad_DoesNotScheduleSave();
    void testLoad_MissingEntry();

private:
    KSharedConfig::Ptr openConfig() const
    {
        return KSharedConfig::openConfig(m_dir->filePath(QStringLiteral("greenhouserc")), KConfig::SimpleConfig);
    }

    static SavedPositionRecord record(const QString& process, const QString& title, const QRect& rect,
                                      const QString& monitor, qreal scale)
    {
        SavedPositionRecord r;
        r.identity = WindowIdentity{process, process, title};
        r.geometry.rect = rect;
        r.geometry.monitorId = monitor;
        r.geometry.dpiScaleAtSave = scale;
        return r;
    }

    std::unique_ptr<QTemporaryDir> m_dir;
};

void TestPositionPersistence::init()
{
    m_dir = std::make_unique<QTemporaryDir>();
    QVERIFY(m_dir->isValid());
}

void TestPositionPersistence::testRecordToJson_Keys()
{
    const QJsonObject obj = PositionPersistence::recordToJson(
        record(QStringLiteral("kate"), QStringLiteral("main.cpp - Kate"), QRect(-1900, 40, 800, 600),
               QStringLiteral("Dell:U2720Q:ABC123"), 1.5));

    QCOMPARE(obj.value(JsonKeys::ProcessName).toString(), QStringLiteral("kate"));
    QCOMPARE(obj.value(JsonKeys::WindowClass).toString(), QStringLiteral("kate"));
    QCOMPARE(obj.value(JsonKeys::Title).toString(), QStringLiteral("main.cpp - Kate"));
    QCOMPARE(obj.value(JsonKeys::X).toInt(), -1900);
    QCOMPARE(obj.value(JsonKeys::Y).toInt(), 40);
    QCOMPARE(obj.value(JsonKeys::Width).toInt(), 800);
    QCOMPARE(obj.value(JsonKeys::Height).toInt(), 600);
    QCOMPARE(obj.value(JsonKeys::MonitorId).toString(), QStringLiteral("Dell:U2720Q:ABC123"));
    QCOMPARE(obj.value(JsonKeys::DpiScale).toDouble(), 1.5);
}

void TestPositionPersistence::testRecordFromJson_Valid()
{
    QJsonObject obj;
    obj[JsonKeys::ProcessName] = QStringLiteral("konsole");
    obj[JsonKeys::WindowClass] = QStringLiteral("konsole");
    obj[JsonKeys::Title] = QStringLiteral("~ : bash");
    obj[JsonKeys::X] = 10;
    obj[JsonKeys::Y] = 20;
    obj[JsonKeys::Width] = 640;
    obj[JsonKeys::Height] = 480;
    obj[JsonKeys::MonitorId] = QStringLiteral("DP-1");
    obj[JsonKeys::DpiScale] = 2.0;

    const std::optional<SavedPositionRecord> parsed = PositionPersistence::recordFromJson(obj);
    QVERIFY(parsed.has_value());
    QCOMPARE(parsed->identity.titleHint, QStringLiteral("~ : bash"));
    QCOMPARE(parsed->geometry.rect, QRect(10, 20, 640, 480));
    QCOMPARE(parsed->geometry.monitorId, QStringLiteral("DP-1"));
    QCOMPARE(parsed->geometry.dpiScaleAtSave, 2.0);
}

void TestPositionPersistence::testRecordFromJson_Rejects()
{
    QJsonObject noIdentity;
    noIdentity[JsonKeys::Title] = QStringLiteral("orphan");
    noIdentity[JsonKeys::Width] = 100;
    noIdentity[JsonKeys::Height] = 100;
    QVERIFY(!PositionPersistence::recordFromJson(noIdentity).has_value());

    QJsonObject zeroSize;
    zeroSize[JsonKeys::ProcessName] = QStringLiteral("kate");
    zeroSize[JsonKeys::Width] = 0;
    zeroSize[JsonKeys::Height] = 100;
    QVERIFY(!PositionPersistence::recordFromJson(zeroSize).has_value());

    QJsonObject noSize;
    noSize[JsonKeys::ProcessName] = QStringLiteral("kate");
    QVERIFY(!PositionPersistence::recordFromJson(noSize).has_value());
}

void TestPositionPersistence::testRecordFromJson_BadScaleFallsBack()
{
    QJsonObject obj;
    obj[JsonKeys::WindowClass] = QStringLiteral("firefox");
    obj[JsonKeys::Width] = 100;
    obj[JsonKeys::Height] = 100;
    obj[JsonKeys::DpiScale] = -2.0;

    std::optional<SavedPositionRecord> parsed = PositionPersistence::recordFromJson(obj);
    QVERIFY(parsed.has_value());
    QCOMPARE(parsed->geometry.dpiScaleAtSave, 1.0);

    obj.remove(JsonKeys::DpiScale);
    parsed = PositionPersistence::recordFromJson(obj);
    QVERIFY(parsed.has_value());
    QCOMPARE(parsed->geometry.dpiScaleAtSave, 1.0);
}

void TestPositionPersistence::testRecordsFromJson_SkipsMalformed()
{
    QJsonArray array;
    array.append(PositionPersistence::recordToJson(
        record(QStringLiteral("a"), QString(), QRect(0, 0, 100, 100), QStringLiteral("A"), 1.0)));
    array.append(QStringLiteral("not an object"));
    array.append(QJsonObject{{QStringLiteral("processName"), QStringLiteral("b")}});
    array.append(PositionPersistence::recordToJson(
        record(QStringLiteral("c"), QString(), QRect(5, 5, 100, 100), QStringLiteral("A"), 1.0)));

    const QVector<SavedPositionRecord> records =
        PositionPersistence::recordsFromJson(QString::fromUtf8(QJsonDocument(array).toJson()));

    QCOMPARE(records.size(), 2);
    QCOMPARE(records.at(0).identity.processName, QStringLiteral("a"));
    QCOMPARE(records.at(1).identity.processName, QStringLiteral("c"));
}

void TestPositionPersistence::testRecordsFromJson_NotAnArray()
{
    QVERIFY(PositionPersistence::recordsFromJson(QString()).isEmpty());
    QVERIFY(PositionPersistence::recordsFromJson(QStringLiteral("{\"processName\":\"kate\"}")).isEmpty());
    QVERIFY(PositionPersistence::recordsFromJson(QStringLiteral("[{broken")).isEmpty());
}

void TestPositionPersistence::testRecordsToJson_Compact()
{
    const QString json = PositionPersistence::recordsToJson(
        {record(QStringLiteral("a"), QString(), QRect(0, 0, 100, 100), QStringLiteral("A"), 1.0),
         record(QStringLiteral("b"), QString(), QRect(0, 0, 100, 100), QStringLiteral("A"), 1.0)});

    // One line so it fits a single KConfig entry
    QVERIFY(!json.contains(QLatin1Char('\n')));
    QVERIFY(json.startsWith(QLatin1Char('[')));
    QCOMPARE(PositionPersistence::recordsFromJson(json).size(), 2);
}

void TestPositionPersistence::testSaveThenLoad_PreservesOrder()
{
    {
        PositionStore store;
        PositionPersistence persistence(&store, openConfig());
        store.save(WindowIdentity{QStringLiteral("zed"), QStringLiteral("zed"), QString()},
                   WindowGeometry{QRect(0, 0, 500, 400), QStringLiteral("A"), 1.0});
        store.save(WindowIdentity{QStringLiteral("alpha"), QStringLiteral("alpha"), QStringLiteral("t")},
                   WindowGeometry{QRect(-1280, 100, 600, 300), QStringLiteral("L"), 1.25});
        persistence.save();
        QVERIFY(!persistence.hasPendingSave());
    }

    const KSharedConfig::Ptr config = openConfig();
    const KConfigGroup group = config->group(QString(ConfigKeys::SavedPositionsGroup));
    QVERIFY(!group.readEntry(QString(ConfigKeys::RecordsEntry), QString()).isEmpty());

    PositionStore restored;
    PositionPersistence persistence(&restored, config);
    QCOMPARE(persistence.load(), 2);

    const QVector<SavedPositionRecord> records = restored.all();
    QCOMPARE(records.at(0).identity.processName, QStringLiteral("zed"));
    QCOMPARE(records.at(1).identity.processName, QStringLiteral("alpha"));
    QCOMPARE(records.at(1).geometry, (WindowGeometry{QRect(-1280, 100, 600, 300), QStringLiteral("L"), 1.25}));
}

void TestPositionPersistence::testDebouncedSave()
{
    PositionStore store;
    PositionPersistence persistence(&store, openConfig());

    store.save(WindowIdentity{QStringLiteral("a"), QStringLiteral("a"), QString()},
               WindowGeometry{QRect(0, 0, 100, 100), QStringLiteral("A"), 1.0});
    store.save(WindowIdentity{QStringLiteral("b"), QStringLiteral("b"), QString()},
               WindowGeometry{QRect(0, 0, 100, 100), QStringLiteral("A"), 1.0});
    QVERIFY(persistence.hasPendingSave());

    QTRY_VERIFY_WITH_TIMEOUT(!persistence.hasPendingSave(), Defaults::SaveDebounceMs * 4);

    PositionStore reloaded;
    PositionPersistence reader(&reloaded, openConfig());
    QCOMPARE(reader.load(), 2);
}

void TestPositionPersistence::testLoad_DoesNotScheduleSave()
{
    {
        KSharedConfig::Ptr config = openConfig();
        KConfigGroup group = config->group(QString(ConfigKeys::SavedPositionsGroup));
        group.writeEntry(QString(ConfigKeys::RecordsEntry),
                         PositionPersistence::recordsToJson({record(QStringLiteral("a"), QString(),
                                                                    QRect(0, 0, 100, 100), QStringLiteral("A"), 1.0)}));
        QVERIFY(config->sync());
    }

    PositionStore store;
    PositionPersistence persistence(&store, openConfig());
    QCOMPARE(persistence.load(), 1);
    QVERIFY(!persistence.hasPendingSave());
}

void TestPositionPersistence::testLoad_MissingEntry()
{
    PositionStore store;
    store.save(WindowIdentity{QStringLiteral("stale"), QStringLiteral("stale"), QString()},
               WindowGeometry{QRect(0, 0, 100, 100), QStringLiteral("A"), 1.0});

    PositionPersistence persistence(&store, openConfig());
    QCOMPARE(persistence.load(), 0);
    QVERIFY(store.isEmpty());
}

QTEST_MAIN(TestPositionPersistence)
#include "test_position_persistence.moc"
