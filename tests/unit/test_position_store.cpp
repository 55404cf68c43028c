// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include <QTest>
#include <QSignalSpy>

#include "core/positionstore.h"

using namespace Greenhouse;

/**
 * @brief Unit tests for PositionStore
 *
 * Tests cover:
 * - Save/get/contains basics
 * - Overwrite keeps one record and its insertion slot
 * - Insertion order after removals
 * - Bulk load with duplicate collapse
 * - Empty identities are refused
 * - changed() emission
 */
class TestPositionStore : public QObject
{
    Q_OBJECT

private:
    static WindowIdentity identity(const QString& process, const QString& title = QString())
    {
        return WindowIdentity{process, process, title};
    }

    static WindowGeometry geometry(int x, int y, int w = 800, int h = 600, const QString& monitor = QStringLiteral("A"),
                                   qreal scale = 1.0)
    {
        WindowGeometry g;
        g.rect = QRect(x, y, w, h);
        g.monitorId = monitor;
        g.dpiScaleAtSave = scale;
        return g;
    }

    static QStringList processOrder(const PositionStore& store)
    {
        QStringList order;
        const QVector<SavedPositionRecord> records = store.all();
        for (const SavedPositionRecord& record : records) {
            order.append(record.identity.processName);
        }
        return order;
    }

private Q_SLOTS:
    void testSaveAndGet()
    {
        PositionStore store;
        QVERIFY(store.isEmpty());

        store.save(identity(QStringLiteral("kate")), geometry(10, 20));

        QCOMPARE(store.size(), 1);
        QVERIFY(store.contains(identity(QStringLiteral("kate"))));
        const std::optional<SavedPositionRecord> record = store.get(identity(QStringLiteral("kate")));
        QVERIFY(record.has_value());
        QCOMPARE(record->geometry, geometry(10, 20));
        QVERIFY(!store.get(identity(QStringLiteral("dolphin"))).has_value());
    }

    void testOverwrite_OneRecordWithSecondGeometry()
    {
        PositionStore store;
        const WindowIdentity kate = identity(QStringLiteral("kate"), QStringLiteral("main.cpp - Kate"));

        store.save(kate, geometry(10, 20, 800, 600, QStringLiteral("A"), 1.0));
        store.save(kate, geometry(2000, 40, 1200, 900, QStringLiteral("B"), 2.0));

        QCOMPARE(store.size(), 1);
        QCOMPARE(store.all().first().identity, kate);
        QCOMPARE(store.get(kate)->geometry, geometry(2000, 40, 1200, 900, QStringLiteral("B"), 2.0));
    }

    void testOverwrite_KeepsInsertionSlot()
    {
        PositionStore store;
        store.save(identity(QStringLiteral("a")), geometry(0, 0));
        store.save(identity(QStringLiteral("b")), geometry(0, 0));
        store.save(identity(QStringLiteral("c")), geometry(0, 0));
        store.save(identity(QStringLiteral("a")), geometry(50, 50));

        QCOMPARE(processOrder(store), (QStringList{QStringLiteral("a"), QStringLiteral("b"), QStringLiteral("c")}));
    }

    void testTitleDistinguishesRecords()
    {
        PositionStore store;
        store.save(identity(QStringLiteral("kate"), QStringLiteral("one")), geometry(0, 0));
        store.save(identity(QStringLiteral("kate"), QStringLiteral("two")), geometry(100, 100));

        QCOMPARE(store.size(), 2);
        QCOMPARE(store.get(identity(QStringLiteral("kate"), QStringLiteral("two")))->geometry.rect.x(), 100);
    }

    void testRemove_PreservesOrderOfRest()
    {
        PositionStore store;
        store.save(identity(QStringLiteral("a")), geometry(0, 0));
        store.save(identity(QStringLiteral("b")), geometry(0, 0));
        store.save(identity(QStringLiteral("c")), geometry(0, 0));

        QVERIFY(store.remove(identity(QStringLiteral("b"))));
        QVERIFY(!store.remove(identity(QStringLiteral("b"))));
        QCOMPARE(processOrder(store), (QStringList{QStringLiteral("a"), QStringLiteral("c")}));

        // Index stays consistent after the shift
        store.save(identity(QStringLiteral("c")), geometry(7, 7));
        QCOMPARE(store.size(), 2);
        QCOMPARE(store.get(identity(QStringLiteral("c")))->geometry.rect.topLeft(), QPoint(7, 7));
    }

    void testEmptyIdentityRefused()
    {
        PositionStore store;
        QSignalSpy spy(&store, &PositionStore::changed);

        store.save(WindowIdentity{QString(), QString(), QStringLiteral("title only")}, geometry(0, 0));

        QVERIFY(store.isEmpty());
        QCOMPARE(spy.count(), 0);
    }

    void testLoad_ReplacesAndCollapsesDuplicates()
    {
        PositionStore store;
        store.save(identity(QStringLiteral("old")), geometry(0, 0));

        const QVector<SavedPositionRecord> records = {
            {identity(QStringLiteral("a")), geometry(1, 1)},
            {identity(QStringLiteral("b")), geometry(2, 2)},
            {identity(QStringLiteral("a")), geometry(3, 3)},
            {WindowIdentity{}, geometry(4, 4)},
        };
        store.load(records);

        QCOMPARE(processOrder(store), (QStringList{QStringLiteral("a"), QStringLiteral("b")}));
        QCOMPARE(store.get(identity(QStringLiteral("a")))->geometry.rect.topLeft(), QPoint(3, 3));
        QVERIFY(!store.contains(identity(QStringLiteral("old"))));
    }

    void testChangedSignal()
    {
        PositionStore store;
        QSignalSpy spy(&store, &PositionStore::changed);

        store.save(identity(QStringLiteral("a")), geometry(0, 0));
        store.save(identity(QStringLiteral("a")), geometry(1, 1));
        store.remove(identity(QStringLiteral("missing")));
        store.remove(identity(QStringLiteral("a")));
        store.clear(); // already empty, no signal
        store.load({});

        QCOMPARE(spy.count(), 4);
    }
};

QTEST_MAIN(TestPositionStore)
#include "test_position_store.moc"
