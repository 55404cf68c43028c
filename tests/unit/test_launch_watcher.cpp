// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include <QTest>
#include <QSignalSpy>

#include "core/positionstore.h"
#include "core/restoreorchestrator.h"
#include "core/windowenumerator.h"
#include "daemon/launchwatcher.h"
#include "fakewindowsystem.h"

using namespace Greenhouse;

/**
 * @brief Unit tests for LaunchWatcher
 *
 * Drives poll() directly; the timer interval is set high enough that it never
 * fires during a test.
 */
class TestLaunchWatcher : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void initTestCase()
    {
        qRegisterMetaType<Greenhouse::RestoreResult>();
        qRegisterMetaType<Greenhouse::RestoreReport>();
    }

    void init()
    {
        m_windows = FakeWindowSystem();
        m_topology = FakeTopologySource();
        m_topology.topology = {makeMonitor(QStringLiteral("A"), QRect(0, 0, 1920, 1080))};

        m_enumerator = std::make_unique<WindowEnumerator>(&m_windows, &m_topology);
        m_store = std::make_unique<PositionStore>();
        m_orchestrator = std::make_unique<RestoreOrchestrator>(&m_windows, m_enumerator.get(), &m_topology);
        m_watcher = std::make_unique<LaunchWatcher>(m_orchestrator.get(), m_enumerator.get(), m_store.get());
        m_watcher->setInterval(60000);
    }

    void cleanup()
    {
        m_watcher.reset();
        m_orchestrator.reset();
        m_store.reset();
        m_enumerator.reset();
    }

    void testStartStop()
    {
        QVERIFY(!m_watcher->isActive());
        m_watcher->start();
        QVERIFY(m_watcher->isActive());
        QCOMPARE(m_watcher->interval(), 60000);
        m_watcher->stop();
        QVERIFY(!m_watcher->isActive());
    }

    void testLaunchedPendingWindow_Restored()
    {
        m_store->save(kate(), WindowGeometry{QRect(300, 200, 800, 600), QStringLiteral("A"), 1.0});
        m_orchestrator->restoreAll(*m_store);
        QVERIFY(m_orchestrator->isPending(kate()));

        m_watcher->start();
        QSignalSpy spy(m_watcher.get(), &LaunchWatcher::launchRestored);

        m_windows.addWindow(4, QStringLiteral("kate"), QStringLiteral("kate"), QStringLiteral("main.cpp - Kate"),
                            QRect(0, 0, 640, 480));
        QCOMPARE(m_watcher->poll(), 1);

        QCOMPARE(spy.count(), 1);
        QCOMPARE(spy.first().first().value<RestoreResult>().outcome, RestoreOutcome::Restored);
        QCOMPARE(m_windows.frameOf(4), QRect(300, 200, 800, 600));
        QVERIFY(!m_orchestrator->isPending(kate()));

        // Same window on the next pass is no longer new
        QCOMPARE(m_watcher->poll(), 0);
    }

    void testWindowsOpenAtStart_NotLaunches()
    {
        m_store->save(kate(), WindowGeometry{QRect(300, 200, 800, 600), QStringLiteral("A"), 1.0});
        m_orchestrator->restoreAll(*m_store);

        m_windows.addWindow(4, QStringLiteral("kate"), QStringLiteral("kate"), QStringLiteral("main.cpp - Kate"),
                            QRect(0, 0, 640, 480));
        m_watcher->start();

        QCOMPARE(m_watcher->poll(), 0);
        QVERIFY(m_windows.applied.isEmpty());
    }

    void testUnrelatedLaunch_Ignored()
    {
        m_store->save(kate(), WindowGeometry{QRect(300, 200, 800, 600), QStringLiteral("A"), 1.0});
        m_orchestrator->restoreAll(*m_store);
        m_watcher->start();

        m_windows.addWindow(5, QStringLiteral("dolphin"), QStringLiteral("dolphin"), QStringLiteral("Home"),
                            QRect(0, 0, 640, 480));
        QCOMPARE(m_watcher->poll(), 0);
        QVERIFY(m_orchestrator->isPending(kate()));
    }

    void testRemovedRecord_DropsPending()
    {
        m_store->save(kate(), WindowGeometry{QRect(300, 200, 800, 600), QStringLiteral("A"), 1.0});
        m_orchestrator->restoreAll(*m_store);
        m_store->remove(kate());
        m_watcher->start();

        m_windows.addWindow(4, QStringLiteral("kate"), QStringLiteral("kate"), QStringLiteral("main.cpp - Kate"),
                            QRect(0, 0, 640, 480));
        QCOMPARE(m_watcher->poll(), 0);
        QVERIFY(!m_orchestrator->isPending(kate()));
        QVERIFY(m_windows.applied.isEmpty());
    }

    void testLaunchWithoutEarlierRestore_Restored()
    {
        m_store->save(kate(), WindowGeometry{QRect(300, 200, 800, 600), QStringLiteral("A"), 1.0});
        m_watcher->start();
        QVERIFY(!m_orchestrator->isPending(kate()));

        m_windows.addWindow(4, QStringLiteral("kate"), QStringLiteral("kate"), QStringLiteral("main.cpp - Kate"),
                            QRect(0, 0, 640, 480));
        QCOMPARE(m_watcher->poll(), 1);
        QCOMPARE(m_windows.frameOf(4), QRect(300, 200, 800, 600));
    }

    void testReopenedWindow_RestoredAgain()
    {
        m_store->save(kate(), WindowGeometry{QRect(300, 200, 800, 600), QStringLiteral("A"), 1.0});
        m_watcher->start();

        m_windows.addWindow(4, QStringLiteral("kate"), QStringLiteral("kate"), QStringLiteral("main.cpp - Kate"),
                            QRect(0, 0, 640, 480));
        QCOMPARE(m_watcher->poll(), 1);
        m_windows.removeWindow(4);
        QCOMPARE(m_watcher->poll(), 0);

        m_windows.addWindow(6, QStringLiteral("kate"), QStringLiteral("kate"), QStringLiteral("main.cpp - Kate"),
                            QRect(0, 0, 640, 480));
        QCOMPARE(m_watcher->poll(), 1);
        QCOMPARE(m_windows.frameOf(6), QRect(300, 200, 800, 600));
    }

    void testOnlyLaunchedWindowIsMoved()
    {
        const WindowIdentity other{QStringLiteral("kate"), QStringLiteral("kate"), QStringLiteral("other.cpp - Kate")};
        const QRect otherRect(1000, 100, 700, 500);
        m_store->save(other, WindowGeometry{otherRect, QStringLiteral("A"), 1.0});
        m_store->save(kate(), WindowGeometry{QRect(300, 200, 800, 600), QStringLiteral("A"), 1.0});

        m_windows.addWindow(1, QStringLiteral("kate"), QStringLiteral("kate"), QStringLiteral("other.cpp - Kate"),
                            QRect(0, 0, 640, 480));
        m_orchestrator->restoreAll(*m_store);
        QCOMPARE(m_windows.frameOf(1), otherRect);
        QVERIFY(m_orchestrator->isPending(kate()));

        m_watcher->start();
        m_windows.applied.clear();

        // Title overlaps window 1 more than the saved title, but window 1 was already open
        m_windows.addWindow(2, QStringLiteral("kate"), QStringLiteral("kate"), QStringLiteral("notes.txt - Kate"),
                            QRect(0, 0, 640, 480));
        QCOMPARE(m_watcher->poll(), 1);

        QCOMPARE(m_windows.frameOf(1), otherRect);
        QCOMPARE(m_windows.frameOf(2), QRect(300, 200, 800, 600));
        QCOMPARE(m_windows.applied.size(), 1);
        QVERIFY(!m_orchestrator->isPending(kate()));
    }

private:
    static WindowIdentity kate()
    {
        return WindowIdentity{QStringLiteral("kate"), QStringLiteral("kate"), QStringLiteral("main.cpp - Kate")};
    }

    FakeWindowSystem m_windows;
    FakeTopologySource m_topology;
    std::unique_ptr<WindowEnumerator> m_enumerator;
    std::unique_ptr<PositionStore> m_store;
    std::unique_ptr<RestoreOrchestrator> m_orchestrator;
    std::unique_ptr<LaunchWatcher> m_watcher;
};

QTEST_MAIN(TestLaunchWatcher)
#include "test_launch_watcher.moc"
