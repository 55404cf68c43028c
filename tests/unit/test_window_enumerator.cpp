// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file test_window_enumerator.cpp
 * @brief Unit tests for WindowEnumerator and WindowFilter
 *
 * Tests cover:
 * - Snapshot contents (identity, frame, owning monitor)
 * - Always-on filters: minimized, hidden, zero area
 * - Configurable filters: exclusions, minimum size, title requirement, own process
 * - Monitor ownership for windows off every monitor
 * - Unavailable window system and failed topology reads
 * - captureGeometry() scale lookup
 */

#include <QTest>

#include "core/windowenumerator.h"
#include "fakewindowsystem.h"

using namespace Greenhouse;

class TestWindowEnumerator : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void init();

    void testSnapshotContents();
    void testAlwaysDropped();
    void testExcludedApplications_CaseInsensitive();
    void testExcludedWindowClasses();
    void testMinimumSize();
    void testRequireTitle();
    void testOwnProcessHidden();
    void testOffscreenWindow_NearestMonitor();
    void testUnavailableWindowSystem();
    void testTopologyFailure_EmptyMonitorIds();
    void testFilterFromNullSettings();
    void testCaptureGeometry();

private:
    QVector<WindowHandle> handles(const QVector<WindowSnapshot>& snapshots) const
    {
        QVector<WindowHandle> result;
        for (const WindowSnapshot& snapshot : snapshots) {
            result.append(snapshot.handle);
        }
        return result;
    }

    FakeWindowSystem m_windows;
    FakeTopologySource m_topology;
};

void TestWindowEnumerator::init()
{
    m_windows = FakeWindowSystem();
    m_topology = FakeTopologySource();
    m_topology.topology = {makeMonitor(QStringLiteral("A"), QRect(0, 0, 1920, 1080), 1.0),
                           makeMonitor(QStringLiteral("B"), QRect(1920, 0, 2560, 1440), 1.5)};
}

void TestWindowEnumerator::testSnapshotContents()
{
    m_windows.addWindow(1, QStringLiteral("kate"), QStringLiteral("kate"), QStringLiteral("main.cpp - Kate"),
                        QRect(100, 100, 800, 600));
    m_windows.addWindow(2, QStringLiteral("konsole"), QStringLiteral("konsole"), QStringLiteral("~ : bash"),
                        QRect(2000, 100, 900, 500));

    WindowEnumerator enumerator(&m_windows, &m_topology);
    const QVector<WindowSnapshot> snapshots = enumerator.listVisibleWindows();

    QCOMPARE(snapshots.size(), 2);
    QCOMPARE(snapshots.at(0).handle, WindowHandle(1));
    QCOMPARE(snapshots.at(0).identity,
             (WindowIdentity{QStringLiteral("kate"), QStringLiteral("kate"), QStringLiteral("main.cpp - Kate")}));
    QCOMPARE(snapshots.at(0).rect, QRect(100, 100, 800, 600));
    QCOMPARE(snapshots.at(0).monitorId, QStringLiteral("A"));
    QCOMPARE(snapshots.at(1).monitorId, QStringLiteral("B"));
}

void TestWindowEnumerator::testAlwaysDropped()
{
    m_windows.addWindow(1, QStringLiteral("a"), QStringLiteral("a"), QStringLiteral("a"), QRect(0, 0, 100, 100))
        .minimized = true;
    m_windows.addWindow(2, QStringLiteral("b"), QStringLiteral("b"), QStringLiteral("b"), QRect(0, 0, 100, 100))
        .visible = false;
    m_windows.addWindow(3, QStringLiteral("c"), QStringLiteral("c"), QStringLiteral("c"), QRect(0, 0, 0, 100));
    m_windows.addWindow(4, QStringLiteral("d"), QStringLiteral("d"), QStringLiteral("d"), QRect(0, 0, 100, 100));

    WindowEnumerator enumerator(&m_windows, &m_topology);
    QCOMPARE(handles(enumerator.listVisibleWindows()), QVector<WindowHandle>{4});
}

void TestWindowEnumerator::testExcludedApplications_CaseInsensitive()
{
    m_windows.addWindow(1, QStringLiteral("plasmashell"), QStringLiteral("plasmashell"), QStringLiteral("Panel"),
                        QRect(0, 1040, 1920, 40));
    m_windows.addWindow(2, QStringLiteral("kate"), QStringLiteral("kate"), QStringLiteral("Kate"),
                        QRect(0, 0, 800, 600));

    WindowEnumerator enumerator(&m_windows, &m_topology);
    WindowFilter filter;
    filter.excludedApplications = {QStringLiteral("PlasmaShell")};
    enumerator.setFilter(filter);

    QCOMPARE(handles(enumerator.listVisibleWindows()), QVector<WindowHandle>{2});
}

void TestWindowEnumerator::testExcludedWindowClasses()
{
    m_windows.addWindow(1, QStringLiteral("java"), QStringLiteral("jetbrains-idea"), QStringLiteral("IDEA"),
                        QRect(0, 0, 800, 600));
    m_windows.addWindow(2, QStringLiteral("java"), QStringLiteral("sun-awt-X11-XDialogPeer"), QStringLiteral("Tip"),
                        QRect(0, 0, 400, 300));

    WindowEnumerator enumerator(&m_windows, &m_topology);
    WindowFilter filter;
    filter.excludedWindowClasses = {QStringLiteral("SUN-AWT-X11-XDIALOGPEER")};
    enumerator.setFilter(filter);

    QCOMPARE(handles(enumerator.listVisibleWindows()), QVector<WindowHandle>{1});
}

void TestWindowEnumerator::testMinimumSize()
{
    m_windows.addWindow(1, QStringLiteral("a"), QStringLiteral("a"), QStringLiteral("tooltip"), QRect(0, 0, 120, 30));
    m_windows.addWindow(2, QStringLiteral("b"), QStringLiteral("b"), QStringLiteral("narrow"), QRect(0, 0, 50, 400));
    m_windows.addWindow(3, QStringLiteral("c"), QStringLiteral("c"), QStringLiteral("exact"), QRect(0, 0, 100, 80));

    WindowEnumerator enumerator(&m_windows, &m_topology);
    WindowFilter filter;
    filter.minimumWidth = 100;
    filter.minimumHeight = 80;
    enumerator.setFilter(filter);

    QCOMPARE(handles(enumerator.listVisibleWindows()), QVector<WindowHandle>{3});
}

void TestWindowEnumerator::testRequireTitle()
{
    m_windows.addWindow(1, QStringLiteral("a"), QStringLiteral("a"), QString(), QRect(0, 0, 100, 100));
    m_windows.addWindow(2, QStringLiteral("b"), QStringLiteral("b"), QStringLiteral("   "), QRect(0, 0, 100, 100));
    m_windows.addWindow(3, QStringLiteral("c"), QStringLiteral("c"), QStringLiteral("c"), QRect(0, 0, 100, 100));

    WindowEnumerator enumerator(&m_windows, &m_topology);
    QCOMPARE(handles(enumerator.listVisibleWindows()), QVector<WindowHandle>{3});

    WindowFilter filter;
    filter.requireTitle = false;
    enumerator.setFilter(filter);
    QCOMPARE(handles(enumerator.listVisibleWindows()), (QVector<WindowHandle>{1, 2, 3}));
}

void TestWindowEnumerator::testOwnProcessHidden()
{
    m_windows.addWindow(1, QStringLiteral("greenhouse"), QStringLiteral("greenhouse"), QStringLiteral("Greenhouse"),
                        QRect(0, 0, 100, 100))
        .pid = 4242;
    m_windows.addWindow(2, QStringLiteral("b"), QStringLiteral("b"), QStringLiteral("b"), QRect(0, 0, 100, 100));

    WindowEnumerator enumerator(&m_windows, &m_topology);
    WindowFilter filter;
    filter.ownPid = 4242;
    enumerator.setFilter(filter);

    QCOMPARE(handles(enumerator.listVisibleWindows()), QVector<WindowHandle>{2});
}

void TestWindowEnumerator::testOffscreenWindow_NearestMonitor()
{
    m_windows.addWindow(1, QStringLiteral("a"), QStringLiteral("a"), QStringLiteral("a"),
                        QRect(6000, 200, 300, 300));

    WindowEnumerator enumerator(&m_windows, &m_topology);
    const QVector<WindowSnapshot> snapshots = enumerator.listVisibleWindows();
    QCOMPARE(snapshots.size(), 1);
    QCOMPARE(snapshots.first().monitorId, QStringLiteral("B"));
}

void TestWindowEnumerator::testUnavailableWindowSystem()
{
    m_windows.addWindow(1, QStringLiteral("a"), QStringLiteral("a"), QStringLiteral("a"), QRect(0, 0, 100, 100));
    m_windows.available = false;

    WindowEnumerator enumerator(&m_windows, &m_topology);
    QVERIFY(enumerator.listVisibleWindows().isEmpty());
}

void TestWindowEnumerator::testTopologyFailure_EmptyMonitorIds()
{
    m_windows.addWindow(1, QStringLiteral("a"), QStringLiteral("a"), QStringLiteral("a"), QRect(0, 0, 100, 100));
    m_topology.fail = true;

    WindowEnumerator enumerator(&m_windows, &m_topology);
    const QVector<WindowSnapshot> snapshots = enumerator.listVisibleWindows();
    QCOMPARE(snapshots.size(), 1);
    QVERIFY(snapshots.first().monitorId.isEmpty());
}

void TestWindowEnumerator::testFilterFromNullSettings()
{
    const WindowFilter filter = WindowFilter::fromSettings(nullptr, 77);
    QCOMPARE(filter.ownPid, qint64(77));
    QVERIFY(filter.requireTitle);
    QVERIFY(filter.excludedApplications.isEmpty());
    QCOMPARE(filter.minimumWidth, 0);
}

void TestWindowEnumerator::testCaptureGeometry()
{
    WindowSnapshot snapshot;
    snapshot.handle = 1;
    snapshot.rect = QRect(2000, 100, 900, 500);
    snapshot.monitorId = QStringLiteral("B");

    const WindowGeometry onB = WindowEnumerator::captureGeometry(snapshot, m_topology.topology);
    QCOMPARE(onB.rect, snapshot.rect);
    QCOMPARE(onB.monitorId, QStringLiteral("B"));
    QCOMPARE(onB.dpiScaleAtSave, 1.5);

    snapshot.monitorId = QStringLiteral("unplugged");
    const WindowGeometry gone = WindowEnumerator::captureGeometry(snapshot, m_topology.topology);
    QCOMPARE(gone.monitorId, QStringLiteral("unplugged"));
    QCOMPARE(gone.dpiScaleAtSave, 1.0);
}

QTEST_MAIN(TestWindowEnumerator)
#include "test_window_enumerator.moc"
