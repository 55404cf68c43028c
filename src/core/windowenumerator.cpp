// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "windowenumerator.h"
#include "constants.h"
#include "geometryutils.h"
#include "interfaces.h"
#include "logging.h"

namespace Greenhouse {

WindowFilter WindowFilter::fromSettings(const IWindowExclusionSettings* settings, qint64 ownPid)
{
    WindowFilter filter;
    filter.ownPid = ownPid;
    if (!settings) {
        return filter;
    }
    filter.excludedApplications = settings->excludedApplications();
    filter.excludedWindowClasses = settings->excludedWindowClasses();
    filter.minimumWidth = settings->minimumWindowWidth();
    filter.minimumHeight = settings->minimumWindowHeight();
    filter.requireTitle = settings->requireWindowTitle();
    return filter;
}

bool WindowFilter::accepts(const NativeWindowInfo& window) const
{
    if (!window.visible || window.minimized) {
        return false;
    }
    if (window.frameGeometry.width() <= 0 || window.frameGeometry.height() <= 0) {
        return false;
    }
    if (ownPid != 0 && window.pid == ownPid) {
        return false;
    }
    if (requireTitle && window.title.trimmed().isEmpty()) {
        return false;
    }
    if (window.frameGeometry.width() < minimumWidth || window.frameGeometry.height() < minimumHeight) {
        return false;
    }
    if (!window.processName.isEmpty() && excludedApplications.contains(window.processName, Qt::CaseInsensitive)) {
        return false;
    }
    if (!window.windowClass.isEmpty() && excludedWindowClasses.contains(window.windowClass, Qt::CaseInsensitive)) {
        return false;
    }
    return true;
}

WindowEnumerator::WindowEnumerator(IWindowSystem* windowSystem, ITopologySource* topology)
    : m_windowSystem(windowSystem)
    , m_topology(topology)
{
    Q_ASSERT(windowSystem);
    Q_ASSERT(topology);
}

WindowEnumerator::~WindowEnumerator() = default;

QVector<WindowSnapshot> WindowEnumerator::listVisibleWindows() const
{
    // Ownership is cosmetic for listing; a failed topology read only leaves monitor ids empty
    const Topology topology = m_topology->readTopology().value_or(Topology{});
    return listVisibleWindows(topology);
}

QVector<WindowSnapshot> WindowEnumerator::listVisibleWindows(const Topology& topology) const
{
    QVector<WindowSnapshot> result;
    if (!m_windowSystem->isAvailable()) {
        qCDebug(lcWindow) << "Window system unavailable - nothing to enumerate";
        return result;
    }

    const QVector<NativeWindowInfo> windows = m_windowSystem->windows();
    result.reserve(windows.size());
    for (const NativeWindowInfo& window : windows) {
        if (!m_filter.accepts(window)) {
            continue;
        }
        WindowSnapshot snapshot;
        snapshot.handle = window.handle;
        snapshot.identity = WindowIdentity{window.processName, window.windowClass, window.title};
        snapshot.rect = window.frameGeometry;
        snapshot.monitorId = ownerMonitorId(window.frameGeometry, topology);
        result.append(snapshot);
    }

    qCDebug(lcWindow) << "Enumerated" << result.size() << "of" << windows.size() << "windows";
    return result;
}

QString WindowEnumerator::ownerMonitorId(const QRect& rect, const Topology& topology)
{
    int index = GeometryUtils::monitorWithLargestOverlap(rect, topology);
    if (index < 0) {
        index = GeometryUtils::nearestMonitor(rect.center(), topology);
    }
    return index >= 0 ? topology.at(index).id : QString();
}

WindowGeometry WindowEnumerator::captureGeometry(const WindowSnapshot& snapshot, const Topology& topology)
{
    WindowGeometry geometry;
    geometry.rect = snapshot.rect;
    geometry.monitorId = snapshot.monitorId;
    geometry.dpiScaleAtSave = Defaults::FallbackDpiScale;

    const int index = GeometryUtils::monitorIndexById(snapshot.monitorId, topology);
    if (index >= 0) {
        geometry.dpiScaleAtSave = topology.at(index).dpiScale;
    }
    return geometry;
}

} // namespace Greenhouse
