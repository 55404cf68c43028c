// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "greenhouse_export.h"
#include "types.h"
#include <QStringList>
#include <QVector>

namespace Greenhouse {

class IWindowSystem;
class ITopologySource;
class IWindowExclusionSettings;

/**
 * @brief Which windows are offered for saving and matching
 *
 * Minimized, hidden and zero-area windows are always dropped; these are the
 * configurable extras on top.
 */
struct GREENHOUSE_EXPORT WindowFilter
{
    QStringList excludedApplications;  ///< Process names, case-insensitive
    QStringList excludedWindowClasses; ///< Window classes, case-insensitive
    int minimumWidth = 0;
    int minimumHeight = 0;
    bool requireTitle = true;
    qint64 ownPid = 0;                 ///< Windows of this process are never listed (0 = none)

    static WindowFilter fromSettings(const IWindowExclusionSettings* settings, qint64 ownPid);

    /**
     * @brief Check a raw window against the filter
     * @return true if the window should be listed
     */
    bool accepts(const NativeWindowInfo& window) const;
};

/**
 * @brief Produces fresh snapshots of the visible top-level windows
 *
 * Read-only: every call queries the window system anew and returns an
 * independent snapshot. Handles from an older snapshot must not be reused.
 */
class GREENHOUSE_EXPORT WindowEnumerator
{
public:
    WindowEnumerator(IWindowSystem* windowSystem, ITopologySource* topology);
    ~WindowEnumerator();

    void setFilter(const WindowFilter& filter)
    {
        m_filter = filter;
    }
    const WindowFilter& filter() const
    {
        return m_filter;
    }

    /**
     * @brief List visible windows, reading the topology for monitor ownership
     */
    QVector<WindowSnapshot> listVisibleWindows() const;

    /**
     * @brief List visible windows against an already-read topology
     *
     * Used inside a restore batch so every record sees the same monitors.
     */
    QVector<WindowSnapshot> listVisibleWindows(const Topology& topology) const;

    /**
     * @brief Monitor owning rect: largest overlap, else nearest to its center
     * @return Monitor id, or empty for an empty topology
     */
    static QString ownerMonitorId(const QRect& rect, const Topology& topology);

    /**
     * @brief Geometry to save for a snapshot, paired with its monitor's scale
     *
     * The snapshot's monitor id is looked up in topology; a monitor that has
     * disappeared since enumeration falls back to a scale of 1.0.
     */
    static WindowGeometry captureGeometry(const WindowSnapshot& snapshot, const Topology& topology);

private:
    IWindowSystem* m_windowSystem = nullptr;
    ITopologySource* m_topology = nullptr;
    WindowFilter m_filter;
};

} // namespace Greenhouse
