// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "greenhouse_export.h"
#include "interfaces.h"
#include "types.h"
#include <QObject>
#include <QScreen>
#include <QTimer>
#include <QVector>

namespace Greenhouse {

/**
 * @brief Reads the monitor topology from Qt's screen list
 *
 * Handles all screen-related operations:
 * - Topology snapshots in native pixels (readTopology)
 * - Screen monitoring (added/removed/geometry changed)
 * - Reconnection detection (monitor count grew)
 *
 * Change notifications are coalesced: a dock or undock fires several
 * QScreen signals in a burst, topologyChanged() fires once after it.
 */
class GREENHOUSE_EXPORT ScreenManager : public QObject, public ITopologySource
{
    Q_OBJECT

public:
    explicit ScreenManager(QObject* parent = nullptr);
    ~ScreenManager() override;

    /**
     * @brief Start monitoring screens
     */
    void start();

    /**
     * @brief Stop monitoring screens
     */
    void stop();

    /**
     * @brief Snapshot of connected monitors, primary first
     *
     * Monitor ids are unique within the snapshot; see
     * GeometryUtils::makeMonitorIdsUnique().
     * @return Topology (empty when no screen is connected), or nullopt without a GUI application
     */
    std::optional<Topology> readTopology() const override;

    QVector<QScreen*> screens() const;

    /**
     * @brief Build the descriptor for one screen
     *
     * Origin stays as Qt reports it (already native on X11); size is
     * scaled by the device pixel ratio.
     */
    static MonitorDescriptor describe(const QScreen* screen);

Q_SIGNALS:
    void topologyChanged();

    /**
     * @brief Emitted when the monitor count grew since the last notification
     */
    void monitorsReconnected(int previousCount, int currentCount);

private Q_SLOTS:
    void onScreenAdded(QScreen* screen);
    void onScreenRemoved(QScreen* screen);
    void onScreensChanged();

private:
    void connectScreenSignals(QScreen* screen);
    void disconnectScreenSignals(QScreen* screen);
    void notifyTopologyChanged();

    QVector<QScreen*> m_trackedScreens;
    QTimer m_changeTimer;
    int m_lastCount = 0;
    bool m_running = false;
};

} // namespace Greenhouse
