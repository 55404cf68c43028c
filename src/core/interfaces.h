// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "greenhouse_export.h"
#include "settings_interfaces.h"
#include "types.h"
#include <QObject>
#include <QRect>
#include <QVector>
#include <optional>

namespace Greenhouse {

/**
 * @brief Abstract interface for settings management
 *
 * Components depend on this interface (or one of the segregated
 * sub-interfaces) rather than on the KConfig-backed Settings class, so tests
 * can run without a config file.
 */
class GREENHOUSE_EXPORT ISettings : public QObject,
                                    public IWindowExclusionSettings,
                                    public IRestoreBehaviorSettings
{
    Q_OBJECT

public:
    explicit ISettings(QObject* parent = nullptr)
        : QObject(parent)
    {
    }
    ~ISettings() override;

    // Persistence (unique to ISettings)
    virtual void load() = 0;
    virtual void save() = 0;
    virtual void reset() = 0;

Q_SIGNALS:
    void settingsChanged();
    void excludedApplicationsChanged();
    void excludedWindowClassesChanged();
    void minimumWindowWidthChanged();
    void minimumWindowHeightChanged();
    void requireWindowTitleChanged();
    void restoreOnStartupChanged();
    void restoreOnMonitorReconnectChanged();
    void autoRestoreOnLaunchChanged();
    void launchPollIntervalMsChanged();
    void topologySettleDelayMsChanged();
};

/**
 * @brief Source of the current monitor topology
 *
 * Implemented by ScreenManager on top of QScreen; tests inject fixed topologies.
 */
class GREENHOUSE_EXPORT ITopologySource
{
public:
    virtual ~ITopologySource();

    /**
     * @brief Read the monitor topology right now
     * @return Monitors in OS enumeration order, or nullopt if the query itself failed
     *
     * An engaged but empty topology is a successful read that found no monitors.
     * Never cache the result across a restore: DPI and bounds drive the
     * reconciliation math.
     */
    virtual std::optional<Topology> readTopology() const = 0;
};

/**
 * @brief Boundary to the OS window manager
 *
 * All calls happen on the control thread. Handles returned by windows() may
 * become invalid at any time; every apply is fallible.
 */
class GREENHOUSE_EXPORT IWindowSystem
{
public:
    virtual ~IWindowSystem();

    /**
     * @brief Whether the backend can talk to a window manager at all
     */
    virtual bool isAvailable() const = 0;

    /**
     * @brief Query all top-level windows, unfiltered
     * @return Windows in stacking/enumeration order, empty on failure
     */
    virtual QVector<NativeWindowInfo> windows() const = 0;

    /**
     * @brief Check that a handle still refers to a live window
     */
    virtual bool isValid(WindowHandle handle) const = 0;

    /**
     * @brief Move and resize a window's frame to rect in one request
     * @return false if the window system rejected the request
     */
    virtual bool moveResize(WindowHandle handle, const QRect& rect) = 0;
};

} // namespace Greenhouse
