// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "greenhouse_export.h"
#include <QString>
#include <QStringList>

namespace Greenhouse {

/**
 * @brief Settings that decide which windows are offered for saving and matching
 *
 * Used by: WindowEnumerator (via WindowFilter), Daemon
 */
class GREENHOUSE_EXPORT IWindowExclusionSettings
{
public:
    virtual ~IWindowExclusionSettings() = default;

    virtual QStringList excludedApplications() const = 0;
    virtual void setExcludedApplications(const QStringList& apps) = 0;
    virtual QStringList excludedWindowClasses() const = 0;
    virtual void setExcludedWindowClasses(const QStringList& classes) = 0;
    virtual int minimumWindowWidth() const = 0;
    virtual void setMinimumWindowWidth(int width) = 0;
    virtual int minimumWindowHeight() const = 0;
    virtual void setMinimumWindowHeight(int height) = 0;
    virtual bool requireWindowTitle() const = 0;
    virtual void setRequireWindowTitle(bool require) = 0;
};

/**
 * @brief Settings that decide when restores are triggered automatically
 *
 * Used by: Daemon, LaunchWatcher
 */
class GREENHOUSE_EXPORT IRestoreBehaviorSettings
{
public:
    virtual ~IRestoreBehaviorSettings() = default;

    virtual bool restoreOnStartup() const = 0;
    virtual void setRestoreOnStartup(bool enabled) = 0;
    virtual bool restoreOnMonitorReconnect() const = 0;
    virtual void setRestoreOnMonitorReconnect(bool enabled) = 0;
    virtual bool autoRestoreOnLaunch() const = 0;
    virtual void setAutoRestoreOnLaunch(bool enabled) = 0;
    virtual int launchPollIntervalMs() const = 0;
    virtual void setLaunchPollIntervalMs(int interval) = 0;
    virtual int topologySettleDelayMs() const = 0;
    virtual void setTopologySettleDelayMs(int delay) = 0;
};

} // namespace Greenhouse
