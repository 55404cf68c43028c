// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "../core/constants.h"
#include "../core/interfaces.h"
#include <KConfigGroup>
#include <KSharedConfig>

namespace Greenhouse {

/**
 * @brief Daemon settings backed by greenhouserc
 *
 * Implements the ISettings interface with KConfig integration. Out-of-range
 * values on disk are replaced by the .kcfg default with a warning; values
 * set through the setters are clamped.
 *
 * Note: This class does NOT use the singleton pattern. Create instances
 * where needed and pass via dependency injection.
 */
class GREENHOUSE_EXPORT Settings : public ISettings
{
    Q_OBJECT

    // Restore triggers
    Q_PROPERTY(bool restoreOnStartup READ restoreOnStartup WRITE setRestoreOnStartup NOTIFY restoreOnStartupChanged)
    Q_PROPERTY(bool restoreOnMonitorReconnect READ restoreOnMonitorReconnect WRITE setRestoreOnMonitorReconnect NOTIFY
                   restoreOnMonitorReconnectChanged)
    Q_PROPERTY(bool autoRestoreOnLaunch READ autoRestoreOnLaunch WRITE setAutoRestoreOnLaunch NOTIFY
                   autoRestoreOnLaunchChanged)
    Q_PROPERTY(int launchPollIntervalMs READ launchPollIntervalMs WRITE setLaunchPollIntervalMs NOTIFY
                   launchPollIntervalMsChanged)
    Q_PROPERTY(int topologySettleDelayMs READ topologySettleDelayMs WRITE setTopologySettleDelayMs NOTIFY
                   topologySettleDelayMsChanged)

    // Exclusions
    Q_PROPERTY(QStringList excludedApplications READ excludedApplications WRITE setExcludedApplications NOTIFY
                   excludedApplicationsChanged)
    Q_PROPERTY(QStringList excludedWindowClasses READ excludedWindowClasses WRITE setExcludedWindowClasses NOTIFY
                   excludedWindowClassesChanged)
    Q_PROPERTY(
        int minimumWindowWidth READ minimumWindowWidth WRITE setMinimumWindowWidth NOTIFY minimumWindowWidthChanged)
    Q_PROPERTY(int minimumWindowHeight READ minimumWindowHeight WRITE setMinimumWindowHeight NOTIFY
                   minimumWindowHeightChanged)
    Q_PROPERTY(
        bool requireWindowTitle READ requireWindowTitle WRITE setRequireWindowTitle NOTIFY requireWindowTitleChanged)

public:
    explicit Settings(QObject* parent = nullptr);

    /**
     * @brief Use a specific config instead of the user's greenhouserc
     */
    explicit Settings(KSharedConfig::Ptr config, QObject* parent = nullptr);
    ~Settings() override = default;

    // IRestoreBehaviorSettings
    bool restoreOnStartup() const override
    {
        return m_restoreOnStartup;
    }
    void setRestoreOnStartup(bool enabled) override;
    bool restoreOnMonitorReconnect() const override
    {
        return m_restoreOnMonitorReconnect;
    }
    void setRestoreOnMonitorReconnect(bool enabled) override;
    bool autoRestoreOnLaunch() const override
    {
        return m_autoRestoreOnLaunch;
    }
    void setAutoRestoreOnLaunch(bool enabled) override;
    int launchPollIntervalMs() const override
    {
        return m_launchPollIntervalMs;
    }
    void setLaunchPollIntervalMs(int interval) override;
    int topologySettleDelayMs() const override
    {
        return m_topologySettleDelayMs;
    }
    void setTopologySettleDelayMs(int delay) override;

    // IWindowExclusionSettings
    QStringList excludedApplications() const override
    {
        return m_excludedApplications;
    }
    void setExcludedApplications(const QStringList& apps) override;
    QStringList excludedWindowClasses() const override
    {
        return m_excludedWindowClasses;
    }
    void setExcludedWindowClasses(const QStringList& classes) override;
    int minimumWindowWidth() const override
    {
        return m_minimumWindowWidth;
    }
    void setMinimumWindowWidth(int width) override;
    int minimumWindowHeight() const override
    {
        return m_minimumWindowHeight;
    }
    void setMinimumWindowHeight(int height) override;
    bool requireWindowTitle() const override
    {
        return m_requireWindowTitle;
    }
    void setRequireWindowTitle(bool require) override;

    // Persistence
    void load() override;
    void save() override;
    void reset() override;

private:
    static int readValidatedInt(const KConfigGroup& group, const char* key, int defaultValue, int min, int max,
                                const char* settingName);
    static QStringList cleanList(const QStringList& list);

    KSharedConfig::Ptr m_config;

    // General (defaults from greenhouse.kcfg via ConfigDefaults)
    bool m_restoreOnStartup = false;
    bool m_restoreOnMonitorReconnect = true;
    bool m_autoRestoreOnLaunch = true;
    int m_launchPollIntervalMs = 2000;
    int m_topologySettleDelayMs = 1000;

    // Exclusions
    QStringList m_excludedApplications;
    QStringList m_excludedWindowClasses;
    int m_minimumWindowWidth = 0;
    int m_minimumWindowHeight = 0;
    bool m_requireWindowTitle = true;
};

} // namespace Greenhouse
