// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <QObject>
#include <QString>
#include <QTimer>
#include <memory>

namespace Greenhouse {

class IWindowSystem;
class LaunchWatcher;
class PositionPersistence;
class PositionStore;
class RestoreOrchestrator;
class ScreenAdaptor;
class ScreenManager;
class Settings;
class WindowEnumerator;
class WindowRestoreAdaptor;

/**
 * @brief Main daemon for Greenhouse
 *
 * The daemon runs in the background and handles:
 * - Saved position persistence in greenhouserc
 * - Restore on startup, on monitor reconnect and on application launch
 * - The D-Bus facade used by presentation clients
 *
 * Note: This class does NOT use the singleton pattern. Create instances
 * where needed and pass via dependency injection.
 */
class Daemon : public QObject
{
    Q_OBJECT

public:
    explicit Daemon(QObject* parent = nullptr);
    ~Daemon() override;

    bool init();
    void start();
    void stop();

    /**
     * @brief Run restoreAll() once the topology settle delay has passed
     *
     * Used for --restore and the RestoreOnStartup setting.
     */
    void scheduleRestore();

    Settings* settings() const
    {
        return m_settings.get();
    }
    ScreenManager* screenManager() const
    {
        return m_screenManager.get();
    }
    PositionStore* positionStore() const
    {
        return m_store.get();
    }
    RestoreOrchestrator* orchestrator() const
    {
        return m_orchestrator.get();
    }

Q_SIGNALS:
    void started();
    void stopped();

private:
    void applySettings();
    void updateLaunchWatcher();
    void runRestore(const QString& reason);

    // Don't pass 'this' as parent for unique_ptr-managed objects.
    std::unique_ptr<Settings> m_settings;
    std::unique_ptr<ScreenManager> m_screenManager;
    std::unique_ptr<IWindowSystem> m_windowSystem;
    std::unique_ptr<WindowEnumerator> m_enumerator;
    std::unique_ptr<PositionStore> m_store;
    std::unique_ptr<PositionPersistence> m_persistence;
    std::unique_ptr<RestoreOrchestrator> m_orchestrator;
    std::unique_ptr<LaunchWatcher> m_launchWatcher;

    WindowRestoreAdaptor* m_windowRestoreAdaptor = nullptr;
    ScreenAdaptor* m_screenAdaptor = nullptr;

    // Delays a restore until a dock/undock has settled
    QTimer m_reconnectRestoreTimer;
    bool m_running = false;
    bool m_restoreScheduled = false;
};

} // namespace Greenhouse
