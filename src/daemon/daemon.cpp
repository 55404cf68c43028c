// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "daemon.h"

#include <QCoreApplication>
#include <QDBusConnection>
#include <QDBusError>
#include <QThread>

#include "launchwatcher.h"
#include "../config/settings.h"
#include "../core/constants.h"
#include "../core/logging.h"
#include "../core/platform.h"
#include "../core/positionpersistence.h"
#include "../core/positionstore.h"
#include "../core/restoreorchestrator.h"
#include "../core/screenmanager.h"
#include "../core/windowenumerator.h"
#include "../dbus/screenadaptor.h"
#include "../dbus/windowrestoreadaptor.h"
#include "../platform/x11windowsystem.h"

namespace Greenhouse {

Daemon::Daemon(QObject* parent)
    : QObject(parent)
    , m_settings(std::make_unique<Settings>())
    , m_screenManager(std::make_unique<ScreenManager>(nullptr))
    , m_windowSystem(std::make_unique<X11WindowSystem>())
    , m_enumerator(std::make_unique<WindowEnumerator>(m_windowSystem.get(), m_screenManager.get()))
    , m_store(std::make_unique<PositionStore>(nullptr))
    , m_persistence(std::make_unique<PositionPersistence>(m_store.get(), KSharedConfig::Ptr(), nullptr))
    , m_orchestrator(std::make_unique<RestoreOrchestrator>(m_windowSystem.get(), m_enumerator.get(),
                                                           m_screenManager.get(), nullptr))
    , m_launchWatcher(std::make_unique<LaunchWatcher>(m_orchestrator.get(), m_enumerator.get(), m_store.get(), nullptr))
{
    m_reconnectRestoreTimer.setSingleShot(true);
    connect(&m_reconnectRestoreTimer, &QTimer::timeout, this, [this]() {
        runRestore(QStringLiteral("monitor reconnect"));
    });
}

Daemon::~Daemon()
{
    stop();
}

bool Daemon::init()
{
    applySettings();
    connect(m_settings.get(), &Settings::settingsChanged, this, &Daemon::applySettings);

    const int loaded = m_persistence->load();
    qCInfo(lcDaemon) << "Loaded" << loaded << "saved window positions";

    // Adaptors are parented to the daemon; Qt owns them
    m_windowRestoreAdaptor = new WindowRestoreAdaptor(m_enumerator.get(), m_store.get(), m_orchestrator.get(),
                                                      m_screenManager.get(), this);
    m_screenAdaptor = new ScreenAdaptor(m_screenManager.get(), this);

    auto bus = QDBusConnection::sessionBus();
    if (!bus.isConnected()) {
        qCCritical(lcDaemon) << "Cannot connect to session D-Bus - daemon cannot function without D-Bus";
        return false;
    }

    // Retry D-Bus service registration (linear backoff)
    const int maxRetries = 3;
    bool serviceRegistered = false;
    for (int attempt = 0; attempt < maxRetries; ++attempt) {
        if (bus.registerService(QString(DBus::ServiceName))) {
            serviceRegistered = true;
            break;
        }

        const QDBusError error = bus.lastError();
        if ((error.type() == QDBusError::ServiceUnknown || error.type() == QDBusError::NoReply)
            && attempt < maxRetries - 1) {
            const int delayMs = 1000 * (attempt + 1);
            qCWarning(lcDaemon) << "Failed to register D-Bus service (attempt" << (attempt + 1) << "/" << maxRetries
                                << "):" << error.message() << "- retrying in" << delayMs << "ms";
            QThread::msleep(delayMs);
            continue;
        }

        qCCritical(lcDaemon) << "Failed to register D-Bus service:" << DBus::ServiceName
                             << "Error:" << error.message();
        return false;
    }

    if (!serviceRegistered) {
        qCCritical(lcDaemon) << "Failed to register D-Bus service after" << maxRetries << "attempts";
        return false;
    }

    if (!bus.registerObject(QString(DBus::ObjectPath), this)) {
        qCCritical(lcDaemon) << "Failed to register D-Bus object:" << DBus::ObjectPath
                             << "Error:" << bus.lastError().message();
        bus.unregisterService(QString(DBus::ServiceName));
        return false;
    }

    qCInfo(lcDaemon) << "D-Bus service registered service=" << DBus::ServiceName << "path=" << DBus::ObjectPath;
    return true;
}

void Daemon::start()
{
    if (m_running) {
        return;
    }
    m_running = true;

    m_screenManager->start();

    if (!m_windowSystem->isAvailable()) {
        qCWarning(lcDaemon) << "No usable window system on" << Platform::displayServer()
                            << "- windows will not be listed or moved";
    }

    connect(m_screenManager.get(), &ScreenManager::monitorsReconnected, this, [this](int previous, int current) {
        if (!m_settings->restoreOnMonitorReconnect()) {
            return;
        }
        qCInfo(lcDaemon) << "Monitor count" << previous << "->" << current << "- restoring in"
                         << m_settings->topologySettleDelayMs() << "ms";
        m_reconnectRestoreTimer.start(m_settings->topologySettleDelayMs());
    });

    updateLaunchWatcher();

    if (m_settings->restoreOnStartup()) {
        scheduleRestore();
    }

    Q_EMIT started();
}

void Daemon::stop()
{
    if (!m_running) {
        return;
    }
    m_running = false;

    m_reconnectRestoreTimer.stop();
    m_launchWatcher->stop();
    m_orchestrator->requestCancel();

    disconnect(m_screenManager.get(), nullptr, this, nullptr);
    m_screenManager->stop();

    m_persistence->save();
    m_settings->save();

    qCInfo(lcDaemon) << "Stopped";
    Q_EMIT stopped();
}

void Daemon::scheduleRestore()
{
    if (m_store->isEmpty()) {
        qCDebug(lcDaemon) << "No saved positions - startup restore skipped";
        return;
    }
    if (m_restoreScheduled) {
        return;
    }
    m_restoreScheduled = true;
    QTimer::singleShot(m_settings->topologySettleDelayMs(), this, [this]() {
        m_restoreScheduled = false;
        if (m_running) {
            runRestore(QStringLiteral("startup"));
        }
    });
}

void Daemon::applySettings()
{
    m_enumerator->setFilter(WindowFilter::fromSettings(m_settings.get(), QCoreApplication::applicationPid()));
    m_launchWatcher->setInterval(m_settings->launchPollIntervalMs());
    if (m_running) {
        updateLaunchWatcher();
    }
}

void Daemon::updateLaunchWatcher()
{
    const bool wanted = m_settings->autoRestoreOnLaunch() && m_windowSystem->isAvailable();
    if (wanted) {
        m_launchWatcher->start();
    } else {
        m_launchWatcher->stop();
    }
}

void Daemon::runRestore(const QString& reason)
{
    if (m_store->isEmpty()) {
        return;
    }
    qCInfo(lcDaemon) << "Restoring saved positions (" << reason << ")";
    const RestoreReport report = m_orchestrator->restoreAll(*m_store);
    if (report.topologyFailed) {
        qCWarning(lcDaemon) << "Restore on" << reason << "skipped - monitors could not be read";
    }
}

} // namespace Greenhouse
