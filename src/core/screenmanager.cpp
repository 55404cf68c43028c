// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "screenmanager.h"
#include "constants.h"
#include "geometryutils.h"
#include "logging.h"
#include "utils.h"
#include <QGuiApplication>

namespace Greenhouse {

ScreenManager::ScreenManager(QObject* parent)
    : QObject(parent)
{
    m_changeTimer.setSingleShot(true);
    m_changeTimer.setInterval(Defaults::TopologyDebounceMs);
    connect(&m_changeTimer, &QTimer::timeout, this, &ScreenManager::notifyTopologyChanged);
}

ScreenManager::~ScreenManager()
{
    stop();
}

void ScreenManager::start()
{
    if (m_running || !qApp) {
        return;
    }

    m_running = true;

    connect(qApp, &QGuiApplication::screenAdded, this, &ScreenManager::onScreenAdded);
    connect(qApp, &QGuiApplication::screenRemoved, this, &ScreenManager::onScreenRemoved);
    connect(qApp, &QGuiApplication::primaryScreenChanged, this, &ScreenManager::onScreensChanged);

    for (auto* screen : QGuiApplication::screens()) {
        if (!m_trackedScreens.contains(screen)) {
            connectScreenSignals(screen);
            m_trackedScreens.append(screen);
        }
    }
    m_lastCount = m_trackedScreens.size();

    qCInfo(lcScreen) << "Monitoring" << m_lastCount << "screens";
}

void ScreenManager::stop()
{
    if (!m_running) {
        return;
    }

    m_running = false;
    m_changeTimer.stop();

    for (auto* screen : std::as_const(m_trackedScreens)) {
        disconnectScreenSignals(screen);
    }
    m_trackedScreens.clear();

    if (qApp) {
        disconnect(qApp, nullptr, this, nullptr);
    }
}

std::optional<Topology> ScreenManager::readTopology() const
{
    if (!qApp) {
        qCWarning(lcScreen) << "readTopology() called before QGuiApplication initialized";
        return std::nullopt;
    }

    const auto screenList = QGuiApplication::screens();
    Topology topology;
    if (screenList.isEmpty()) {
        qCWarning(lcScreen) << "Platform reported no screens";
        return topology;
    }

    topology.reserve(screenList.size());

    QScreen* primary = QGuiApplication::primaryScreen();
    if (primary) {
        topology.append(describe(primary));
    }
    for (auto* screen : screenList) {
        if (screen != primary) {
            topology.append(describe(screen));
        }
    }

    if (GeometryUtils::makeMonitorIdsUnique(topology) > 0) {
        qCDebug(lcScreen) << "Identical monitors disambiguated by connector";
    }
    return topology;
}

QVector<QScreen*> ScreenManager::screens() const
{
    if (!qApp) {
        return {};
    }
    const auto screenList = QGuiApplication::screens();
    return QVector<QScreen*>(screenList.begin(), screenList.end());
}

MonitorDescriptor ScreenManager::describe(const QScreen* screen)
{
    MonitorDescriptor monitor;
    if (!screen) {
        return monitor;
    }

    const QRect logical = screen->geometry();
    const qreal dpr = screen->devicePixelRatio() > 0 ? screen->devicePixelRatio() : Defaults::FallbackDpiScale;

    monitor.id = Utils::screenIdentifier(screen);
    monitor.bounds = QRect(logical.topLeft(), QSize(qRound(logical.width() * dpr), qRound(logical.height() * dpr)));
    monitor.dpiScale = dpr;
    monitor.connector = screen->name();
    return monitor;
}

void ScreenManager::onScreenAdded(QScreen* screen)
{
    if (!screen || m_trackedScreens.contains(screen)) {
        return;
    }

    connectScreenSignals(screen);
    m_trackedScreens.append(screen);
    qCInfo(lcScreen) << "Screen added:" << screen->name();
    m_changeTimer.start();
}

void ScreenManager::onScreenRemoved(QScreen* screen)
{
    if (!screen) {
        return;
    }

    disconnectScreenSignals(screen);
    m_trackedScreens.removeAll(screen);
    // A different monitor may later appear on the same connector
    Utils::invalidateEdidCache(screen->name());
    qCInfo(lcScreen) << "Screen removed:" << screen->name();
    m_changeTimer.start();
}

void ScreenManager::onScreensChanged()
{
    m_changeTimer.start();
}

void ScreenManager::notifyTopologyChanged()
{
    const int previous = m_lastCount;
    m_lastCount = m_trackedScreens.size();

    Q_EMIT topologyChanged();
    if (m_lastCount > previous) {
        qCInfo(lcScreen) << "Monitors reconnected:" << previous << "->" << m_lastCount;
        Q_EMIT monitorsReconnected(previous, m_lastCount);
    }
}

void ScreenManager::connectScreenSignals(QScreen* screen)
{
    if (!screen) {
        return;
    }

    connect(screen, &QScreen::geometryChanged, this, &ScreenManager::onScreensChanged);
    connect(screen, &QScreen::physicalDotsPerInchChanged, this, &ScreenManager::onScreensChanged);
}

void ScreenManager::disconnectScreenSignals(QScreen* screen)
{
    if (!screen) {
        return;
    }

    disconnect(screen, nullptr, this, nullptr);
}

} // namespace Greenhouse
