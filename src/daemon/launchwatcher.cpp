// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "launchwatcher.h"
#include "../core/logging.h"
#include "../core/positionstore.h"
#include "../core/restoreorchestrator.h"
#include "../core/windowenumerator.h"

namespace Greenhouse {

LaunchWatcher::LaunchWatcher(RestoreOrchestrator* orchestrator, WindowEnumerator* enumerator, PositionStore* store,
                             QObject* parent)
    : QObject(parent)
    , m_orchestrator(orchestrator)
    , m_enumerator(enumerator)
    , m_store(store)
{
    Q_ASSERT(orchestrator);
    Q_ASSERT(enumerator);
    Q_ASSERT(store);

    connect(&m_timer, &QTimer::timeout, this, &LaunchWatcher::poll);
}

LaunchWatcher::~LaunchWatcher() = default;

void LaunchWatcher::setInterval(int intervalMs)
{
    m_timer.setInterval(intervalMs);
}

void LaunchWatcher::start()
{
    if (m_timer.isActive()) {
        return;
    }

    // Baseline: whatever is open now is not a launch
    m_seen.clear();
    const QVector<WindowSnapshot> windows = m_enumerator->listVisibleWindows();
    for (const WindowSnapshot& window : windows) {
        m_seen.insert(window.handle);
    }

    m_timer.start();
    qCInfo(lcDaemon) << "Launch detection started, polling every" << m_timer.interval() << "ms";
}

void LaunchWatcher::stop()
{
    if (!m_timer.isActive()) {
        return;
    }
    m_timer.stop();
    m_seen.clear();
    qCInfo(lcDaemon) << "Launch detection stopped";
}

int LaunchWatcher::poll()
{
    const QVector<WindowSnapshot> windows = m_enumerator->listVisibleWindows();

    QSet<WindowHandle> current;
    QVector<WindowSnapshot> launched;
    for (const WindowSnapshot& window : windows) {
        current.insert(window.handle);
        if (!m_seen.contains(window.handle)) {
            launched.append(window);
        }
    }
    m_seen = current;

    // Drop pending identities whose record has been removed
    const QVector<WindowIdentity> pending = m_orchestrator->pendingIdentities();
    for (const WindowIdentity& identity : pending) {
        if (!m_store->contains(identity)) {
            m_orchestrator->clearPending(identity);
        }
    }

    if (launched.isEmpty() || m_store->isEmpty() || m_orchestrator->isRunning()) {
        return 0;
    }

    // Records still waiting for a window get first pick of the launches
    QVector<SavedPositionRecord> records;
    QVector<SavedPositionRecord> others;
    const QVector<SavedPositionRecord> all = m_store->all();
    for (const SavedPositionRecord& record : all) {
        if (m_orchestrator->isPending(record.identity)) {
            records.append(record);
        } else {
            others.append(record);
        }
    }
    records.append(others);

    int restored = 0;
    QSet<WindowHandle> claimed;
    for (const SavedPositionRecord& record : std::as_const(records)) {
        if (claimed.size() == launched.size()) {
            break;
        }
        if (!m_matcher.match(record.identity, launched, claimed).isMatch()) {
            continue;
        }

        qCDebug(lcDaemon) << "Launch detected for" << record.identity.toString();
        const std::optional<RestoreResult> result =
            m_orchestrator->restoreIdentity(record.identity, *m_store, launched, claimed);
        if (!result) {
            continue;
        }
        if (result->outcome == RestoreOutcome::Restored) {
            ++restored;
        }
        Q_EMIT launchRestored(*result);
    }
    return restored;
}

} // namespace Greenhouse
