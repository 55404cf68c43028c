// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "restoreorchestrator.h"
#include "interfaces.h"
#include "logging.h"
#include "positionstore.h"
#include "windowenumerator.h"

namespace Greenhouse {

RestoreOrchestrator::RestoreOrchestrator(IWindowSystem* windowSystem, WindowEnumerator* enumerator,
                                         ITopologySource* topology, QObject* parent)
    : QObject(parent)
    , m_windowSystem(windowSystem)
    , m_enumerator(enumerator)
    , m_topology(topology)
{
    Q_ASSERT(windowSystem);
    Q_ASSERT(enumerator);
    Q_ASSERT(topology);
}

RestoreOrchestrator::~RestoreOrchestrator() = default;

RestoreReport RestoreOrchestrator::restoreAll(const PositionStore& store)
{
    RestoreReport report;
    if (m_running) {
        qCWarning(lcRestore) << "Restore already in progress - ignoring nested restoreAll";
        return report;
    }

    m_cancelRequested = false;

    // Topology is read immediately before the batch; a stale one would feed
    // wrong bounds and scales into the reconciliation
    const std::optional<Topology> topology = m_topology->readTopology();
    if (!topology) {
        qCWarning(lcRestore) << "Topology read failed - aborting restore batch";
        report.topologyFailed = true;
        Q_EMIT batchFinished(report);
        return report;
    }

    m_running = true;
    QSet<WindowHandle> claimed;
    const QVector<SavedPositionRecord> records = store.all();
    for (const SavedPositionRecord& record : records) {
        if (m_cancelRequested) {
            qCInfo(lcRestore) << "Restore cancelled after" << report.results.size() << "of" << records.size()
                              << "records";
            report.cancelled = true;
            break;
        }
        const RestoreResult result =
            restoreRecord(record, *topology, m_enumerator->listVisibleWindows(*topology), claimed);
        report.results.append(result);
        Q_EMIT recordRestored(result);
    }
    m_running = false;
    m_cancelRequested = false;

    qCInfo(lcRestore) << "Restore finished -" << report.count(RestoreOutcome::Restored) << "restored,"
                      << report.count(RestoreOutcome::NotFound) << "not found,"
                      << report.count(RestoreOutcome::ApplyFailed) << "failed,"
                      << report.count(RestoreOutcome::MonitorUnavailable) << "without monitor";
    Q_EMIT batchFinished(report);
    return report;
}

std::optional<RestoreResult> RestoreOrchestrator::restoreIdentity(const WindowIdentity& identity,
                                                                  const PositionStore& store)
{
    const std::optional<SavedPositionRecord> record = store.get(identity);
    if (!record) {
        qCDebug(lcRestore) << "No saved position for" << identity.toString();
        return std::nullopt;
    }

    const std::optional<Topology> topology = m_topology->readTopology();
    if (!topology) {
        qCWarning(lcRestore) << "Topology read failed - cannot restore" << identity.toString();
        return std::nullopt;
    }

    QSet<WindowHandle> claimed;
    const RestoreResult result =
        restoreRecord(*record, *topology, m_enumerator->listVisibleWindows(*topology), claimed);
    Q_EMIT recordRestored(result);
    return result;
}

std::optional<RestoreResult> RestoreOrchestrator::restoreIdentity(const WindowIdentity& identity,
                                                                  const PositionStore& store,
                                                                  const QVector<WindowSnapshot>& candidates,
                                                                  QSet<WindowHandle>& claimed)
{
    const std::optional<SavedPositionRecord> record = store.get(identity);
    if (!record) {
        qCDebug(lcRestore) << "No saved position for" << identity.toString();
        return std::nullopt;
    }

    const std::optional<Topology> topology = m_topology->readTopology();
    if (!topology) {
        qCWarning(lcRestore) << "Topology read failed - cannot restore" << identity.toString();
        return std::nullopt;
    }

    const RestoreResult result = restoreRecord(*record, *topology, candidates, claimed);
    Q_EMIT recordRestored(result);
    return result;
}

void RestoreOrchestrator::requestCancel()
{
    m_cancelRequested = true;
}

QVector<WindowIdentity> RestoreOrchestrator::pendingIdentities() const
{
    return QVector<WindowIdentity>(m_pending.cbegin(), m_pending.cend());
}

bool RestoreOrchestrator::isPending(const WindowIdentity& identity) const
{
    return m_pending.contains(identity);
}

void RestoreOrchestrator::clearPending(const WindowIdentity& identity)
{
    setPending(identity, false);
}

RestoreResult RestoreOrchestrator::restoreRecord(const SavedPositionRecord& record, const Topology& topology,
                                                 const QVector<WindowSnapshot>& windows, QSet<WindowHandle>& claimed)
{
    RestoreResult result;
    result.identity = record.identity;

    const MatchResult match = m_matcher.match(record.identity, windows, claimed);
    if (!match.isMatch()) {
        qCDebug(lcRestore) << "No live window for" << record.identity.toString() << "- pending";
        result.outcome = RestoreOutcome::NotFound;
        setPending(record.identity, true);
        return result;
    }

    const WindowHandle handle = *match.handle;
    claimed.insert(handle);

    const ReconcileResult target = m_reconciler.reconcile(record.geometry, topology);
    if (!target.isValid()) {
        result.outcome = RestoreOutcome::MonitorUnavailable;
        return result;
    }
    result.targetRect = target.rect;

    // Handle may have died between enumeration and apply
    if (!m_windowSystem->isValid(handle) || !m_windowSystem->moveResize(handle, target.rect)) {
        qCWarning(lcRestore) << "Failed to move" << record.identity.toString() << "to" << target.rect;
        result.outcome = RestoreOutcome::ApplyFailed;
        return result;
    }

    qCDebug(lcRestore) << "Restored" << record.identity.toString() << "to" << target.rect << "on"
                       << target.monitorId;
    result.outcome = RestoreOutcome::Restored;
    setPending(record.identity, false);
    return result;
}

void RestoreOrchestrator::setPending(const WindowIdentity& identity, bool pending)
{
    const bool changed = pending ? !m_pending.contains(identity) : m_pending.remove(identity);
    if (pending && changed) {
        m_pending.insert(identity);
    }
    if (changed) {
        Q_EMIT pendingChanged();
    }
}

} // namespace Greenhouse
