// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "geometryreconciler.h"
#include "greenhouse_export.h"
#include "types.h"
#include "windowmatcher.h"
#include <QObject>
#include <QSet>
#include <QVector>
#include <atomic>
#include <optional>

namespace Greenhouse {

class IWindowSystem;
class ITopologySource;
class PositionStore;
class WindowEnumerator;

/**
 * @brief Drives restore of saved positions onto live windows
 *
 * For each stored record, in store order: match against a fresh enumeration
 * (windows moved by earlier records are excluded),
 * reconcile against the topology read at batch start, then apply with a single
 * move/resize. Per-record failures become outcomes in the report; only a
 * failed topology read aborts the batch.
 *
 * Identities that found no window are kept as "pending" until a later restore
 * of that identity succeeds; the launch watcher uses them to retry when a
 * matching application starts.
 */
class GREENHOUSE_EXPORT RestoreOrchestrator : public QObject
{
    Q_OBJECT

public:
    RestoreOrchestrator(IWindowSystem* windowSystem, WindowEnumerator* enumerator, ITopologySource* topology,
                        QObject* parent = nullptr);
    ~RestoreOrchestrator() override;

    /**
     * @brief Restore every record in the store
     * @return One result per attempted record; topologyFailed/cancelled flags on early stop
     */
    RestoreReport restoreAll(const PositionStore& store);

    /**
     * @brief Restore a single stored identity (launch-detection hook)
     * @return Result for that record, or nullopt if it isn't stored or the topology read failed
     */
    std::optional<RestoreResult> restoreIdentity(const WindowIdentity& identity, const PositionStore& store);

    /**
     * @brief Restore a stored identity onto one of the given windows only
     *
     * Used for freshly launched windows: windows that were already open are
     * never candidates. A handle moved here is added to @p claimed.
     */
    std::optional<RestoreResult> restoreIdentity(const WindowIdentity& identity, const PositionStore& store,
                                                 const QVector<WindowSnapshot>& candidates,
                                                 QSet<WindowHandle>& claimed);

    /**
     * @brief Ask a running batch to stop before its next record
     *
     * Safe to call from any thread. A window already being moved is not
     * interrupted; apply is a single call.
     */
    void requestCancel();

    bool isRunning() const
    {
        return m_running;
    }

    /**
     * @brief Identities whose last restore attempt found no live window
     */
    QVector<WindowIdentity> pendingIdentities() const;
    bool isPending(const WindowIdentity& identity) const;

    /**
     * @brief Drop a pending identity, e.g. after its record was removed
     */
    void clearPending(const WindowIdentity& identity);

Q_SIGNALS:
    void recordRestored(const Greenhouse::RestoreResult& result);
    void batchFinished(const Greenhouse::RestoreReport& report);
    void pendingChanged();

private:
    RestoreResult restoreRecord(const SavedPositionRecord& record, const Topology& topology,
                                const QVector<WindowSnapshot>& windows, QSet<WindowHandle>& claimed);
    void setPending(const WindowIdentity& identity, bool pending);

    IWindowSystem* m_windowSystem = nullptr;
    WindowEnumerator* m_enumerator = nullptr;
    ITopologySource* m_topology = nullptr;
    WindowMatcher m_matcher;
    GeometryReconciler m_reconciler;

    QSet<WindowIdentity> m_pending;
    std::atomic_bool m_cancelRequested{false};
    bool m_running = false;
};

} // namespace Greenhouse
