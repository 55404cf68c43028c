// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "greenhouse_export.h"
#include "../core/types.h"
#include <QDBusAbstractAdaptor>
#include <QJsonArray>
#include <QJsonObject>
#include <QObject>
#include <QStringList>

namespace Greenhouse {

class ITopologySource;
class PositionStore;
class RestoreOrchestrator;
class WindowEnumerator;

/**
 * @brief D-Bus adaptor for saving and restoring window positions
 *
 * Provides D-Bus interface: org.greenhouse.WindowRestore
 *
 * Structured replies are compact JSON strings, the same shape the saved
 * positions use on disk. Window handles travel as decimal strings and are
 * only meaningful until the next enumeration.
 *
 * NOTE: Interface name must match DBus::Interface::WindowRestore.
 */
class GREENHOUSE_EXPORT WindowRestoreAdaptor : public QDBusAbstractAdaptor
{
    Q_OBJECT
    Q_CLASSINFO("D-Bus Interface", "org.greenhouse.WindowRestore")

public:
    WindowRestoreAdaptor(WindowEnumerator* enumerator, PositionStore* store, RestoreOrchestrator* orchestrator,
                         ITopologySource* topology, QObject* parent);
    ~WindowRestoreAdaptor() override = default;

    static QJsonObject identityToJson(const WindowIdentity& identity);
    static QJsonObject snapshotToJson(const WindowSnapshot& snapshot);
    static QJsonObject resultToJson(const RestoreResult& result);
    static QJsonObject reportToJson(const RestoreReport& report);

public Q_SLOTS:
    /**
     * @brief Visible windows right now, with handle and owning monitor
     * @return JSON array of {handle, processName, windowClass, title, x, y, width, height, monitorId}
     */
    QString listVisibleWindows();

    /**
     * @brief Save the positions of the given windows
     * @param handles Handles from a recent listVisibleWindows() reply
     * @return Number of positions saved; stale handles are skipped
     */
    int saveSelection(const QStringList& handles);

    /**
     * @brief Forget the saved position of one identity
     * @return true if a record was removed
     */
    bool removeSavedPosition(const QString& processName, const QString& windowClass, const QString& title);

    QString savedPositions();

    /**
     * @brief Identities whose last restore found no running window
     */
    QString pendingWindows();

    /**
     * @brief Restore every saved position
     * @return JSON report {results: [...], topologyFailed, cancelled}
     */
    QString restoreAll();

    /**
     * @brief Restore a single saved identity
     * @return JSON result, or empty if the identity is not saved or monitors could not be read
     */
    QString restoreWindow(const QString& processName, const QString& windowClass, const QString& title);

    void cancelRestore();

Q_SIGNALS:
    void positionsChanged();
    void pendingWindowsChanged();
    void restoreFinished(const QString& reportJson);

private:
    WindowEnumerator* m_enumerator;
    PositionStore* m_store;
    RestoreOrchestrator* m_orchestrator;
    ITopologySource* m_topology;
};

} // namespace Greenhouse
