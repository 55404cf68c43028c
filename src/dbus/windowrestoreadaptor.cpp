// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "windowrestoreadaptor.h"
#include "../core/constants.h"
#include "../core/interfaces.h"
#include "../core/logging.h"
#include "../core/positionpersistence.h"
#include "../core/positionstore.h"
#include "../core/restoreorchestrator.h"
#include "../core/utils.h"
#include "../core/windowenumerator.h"
#include <QHash>
#include <QJsonDocument>

namespace Greenhouse {

namespace {
QString toCompactJson(const QJsonObject& obj)
{
    return QString::fromUtf8(QJsonDocument(obj).toJson(QJsonDocument::Compact));
}

QString toCompactJson(const QJsonArray& array)
{
    return QString::fromUtf8(QJsonDocument(array).toJson(QJsonDocument::Compact));
}
}

WindowRestoreAdaptor::WindowRestoreAdaptor(WindowEnumerator* enumerator, PositionStore* store,
                                           RestoreOrchestrator* orchestrator, ITopologySource* topology,
                                           QObject* parent)
    : QDBusAbstractAdaptor(parent)
    , m_enumerator(enumerator)
    , m_store(store)
    , m_orchestrator(orchestrator)
    , m_topology(topology)
{
    Q_ASSERT(enumerator);
    Q_ASSERT(store);
    Q_ASSERT(orchestrator);
    Q_ASSERT(topology);

    connect(m_store, &PositionStore::changed, this, &WindowRestoreAdaptor::positionsChanged);
    connect(m_orchestrator, &RestoreOrchestrator::pendingChanged, this, &WindowRestoreAdaptor::pendingWindowsChanged);
    connect(m_orchestrator, &RestoreOrchestrator::batchFinished, this, [this](const RestoreReport& report) {
        Q_EMIT restoreFinished(toCompactJson(reportToJson(report)));
    });
}

QJsonObject WindowRestoreAdaptor::identityToJson(const WindowIdentity& identity)
{
    QJsonObject obj;
    obj[JsonKeys::ProcessName] = identity.processName;
    obj[JsonKeys::WindowClass] = identity.windowClass;
    obj[JsonKeys::Title] = identity.titleHint;
    return obj;
}

QJsonObject WindowRestoreAdaptor::snapshotToJson(const WindowSnapshot& snapshot)
{
    QJsonObject obj = identityToJson(snapshot.identity);
    obj[JsonKeys::Handle] = Utils::handleToString(snapshot.handle);
    obj[JsonKeys::X] = snapshot.rect.x();
    obj[JsonKeys::Y] = snapshot.rect.y();
    obj[JsonKeys::Width] = snapshot.rect.width();
    obj[JsonKeys::Height] = snapshot.rect.height();
    obj[JsonKeys::MonitorId] = snapshot.monitorId;
    return obj;
}

QJsonObject WindowRestoreAdaptor::resultToJson(const RestoreResult& result)
{
    QJsonObject obj = identityToJson(result.identity);
    obj[JsonKeys::Outcome] = restoreOutcomeToString(result.outcome);
    if (!result.targetRect.isNull()) {
        obj[JsonKeys::X] = result.targetRect.x();
        obj[JsonKeys::Y] = result.targetRect.y();
        obj[JsonKeys::Width] = result.targetRect.width();
        obj[JsonKeys::Height] = result.targetRect.height();
    }
    return obj;
}

QJsonObject WindowRestoreAdaptor::reportToJson(const RestoreReport& report)
{
    QJsonArray results;
    for (const RestoreResult& result : report.results) {
        results.append(resultToJson(result));
    }
    QJsonObject obj;
    obj[JsonKeys::Results] = results;
    obj[JsonKeys::TopologyFailed] = report.topologyFailed;
    obj[JsonKeys::Cancelled] = report.cancelled;
    return obj;
}

QString WindowRestoreAdaptor::listVisibleWindows()
{
    QJsonArray array;
    const QVector<WindowSnapshot> windows = m_enumerator->listVisibleWindows();
    for (const WindowSnapshot& snapshot : windows) {
        array.append(snapshotToJson(snapshot));
    }
    return toCompactJson(array);
}

int WindowRestoreAdaptor::saveSelection(const QStringList& handles)
{
    if (handles.isEmpty()) {
        qCDebug(lcDbus) << "saveSelection called with no handles";
        return 0;
    }

    // Topology is re-read per save so monitor ids and scales match this moment
    const std::optional<Topology> topology = m_topology->readTopology();
    if (!topology) {
        qCWarning(lcDbus) << "Cannot save positions - topology read failed";
        return 0;
    }

    const QVector<WindowSnapshot> windows = m_enumerator->listVisibleWindows(*topology);
    QHash<WindowHandle, int> byHandle;
    for (int i = 0; i < windows.size(); ++i) {
        byHandle.insert(windows.at(i).handle, i);
    }

    int saved = 0;
    for (const QString& text : handles) {
        const std::optional<WindowHandle> handle = Utils::parseHandle(text);
        if (!handle) {
            qCWarning(lcDbus) << "saveSelection: invalid handle" << text;
            continue;
        }
        auto it = byHandle.constFind(*handle);
        if (it == byHandle.constEnd()) {
            qCDebug(lcDbus) << "saveSelection: window" << text << "is no longer listed";
            continue;
        }
        const WindowSnapshot& snapshot = windows.at(it.value());
        if (!snapshot.identity.isValid()) {
            qCWarning(lcDbus) << "saveSelection: window" << text << "has no process or class";
            continue;
        }
        m_store->save(snapshot.identity, WindowEnumerator::captureGeometry(snapshot, *topology));
        ++saved;
    }

    qCInfo(lcDbus) << "Saved" << saved << "of" << handles.size() << "selected windows";
    return saved;
}

bool WindowRestoreAdaptor::removeSavedPosition(const QString& processName, const QString& windowClass,
                                               const QString& title)
{
    const WindowIdentity identity{processName, windowClass, title};
    m_orchestrator->clearPending(identity);
    if (!m_store->remove(identity)) {
        qCDebug(lcDbus) << "No saved position to remove for" << identity.toString();
        return false;
    }
    return true;
}

QString WindowRestoreAdaptor::savedPositions()
{
    return PositionPersistence::recordsToJson(m_store->all());
}

QString WindowRestoreAdaptor::pendingWindows()
{
    QJsonArray array;
    const QVector<WindowIdentity> pending = m_orchestrator->pendingIdentities();
    for (const WindowIdentity& identity : pending) {
        array.append(identityToJson(identity));
    }
    return toCompactJson(array);
}

QString WindowRestoreAdaptor::restoreAll()
{
    return toCompactJson(reportToJson(m_orchestrator->restoreAll(*m_store)));
}

QString WindowRestoreAdaptor::restoreWindow(const QString& processName, const QString& windowClass,
                                            const QString& title)
{
    const WindowIdentity identity{processName, windowClass, title};
    const std::optional<RestoreResult> result = m_orchestrator->restoreIdentity(identity, *m_store);
    if (!result) {
        qCWarning(lcDbus) << "Cannot restore" << identity.toString();
        return QString();
    }
    return toCompactJson(resultToJson(*result));
}

void WindowRestoreAdaptor::cancelRestore()
{
    m_orchestrator->requestCancel();
}

} // namespace Greenhouse
