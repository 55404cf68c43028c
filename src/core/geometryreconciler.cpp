// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "geometryreconciler.h"
#include "geometryutils.h"
#include "logging.h"

namespace Greenhouse {

namespace {

bool sameScale(qreal a, qreal b)
{
    return qFuzzyCompare(a, b);
}

qreal scaleFactor(qreal currentScale, qreal savedScale)
{
    if (savedScale <= 0.0 || currentScale <= 0.0) {
        return 1.0;
    }
    return currentScale / savedScale;
}

} // namespace

ReconcileResult GeometryReconciler::reconcile(const WindowGeometry& saved, const Topology& topology) const
{
    if (topology.isEmpty()) {
        qCWarning(lcRestore) << "Cannot reconcile geometry - topology has no monitors";
        return ReconcileResult::noMonitors();
    }

    ReconcileResult result;
    result.status = ReconcileResult::Status::Ok;

    const int savedIndex = GeometryUtils::monitorIndexById(saved.monitorId, topology);
    int targetIndex = savedIndex;
    QRect rect = saved.rect;

    if (savedIndex >= 0) {
        const MonitorDescriptor& monitor = topology.at(savedIndex);
        if (sameScale(monitor.dpiScale, saved.dpiScaleAtSave)) {
            result.strategy = ReconcileResult::Strategy::Unchanged;
        } else {
            const qreal factor = scaleFactor(monitor.dpiScale, saved.dpiScaleAtSave);
            rect = GeometryUtils::scaleAround(rect, monitor.bounds.topLeft(), factor);
            result.strategy = ReconcileResult::Strategy::Rescaled;
            qCDebug(lcRestore) << "Rescaled" << saved.rect << "by" << factor << "on" << monitor.id << "->" << rect;
        }
    } else {
        targetIndex = GeometryUtils::monitorWithLargestOverlap(saved.rect, topology);
        if (targetIndex >= 0) {
            result.strategy = ReconcileResult::Strategy::FallbackOverlap;
        } else {
            targetIndex = 0;
            result.strategy = ReconcileResult::Strategy::FallbackPrimary;
        }

        const MonitorDescriptor& monitor = topology.at(targetIndex);
        if (!sameScale(monitor.dpiScale, saved.dpiScaleAtSave)) {
            // Position is kept; only the size follows the new scale
            const qreal factor = scaleFactor(monitor.dpiScale, saved.dpiScaleAtSave);
            rect = GeometryUtils::scaleAround(rect, rect.topLeft(), factor);
        }
        qCDebug(lcRestore) << "Monitor" << saved.monitorId << "not present, falling back to" << monitor.id;
    }

    const MonitorDescriptor& target = topology.at(targetIndex);
    result.rect = GeometryUtils::clampToBounds(rect, target.bounds);
    result.monitorId = target.id;
    return result;
}

} // namespace Greenhouse
