// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "geometryutils.h"
#include <QHash>
#include <QPoint>
#include <algorithm>
#include <limits>

namespace Greenhouse {

namespace GeometryUtils {

QRect snapToRect(const QRectF& rf)
{
    // Round each edge independently, then derive width/height from the
    // rounded edges. QRectF uses exclusive right/bottom: right = x + width.
    const int left = qRound(rf.x());
    const int top = qRound(rf.y());
    const int right = qRound(rf.x() + rf.width());
    const int bottom = qRound(rf.y() + rf.height());
    return QRect(left, top, std::max(0, right - left), std::max(0, bottom - top));
}

qint64 overlapArea(const QRect& a, const QRect& b)
{
    const QRect intersection = a.intersected(b);
    if (intersection.isEmpty()) {
        return 0;
    }
    return qint64(intersection.width()) * qint64(intersection.height());
}

QRect scaleAround(const QRect& rect, const QPoint& anchor, qreal factor)
{
    const QRectF local(rect.x() - anchor.x(), rect.y() - anchor.y(), rect.width(), rect.height());
    const QRectF scaled(local.x() * factor, local.y() * factor, local.width() * factor, local.height() * factor);
    return snapToRect(scaled.translated(anchor));
}

QRect clampToBounds(const QRect& rect, const QRect& bounds)
{
    if (!bounds.isValid()) {
        return rect;
    }

    const int width = std::min(rect.width(), bounds.width());
    const int height = std::min(rect.height(), bounds.height());

    // Exclusive edges, so a rect flush against the right edge ends at x + width == boundsRight
    const int boundsRight = bounds.x() + bounds.width();
    const int boundsBottom = bounds.y() + bounds.height();

    int x = rect.x();
    int y = rect.y();
    if (x + width > boundsRight) {
        x = boundsRight - width;
    }
    if (x < bounds.x()) {
        x = bounds.x();
    }
    if (y + height > boundsBottom) {
        y = boundsBottom - height;
    }
    if (y < bounds.y()) {
        y = bounds.y();
    }

    return QRect(x, y, width, height);
}

int monitorWithLargestOverlap(const QRect& rect, const Topology& topology)
{
    int best = -1;
    qint64 bestArea = 0;
    for (int i = 0; i < topology.size(); ++i) {
        const qint64 area = overlapArea(rect, topology.at(i).bounds);
        if (area > bestArea) {
            bestArea = area;
            best = i;
        }
    }
    return best;
}

int nearestMonitor(const QPoint& point, const Topology& topology)
{
    int nearest = -1;
    int minDistance = std::numeric_limits<int>::max();
    for (int i = 0; i < topology.size(); ++i) {
        const int distance = (topology.at(i).bounds.center() - point).manhattanLength();
        if (distance < minDistance) {
            minDistance = distance;
            nearest = i;
        }
    }
    return nearest;
}

int monitorIndexById(const QString& id, const Topology& topology)
{
    if (id.isEmpty()) {
        return -1;
    }
    for (int i = 0; i < topology.size(); ++i) {
        if (topology.at(i).id == id) {
            return i;
        }
    }
    return -1;
}

int makeMonitorIdsUnique(Topology& topology)
{
    QHash<QString, QVector<int>> groups;
    for (int i = 0; i < topology.size(); ++i) {
        groups[topology.at(i).id].append(i);
    }

    int changed = 0;
    for (auto it = groups.constBegin(); it != groups.constEnd(); ++it) {
        const QVector<int>& members = it.value();
        if (members.size() < 2) {
            continue;
        }

        QHash<QString, int> connectorUse;
        for (int index : members) {
            connectorUse[topology.at(index).connector] += 1;
        }

        int ordinal = 0;
        for (int index : members) {
            MonitorDescriptor& monitor = topology[index];
            ++ordinal;
            const bool usable = !monitor.connector.isEmpty() && connectorUse.value(monitor.connector) == 1;
            const QString suffix = usable ? monitor.connector : QString::number(ordinal);
            monitor.id = it.key() + QLatin1Char('/') + suffix;
            ++changed;
        }
    }
    return changed;
}

} // namespace GeometryUtils

} // namespace Greenhouse
