// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "greenhouse_export.h"
#include "types.h"
#include <QRect>
#include <QRectF>

namespace Greenhouse {

/**
 * @brief Centralized geometry calculation utilities
 *
 * Pure functions over QRect and Topology, shared by the enumerator,
 * reconciler and tests.
 */
namespace GeometryUtils {

/**
 * @brief Convert QRectF to QRect with edge-consistent rounding
 * @param rf Source floating-point rectangle
 * @return Integer rectangle with consistent edge rounding
 *
 * Unlike QRectF::toRect() which rounds x, y, width, height independently,
 * this rounds the edges (left, top, right, bottom) and derives width/height
 * from the rounded edges, so a window scaled by an exact factor keeps the
 * exact factor on both position and size.
 */
GREENHOUSE_EXPORT QRect snapToRect(const QRectF& rf);

/**
 * @brief Area of the intersection of two rectangles, 0 if they don't intersect
 *
 * Returned as qint64 since two 8K monitors side by side already overflow int
 * on a full-desktop rect.
 */
GREENHOUSE_EXPORT qint64 overlapArea(const QRect& a, const QRect& b);

/**
 * @brief Scale a rectangle about an anchor point
 * @param rect Rectangle in global coordinates
 * @param anchor Fixed point of the transform (usually a monitor origin)
 * @param factor Scale factor applied to both offset-from-anchor and size
 *
 * Translates into anchor-local coordinates, scales, translates back.
 */
GREENHOUSE_EXPORT QRect scaleAround(const QRect& rect, const QPoint& anchor, qreal factor);

/**
 * @brief Clamp a rectangle so it lies fully within bounds
 * @param rect Rectangle to clamp
 * @param bounds Containing rectangle (a monitor)
 * @return Rectangle inside bounds
 *
 * Size is preserved unless it exceeds bounds, in which case it is capped to
 * the bounds' size; the position is then shifted the minimum amount.
 */
GREENHOUSE_EXPORT QRect clampToBounds(const QRect& rect, const QRect& bounds);

/**
 * @brief Index of the monitor with the largest overlap with rect
 * @return Index into topology, or -1 if rect overlaps no monitor
 *
 * Ties keep the earliest monitor in topology order.
 */
GREENHOUSE_EXPORT int monitorWithLargestOverlap(const QRect& rect, const Topology& topology);

/**
 * @brief Index of the monitor whose center is closest to point
 * @return Index into topology, or -1 if topology is empty
 */
GREENHOUSE_EXPORT int nearestMonitor(const QPoint& point, const Topology& topology);

/**
 * @brief Index of the monitor with the given id
 * @return Index into topology, or -1 if absent
 */
GREENHOUSE_EXPORT int monitorIndexById(const QString& id, const Topology& topology);

/**
 * @brief Make every monitor id in topology unique
 *
 * Identical monitors without EDID serials share "manufacturer:model". Each
 * monitor in such a group gets its connector appended ("DEL:U2415/DP-2"),
 * or its ordinal within the group when the connector is unknown or repeated.
 * Ids that are already unique are left alone.
 *
 * @return Number of ids changed
 */
GREENHOUSE_EXPORT int makeMonitorIdsUnique(Topology& topology);

} // namespace GeometryUtils

} // namespace Greenhouse
