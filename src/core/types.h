// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "greenhouse_export.h"
#include <QHash>
#include <QMetaType>
#include <QRect>
#include <QString>
#include <QVector>

namespace Greenhouse {

// ═══════════════════════════════════════════════════════════════════════════════
// Shared Types - value objects passed between enumerator, matcher, reconciler
// and store. None of them hold OS resources.
// ═══════════════════════════════════════════════════════════════════════════════

/**
 * @brief Opaque reference to a live top-level window
 *
 * Only valid inside the enumeration snapshot that produced it. Never persisted.
 */
using WindowHandle = quint64;

/**
 * @brief Stable fingerprint of a logical window across process restarts
 *
 * processName + windowClass are the primary keys; titleHint only disambiguates
 * between several windows of the same application.
 */
struct GREENHOUSE_EXPORT WindowIdentity
{
    QString processName;
    QString windowClass;
    QString titleHint;

    bool isValid() const
    {
        return !processName.isEmpty() || !windowClass.isEmpty();
    }

    bool operator==(const WindowIdentity& other) const
    {
        return processName == other.processName && windowClass == other.windowClass
            && titleHint == other.titleHint;
    }
    bool operator!=(const WindowIdentity& other) const
    {
        return !(*this == other);
    }

    /**
     * @brief Human-readable form for logs ("process/class \"title\"")
     */
    QString toString() const
    {
        return QStringLiteral("%1/%2 \"%3\"").arg(processName, windowClass, titleHint);
    }
};

inline size_t qHash(const WindowIdentity& identity, size_t seed = 0)
{
    return qHashMulti(seed, identity.processName, identity.windowClass, identity.titleHint);
}

/**
 * @brief One connected display
 *
 * bounds are in virtual-desktop (native pixel) coordinates; dpiScale is the
 * display scaling factor (1.0, 1.25, 2.0, ...).
 */
struct GREENHOUSE_EXPORT MonitorDescriptor
{
    QString id;
    QRect bounds;
    qreal dpiScale = 1.0;
    QString connector; ///< Output name (DP-1); not part of identity

    bool operator==(const MonitorDescriptor& other) const
    {
        return id == other.id && bounds == other.bounds && qFuzzyCompare(dpiScale, other.dpiScale);
    }
};

/**
 * @brief Ordered monitor list, OS enumeration order (primary first)
 *
 * Order is for iteration and the last-resort fallback only, never for identity.
 */
using Topology = QVector<MonitorDescriptor>;

/**
 * @brief Saved window rectangle together with the display context it was saved in
 *
 * A rect is meaningless without its monitor and scale: raw pixel coordinates
 * are not portable across DPI changes.
 */
struct GREENHOUSE_EXPORT WindowGeometry
{
    QRect rect;
    QString monitorId;
    qreal dpiScaleAtSave = 1.0;

    bool operator==(const WindowGeometry& other) const
    {
        return rect == other.rect && monitorId == other.monitorId
            && qFuzzyCompare(dpiScaleAtSave, other.dpiScaleAtSave);
    }
};

struct GREENHOUSE_EXPORT SavedPositionRecord
{
    WindowIdentity identity;
    WindowGeometry geometry;
};

/**
 * @brief One entry of a window enumeration pass
 */
struct GREENHOUSE_EXPORT WindowSnapshot
{
    WindowHandle handle = 0;
    WindowIdentity identity;
    QRect rect;
    QString monitorId; ///< Monitor with the largest share of the window, empty if none
};

/**
 * @brief Raw window data as reported by the window-system backend, before filtering
 */
struct GREENHOUSE_EXPORT NativeWindowInfo
{
    WindowHandle handle = 0;
    qint64 pid = 0;
    QString processName;
    QString windowClass;
    QString title;
    QRect frameGeometry;
    bool visible = true;
    bool minimized = false;
};

/**
 * @brief Per-record result of a restore attempt
 */
enum class RestoreOutcome {
    Restored,           ///< Matched, reconciled and applied
    NotFound,           ///< No live window matches; record stays pending
    ApplyFailed,        ///< Window system rejected the move/resize
    MonitorUnavailable  ///< No target monitor could be determined
};

GREENHOUSE_EXPORT QString restoreOutcomeToString(RestoreOutcome outcome);

struct GREENHOUSE_EXPORT RestoreResult
{
    WindowIdentity identity;
    RestoreOutcome outcome = RestoreOutcome::NotFound;
    QRect targetRect; ///< Rect that was (or would have been) applied; null unless reconciled
};

/**
 * @brief Result of a restore batch
 *
 * topologyFailed means the monitor query itself failed and no record was
 * attempted; cancelled means the caller stopped the batch between records.
 */
struct GREENHOUSE_EXPORT RestoreReport
{
    QVector<RestoreResult> results;
    bool topologyFailed = false;
    bool cancelled = false;

    int count(RestoreOutcome outcome) const
    {
        int n = 0;
        for (const RestoreResult& result : results) {
            if (result.outcome == outcome) {
                ++n;
            }
        }
        return n;
    }
};

} // namespace Greenhouse

Q_DECLARE_METATYPE(Greenhouse::RestoreResult)
Q_DECLARE_METATYPE(Greenhouse::RestoreReport)
