// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "greenhouse_export.h"
#include "types.h"
#include <QRect>
#include <QString>

namespace Greenhouse {

/**
 * @brief Result of reconciling a saved geometry against the current topology
 */
struct GREENHOUSE_EXPORT ReconcileResult
{
    enum class Status {
        Ok,
        NoMonitorsAvailable
    };

    /// How the target monitor was chosen
    enum class Strategy {
        None,            ///< No monitor (status != Ok)
        Unchanged,       ///< Saved monitor present at the saved scale
        Rescaled,        ///< Saved monitor present, scale changed
        FallbackOverlap, ///< Saved monitor gone, largest-overlap monitor used
        FallbackPrimary  ///< Saved monitor gone and no overlap, first monitor used
    };

    Status status = Status::NoMonitorsAvailable;
    Strategy strategy = Strategy::None;
    QRect rect;
    QString monitorId;

    bool isValid() const
    {
        return status == Status::Ok;
    }

    static ReconcileResult noMonitors()
    {
        return ReconcileResult{};
    }
};

/**
 * @brief Computes where a saved window should go under current display conditions
 *
 * Handles DPI rescale about the monitor origin, monitor disappearance
 * (largest-overlap then first-monitor fallback), and clamps the result so it
 * lies fully within the chosen monitor. Stateless.
 */
class GREENHOUSE_EXPORT GeometryReconciler
{
public:
    /**
     * @brief Reconcile a saved geometry against a freshly read topology
     * @param saved Rect plus the monitor id and scale it was saved under
     * @param topology Current monitors, primary first
     * @return Target rect and monitor, or NoMonitorsAvailable for an empty topology
     */
    ReconcileResult reconcile(const WindowGeometry& saved, const Topology& topology) const;
};

} // namespace Greenhouse
