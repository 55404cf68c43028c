// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "greenhouse_export.h"
#include "types.h"
#include <QSet>
#include <QVector>
#include <optional>

namespace Greenhouse {

/**
 * @brief Outcome of matching one saved identity against live windows
 */
struct GREENHOUSE_EXPORT MatchResult
{
    /// Which rule of the cascade produced the match
    enum class Tier {
        None,
        ExactTitle,      ///< process + class + title
        ProcessAndClass, ///< process + class, title used only as tie-break
        ProcessOnly      ///< unique process name
    };

    std::optional<WindowHandle> handle;
    Tier tier = Tier::None;

    bool isMatch() const
    {
        return handle.has_value();
    }

    static MatchResult none()
    {
        return MatchResult{};
    }
};

/**
 * @brief Finds the live window that best corresponds to a saved identity
 *
 * Cascade, first rule that yields a window wins:
 *   1. exact (processName, windowClass, titleHint), first enumerated
 *   2. (processName, windowClass): unique candidate, or highest title overlap
 *      score with titleHint among several (tie -> first enumerated)
 *   3. processName alone when exactly one candidate has it
 *   4. none
 *
 * Titles are the most specific but least stable signal, process+class is
 * stable but ambiguous for multi-window apps; the cascade trades one for the
 * other. Stateless; candidates are taken in enumeration order.
 */
class GREENHOUSE_EXPORT WindowMatcher
{
public:
    /**
     * @brief Match a saved identity against a snapshot
     * @param saved Identity from a SavedPositionRecord
     * @param candidates Current enumeration, in enumeration order
     * @param excluded Handles already claimed by another record in the same batch
     */
    MatchResult match(const WindowIdentity& saved, const QVector<WindowSnapshot>& candidates,
                      const QSet<WindowHandle>& excluded = {}) const;

    /**
     * @brief Similarity of two titles for the process+class tie-break
     * @return Length of the longest common substring, compared case-insensitively
     */
    static int titleOverlapScore(const QString& a, const QString& b);
};

} // namespace Greenhouse
