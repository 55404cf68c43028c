// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "windowmatcher.h"
#include "logging.h"
#include <algorithm>
#include <utility>
#include <vector>

namespace Greenhouse {

MatchResult WindowMatcher::match(const WindowIdentity& saved, const QVector<WindowSnapshot>& candidates,
                                 const QSet<WindowHandle>& excluded) const
{
    if (!saved.isValid()) {
        return MatchResult::none();
    }

    QVector<const WindowSnapshot*> sameProcessAndClass;
    QVector<const WindowSnapshot*> sameProcess;

    for (const WindowSnapshot& candidate : candidates) {
        if (excluded.contains(candidate.handle)) {
            continue;
        }
        const WindowIdentity& live = candidate.identity;
        if (live.processName != saved.processName) {
            continue;
        }
        sameProcess.append(&candidate);

        if (live.windowClass != saved.windowClass) {
            continue;
        }
        // Tier 1: first exact match in enumeration order
        if (live.titleHint == saved.titleHint) {
            return MatchResult{candidate.handle, MatchResult::Tier::ExactTitle};
        }
        sameProcessAndClass.append(&candidate);
    }

    // Tier 2: process + class, disambiguated by title overlap
    if (sameProcessAndClass.size() == 1) {
        return MatchResult{sameProcessAndClass.first()->handle, MatchResult::Tier::ProcessAndClass};
    }
    if (sameProcessAndClass.size() > 1) {
        const WindowSnapshot* best = nullptr;
        int bestScore = -1;
        for (const WindowSnapshot* candidate : std::as_const(sameProcessAndClass)) {
            const int score = titleOverlapScore(candidate->identity.titleHint, saved.titleHint);
            // Strictly greater keeps the first enumerated on ties
            if (score > bestScore) {
                bestScore = score;
                best = candidate;
            }
        }
        qCDebug(lcWindow) << "Ambiguous match for" << saved.toString() << "-" << sameProcessAndClass.size()
                          << "candidates, picked" << best->identity.titleHint << "score" << bestScore;
        return MatchResult{best->handle, MatchResult::Tier::ProcessAndClass};
    }

    // Tier 3: unique process name
    if (sameProcess.size() == 1) {
        return MatchResult{sameProcess.first()->handle, MatchResult::Tier::ProcessOnly};
    }

    return MatchResult::none();
}

int WindowMatcher::titleOverlapScore(const QString& a, const QString& b)
{
    if (a.isEmpty() || b.isEmpty()) {
        return 0;
    }

    const QString lhs = a.toCaseFolded();
    const QString rhs = b.toCaseFolded();

    // Longest common substring, two-row DP
    std::vector<int> previous(rhs.size() + 1, 0);
    std::vector<int> current(rhs.size() + 1, 0);
    int best = 0;
    for (int i = 1; i <= lhs.size(); ++i) {
        for (int j = 1; j <= rhs.size(); ++j) {
            if (lhs.at(i - 1) == rhs.at(j - 1)) {
                current[j] = previous[j - 1] + 1;
                best = std::max(best, current[j]);
            } else {
                current[j] = 0;
            }
        }
        std::swap(previous, current);
    }
    return best;
}

} // namespace Greenhouse
