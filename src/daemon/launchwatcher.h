// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "greenhouse_export.h"
#include "../core/types.h"
#include "../core/windowmatcher.h"
#include <QObject>
#include <QSet>
#include <QTimer>

namespace Greenhouse {

class PositionStore;
class RestoreOrchestrator;
class WindowEnumerator;

/**
 * @brief Restores saved positions when their application opens a window
 *
 * Polls the enumerator on a timer. A handle not seen in the previous poll
 * is a newly opened window. Every saved record is matched against the new
 * windows, pending identities first, and a match is restored onto that new
 * window through the orchestrator. Windows already open when the watcher
 * starts are never treated as launches, and never moved by it.
 */
class GREENHOUSE_EXPORT LaunchWatcher : public QObject
{
    Q_OBJECT

public:
    LaunchWatcher(RestoreOrchestrator* orchestrator, WindowEnumerator* enumerator, PositionStore* store,
                  QObject* parent = nullptr);
    ~LaunchWatcher() override;

    void setInterval(int intervalMs);
    int interval() const
    {
        return m_timer.interval();
    }

    void start();
    void stop();
    bool isActive() const
    {
        return m_timer.isActive();
    }

    /**
     * @brief Run one detection pass now
     * @return Number of identities restored in this pass
     */
    int poll();

Q_SIGNALS:
    void launchRestored(const Greenhouse::RestoreResult& result);

private:
    RestoreOrchestrator* m_orchestrator;
    WindowEnumerator* m_enumerator;
    PositionStore* m_store;
    WindowMatcher m_matcher;
    QTimer m_timer;
    QSet<WindowHandle> m_seen;
};

} // namespace Greenhouse
