// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "greenhouse_export.h"
#include <QDBusAbstractAdaptor>
#include <QObject>

namespace Greenhouse {

class ScreenManager;

/**
 * @brief D-Bus adaptor for monitor topology queries
 *
 * Provides D-Bus interface: org.greenhouse.Screen
 *
 * NOTE: Interface name must match DBus::Interface::Screen.
 */
class GREENHOUSE_EXPORT ScreenAdaptor : public QDBusAbstractAdaptor
{
    Q_OBJECT
    Q_CLASSINFO("D-Bus Interface", "org.greenhouse.Screen")

public:
    ScreenAdaptor(ScreenManager* screenManager, QObject* parent);
    ~ScreenAdaptor() override = default;

public Q_SLOTS:
    /**
     * @brief Monitors as the restore pipeline sees them, primary first
     * @return JSON array of {id, x, y, width, height, dpiScale}; empty if unreadable
     */
    QString currentTopology();
    int getScreenCount();

Q_SIGNALS:
    void topologyChanged();

private:
    ScreenManager* m_screenManager;
};

} // namespace Greenhouse
