// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "platform.h"
#include <QGuiApplication>

namespace Greenhouse {

namespace Platform {

bool isWayland()
{
    if (!qEnvironmentVariableIsEmpty("WAYLAND_DISPLAY")) {
        return true;
    }

    const QString sessionType = qEnvironmentVariable("XDG_SESSION_TYPE");
    if (sessionType.compare(QLatin1String("wayland"), Qt::CaseInsensitive) == 0) {
        return true;
    }

    if (const auto* app = qGuiApp) {
        return app->platformName().contains(QLatin1String("wayland"), Qt::CaseInsensitive);
    }

    return false;
}

bool isX11()
{
    if (qEnvironmentVariableIsEmpty("DISPLAY")) {
        return false;
    }
    if (const auto* app = qGuiApp) {
        if (app->platformName() == QLatin1String("xcb")) {
            return true;
        }
    }
    return !isWayland();
}

QString displayServer()
{
    if (isX11()) {
        return QStringLiteral("x11");
    }
    if (isWayland()) {
        return QStringLiteral("wayland");
    }
    return QStringLiteral("unknown");
}

} // namespace Platform

} // namespace Greenhouse
