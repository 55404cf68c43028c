// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "greenhouse_export.h"
#include <QString>

namespace Greenhouse {

/**
 * @brief Display server detection
 *
 * Window moving is only possible where the display server lets a client
 * place other clients' windows, which rules out Wayland.
 */
namespace Platform {

/**
 * @brief Check if running on Wayland
 * @return true if WAYLAND_DISPLAY, XDG_SESSION_TYPE or the Qt platform say so
 */
GREENHOUSE_EXPORT bool isWayland();

/**
 * @brief Check if running on X11
 * @return true if DISPLAY is set and not Wayland
 */
GREENHOUSE_EXPORT bool isX11();

/**
 * @brief Get the display server name
 * @return "wayland", "x11", or "unknown"
 */
GREENHOUSE_EXPORT QString displayServer();

} // namespace Platform

} // namespace Greenhouse
