// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "greenhouse_export.h"
#include "../core/interfaces.h"
#include <memory>

namespace Greenhouse {

struct X11Connection;

/**
 * @brief IWindowSystem over Xlib and EWMH
 *
 * Opens its own Xlib connection (separate from Qt's xcb one) so window
 * queries never interfere with Qt's event processing. All geometry is in
 * root-window pixels, the same native space ScreenManager reports monitor
 * bounds in.
 *
 * Xlib errors for vanished windows are trapped per call and turned into
 * failed queries or a false return from moveResize().
 */
class GREENHOUSE_EXPORT X11WindowSystem : public IWindowSystem
{
public:
    X11WindowSystem();
    ~X11WindowSystem() override;

    X11WindowSystem(const X11WindowSystem&) = delete;
    X11WindowSystem& operator=(const X11WindowSystem&) = delete;

    bool isAvailable() const override;
    QVector<NativeWindowInfo> windows() const override;
    bool isValid(WindowHandle handle) const override;
    bool moveResize(WindowHandle handle, const QRect& rect) override;

private:
    std::unique_ptr<X11Connection> m_connection;
};

} // namespace Greenhouse
