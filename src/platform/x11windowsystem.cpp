// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "x11windowsystem.h"
#include "../core/logging.h"
#include "../core/platform.h"
#include "../core/utils.h"

// Xlib defines macros (None, Bool, Status, ...) that clash with Qt; keep it last
#include <X11/Xatom.h>
#include <X11/Xlib.h>
#include <X11/Xutil.h>

#include <cstring>
#include <optional>

namespace Greenhouse {

namespace {

// Upper bound for list properties; far above any real client count
constexpr long MaxPropertyItems = 0x10000;

// _NET_MOVERESIZE_WINDOW flags: x, y, width, height present; source = pager
constexpr long MoveResizeFlags = (1L << 8) | (1L << 9) | (1L << 10) | (1L << 11) | (2L << 12);

// _NET_WM_STATE actions
constexpr long StateRemove = 0;

struct DisplayDeleter
{
    void operator()(Display* display) const
    {
        if (display) {
            XCloseDisplay(display);
        }
    }
};

/**
 * @brief Records Xlib errors instead of letting the default handler exit
 *
 * Installed for the duration of one backend call. Not reentrant.
 */
class XErrorTrap
{
public:
    explicit XErrorTrap(Display* display)
        : m_display(display)
    {
        XSync(m_display, False);
        s_errorCode = 0;
        m_previous = XSetErrorHandler(&XErrorTrap::handler);
    }

    ~XErrorTrap()
    {
        XSync(m_display, False);
        XSetErrorHandler(m_previous);
    }

    void reset()
    {
        XSync(m_display, False);
        s_errorCode = 0;
    }

    bool failed() const
    {
        XSync(m_display, False);
        return s_errorCode != 0;
    }

    int errorCode() const
    {
        return s_errorCode;
    }

private:
    static int handler(Display*, XErrorEvent* event)
    {
        s_errorCode = event->error_code;
        return 0;
    }

    static inline int s_errorCode = 0;
    Display* m_display = nullptr;
    XErrorHandler m_previous = nullptr;
};

struct FrameExtents
{
    int left = 0;
    int right = 0;
    int top = 0;
    int bottom = 0;
};

} // namespace

struct X11Connection
{
    std::unique_ptr<Display, DisplayDeleter> display;
    Window root = 0;

    Atom netSupported = 0;
    Atom netClientList = 0;
    Atom netWmPid = 0;
    Atom netWmName = 0;
    Atom utf8String = 0;
    Atom netFrameExtents = 0;
    Atom netWmState = 0;
    Atom netWmStateHidden = 0;
    Atom netWmStateMaximizedHorz = 0;
    Atom netWmStateMaximizedVert = 0;
    Atom netWmStateFullscreen = 0;
    Atom netWmWindowType = 0;
    Atom netWmWindowTypeDock = 0;
    Atom netWmWindowTypeDesktop = 0;
    Atom netMoveResizeWindow = 0;

    Display* dpy() const
    {
        return display.get();
    }

    Atom intern(const char* name) const
    {
        return XInternAtom(display.get(), name, False);
    }

    /// 32-bit format property as a list of longs (Xlib widens them)
    QVector<unsigned long> readLongs(Window window, Atom property, Atom type, long maxItems) const
    {
        QVector<unsigned long> values;
        Atom actualType = 0;
        int actualFormat = 0;
        unsigned long nItems = 0;
        unsigned long bytesAfter = 0;
        unsigned char* data = nullptr;

        if (XGetWindowProperty(dpy(), window, property, 0, maxItems, False, type, &actualType, &actualFormat,
                               &nItems, &bytesAfter, &data)
            != Success) {
            return values;
        }
        if (data && actualFormat == 32) {
            const auto* items = reinterpret_cast<const unsigned long*>(data);
            values.reserve(static_cast<int>(nItems));
            for (unsigned long i = 0; i < nItems; ++i) {
                values.append(items[i]);
            }
        }
        if (data) {
            XFree(data);
        }
        return values;
    }

    QString readUtf8(Window window, Atom property) const
    {
        Atom actualType = 0;
        int actualFormat = 0;
        unsigned long nItems = 0;
        unsigned long bytesAfter = 0;
        unsigned char* data = nullptr;

        QString result;
        if (XGetWindowProperty(dpy(), window, property, 0, MaxPropertyItems, False, utf8String, &actualType,
                               &actualFormat, &nItems, &bytesAfter, &data)
            == Success
            && data && actualFormat == 8) {
            result = QString::fromUtf8(reinterpret_cast<const char*>(data), static_cast<int>(nItems));
        }
        if (data) {
            XFree(data);
        }
        return result;
    }

    QString readTitle(Window window) const
    {
        QString title = readUtf8(window, netWmName);
        if (!title.isEmpty()) {
            return title;
        }
        char* name = nullptr;
        if (XFetchName(dpy(), window, &name) && name) {
            title = QString::fromLocal8Bit(name);
            XFree(name);
        }
        return title;
    }

    QString readClass(Window window) const
    {
        QString windowClass;
        XClassHint hint{};
        if (XGetClassHint(dpy(), window, &hint)) {
            if (hint.res_class) {
                windowClass = QString::fromLocal8Bit(hint.res_class);
                XFree(hint.res_class);
            }
            if (hint.res_name) {
                XFree(hint.res_name);
            }
        }
        return windowClass;
    }

    FrameExtents readFrameExtents(Window window) const
    {
        FrameExtents extents;
        const QVector<unsigned long> values = readLongs(window, netFrameExtents, XA_CARDINAL, 4);
        if (values.size() >= 4) {
            extents.left = static_cast<int>(values.at(0));
            extents.right = static_cast<int>(values.at(1));
            extents.top = static_cast<int>(values.at(2));
            extents.bottom = static_cast<int>(values.at(3));
        }
        return extents;
    }

    bool supports(Atom feature) const
    {
        return readLongs(root, netSupported, XA_ATOM, MaxPropertyItems).contains(feature);
    }

    void sendRootMessage(Window window, Atom messageType, const long (&data)[5]) const
    {
        XEvent event;
        std::memset(&event, 0, sizeof(event));
        event.xclient.type = ClientMessage;
        event.xclient.send_event = True;
        event.xclient.display = dpy();
        event.xclient.window = window;
        event.xclient.message_type = messageType;
        event.xclient.format = 32;
        for (int i = 0; i < 5; ++i) {
            event.xclient.data.l[i] = data[i];
        }
        XSendEvent(dpy(), root, False, SubstructureRedirectMask | SubstructureNotifyMask, &event);
    }

    std::optional<NativeWindowInfo> describe(Window window) const
    {
        XWindowAttributes attrs;
        if (!XGetWindowAttributes(dpy(), window, &attrs)) {
            return std::nullopt;
        }

        NativeWindowInfo info;
        info.handle = static_cast<WindowHandle>(window);
        info.visible = attrs.map_state == IsViewable;

        const QVector<unsigned long> pid = readLongs(window, netWmPid, XA_CARDINAL, 1);
        if (!pid.isEmpty()) {
            info.pid = static_cast<qint64>(pid.constFirst());
            info.processName = Utils::processNameForPid(info.pid);
        }
        info.windowClass = readClass(window);
        info.title = readTitle(window);

        const QVector<unsigned long> states = readLongs(window, netWmState, XA_ATOM, MaxPropertyItems);
        info.minimized = states.contains(netWmStateHidden);

        // Panels and the desktop are clients too, but never ours to move
        const QVector<unsigned long> types = readLongs(window, netWmWindowType, XA_ATOM, MaxPropertyItems);
        if (types.contains(netWmWindowTypeDock) || types.contains(netWmWindowTypeDesktop)) {
            info.visible = false;
        }

        int rootX = 0;
        int rootY = 0;
        Window child = 0;
        if (!XTranslateCoordinates(dpy(), window, root, 0, 0, &rootX, &rootY, &child)) {
            return std::nullopt;
        }
        const FrameExtents extents = readFrameExtents(window);
        info.frameGeometry = QRect(rootX - extents.left, rootY - extents.top,
                                   attrs.width + extents.left + extents.right,
                                   attrs.height + extents.top + extents.bottom);
        return info;
    }
};

X11WindowSystem::X11WindowSystem()
{
    if (!Platform::isX11()) {
        qCWarning(lcWindow) << "Window placement needs X11, running on" << Platform::displayServer()
                            << "- window restore disabled";
        return;
    }

    Display* display = XOpenDisplay(nullptr);
    if (!display) {
        qCWarning(lcWindow) << "Cannot open X display" << qEnvironmentVariable("DISPLAY");
        return;
    }

    auto connection = std::make_unique<X11Connection>();
    connection->display.reset(display);
    connection->root = DefaultRootWindow(display);
    connection->netSupported = connection->intern("_NET_SUPPORTED");
    connection->netClientList = connection->intern("_NET_CLIENT_LIST");
    connection->netWmPid = connection->intern("_NET_WM_PID");
    connection->netWmName = connection->intern("_NET_WM_NAME");
    connection->utf8String = connection->intern("UTF8_STRING");
    connection->netFrameExtents = connection->intern("_NET_FRAME_EXTENTS");
    connection->netWmState = connection->intern("_NET_WM_STATE");
    connection->netWmStateHidden = connection->intern("_NET_WM_STATE_HIDDEN");
    connection->netWmStateMaximizedHorz = connection->intern("_NET_WM_STATE_MAXIMIZED_HORZ");
    connection->netWmStateMaximizedVert = connection->intern("_NET_WM_STATE_MAXIMIZED_VERT");
    connection->netWmStateFullscreen = connection->intern("_NET_WM_STATE_FULLSCREEN");
    connection->netWmWindowType = connection->intern("_NET_WM_WINDOW_TYPE");
    connection->netWmWindowTypeDock = connection->intern("_NET_WM_WINDOW_TYPE_DOCK");
    connection->netWmWindowTypeDesktop = connection->intern("_NET_WM_WINDOW_TYPE_DESKTOP");
    connection->netMoveResizeWindow = connection->intern("_NET_MOVERESIZE_WINDOW");
    m_connection = std::move(connection);

    qCInfo(lcWindow) << "X11 window system ready on" << DisplayString(display);
}

X11WindowSystem::~X11WindowSystem() = default;

bool X11WindowSystem::isAvailable() const
{
    return m_connection != nullptr;
}

QVector<NativeWindowInfo> X11WindowSystem::windows() const
{
    QVector<NativeWindowInfo> result;
    if (!isAvailable()) {
        return result;
    }

    const X11Connection& x = *m_connection;
    XErrorTrap trap(x.dpy());

    const QVector<unsigned long> clients = x.readLongs(x.root, x.netClientList, XA_WINDOW, MaxPropertyItems);
    if (clients.isEmpty()) {
        qCDebug(lcWindow) << "_NET_CLIENT_LIST is empty or missing - no EWMH window manager?";
        return result;
    }

    result.reserve(clients.size());
    for (unsigned long client : clients) {
        trap.reset();
        const std::optional<NativeWindowInfo> info = x.describe(static_cast<Window>(client));
        if (trap.failed() || !info) {
            qCDebug(lcWindow) << "Window" << client << "vanished during enumeration";
            continue;
        }
        result.append(*info);
    }
    return result;
}

bool X11WindowSystem::isValid(WindowHandle handle) const
{
    if (!isAvailable() || handle == 0) {
        return false;
    }

    const X11Connection& x = *m_connection;
    XErrorTrap trap(x.dpy());
    XWindowAttributes attrs;
    const bool ok = XGetWindowAttributes(x.dpy(), static_cast<Window>(handle), &attrs) != 0;
    return ok && !trap.failed();
}

bool X11WindowSystem::moveResize(WindowHandle handle, const QRect& rect)
{
    if (!isAvailable() || handle == 0 || rect.width() <= 0 || rect.height() <= 0) {
        return false;
    }

    const X11Connection& x = *m_connection;
    const auto window = static_cast<Window>(handle);
    XErrorTrap trap(x.dpy());

    // rect is the frame; the client area excludes the decorations
    const FrameExtents extents = x.readFrameExtents(window);
    const int clientWidth = qMax(1, rect.width() - extents.left - extents.right);
    const int clientHeight = qMax(1, rect.height() - extents.top - extents.bottom);

    if (x.supports(x.netMoveResizeWindow)) {
        // Window managers ignore geometry requests for maximized or fullscreen windows
        const long unmaximize[5] = {StateRemove, static_cast<long>(x.netWmStateMaximizedHorz),
                                    static_cast<long>(x.netWmStateMaximizedVert), 2, 0};
        x.sendRootMessage(window, x.netWmState, unmaximize);
        const long unfullscreen[5] = {StateRemove, static_cast<long>(x.netWmStateFullscreen), 0, 2, 0};
        x.sendRootMessage(window, x.netWmState, unfullscreen);

        // NorthWest gravity: x/y address the frame's top-left corner
        const long geometry[5] = {NorthWestGravity | MoveResizeFlags, rect.x(), rect.y(), clientWidth, clientHeight};
        x.sendRootMessage(window, x.netMoveResizeWindow, geometry);
    } else {
        qCDebug(lcWindow) << "No EWMH move/resize support - configuring window directly";
        XMoveResizeWindow(x.dpy(), window, rect.x(), rect.y(), static_cast<unsigned int>(clientWidth),
                          static_cast<unsigned int>(clientHeight));
    }
    XFlush(x.dpy());

    if (trap.failed()) {
        qCWarning(lcWindow) << "X error" << trap.errorCode() << "moving window" << handle;
        return false;
    }
    return true;
}

} // namespace Greenhouse
