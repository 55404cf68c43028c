// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <QLatin1String>

namespace Greenhouse {

/**
 * @brief Core module constants that can't depend on config
 *
 * User-configurable defaults live in greenhouse.kcfg (see ConfigDefaults).
 */
namespace Defaults {
// Debounce between a store mutation and the KConfig write
constexpr int SaveDebounceMs = 500;
// Debounce for coalescing QScreen change notifications into one topologyChanged()
constexpr int TopologyDebounceMs = 100;
// Scale used when a screen reports a non-positive device pixel ratio
constexpr qreal FallbackDpiScale = 1.0;
}

/**
 * @brief JSON keys shared by persistence and the D-Bus facade
 */
namespace JsonKeys {
inline constexpr QLatin1String ProcessName{"processName"};
inline constexpr QLatin1String WindowClass{"windowClass"};
inline constexpr QLatin1String Title{"title"};
inline constexpr QLatin1String Handle{"handle"};
inline constexpr QLatin1String X{"x"};
inline constexpr QLatin1String Y{"y"};
inline constexpr QLatin1String Width{"width"};
inline constexpr QLatin1String Height{"height"};
inline constexpr QLatin1String MonitorId{"monitorId"};
inline constexpr QLatin1String DpiScale{"dpiScale"};
inline constexpr QLatin1String Id{"id"};
inline constexpr QLatin1String Outcome{"outcome"};
inline constexpr QLatin1String Results{"results"};
inline constexpr QLatin1String TopologyFailed{"topologyFailed"};
inline constexpr QLatin1String Cancelled{"cancelled"};
}

/**
 * @brief D-Bus service, path and interface names
 */
namespace DBus {
inline constexpr QLatin1String ServiceName{"org.greenhouse.daemon"};
inline constexpr QLatin1String ObjectPath{"/Greenhouse"};

namespace Interface {
inline constexpr QLatin1String WindowRestore{"org.greenhouse.WindowRestore"};
inline constexpr QLatin1String Screen{"org.greenhouse.Screen"};
}
}

/**
 * @brief KConfig locations for persisted window positions
 */
namespace ConfigKeys {
inline constexpr QLatin1String ConfigFile{"greenhouserc"};
inline constexpr QLatin1String SavedPositionsGroup{"SavedPositions"};
inline constexpr QLatin1String RecordsEntry{"Records"};
}

} // namespace Greenhouse
