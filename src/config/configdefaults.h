// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "greenhouse.h" // Generated from greenhouse.kcfg via KConfigXT

#include <QStringList>

namespace Greenhouse {

/**
 * @brief Static access to default configuration values
 *
 * Wraps the KConfigXT-generated GreenhouseConfig class. greenhouse.kcfg is
 * the single source of truth for defaults.
 *
 * Usage:
 *   int interval = ConfigDefaults::launchPollIntervalMs();  // 2000 (from .kcfg)
 */
class ConfigDefaults
{
public:
    // ═══════════════════════════════════════════════════════════════════════════
    // General
    // ═══════════════════════════════════════════════════════════════════════════

    static bool restoreOnStartup() { return instance().defaultRestoreOnStartupValue(); }
    static bool restoreOnMonitorReconnect() { return instance().defaultRestoreOnMonitorReconnectValue(); }
    static bool autoRestoreOnLaunch() { return instance().defaultAutoRestoreOnLaunchValue(); }
    static int launchPollIntervalMs() { return instance().defaultLaunchPollIntervalMsValue(); }
    static int topologySettleDelayMs() { return instance().defaultTopologySettleDelayMsValue(); }

    // ═══════════════════════════════════════════════════════════════════════════
    // Exclusions
    // ═══════════════════════════════════════════════════════════════════════════

    static QStringList excludedApplications() { return instance().defaultExcludedApplicationsValue(); }
    static QStringList excludedWindowClasses() { return instance().defaultExcludedWindowClassesValue(); }
    static int minimumWindowWidth() { return instance().defaultMinimumWindowWidthValue(); }
    static int minimumWindowHeight() { return instance().defaultMinimumWindowHeightValue(); }
    static bool requireWindowTitle() { return instance().defaultRequireWindowTitleValue(); }

    // ═══════════════════════════════════════════════════════════════════════════
    // Ranges (mirrored from <min>/<max> in greenhouse.kcfg)
    // ═══════════════════════════════════════════════════════════════════════════

    static constexpr int launchPollIntervalMsMin() { return 250; }
    static constexpr int launchPollIntervalMsMax() { return 60000; }
    static constexpr int topologySettleDelayMsMin() { return 0; }
    static constexpr int topologySettleDelayMsMax() { return 10000; }
    static constexpr int minimumWindowSizeMin() { return 0; }
    static constexpr int minimumWindowSizeMax() { return 10000; }

private:
    // Lazily-initialized singleton instance
    static GreenhouseConfig& instance()
    {
        static GreenhouseConfig config;
        return config;
    }

    // Non-instantiable
    ConfigDefaults() = delete;
};

} // namespace Greenhouse
