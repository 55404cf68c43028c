// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "greenhouse_export.h"
#include <QLoggingCategory>

/**
 * @file logging.h
 * @brief Centralized logging categories for Greenhouse
 *
 * Use these categories instead of plain qDebug/qWarning.
 *
 * Usage:
 *   #include "logging.h"
 *   qCDebug(lcRestore) << "Debug message";
 *   qCWarning(lcWindow) << "Warning message";
 *
 * Runtime filtering via environment variable:
 *   QT_LOGGING_RULES="greenhouse.*=true"                 # Enable all
 *   QT_LOGGING_RULES="greenhouse.*.debug=false"          # Disable debug only
 *   QT_LOGGING_RULES="greenhouse.core.restore=true"      # Enable restore only
 *
 * Severity Guidelines:
 *   qCDebug    - Development tracing
 *   qCInfo     - Significant operational events (startup, batch finished, records loaded)
 *   qCWarning  - Recoverable errors (apply failed, malformed record, backend unavailable)
 *   qCCritical - Failures preventing normal operation (D-Bus registration)
 */

namespace Greenhouse {

// Core module - topology, windows, matching, restore, store
GREENHOUSE_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcCore)
GREENHOUSE_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcScreen)
GREENHOUSE_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcWindow)
GREENHOUSE_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcRestore)
GREENHOUSE_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcStore)

// Daemon module - lifecycle, launch watcher
GREENHOUSE_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcDaemon)

// D-Bus module
GREENHOUSE_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcDbus)

// Configuration module - settings loading/saving
GREENHOUSE_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcConfig)

} // namespace Greenhouse
