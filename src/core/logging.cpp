// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "logging.h"

namespace Greenhouse {

// Core module categories
Q_LOGGING_CATEGORY(lcCore, "greenhouse.core", QtInfoMsg)
Q_LOGGING_CATEGORY(lcScreen, "greenhouse.core.screen", QtInfoMsg)
Q_LOGGING_CATEGORY(lcWindow, "greenhouse.core.window", QtInfoMsg)
Q_LOGGING_CATEGORY(lcRestore, "greenhouse.core.restore", QtInfoMsg)
Q_LOGGING_CATEGORY(lcStore, "greenhouse.core.store", QtInfoMsg)

// Daemon module categories
Q_LOGGING_CATEGORY(lcDaemon, "greenhouse.daemon", QtInfoMsg)

// D-Bus module categories
Q_LOGGING_CATEGORY(lcDbus, "greenhouse.dbus", QtInfoMsg)

// Configuration module categories
Q_LOGGING_CATEGORY(lcConfig, "greenhouse.config", QtInfoMsg)

} // namespace Greenhouse
