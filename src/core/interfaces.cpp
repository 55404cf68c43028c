// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "interfaces.h"

namespace Greenhouse {

// Key functions for interface classes to anchor vtables to this translation unit
// This prevents ODR violations when interfaces are used across shared library boundaries

ISettings::~ISettings() = default;

ITopologySource::~ITopologySource() = default;

IWindowSystem::~IWindowSystem() = default;

QString restoreOutcomeToString(RestoreOutcome outcome)
{
    switch (outcome) {
    case RestoreOutcome::Restored:
        return QStringLiteral("Restored");
    case RestoreOutcome::NotFound:
        return QStringLiteral("NotFound");
    case RestoreOutcome::ApplyFailed:
        return QStringLiteral("ApplyFailed");
    case RestoreOutcome::MonitorUnavailable:
        return QStringLiteral("MonitorUnavailable");
    }
    return QString();
}

} // namespace Greenhouse
