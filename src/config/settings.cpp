// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "settings.h"
#include "configdefaults.h"
#include "../core/logging.h"

namespace Greenhouse {

// ═══════════════════════════════════════════════════════════════════════════════
// Macros for setter patterns
// ═══════════════════════════════════════════════════════════════════════════════

// Simple setter: if changed, update member, emit specific signal, emit settingsChanged
#define SETTINGS_SETTER(Type, name, member, signal) \
    void Settings::set##name(Type value) \
    { \
        if (member != value) { \
            member = value; \
            Q_EMIT signal(); \
            Q_EMIT settingsChanged(); \
        } \
    }

// Clamped int setter: clamp value, then apply if changed
#define SETTINGS_SETTER_CLAMPED(name, member, signal, minVal, maxVal) \
    void Settings::set##name(int value) \
    { \
        value = qBound(minVal, value, maxVal); \
        if (member != value) { \
            member = value; \
            Q_EMIT signal(); \
            Q_EMIT settingsChanged(); \
        } \
    }

namespace {
const QString GeneralGroup = QStringLiteral("General");
const QString ExclusionsGroup = QStringLiteral("Exclusions");
}

Settings::Settings(QObject* parent)
    : Settings(KSharedConfig::Ptr(), parent)
{
}

Settings::Settings(KSharedConfig::Ptr config, QObject* parent)
    : ISettings(parent)
    , m_config(config ? config : KSharedConfig::openConfig(QString(ConfigKeys::ConfigFile)))
{
    load();
}

// ═══════════════════════════════════════════════════════════════════════════════
// Helper Methods
// ═══════════════════════════════════════════════════════════════════════════════

int Settings::readValidatedInt(const KConfigGroup& group, const char* key, int defaultValue, int min, int max,
                               const char* settingName)
{
    int value = group.readEntry(QLatin1String(key), defaultValue);
    if (value < min || value > max) {
        qCWarning(lcConfig) << "Invalid" << settingName << ":" << value << "using default (must be" << min << "-"
                            << max << ")";
        value = defaultValue;
    }
    return value;
}

QStringList Settings::cleanList(const QStringList& list)
{
    QStringList cleaned;
    for (const QString& entry : list) {
        const QString trimmed = entry.trimmed();
        if (!trimmed.isEmpty() && !cleaned.contains(trimmed, Qt::CaseInsensitive)) {
            cleaned.append(trimmed);
        }
    }
    return cleaned;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Setters
// ═══════════════════════════════════════════════════════════════════════════════

SETTINGS_SETTER(bool, RestoreOnStartup, m_restoreOnStartup, restoreOnStartupChanged)
SETTINGS_SETTER(bool, RestoreOnMonitorReconnect, m_restoreOnMonitorReconnect, restoreOnMonitorReconnectChanged)
SETTINGS_SETTER(bool, AutoRestoreOnLaunch, m_autoRestoreOnLaunch, autoRestoreOnLaunchChanged)
SETTINGS_SETTER_CLAMPED(LaunchPollIntervalMs, m_launchPollIntervalMs, launchPollIntervalMsChanged,
                        ConfigDefaults::launchPollIntervalMsMin(), ConfigDefaults::launchPollIntervalMsMax())
SETTINGS_SETTER_CLAMPED(TopologySettleDelayMs, m_topologySettleDelayMs, topologySettleDelayMsChanged,
                        ConfigDefaults::topologySettleDelayMsMin(), ConfigDefaults::topologySettleDelayMsMax())

void Settings::setExcludedApplications(const QStringList& apps)
{
    const QStringList cleaned = cleanList(apps);
    if (m_excludedApplications != cleaned) {
        m_excludedApplications = cleaned;
        Q_EMIT excludedApplicationsChanged();
        Q_EMIT settingsChanged();
    }
}

void Settings::setExcludedWindowClasses(const QStringList& classes)
{
    const QStringList cleaned = cleanList(classes);
    if (m_excludedWindowClasses != cleaned) {
        m_excludedWindowClasses = cleaned;
        Q_EMIT excludedWindowClassesChanged();
        Q_EMIT settingsChanged();
    }
}

SETTINGS_SETTER_CLAMPED(MinimumWindowWidth, m_minimumWindowWidth, minimumWindowWidthChanged,
                        ConfigDefaults::minimumWindowSizeMin(), ConfigDefaults::minimumWindowSizeMax())
SETTINGS_SETTER_CLAMPED(MinimumWindowHeight, m_minimumWindowHeight, minimumWindowHeightChanged,
                        ConfigDefaults::minimumWindowSizeMin(), ConfigDefaults::minimumWindowSizeMax())
SETTINGS_SETTER(bool, RequireWindowTitle, m_requireWindowTitle, requireWindowTitleChanged)

// ═══════════════════════════════════════════════════════════════════════════════
// Persistence
// ═══════════════════════════════════════════════════════════════════════════════

void Settings::load()
{
    // KSharedConfig caches in memory; pick up edits made by other processes
    m_config->reparseConfiguration();

    const KConfigGroup general = m_config->group(GeneralGroup);
    const KConfigGroup exclusions = m_config->group(ExclusionsGroup);

    m_restoreOnStartup = general.readEntry(QLatin1String("RestoreOnStartup"), ConfigDefaults::restoreOnStartup());
    m_restoreOnMonitorReconnect =
        general.readEntry(QLatin1String("RestoreOnMonitorReconnect"), ConfigDefaults::restoreOnMonitorReconnect());
    m_autoRestoreOnLaunch =
        general.readEntry(QLatin1String("AutoRestoreOnLaunch"), ConfigDefaults::autoRestoreOnLaunch());
    m_launchPollIntervalMs = readValidatedInt(general, "LaunchPollIntervalMs", ConfigDefaults::launchPollIntervalMs(),
                                              ConfigDefaults::launchPollIntervalMsMin(),
                                              ConfigDefaults::launchPollIntervalMsMax(), "launch poll interval");
    m_topologySettleDelayMs =
        readValidatedInt(general, "TopologySettleDelayMs", ConfigDefaults::topologySettleDelayMs(),
                         ConfigDefaults::topologySettleDelayMsMin(), ConfigDefaults::topologySettleDelayMsMax(),
                         "topology settle delay");

    m_excludedApplications = cleanList(
        exclusions.readEntry(QLatin1String("ExcludedApplications"), ConfigDefaults::excludedApplications()));
    m_excludedWindowClasses = cleanList(
        exclusions.readEntry(QLatin1String("ExcludedWindowClasses"), ConfigDefaults::excludedWindowClasses()));
    m_minimumWindowWidth = readValidatedInt(exclusions, "MinimumWindowWidth", ConfigDefaults::minimumWindowWidth(),
                                            ConfigDefaults::minimumWindowSizeMin(),
                                            ConfigDefaults::minimumWindowSizeMax(), "minimum window width");
    m_minimumWindowHeight = readValidatedInt(exclusions, "MinimumWindowHeight", ConfigDefaults::minimumWindowHeight(),
                                             ConfigDefaults::minimumWindowSizeMin(),
                                             ConfigDefaults::minimumWindowSizeMax(), "minimum window height");
    m_requireWindowTitle =
        exclusions.readEntry(QLatin1String("RequireWindowTitle"), ConfigDefaults::requireWindowTitle());

    qCDebug(lcConfig) << "Settings loaded - restoreOnStartup:" << m_restoreOnStartup
                      << "reconnect:" << m_restoreOnMonitorReconnect << "launch:" << m_autoRestoreOnLaunch
                      << "poll:" << m_launchPollIntervalMs << "ms";

    Q_EMIT settingsChanged();
}

void Settings::save()
{
    KConfigGroup general = m_config->group(GeneralGroup);
    KConfigGroup exclusions = m_config->group(ExclusionsGroup);

    general.writeEntry(QLatin1String("RestoreOnStartup"), m_restoreOnStartup);
    general.writeEntry(QLatin1String("RestoreOnMonitorReconnect"), m_restoreOnMonitorReconnect);
    general.writeEntry(QLatin1String("AutoRestoreOnLaunch"), m_autoRestoreOnLaunch);
    general.writeEntry(QLatin1String("LaunchPollIntervalMs"), m_launchPollIntervalMs);
    general.writeEntry(QLatin1String("TopologySettleDelayMs"), m_topologySettleDelayMs);

    exclusions.writeEntry(QLatin1String("ExcludedApplications"), m_excludedApplications);
    exclusions.writeEntry(QLatin1String("ExcludedWindowClasses"), m_excludedWindowClasses);
    exclusions.writeEntry(QLatin1String("MinimumWindowWidth"), m_minimumWindowWidth);
    exclusions.writeEntry(QLatin1String("MinimumWindowHeight"), m_minimumWindowHeight);
    exclusions.writeEntry(QLatin1String("RequireWindowTitle"), m_requireWindowTitle);

    if (!m_config->sync()) {
        qCWarning(lcConfig) << "Failed to write settings to" << m_config->name();
    }
}

void Settings::reset()
{
    // Saved positions live in their own group and survive a settings reset
    m_config->deleteGroup(GeneralGroup);
    m_config->deleteGroup(ExclusionsGroup);
    if (!m_config->sync()) {
        qCWarning(lcConfig) << "Failed to reset settings in" << m_config->name();
    }

    load();

    Q_EMIT restoreOnStartupChanged();
    Q_EMIT restoreOnMonitorReconnectChanged();
    Q_EMIT autoRestoreOnLaunchChanged();
    Q_EMIT launchPollIntervalMsChanged();
    Q_EMIT topologySettleDelayMsChanged();
    Q_EMIT excludedApplicationsChanged();
    Q_EMIT excludedWindowClassesChanged();
    Q_EMIT minimumWindowWidthChanged();
    Q_EMIT minimumWindowHeightChanged();
    Q_EMIT requireWindowTitleChanged();
}

} // namespace Greenhouse
