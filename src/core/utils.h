// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "greenhouse_export.h"
#include "types.h"
#include <QDir>
#include <QFile>
#include <QHash>
#include <QScreen>
#include <QString>
#include <optional>

namespace Greenhouse {
namespace Utils {

// ═══════════════════════════════════════════════════════════════════════════════
// Window handle text form (D-Bus clients pass handles as strings)
// ═══════════════════════════════════════════════════════════════════════════════

inline QString handleToString(WindowHandle handle)
{
    return QString::number(handle);
}

inline std::optional<WindowHandle> parseHandle(const QString& text)
{
    bool ok = false;
    const WindowHandle handle = text.trimmed().toULongLong(&ok, 0);
    if (!ok || handle == 0) {
        return std::nullopt;
    }
    return handle;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Process names
// ═══════════════════════════════════════════════════════════════════════════════

/**
 * @brief Executable name of a process, from /proc/<pid>/comm
 *
 * comm is truncated by the kernel to 15 characters; the same truncation
 * happens at save and at restore, so identities still compare equal.
 *
 * @return Process name, or empty if the process is gone or pid is unknown
 */
inline QString processNameForPid(qint64 pid)
{
    if (pid <= 0) {
        return QString();
    }
    QFile comm(QStringLiteral("/proc/%1/comm").arg(pid));
    if (!comm.open(QIODevice::ReadOnly)) {
        return QString();
    }
    return QString::fromLocal8Bit(comm.readAll()).trimmed();
}

// ═══════════════════════════════════════════════════════════════════════════════
// Screen Identity Utilities (EDID-based stable identification)
// ═══════════════════════════════════════════════════════════════════════════════

/// Connector name -> EDID header serial. Main thread only.
inline QHash<QString, QString>& edidSerialCache()
{
    static QHash<QString, QString> s_cache;
    return s_cache;
}

/// Failed reads per connector; empty results are cached after a few misses
inline QHash<QString, int>& edidMissCounter()
{
    static QHash<QString, int> s_counter;
    return s_counter;
}

/**
 * @brief Read the EDID header serial (bytes 12-15, little-endian) from sysfs
 * @param connectorName Connector name (e.g., "DP-2")
 * @return Serial as decimal string, or empty if not readable
 */
inline QString readEdidHeaderSerial(const QString& connectorName)
{
    auto& cache = edidSerialCache();
    auto cacheIt = cache.constFind(connectorName);
    if (cacheIt != cache.constEnd()) {
        return *cacheIt;
    }

    QString result;
    const QDir drmDir(QStringLiteral("/sys/class/drm"));
    const QStringList entries = drmDir.entryList(QDir::Dirs | QDir::NoDotAndDotDot);
    for (const QString& entry : entries) {
        // "card0-DP-2", "card1-HDMI-A-1"
        const int dashPos = entry.indexOf(QLatin1Char('-'));
        if (dashPos < 0 || entry.mid(dashPos + 1) != connectorName) {
            continue;
        }
        QFile edidFile(drmDir.filePath(entry) + QStringLiteral("/edid"));
        if (!edidFile.open(QIODevice::ReadOnly)) {
            continue;
        }
        const QByteArray header = edidFile.read(16);
        if (header.size() < 16) {
            continue;
        }
        static const QByteArray magic = QByteArray::fromHex("00ffffffffffff00");
        if (!header.startsWith(magic)) {
            continue;
        }
        const auto* data = reinterpret_cast<const uchar*>(header.constData());
        const quint32 serial = data[12] | (quint32(data[13]) << 8) | (quint32(data[14]) << 16)
            | (quint32(data[15]) << 24);
        if (serial != 0) {
            result = QString::number(serial);
            break;
        }
    }

    if (!result.isEmpty()) {
        cache.insert(connectorName, result);
        edidMissCounter().remove(connectorName);
    } else {
        constexpr int maxRetries = 3;
        int& misses = edidMissCounter()[connectorName];
        if (++misses >= maxRetries) {
            cache.insert(connectorName, result);
        }
    }
    return result;
}

/**
 * @brief Forget the cached serial for a connector, or all if empty
 */
inline void invalidateEdidCache(const QString& connectorName = QString())
{
    if (connectorName.isEmpty()) {
        edidSerialCache().clear();
        edidMissCounter().clear();
    } else {
        edidSerialCache().remove(connectorName);
        edidMissCounter().remove(connectorName);
    }
}

/**
 * @brief Stable identifier for a physical monitor
 *
 * "manufacturer:model:serial" when a serial is known, "manufacturer:model"
 * otherwise, and the connector name for displays without EDID data. This
 * is the id saved with each position, so it must survive reboots and
 * connector reshuffles. Identical monitors can share it; ScreenManager
 * makes the ids unique per topology.
 */
inline QString screenIdentifier(const QScreen* screen)
{
    if (!screen) {
        return QString();
    }

    const QString manufacturer = screen->manufacturer();
    const QString model = screen->model();

    QString serial = screen->serialNumber();
    if (serial.isEmpty()) {
        serial = readEdidHeaderSerial(screen->name());
    }

    if (!serial.isEmpty()) {
        return manufacturer + QLatin1Char(':') + model + QLatin1Char(':') + serial;
    }
    if (!manufacturer.isEmpty() || !model.isEmpty()) {
        return manufacturer + QLatin1Char(':') + model;
    }
    return screen->name();
}

} // namespace Utils
} // namespace Greenhouse
