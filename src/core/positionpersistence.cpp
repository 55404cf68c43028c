// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "positionpersistence.h"
#include "constants.h"
#include "logging.h"
#include "positionstore.h"
#include <KConfigGroup>
#include <QJsonDocument>
#include <QJsonParseError>

namespace Greenhouse {

PositionPersistence::PositionPersistence(PositionStore* store, KSharedConfig::Ptr config, QObject* parent)
    : QObject(parent)
    , m_store(store)
    , m_config(config ? config : KSharedConfig::openConfig(QString(ConfigKeys::ConfigFile)))
{
    Q_ASSERT(store);

    m_saveTimer.setSingleShot(true);
    m_saveTimer.setInterval(Defaults::SaveDebounceMs);
    connect(&m_saveTimer, &QTimer::timeout, this, &PositionPersistence::save);

    connect(m_store, &PositionStore::changed, this, [this]() {
        if (!m_loading) {
            scheduleSave();
        }
    });
}

PositionPersistence::~PositionPersistence() = default;

int PositionPersistence::load()
{
    // Pick up edits made by other processes since the config was opened
    m_config->reparseConfiguration();
    const KConfigGroup group = m_config->group(QString(ConfigKeys::SavedPositionsGroup));
    const QString json = group.readEntry(QString(ConfigKeys::RecordsEntry), QString());

    m_loading = true;
    m_store->load(recordsFromJson(json));
    m_loading = false;
    return m_store->size();
}

void PositionPersistence::save()
{
    m_saveTimer.stop();

    KConfigGroup group = m_config->group(QString(ConfigKeys::SavedPositionsGroup));
    group.writeEntry(QString(ConfigKeys::RecordsEntry), recordsToJson(m_store->all()));
    if (!m_config->sync()) {
        qCWarning(lcStore) << "Failed to write saved positions to" << m_config->name();
        return;
    }
    qCDebug(lcStore) << "Wrote" << m_store->size() << "saved positions";
}

void PositionPersistence::scheduleSave()
{
    m_saveTimer.start();
}

QJsonObject PositionPersistence::recordToJson(const SavedPositionRecord& record)
{
    QJsonObject obj;
    obj[JsonKeys::ProcessName] = record.identity.processName;
    obj[JsonKeys::WindowClass] = record.identity.windowClass;
    obj[JsonKeys::Title] = record.identity.titleHint;
    obj[JsonKeys::X] = record.geometry.rect.x();
    obj[JsonKeys::Y] = record.geometry.rect.y();
    obj[JsonKeys::Width] = record.geometry.rect.width();
    obj[JsonKeys::Height] = record.geometry.rect.height();
    obj[JsonKeys::MonitorId] = record.geometry.monitorId;
    obj[JsonKeys::DpiScale] = record.geometry.dpiScaleAtSave;
    return obj;
}

std::optional<SavedPositionRecord> PositionPersistence::recordFromJson(const QJsonObject& obj)
{
    SavedPositionRecord record;
    record.identity.processName = obj.value(JsonKeys::ProcessName).toString();
    record.identity.windowClass = obj.value(JsonKeys::WindowClass).toString();
    record.identity.titleHint = obj.value(JsonKeys::Title).toString();
    if (!record.identity.isValid()) {
        return std::nullopt;
    }

    const QRect rect(obj.value(JsonKeys::X).toInt(), obj.value(JsonKeys::Y).toInt(),
                     obj.value(JsonKeys::Width).toInt(), obj.value(JsonKeys::Height).toInt());
    if (rect.width() <= 0 || rect.height() <= 0) {
        return std::nullopt;
    }

    const double scale = obj.value(JsonKeys::DpiScale).toDouble(Defaults::FallbackDpiScale);
    record.geometry.rect = rect;
    record.geometry.monitorId = obj.value(JsonKeys::MonitorId).toString();
    record.geometry.dpiScaleAtSave = scale > 0 ? scale : Defaults::FallbackDpiScale;
    return record;
}

QString PositionPersistence::recordsToJson(const QVector<SavedPositionRecord>& records)
{
    QJsonArray array;
    for (const SavedPositionRecord& record : records) {
        array.append(recordToJson(record));
    }
    return QString::fromUtf8(QJsonDocument(array).toJson(QJsonDocument::Compact));
}

QVector<SavedPositionRecord> PositionPersistence::recordsFromJson(const QString& json)
{
    QVector<SavedPositionRecord> records;
    if (json.isEmpty()) {
        return records;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(json.toUtf8(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isArray()) {
        qCWarning(lcStore) << "Saved positions are not a JSON array:" << parseError.errorString();
        return records;
    }

    const QJsonArray array = doc.array();
    records.reserve(array.size());
    for (int i = 0; i < array.size(); ++i) {
        const std::optional<SavedPositionRecord> record =
            array.at(i).isObject() ? recordFromJson(array.at(i).toObject()) : std::nullopt;
        if (!record) {
            qCWarning(lcStore) << "Skipping malformed saved position at index" << i;
            continue;
        }
        records.append(*record);
    }
    return records;
}

} // namespace Greenhouse
