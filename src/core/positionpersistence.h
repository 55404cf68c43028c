// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "greenhouse_export.h"
#include "types.h"
#include <KSharedConfig>
#include <QJsonArray>
#include <QJsonObject>
#include <QObject>
#include <QTimer>
#include <optional>

namespace Greenhouse {

class PositionStore;

/**
 * @brief Keeps the position store in sync with greenhouserc
 *
 * Records are written as one compact JSON array to
 * [SavedPositions] Records. Store mutations are debounced so a burst of
 * saves from one D-Bus call produces a single disk write.
 */
class GREENHOUSE_EXPORT PositionPersistence : public QObject
{
    Q_OBJECT

public:
    /**
     * @param store Store to load into and save from (not owned)
     * @param config Config to use; the user's greenhouserc when null
     */
    explicit PositionPersistence(PositionStore* store, KSharedConfig::Ptr config = {}, QObject* parent = nullptr);
    ~PositionPersistence() override;

    /**
     * @brief Replace the store contents with what is on disk
     * @return Number of records loaded
     */
    int load();

    /**
     * @brief Write the store now, cancelling any pending debounced write
     */
    void save();

    /**
     * @brief Write the store after the debounce interval
     */
    void scheduleSave();

    bool hasPendingSave() const
    {
        return m_saveTimer.isActive();
    }

    static QJsonObject recordToJson(const SavedPositionRecord& record);
    static std::optional<SavedPositionRecord> recordFromJson(const QJsonObject& obj);

    static QString recordsToJson(const QVector<SavedPositionRecord>& records);

    /**
     * @brief Parse a serialized record array
     *
     * Malformed entries are skipped with a warning; a document that is not an
     * array yields an empty list.
     */
    static QVector<SavedPositionRecord> recordsFromJson(const QString& json);

private:
    PositionStore* m_store = nullptr;
    KSharedConfig::Ptr m_config;
    QTimer m_saveTimer;
    bool m_loading = false;
};

} // namespace Greenhouse
