// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "greenhouse_export.h"
#include "types.h"
#include <QHash>
#include <QObject>
#include <QVector>
#include <optional>

namespace Greenhouse {

/**
 * @brief In-memory mapping from window identity to its saved position
 *
 * Keys are unique; saving an existing identity overwrites its geometry but
 * keeps its first insertion slot, so all() is stable and restore stacking
 * order stays predictable. Records are never removed implicitly.
 *
 * Owned by the daemon and passed to whoever needs it; accessed only from the
 * control thread.
 */
class GREENHOUSE_EXPORT PositionStore : public QObject
{
    Q_OBJECT

public:
    explicit PositionStore(QObject* parent = nullptr);
    ~PositionStore() override;

    /**
     * @brief Insert or overwrite the record for identity
     */
    void save(const WindowIdentity& identity, const WindowGeometry& geometry);

    std::optional<SavedPositionRecord> get(const WindowIdentity& identity) const;

    bool contains(const WindowIdentity& identity) const;

    /**
     * @brief All records in insertion order
     */
    QVector<SavedPositionRecord> all() const;

    /**
     * @brief Remove the record for identity
     * @return true if a record was removed
     */
    bool remove(const WindowIdentity& identity);

    void clear();

    /**
     * @brief Replace the whole content, e.g. from persisted state at startup
     *
     * Duplicate identities collapse with the last occurrence winning, like a
     * sequence of save() calls.
     */
    void load(const QVector<SavedPositionRecord>& records);

    int size() const
    {
        return m_records.size();
    }
    bool isEmpty() const
    {
        return m_records.isEmpty();
    }

Q_SIGNALS:
    /**
     * @brief Emitted after every mutation (save, remove, clear, load)
     */
    void changed();

private:
    void rebuildIndex();

    QVector<SavedPositionRecord> m_records;
    QHash<WindowIdentity, int> m_index; // identity -> position in m_records
};

} // namespace Greenhouse
