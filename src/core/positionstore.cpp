// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "positionstore.h"
#include "logging.h"

namespace Greenhouse {

PositionStore::PositionStore(QObject* parent)
    : QObject(parent)
{
}

PositionStore::~PositionStore() = default;

void PositionStore::save(const WindowIdentity& identity, const WindowGeometry& geometry)
{
    if (!identity.isValid()) {
        qCWarning(lcStore) << "Refusing to save position for an empty identity";
        return;
    }

    auto it = m_index.constFind(identity);
    if (it != m_index.constEnd()) {
        m_records[it.value()].geometry = geometry;
        qCDebug(lcStore) << "Overwrote position for" << identity.toString() << geometry.rect;
    } else {
        m_index.insert(identity, m_records.size());
        m_records.append(SavedPositionRecord{identity, geometry});
        qCDebug(lcStore) << "Saved position for" << identity.toString() << geometry.rect;
    }
    Q_EMIT changed();
}

std::optional<SavedPositionRecord> PositionStore::get(const WindowIdentity& identity) const
{
    auto it = m_index.constFind(identity);
    if (it == m_index.constEnd()) {
        return std::nullopt;
    }
    return m_records.at(it.value());
}

bool PositionStore::contains(const WindowIdentity& identity) const
{
    return m_index.contains(identity);
}

QVector<SavedPositionRecord> PositionStore::all() const
{
    return m_records;
}

bool PositionStore::remove(const WindowIdentity& identity)
{
    auto it = m_index.constFind(identity);
    if (it == m_index.constEnd()) {
        return false;
    }

    m_records.removeAt(it.value());
    rebuildIndex();
    qCDebug(lcStore) << "Removed position for" << identity.toString();
    Q_EMIT changed();
    return true;
}

void PositionStore::clear()
{
    if (m_records.isEmpty()) {
        return;
    }
    m_records.clear();
    m_index.clear();
    Q_EMIT changed();
}

void PositionStore::load(const QVector<SavedPositionRecord>& records)
{
    m_records.clear();
    m_index.clear();

    for (const SavedPositionRecord& record : records) {
        if (!record.identity.isValid()) {
            continue;
        }
        auto it = m_index.constFind(record.identity);
        if (it != m_index.constEnd()) {
            m_records[it.value()].geometry = record.geometry;
        } else {
            m_index.insert(record.identity, m_records.size());
            m_records.append(record);
        }
    }

    qCInfo(lcStore) << "Loaded" << m_records.size() << "saved positions";
    Q_EMIT changed();
}

void PositionStore::rebuildIndex()
{
    m_index.clear();
    for (int i = 0; i < m_records.size(); ++i) {
        m_index.insert(m_records.at(i).identity, i);
    }
}

} // namespace Greenhouse
