// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "screenadaptor.h"
#include "../core/constants.h"
#include "../core/logging.h"
#include "../core/screenmanager.h"
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

namespace Greenhouse {

ScreenAdaptor::ScreenAdaptor(ScreenManager* screenManager, QObject* parent)
    : QDBusAbstractAdaptor(parent)
    , m_screenManager(screenManager)
{
    Q_ASSERT(screenManager);
    connect(m_screenManager, &ScreenManager::topologyChanged, this, &ScreenAdaptor::topologyChanged);
}

QString ScreenAdaptor::currentTopology()
{
    const std::optional<Topology> topology = m_screenManager->readTopology();
    if (!topology) {
        qCWarning(lcDbus) << "currentTopology: topology read failed";
        return QString();
    }

    QJsonArray array;
    for (const MonitorDescriptor& monitor : *topology) {
        QJsonObject obj;
        obj[JsonKeys::Id] = monitor.id;
        obj[JsonKeys::X] = monitor.bounds.x();
        obj[JsonKeys::Y] = monitor.bounds.y();
        obj[JsonKeys::Width] = monitor.bounds.width();
        obj[JsonKeys::Height] = monitor.bounds.height();
        obj[JsonKeys::DpiScale] = monitor.dpiScale;
        array.append(obj);
    }
    return QString::fromUtf8(QJsonDocument(array).toJson(QJsonDocument::Compact));
}

int ScreenAdaptor::getScreenCount()
{
    return m_screenManager->screens().size();
}

} // namespace Greenhouse
