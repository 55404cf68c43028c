// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "daemon.h"
#include "../core/logging.h"
#include "../core/types.h"
#include <QCommandLineParser>
#include <QGuiApplication>
#include <KAboutData>
#include <KDBusService>
#include <KLocalizedString>
#include <signal.h>

using namespace Greenhouse;

static Daemon* g_daemon = nullptr;

void signalHandler(int /*signal*/)
{
    if (g_daemon) {
        g_daemon->stop();
    }
    QCoreApplication::quit();
}

int main(int argc, char* argv[])
{
    QGuiApplication app(argc, argv);

    // No windows of our own; never quit because the last one closed
    app.setQuitOnLastWindowClosed(false);

    qRegisterMetaType<Greenhouse::RestoreResult>();
    qRegisterMetaType<Greenhouse::RestoreReport>();

    // Set translation domain BEFORE any i18n() calls
    KLocalizedString::setApplicationDomain("greenhoused");

    KAboutData aboutData(QStringLiteral("greenhoused"), i18n("Greenhouse Daemon"), QStringLiteral("1.0.0"),
                         i18n("Saves window positions and restores them across monitors"), KAboutLicense::GPL_V3,
                         i18n("© 2026 fuddlesworth"));
    aboutData.addAuthor(i18n("fuddlesworth"));
    aboutData.setDesktopFileName(QStringLiteral("org.greenhouse.daemon"));

    KAboutData::setApplicationData(aboutData);

    QCommandLineParser parser;
    aboutData.setupCommandLine(&parser);

    QCommandLineOption replaceOption(QStringList{QStringLiteral("r"), QStringLiteral("replace")},
                                     i18n("Replace existing daemon instance"));
    parser.addOption(replaceOption);

    QCommandLineOption restoreOption(QStringList{QStringLiteral("restore")},
                                     i18n("Restore all saved window positions once the monitors have settled"));
    parser.addOption(restoreOption);

    parser.process(app);
    aboutData.processCommandLine(&parser);

    // Ensure single instance
    KDBusService::StartupOptions options = KDBusService::Unique;
    if (parser.isSet(replaceOption)) {
        options |= KDBusService::Replace;
    }

    KDBusService service(options);

    // Set up signal handling for clean shutdown
    signal(SIGINT, signalHandler);
    signal(SIGTERM, signalHandler);
    signal(SIGHUP, signalHandler);

    Daemon daemon;
    g_daemon = &daemon;

    if (!daemon.init()) {
        qCCritical(Greenhouse::lcDaemon) << "Failed to initialize daemon";
        return 1;
    }

    qCInfo(Greenhouse::lcDaemon) << "Started successfully";
    daemon.start();
    if (parser.isSet(restoreOption)) {
        daemon.scheduleRestore();
    }

    QObject::connect(&service, &KDBusService::activateRequested, &daemon, []() {
        qCDebug(Greenhouse::lcDaemon) << "Already running - activation request ignored";
    });

    const int result = app.exec();

    daemon.stop();
    g_daemon = nullptr;

    return result;
}
