// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDBusConnection>
#include <QDBusError>
#include <QDebug>
#include <QSettings>

#include "CatalogService.h"
#include "../CatalogConfig.h"
#include "../Version.h"

int main(int argc, char** argv) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("tagdeckd");
    QCoreApplication::setOrganizationName("tagdeck");
    QCoreApplication::setApplicationVersion(QString::fromUtf8(Version::VERSION));

    constexpr const char* kServiceName = "org.tagdeck.Catalog1";
    constexpr const char* kObjectPath  = "/org/tagdeck/Catalog1";

    QCommandLineParser parser;
    parser.setApplicationDescription("File tagging catalog service");
    parser.addHelpOption();
    parser.addVersionOption();
    const QCommandLineOption databaseOption(QStringList{"d", "database"},
                                            "Use the catalog database at <path>.",
                                            "path");
    parser.addOption(databaseOption);
    parser.process(app);

    QSettings settings;
    CatalogConfig config = CatalogConfig::load(settings);
    if (parser.isSet(databaseOption)) {
        config.databasePath = parser.value(databaseOption);
    }

    CatalogService svc(config);

    QString err;
    if (!svc.initialize(&err)) {
        qCritical().noquote() << "Failed to open catalog" << config.databasePath << ":" << err;
        return 4;
    }

    auto conn = QDBusConnection::sessionBus();
    if (!conn.isConnected()) {
        qCritical() << "Failed to connect to session bus:" << conn.lastError().message();
        return 1;
    }

    if (!conn.registerService(kServiceName)) {
        qCritical() << "Failed to register service" << kServiceName << ":" << conn.lastError().message();
        return 2;
    }

    if (!conn.registerObject(kObjectPath, &svc,
                             QDBusConnection::ExportAllSlots | QDBusConnection::ExportAllSignals)) {
        qCritical() << "Failed to register object" << kObjectPath << ":" << conn.lastError().message();
        return 3;
    }

    qInfo() << "tagdeckd running on session bus as" << kServiceName << "object" << kObjectPath;
    return app.exec();
}
