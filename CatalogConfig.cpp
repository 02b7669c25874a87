// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include <algorithm>
#include <QDir>
#include <QSettings>
#include <QStandardPaths>
#include "CatalogConfig.h"

QString CatalogConfig::defaultDatabasePath() {
    QString base = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    if (base.isEmpty()) {
        base = QDir::homePath() + QStringLiteral("/.local/share/tagdeck");
    }
    return base + QStringLiteral("/filetags.db");
}

CatalogConfig CatalogConfig::load(QSettings& settings) {
    CatalogConfig cfg;

    settings.beginGroup(QStringLiteral("catalog"));
    cfg.databasePath = settings.value(QStringLiteral("databasePath"), defaultDatabasePath()).toString();
    cfg.busyTimeoutMs = settings.value(QStringLiteral("busyTimeoutMs"), cfg.busyTimeoutMs).toInt();
    cfg.allRootsProgressInterval =
        settings.value(QStringLiteral("allRootsProgressInterval"), cfg.allRootsProgressInterval).toInt();
    settings.endGroup();

    if (cfg.databasePath.trimmed().isEmpty()) {
        cfg.databasePath = defaultDatabasePath();
    }
    cfg.busyTimeoutMs = std::max(0, cfg.busyTimeoutMs);
    cfg.allRootsProgressInterval = std::max(1, cfg.allRootsProgressInterval);

    return cfg;
}

void CatalogConfig::save(QSettings& settings) const {
    settings.beginGroup(QStringLiteral("catalog"));
    settings.setValue(QStringLiteral("databasePath"), databasePath);
    settings.setValue(QStringLiteral("busyTimeoutMs"), busyTimeoutMs);
    settings.setValue(QStringLiteral("allRootsProgressInterval"), allRootsProgressInterval);
    settings.endGroup();
}
