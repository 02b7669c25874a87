// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef TAGDECK_CATALOGCONFIG_H
#define TAGDECK_CATALOGCONFIG_H

#include <QString>

class QSettings;

/**
 * Runtime knobs for the catalog, persisted with QSettings in the "catalog" group.
 *
 * The UI/session preferences (last search, last root, ...) are NOT stored here;
 * they live in the catalog's own settings table so they travel with the database.
 */
struct CatalogConfig {
    QString databasePath;

    // Passed to QSQLITE_BUSY_TIMEOUT so a foreground read waits for a background write
    int busyTimeoutMs = 5000;

    // Progress granularity of a reconcileAll() walk, in files
    int allRootsProgressInterval = 500;

    [[nodiscard]] static QString defaultDatabasePath();

    // Reads the "catalog" group, falling back to defaults for missing keys.
    [[nodiscard]] static CatalogConfig load(QSettings& settings);
    void save(QSettings& settings) const;
};

#endif //TAGDECK_CATALOGCONFIG_H
