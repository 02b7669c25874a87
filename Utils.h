// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef TAGDECK_UTILS_H
#define TAGDECK_UTILS_H

#include <QString>
#include <string>
#include <cstdint>

class QFileInfo;

namespace Utils {
    /**
     * Normalizes a filesystem path into the form stored in the catalog.
     *
     * The path is made absolute against the current working directory, "." and ".."
     * segments and duplicate separators are collapsed, and a trailing separator is
     * dropped (except for the filesystem root "/"). An empty input stays empty.
     *
     * @param path The path as typed by the user or produced by a directory walk.
     * @return The normalized absolute path.
     */
    [[nodiscard]] QString normalizePath(const QString& path);

    /**
     * Returns true when `path` is `root` itself or lies below it.
     * Both arguments must already be normalized. "/data/ab/x" is not under "/data/a".
     */
    [[nodiscard]] bool isUnderRoot(const QString& path, const QString& root);

    /**
     * Escapes the LIKE metacharacters '%', '_' and the escape character '\' so the
     * text matches literally in a "LIKE ? ESCAPE '\'" clause.
     */
    [[nodiscard]] QString escapeLike(const QString& text);

    /**
     * Builds the LIKE pattern matching every path strictly below a normalized root,
     * e.g. "/data/a" -> "/data/a/%" and "/" -> "/%".
     */
    [[nodiscard]] QString childrenLikePattern(const QString& normalizedRoot);

    /**
     * Formats a byte count the way desktop file managers do:
     * below 1 KiB as bytes ("512B"), below 1 MiB as whole KB with thousands
     * separators ("59KB"), below 1 GiB as MB with one decimal ("1.2MB"),
     * otherwise GB with one decimal ("3.4GB"). Trailing ".0" is dropped.
     */
    [[nodiscard]] QString formatSize(quint64 bytes);

    /**
     * Modification time as fractional seconds since the Unix epoch (millisecond precision).
     * Both the disk fingerprint and the catalog rows use this, so values compare exactly.
     */
    [[nodiscard]] double modificationSeconds(const QFileInfo& info);

    // "YYYY-MM-DD HH:MM:SS" in local time, or "N/A" for 0.
    [[nodiscard]] std::string secondsToFormattedTime(double secondsSinceEpoch);
}

#endif //TAGDECK_UTILS_H
