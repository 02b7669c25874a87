// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include <ctime>
#include <cmath>
#include <QDateTime>
#include <QDir>
#include <QFileInfo>
#include <QLocale>
#include "Utils.h"

namespace Utils {
    QString normalizePath(const QString& path) {
        if (path.trimmed().isEmpty())
            return {};

        // QFileInfo resolves relative paths against the current directory without touching the disk
        QString out = QDir::cleanPath(QFileInfo(path).absoluteFilePath());

        // cleanPath keeps "/" but strips every other trailing separator
        if (out.isEmpty())
            return QStringLiteral("/");
        return out;
    }

    bool isUnderRoot(const QString& path, const QString& root) {
        if (root.isEmpty() || path.isEmpty())
            return false;
        if (path == root)
            return true;
        if (root.endsWith(QLatin1Char('/')))
            return path.startsWith(root);
        return path.startsWith(root) && path.at(root.size()) == QLatin1Char('/');
    }

    QString escapeLike(const QString& text) {
        QString out;
        out.reserve(text.size() + 8);
        for (const QChar c : text) {
            if (c == QLatin1Char('\\') || c == QLatin1Char('%') || c == QLatin1Char('_'))
                out += QLatin1Char('\\');
            out += c;
        }
        return out;
    }

    QString childrenLikePattern(const QString& normalizedRoot) {
        QString prefix = escapeLike(normalizedRoot);
        if (!normalizedRoot.endsWith(QLatin1Char('/')))
            prefix += QLatin1Char('/');
        return prefix + QLatin1Char('%');
    }

    QString formatSize(quint64 bytes) {
        static constexpr quint64 kKiB = 1024;
        static constexpr quint64 kMiB = kKiB * 1024;
        static constexpr quint64 kGiB = kMiB * 1024;

        if (bytes < kKiB)
            return QStringLiteral("%1B").arg(bytes);

        const double kb = static_cast<double>(bytes) / 1024.0;
        if (bytes < kMiB) {
            // Group separators regardless of the user's locale so output stays stable
            const QLocale grouping(QLocale::English, QLocale::UnitedStates);
            return grouping.toString(static_cast<qlonglong>(std::llround(kb))) + QStringLiteral("KB");
        }

        auto oneDecimal = [](double v) {
            QString s = QString::number(v, 'f', 1);
            if (s.endsWith(QStringLiteral(".0")))
                s.chop(2);
            return s;
        };

        const double mb = kb / 1024.0;
        if (bytes < kGiB)
            return oneDecimal(mb) + QStringLiteral("MB");

        return oneDecimal(mb / 1024.0) + QStringLiteral("GB");
    }

    double modificationSeconds(const QFileInfo& info) {
        return static_cast<double>(info.lastModified().toMSecsSinceEpoch()) / 1000.0;
    }

    std::string secondsToFormattedTime(double secondsSinceEpoch) {
        if (secondsSinceEpoch <= 0.0)
            return "N/A";

        std::time_t mtime = static_cast<std::time_t>(secondsSinceEpoch);
        std::tm tmLocal{};
        if (!localtime_r(&mtime, &tmLocal))
            return "invalid-time";

        char time_buf[20];
        if (std::strftime(time_buf, sizeof(time_buf), "%Y-%m-%d %H:%M:%S", &tmLocal) == 0)
            return "format-error";
        return std::string{time_buf};
    }
}
