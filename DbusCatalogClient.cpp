// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include "DbusCatalogClient.h"

#include <QtDBus/QDBusConnection>
#include <QtDBus/QDBusInterface>
#include <QtDBus/QDBusMessage>
#include <QtDBus/QDBusError>
#include <QtDBus/QDBusArgument>
#include <QtDBus/QDBusVariant>

static QVariant unwrapDbusVariant(const QVariant& v) {
    if (v.canConvert<QDBusVariant>()) {
        return qvariant_cast<QDBusVariant>(v).variant();
    }
    return v;
}

static QVariantList toVariantListLoose(const QVariant& input) {
    QVariant v = unwrapDbusVariant(input);

    if (v.metaType().id() == QMetaType::QVariantList) {
        const QVariantList raw = v.toList();
        QVariantList out;
        out.reserve(raw.size());
        for (const auto& e : raw) out.push_back(unwrapDbusVariant(e));
        return out;
    }

    if (v.canConvert<QDBusArgument>()) {
        const QDBusArgument a = qvariant_cast<QDBusArgument>(v);

        QVariantList out;
        a.beginArray();
        while (!a.atEnd()) {
            QVariant elem;
            a >> elem;
            out.push_back(unwrapDbusVariant(elem));
        }
        a.endArray();
        return out;
    }

    return {};
}

static QVariantList idsToVariantList(const QList<qint64>& ids) {
    QVariantList out;
    out.reserve(ids.size());
    for (qint64 id : ids) {
        out << QVariant::fromValue(id);
    }
    return out;
}

// [id, path, size, mtime, tags]
static std::optional<DbusCatalogClient::FileEntry> fileEntryFrom(const QVariant& raw) {
    const QVariantList f = toVariantListLoose(raw);
    if (f.size() < 5) return std::nullopt;

    DbusCatalogClient::FileEntry e;
    e.id = f[0].toLongLong();
    e.path = f[1].toString();
    e.size = f[2].toLongLong();
    e.mtime = f[3].toDouble();
    e.tags = f[4].toString();
    return e;
}

DbusCatalogClient::DbusCatalogClient(QObject* parent)
    : QObject(parent)
    , m_service(QStringLiteral("org.tagdeck.Catalog1"))
    , m_path(QStringLiteral("/org/tagdeck/Catalog1"))
    , m_iface(QStringLiteral("org.tagdeck.Catalog1.Catalog")) {}

bool DbusCatalogClient::isAvailable() const {
    QDBusInterface iface(m_service, m_path, m_iface, QDBusConnection::sessionBus());
    return iface.isValid();
}

std::optional<QVariantList> DbusCatalogClient::callMethod(const QString& method,
                                                          const QVariantList& args,
                                                          int minReplyArgs,
                                                          QString* errorOut) const {
    QDBusInterface iface(m_service, m_path, m_iface, QDBusConnection::sessionBus());
    if (!iface.isValid()) {
        if (errorOut) {
            const QDBusError e = iface.lastError();
            *errorOut = e.message().isEmpty()
                ? QStringLiteral("D-Bus interface not valid (is tagdeckd running?).")
                : e.message();
        }
        return std::nullopt;
    }

    const QDBusMessage reply = iface.callWithArgumentList(QDBus::Block, method, args);
    if (reply.type() == QDBusMessage::ErrorMessage) {
        if (errorOut) {
            const QString name = reply.errorName();
            const QString msg  = reply.errorMessage();
            *errorOut = msg.isEmpty()
                ? (name.isEmpty() ? QStringLiteral("Unknown D-Bus error.") : name)
                : msg;
        }
        return std::nullopt;
    }

    const QVariantList replyArgs = reply.arguments();
    if (replyArgs.size() < minReplyArgs) {
        if (errorOut) *errorOut = QStringLiteral("%1(): unexpected reply shape").arg(method);
        return std::nullopt;
    }

    return replyArgs;
}

std::optional<DbusCatalogClient::PingResult> DbusCatalogClient::ping(QString* errorOut) const {
    const auto args = callMethod(QStringLiteral("Ping"), {}, 2, errorOut);
    if (!args) return std::nullopt;

    PingResult r;
    r.version = (*args)[0].toString();
    r.apiVersion = (*args)[1].toUInt();
    return r;
}

std::optional<QStringList> DbusCatalogClient::listRoots(QString* errorOut) const {
    const auto args = callMethod(QStringLiteral("ListRoots"), {}, 1, errorOut);
    if (!args) return std::nullopt;
    return unwrapDbusVariant((*args)[0]).toStringList();
}

bool DbusCatalogClient::addRoot(const QString& path, QString* errorOut) const {
    return callMethod(QStringLiteral("AddRoot"), {path}, 0, errorOut).has_value();
}

std::optional<quint32> DbusCatalogClient::removeRoot(const QString& path, QString* errorOut) const {
    const auto args = callMethod(QStringLiteral("RemoveRoot"), {path}, 1, errorOut);
    if (!args) return std::nullopt;
    return (*args)[0].toUInt();
}

std::optional<QString> DbusCatalogClient::reconcile(const QString& root, QString* errorOut) const {
    const auto args = callMethod(QStringLiteral("Reconcile"), {root}, 1, errorOut);
    if (!args) return std::nullopt;
    return (*args)[0].toString();
}

std::optional<QString> DbusCatalogClient::reconcileAll(QString* errorOut) const {
    const auto args = callMethod(QStringLiteral("ReconcileAll"), {}, 1, errorOut);
    if (!args) return std::nullopt;
    return (*args)[0].toString();
}

std::optional<bool> DbusCatalogClient::isScanning(QString* errorOut) const {
    const auto args = callMethod(QStringLiteral("IsScanning"), {}, 1, errorOut);
    if (!args) return std::nullopt;
    return (*args)[0].toBool();
}

std::optional<QList<DbusCatalogClient::FileEntry>> DbusCatalogClient::listFiles(const QString& search,
                                                                                const QList<qint64>& tagIds,
                                                                                bool onlyTagged,
                                                                                const QString& rootPrefix,
                                                                                QString* errorOut) const {
    const auto args = callMethod(QStringLiteral("ListFiles"),
                                 {search, idsToVariantList(tagIds), onlyTagged, rootPrefix},
                                 1,
                                 errorOut);
    if (!args) return std::nullopt;

    QList<FileEntry> out;
    for (const QVariant& raw : toVariantListLoose((*args)[0])) {
        if (auto e = fileEntryFrom(raw)) out.push_back(*e);
    }
    return out;
}

std::optional<quint64> DbusCatalogClient::countFiles(const QString& rootPrefix, QString* errorOut) const {
    const auto args = callMethod(QStringLiteral("CountFiles"), {rootPrefix}, 1, errorOut);
    if (!args) return std::nullopt;
    return (*args)[0].toULongLong();
}

std::optional<DbusCatalogClient::FileEntry> DbusCatalogClient::fileByPath(const QString& path,
                                                                         QString* errorOut) const {
    const auto args = callMethod(QStringLiteral("FileByPath"), {path}, 1, errorOut);
    if (!args) return std::nullopt;

    auto e = fileEntryFrom((*args)[0]);
    if (!e && errorOut) *errorOut = QStringLiteral("FileByPath(): unexpected reply shape");
    return e;
}

std::optional<QString> DbusCatalogClient::renameFile(const QString& path,
                                                     const QString& newName,
                                                     QString* errorOut) const {
    const auto args = callMethod(QStringLiteral("RenameFile"), {path, newName}, 1, errorOut);
    if (!args) return std::nullopt;
    return (*args)[0].toString();
}

bool DbusCatalogClient::forgetFile(const QString& path, QString* errorOut) const {
    return callMethod(QStringLiteral("ForgetFile"), {path}, 0, errorOut).has_value();
}

std::optional<QList<DbusCatalogClient::TagEntry>> DbusCatalogClient::listTags(QString* errorOut) const {
    const auto args = callMethod(QStringLiteral("ListTags"), {}, 1, errorOut);
    if (!args) return std::nullopt;

    QList<TagEntry> out;
    for (const QVariant& raw : toVariantListLoose((*args)[0])) {
        const QVariantList f = toVariantListLoose(raw);
        if (f.size() < 4) continue;

        TagEntry t;
        t.id = f[0].toLongLong();
        t.name = f[1].toString();
        t.order = f[2].toLongLong();
        t.fileCount = f[3].toULongLong();
        out.push_back(t);
    }
    return out;
}

std::optional<qint64> DbusCatalogClient::ensureTag(const QString& name, QString* errorOut) const {
    const auto args = callMethod(QStringLiteral("EnsureTag"), {name}, 1, errorOut);
    if (!args) return std::nullopt;
    return (*args)[0].toLongLong();
}

std::optional<QString> DbusCatalogClient::renameTag(qint64 tagId, const QString& newName, QString* errorOut) const {
    const auto args = callMethod(QStringLiteral("RenameTag"), {QVariant::fromValue(tagId), newName}, 1, errorOut);
    if (!args) return std::nullopt;
    return (*args)[0].toString();
}

bool DbusCatalogClient::deleteTags(const QList<qint64>& tagIds, QString* errorOut) const {
    return callMethod(QStringLiteral("DeleteTags"), {idsToVariantList(tagIds)}, 0, errorOut).has_value();
}

bool DbusCatalogClient::moveTag(qint64 tagId, int delta, QString* errorOut) const {
    return callMethod(QStringLiteral("MoveTag"), {QVariant::fromValue(tagId), delta}, 0, errorOut).has_value();
}

bool DbusCatalogClient::tagFiles(const QList<qint64>& fileIds, const QString& tagName, QString* errorOut) const {
    return callMethod(QStringLiteral("TagFiles"), {idsToVariantList(fileIds), tagName}, 0, errorOut).has_value();
}

bool DbusCatalogClient::untagFile(qint64 fileId, const QList<qint64>& tagIds, QString* errorOut) const {
    return callMethod(QStringLiteral("UntagFile"),
                      {QVariant::fromValue(fileId), idsToVariantList(tagIds)},
                      0,
                      errorOut).has_value();
}

std::optional<QList<DbusCatalogClient::TagEntry>> DbusCatalogClient::fileTags(qint64 fileId,
                                                                             QString* errorOut) const {
    const auto args = callMethod(QStringLiteral("FileTags"), {QVariant::fromValue(fileId)}, 1, errorOut);
    if (!args) return std::nullopt;

    QList<TagEntry> out;
    for (const QVariant& raw : toVariantListLoose((*args)[0])) {
        const QVariantList f = toVariantListLoose(raw);
        if (f.size() < 2) continue;

        TagEntry t;
        t.id = f[0].toLongLong();
        t.name = f[1].toString();
        out.push_back(t);
    }
    return out;
}

std::optional<QString> DbusCatalogClient::setting(const QString& key,
                                                  const QString& defaultValue,
                                                  QString* errorOut) const {
    const auto args = callMethod(QStringLiteral("GetSetting"), {key, defaultValue}, 1, errorOut);
    if (!args) return std::nullopt;
    return (*args)[0].toString();
}

bool DbusCatalogClient::setSetting(const QString& key, const QString& value, QString* errorOut) const {
    return callMethod(QStringLiteral("SetSetting"), {key, value}, 0, errorOut).has_value();
}

bool DbusCatalogClient::subscribeScanSignals(QString* errorOut) {
    auto bus = QDBusConnection::sessionBus();

    const bool ok =
        bus.connect(m_service, m_path, m_iface, QStringLiteral("ScanStarted"),
                    this, SLOT(onScanStarted(quint64,QString))) &&
        bus.connect(m_service, m_path, m_iface, QStringLiteral("ScanProgress"),
                    this, SLOT(onScanProgress(quint64,quint64))) &&
        bus.connect(m_service, m_path, m_iface, QStringLiteral("ScanFinished"),
                    this, SLOT(onScanFinished(QVariantMap)));

    if (!ok && errorOut) {
        *errorOut = bus.lastError().message().isEmpty()
            ? QStringLiteral("Could not subscribe to scan signals.")
            : bus.lastError().message();
    }
    return ok;
}

void DbusCatalogClient::onScanStarted(quint64 total, const QString& purpose) {
    Q_EMIT scanStarted(total, purpose);
}

void DbusCatalogClient::onScanProgress(quint64 processed, quint64 total) {
    Q_EMIT scanProgress(processed, total);
}

void DbusCatalogClient::onScanFinished(const QVariantMap& summary) {
    Q_EMIT scanFinished(summary);
}
