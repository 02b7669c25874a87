// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include <algorithm>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>
#include <QEventLoop>
#include <KAboutData>
#include <iostream>
#include <optional>
#include <string_view>
#include "DbusCatalogClient.h"
#include "Utils.h"
#include "Version.h"

static constexpr int kExitOk = 0;
static constexpr int kExitError = 1;
static constexpr int kExitUsage = 2;

static std::ostream& operator<<(std::ostream& os, const QString& s) {
    return os << s.toStdString();
}

static int fail(const QString& what, const QString& err) {
    std::cerr << what << ": " << err << std::endl;
    return kExitError;
}

static int usage(const QString& message) {
    std::cerr << message << "\nRun with --help for the list of commands." << std::endl;
    return kExitUsage;
}

static std::optional<DbusCatalogClient::TagEntry> findTag(const DbusCatalogClient& client,
                                                          const QString& name,
                                                          QString* errorOut) {
    const auto tags = client.listTags(errorOut);
    if (!tags) return std::nullopt;

    const QString wanted = name.trimmed();
    for (const auto& t : *tags) {
        if (t.name == wanted) return t;
    }

    if (errorOut) *errorOut = QStringLiteral("No such tag: %1").arg(wanted);
    return std::nullopt;
}

static int runScan(DbusCatalogClient& client, const QString& root) {
    QString err;
    if (!client.subscribeScanSignals(&err)) {
        return fail(QStringLiteral("scan"), err);
    }

    QEventLoop loop;
    int lastPct = -1;
    QVariantMap result;

    QObject::connect(&client, &DbusCatalogClient::scanStarted, &loop, [](quint64 total, const QString& purpose) {
        std::cout << purpose << " (" << total << " files)" << std::endl;
    });
    QObject::connect(&client, &DbusCatalogClient::scanProgress, &loop, [&lastPct](quint64 processed, quint64 total) {
        const int pct = total > 0 ? static_cast<int>(processed * 100 / total) : 100;
        if (pct != lastPct) {
            lastPct = pct;
            std::cout << "\r" << pct << "% (" << processed << "/" << total << ")" << std::flush;
        }
    });
    QObject::connect(&client, &DbusCatalogClient::scanFinished, &loop, [&loop, &result](const QVariantMap& summary) {
        result = summary;
        loop.quit();
    });

    const auto status = root.isEmpty() ? client.reconcileAll(&err) : client.reconcile(root, &err);
    if (!status) {
        return fail(QStringLiteral("scan"), err);
    }

    if (*status == QStringLiteral("upToDate")) {
        std::cout << root << " is already up to date." << std::endl;
        return kExitOk;
    }

    loop.exec();

    if (lastPct >= 0) std::cout << std::endl;
    std::cout << "Recorded " << result.value(QStringLiteral("upserted")).toULongLong() << " file(s), removed "
              << result.value(QStringLiteral("removed")).toULongLong() << ", skipped "
              << result.value(QStringLiteral("skippedMissing")).toULongLong()
                     + result.value(QStringLiteral("skippedErrors")).toULongLong()
              << "." << std::endl;
    return kExitOk;
}

static int listFiles(const DbusCatalogClient& client, const QCommandLineParser& parser,
                     const QCommandLineOption& searchOpt, const QCommandLineOption& tagOpt,
                     const QCommandLineOption& taggedOpt, const QCommandLineOption& rootOpt,
                     const QCommandLineOption& lastOpt) {
    QString err;
    QString search = parser.value(searchOpt);
    bool onlyTagged = parser.isSet(taggedOpt);
    QString root = parser.isSet(rootOpt) ? Utils::normalizePath(parser.value(rootOpt)) : QString();

    if (parser.isSet(lastOpt)) {
        const auto lastSearch = client.setting(QStringLiteral("last_search"), {}, &err);
        const auto lastOnlyTagged = client.setting(QStringLiteral("last_only_tagged"), QStringLiteral("0"), &err);
        const auto lastRoot = client.setting(QStringLiteral("last_root"), {}, &err);
        if (!lastSearch || !lastOnlyTagged || !lastRoot) return fail(QStringLiteral("files"), err);

        search = *lastSearch;
        onlyTagged = *lastOnlyTagged == QStringLiteral("1");
        root = *lastRoot;
    }

    QList<qint64> tagIds;
    for (const QString& name : parser.values(tagOpt)) {
        const auto tag = findTag(client, name, &err);
        if (!tag) return fail(QStringLiteral("files"), err);
        tagIds.push_back(tag->id);
    }

    const auto files = client.listFiles(search, tagIds, onlyTagged, root, &err);
    if (!files) return fail(QStringLiteral("files"), err);

    for (const auto& f : *files) {
        std::cout << Utils::formatSize(static_cast<quint64>(std::max<qint64>(0, f.size))).rightJustified(8)
                  << "  " << Utils::secondsToFormattedTime(f.mtime)
                  << "  " << f.path;
        if (!f.tags.isEmpty()) std::cout << "  [" << f.tags << "]";
        std::cout << "\n";
    }
    std::cout << files->size() << " file(s)" << std::endl;

    // Remembered for the next "files --last"
    if (!client.setSetting(QStringLiteral("last_search"), search, &err) ||
        !client.setSetting(QStringLiteral("last_only_tagged"), onlyTagged ? QStringLiteral("1") : QStringLiteral("0"), &err) ||
        !client.setSetting(QStringLiteral("last_root"), root, &err)) {
        qWarning().noquote() << "Could not save the filter:" << err;
    }
    return kExitOk;
}

static int listTags(const DbusCatalogClient& client) {
    QString err;
    const auto tags = client.listTags(&err);
    if (!tags) return fail(QStringLiteral("tags"), err);

    for (const auto& t : *tags) {
        std::cout << t.name << " (" << t.fileCount << ")\n";
    }
    std::cout << std::flush;
    return kExitOk;
}

static int showStatus(const DbusCatalogClient& client) {
    if (!client.isAvailable()) {
        return fail(QStringLiteral("status"), QStringLiteral("tagdeckd is not running on the session bus."));
    }

    QString err;
    const auto pong = client.ping(&err);
    if (!pong) return fail(QStringLiteral("status"), err);

    const auto scanning = client.isScanning(&err);
    if (!scanning) return fail(QStringLiteral("status"), err);

    const auto files = client.countFiles(QString(), &err);
    if (!files) return fail(QStringLiteral("status"), err);

    const auto roots = client.listRoots(&err);
    if (!roots) return fail(QStringLiteral("status"), err);

    std::cout << "tagdeckd v" << pong->version << " (API " << pong->apiVersion << ")\n"
              << "Folders: " << roots->size() << "\n"
              << "Files:   " << *files << "\n"
              << "State:   " << (*scanning ? "scanning" : "idle") << std::endl;
    return kExitOk;
}

static int showFileTags(const DbusCatalogClient& client, const QString& path) {
    QString err;
    const auto file = client.fileByPath(path, &err);
    if (!file) return fail(QStringLiteral("file-tags"), err);

    const auto tags = client.fileTags(file->id, &err);
    if (!tags) return fail(QStringLiteral("file-tags"), err);

    for (const auto& t : *tags) std::cout << t.name << "\n";
    std::cout << std::flush;
    return kExitOk;
}

static int tagPaths(const DbusCatalogClient& client, const QString& tagName, const QStringList& paths) {
    QString err;
    QList<qint64> fileIds;
    for (const QString& p : paths) {
        const auto file = client.fileByPath(Utils::normalizePath(p), &err);
        if (!file) return fail(QStringLiteral("tag"), err);
        fileIds.push_back(file->id);
    }

    if (!client.tagFiles(fileIds, tagName, &err)) return fail(QStringLiteral("tag"), err);
    std::cout << "Tagged " << fileIds.size() << " file(s) with " << tagName.trimmed() << std::endl;
    return kExitOk;
}

int main(int argc, char* argv[])
{
    for (int i = 1; i < argc; ++i) {
        if (std::string_view(argv[i]) == "--version") {
            std::cout << "tagdeck v" << Version::VERSION << std::endl;
            return kExitOk;
        }
    }

    QCoreApplication app(argc, argv);

    KAboutData aboutData(
        QStringLiteral("tagdeck"),
        QStringLiteral("Tagdeck"),
        QString::fromUtf8(Version::VERSION),
        QStringLiteral("Tag files on disk with free-text labels and browse them by tag or folder."),
        KAboutLicense::GPL_V3,
        QStringLiteral("(c) 2026 Reikooters <https://github.com/Reikooters>")
    );

    aboutData.addAuthor("Reikooters", "Developer", "https://github.com/Reikooters");
    KAboutData::setApplicationData(aboutData);

    QCommandLineParser parser;
    aboutData.setupCommandLine(&parser);
    parser.setApplicationDescription(aboutData.shortDescription() + QStringLiteral("\n\n"
        "Commands:\n"
        "  status                    Show the daemon version and catalog state\n"
        "  roots                     List indexed folders\n"
        "  add-root PATH             Add a folder to the catalog\n"
        "  remove-root PATH          Remove a folder and forget its files\n"
        "  scan [PATH]               Re-index one folder, or all folders\n"
        "  files                     List files (see --search, --tag, --tagged, --root, --last)\n"
        "  tags                      List tags with file counts\n"
        "  new-tag NAME              Create a tag without attaching it\n"
        "  tag NAME PATH...          Attach a tag to files\n"
        "  file-tags PATH            List the tags of one file\n"
        "  untag NAME PATH           Detach a tag from a file\n"
        "  rename-tag OLD NEW        Rename a tag, merging into NEW if it exists\n"
        "  delete-tag NAME...        Delete tags\n"
        "  move-tag NAME up|down     Change a tag's display position\n"
        "  rename PATH NEWNAME       Rename a file on disk\n"
        "  forget PATH               Remove a file from the catalog"));

    const QCommandLineOption searchOpt(QStringList{"s", "search"}, "Only files whose path contains <text>.", "text");
    const QCommandLineOption tagOpt(QStringList{"t", "tag"}, "Only files carrying tag <name> (repeatable).", "name");
    const QCommandLineOption taggedOpt("tagged", "Only files that have at least one tag.");
    const QCommandLineOption rootOpt(QStringList{"r", "root"}, "Only files under folder <path>.", "path");
    const QCommandLineOption lastOpt("last", "Repeat the previous files filter.");
    parser.addOptions({searchOpt, tagOpt, taggedOpt, rootOpt, lastOpt});
    parser.addPositionalArgument("command", "The command to run.");
    parser.addPositionalArgument("args", "Command arguments.", "[args...]");

    parser.process(app);
    aboutData.processCommandLine(&parser);

    const QStringList args = parser.positionalArguments();
    if (args.isEmpty()) {
        parser.showHelp(kExitUsage);
    }

    const QString command = args.first();
    const QStringList rest = args.mid(1);

    DbusCatalogClient client;
    QString err;

    if (command == QStringLiteral("status")) {
        if (!rest.isEmpty()) return usage(QStringLiteral("status takes no arguments."));
        return showStatus(client);
    }

    if (command == QStringLiteral("roots")) {
        const auto roots = client.listRoots(&err);
        if (!roots) return fail(command, err);
        for (const QString& r : *roots) std::cout << r << "\n";
        std::cout << std::flush;
        return kExitOk;
    }

    if (command == QStringLiteral("add-root")) {
        if (rest.size() != 1) return usage(QStringLiteral("add-root takes exactly one PATH."));
        if (!client.addRoot(Utils::normalizePath(rest[0]), &err)) return fail(command, err);
        std::cout << "Added " << Utils::normalizePath(rest[0]) << ". Run \"tagdeck scan\" to index it." << std::endl;
        return kExitOk;
    }

    if (command == QStringLiteral("remove-root")) {
        if (rest.size() != 1) return usage(QStringLiteral("remove-root takes exactly one PATH."));
        const auto removed = client.removeRoot(Utils::normalizePath(rest[0]), &err);
        if (!removed) return fail(command, err);
        std::cout << "Removed " << Utils::normalizePath(rest[0]) << " and " << *removed << " file record(s)." << std::endl;
        return kExitOk;
    }

    if (command == QStringLiteral("scan")) {
        if (rest.size() > 1) return usage(QStringLiteral("scan takes at most one PATH."));
        return runScan(client, rest.isEmpty() ? QString() : Utils::normalizePath(rest[0]));
    }

    if (command == QStringLiteral("files")) {
        if (!rest.isEmpty()) return usage(QStringLiteral("files takes options only."));
        return listFiles(client, parser, searchOpt, tagOpt, taggedOpt, rootOpt, lastOpt);
    }

    if (command == QStringLiteral("tags")) {
        return listTags(client);
    }

    if (command == QStringLiteral("new-tag")) {
        if (rest.size() != 1) return usage(QStringLiteral("new-tag takes exactly one NAME."));
        const auto tagId = client.ensureTag(rest[0], &err);
        if (!tagId) return fail(command, err);
        std::cout << "Tag " << rest[0].trimmed() << " has id " << *tagId << std::endl;
        return kExitOk;
    }

    if (command == QStringLiteral("file-tags")) {
        if (rest.size() != 1) return usage(QStringLiteral("file-tags takes exactly one PATH."));
        return showFileTags(client, Utils::normalizePath(rest[0]));
    }

    if (command == QStringLiteral("tag")) {
        if (rest.size() < 2) return usage(QStringLiteral("tag takes a NAME and at least one PATH."));
        return tagPaths(client, rest[0], rest.mid(1));
    }

    if (command == QStringLiteral("untag")) {
        if (rest.size() != 2) return usage(QStringLiteral("untag takes a NAME and a PATH."));
        const auto tag = findTag(client, rest[0], &err);
        if (!tag) return fail(command, err);
        const auto file = client.fileByPath(Utils::normalizePath(rest[1]), &err);
        if (!file) return fail(command, err);
        if (!client.untagFile(file->id, {tag->id}, &err)) return fail(command, err);
        return kExitOk;
    }

    if (command == QStringLiteral("rename-tag")) {
        if (rest.size() != 2) return usage(QStringLiteral("rename-tag takes OLD and NEW."));
        const auto tag = findTag(client, rest[0], &err);
        if (!tag) return fail(command, err);
        const auto outcome = client.renameTag(tag->id, rest[1], &err);
        if (!outcome) return fail(command, err);
        if (*outcome == QStringLiteral("merged")) {
            std::cout << "Merged " << tag->name << " into " << rest[1].trimmed() << std::endl;
        } else if (*outcome == QStringLiteral("renamed")) {
            std::cout << "Renamed " << tag->name << " to " << rest[1].trimmed() << std::endl;
        }
        return kExitOk;
    }

    if (command == QStringLiteral("delete-tag")) {
        if (rest.isEmpty()) return usage(QStringLiteral("delete-tag takes at least one NAME."));
        QList<qint64> ids;
        for (const QString& name : rest) {
            const auto tag = findTag(client, name, &err);
            if (!tag) return fail(command, err);
            ids.push_back(tag->id);
        }
        if (!client.deleteTags(ids, &err)) return fail(command, err);
        return kExitOk;
    }

    if (command == QStringLiteral("move-tag")) {
        if (rest.size() != 2 || (rest[1] != QStringLiteral("up") && rest[1] != QStringLiteral("down"))) {
            return usage(QStringLiteral("move-tag takes a NAME and up or down."));
        }
        const auto tag = findTag(client, rest[0], &err);
        if (!tag) return fail(command, err);
        if (!client.moveTag(tag->id, rest[1] == QStringLiteral("up") ? -1 : 1, &err)) return fail(command, err);
        return kExitOk;
    }

    if (command == QStringLiteral("rename")) {
        if (rest.size() != 2) return usage(QStringLiteral("rename takes PATH and NEWNAME."));
        const auto newPath = client.renameFile(Utils::normalizePath(rest[0]), rest[1], &err);
        if (!newPath) return fail(command, err);
        std::cout << *newPath << std::endl;
        return kExitOk;
    }

    if (command == QStringLiteral("forget")) {
        if (rest.size() != 1) return usage(QStringLiteral("forget takes exactly one PATH."));
        if (!client.forgetFile(Utils::normalizePath(rest[0]), &err)) return fail(command, err);
        return kExitOk;
    }

    return usage(QStringLiteral("Unknown command: %1").arg(command));
}
