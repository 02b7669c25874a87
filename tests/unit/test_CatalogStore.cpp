// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include <gtest/gtest.h>
#include <QDateTime>
#include <QElapsedTimer>
#include <QFile>
#include <QSemaphore>
#include <QThread>
#include <QTimeZone>
#include <memory>
#include "TestHelpers.h"
#include "../../CatalogConnection.h"
#include "../../CatalogStore.h"

class CatalogStoreTest : public CatalogTestBase {
protected:
    /**
     * Starts a thread that opens its own connection, takes the write lock with an
     * uncommitted insert and holds it for `holdMs` before committing.
     * Returns once the lock is held; the caller waits on the thread.
     */
    std::unique_ptr<QThread> holdWriteLock(int holdMs, bool* committed) {
        auto ready = std::make_shared<QSemaphore>();
        const QString dbPath = store->databasePath();

        std::unique_ptr<QThread> writer(QThread::create([dbPath, holdMs, committed, ready]() {
            CatalogConnection conn(dbPath, 1000);
            const bool locked = conn.isOpen()
                && conn.exec(QStringLiteral("BEGIN IMMEDIATE;"))
                && conn.exec(QStringLiteral("INSERT INTO settings(key, value) VALUES('writer', 'busy');"));
            ready->release();
            if (!locked) return;

            QThread::msleep(static_cast<unsigned long>(holdMs));
            *committed = conn.exec(QStringLiteral("COMMIT;"));
        }));
        writer->start();
        ready->acquire();
        return writer;
    }
};

TEST_F(CatalogStoreTest, InitializeIsRepeatable) {
    QString err;
    EXPECT_TRUE(store->initialize(&err)) << err.toStdString();
    EXPECT_TRUE(store->initialize(&err)) << err.toStdString();
}

TEST_F(CatalogStoreTest, UpsertTwiceKeepsOneRow) {
    const QString path = writeFile(QStringLiteral("a.txt"), QByteArrayLiteral("hello"));

    EXPECT_EQ(store->upsertFile(path), CatalogStore::UpsertResult::Written);
    const qint64 firstId = fileId(path);
    EXPECT_EQ(store->upsertFile(path), CatalogStore::UpsertResult::Written);

    EXPECT_EQ(store->countFiles().value_or(0), 1u);
    EXPECT_EQ(fileId(path), firstId);

    const auto row = store->fileByPath(path);
    ASSERT_TRUE(row.has_value());
    EXPECT_EQ(row->size, 5);
}

TEST_F(CatalogStoreTest, UpsertRefreshesSizeAndMtime) {
    const QDateTime older = QDateTime::fromSecsSinceEpoch(1600000000, QTimeZone::utc());
    const QDateTime newer = QDateTime::fromSecsSinceEpoch(1700000000, QTimeZone::utc());

    const QString path = writeFile(QStringLiteral("b.bin"), QByteArrayLiteral("12"), older);
    ASSERT_EQ(store->upsertFile(path), CatalogStore::UpsertResult::Written);

    writeFile(QStringLiteral("b.bin"), QByteArrayLiteral("1234567"), newer);
    ASSERT_EQ(store->upsertFile(path), CatalogStore::UpsertResult::Written);

    const auto row = store->fileByPath(path);
    ASSERT_TRUE(row.has_value());
    EXPECT_EQ(row->size, 7);
    EXPECT_DOUBLE_EQ(row->mtime, 1700000000.0);
}

TEST_F(CatalogStoreTest, UpsertOfMissingPathIsSkipped) {
    EXPECT_EQ(store->upsertFile(pathFor(QStringLiteral("nope.txt"))), CatalogStore::UpsertResult::SkippedMissing);
    EXPECT_EQ(store->upsertFile(root()), CatalogStore::UpsertResult::SkippedMissing);
    EXPECT_EQ(store->countFiles().value_or(99), 0u);
}

TEST_F(CatalogStoreTest, FingerprintIsScopedToRoot) {
    const QDateTime t1 = QDateTime::fromSecsSinceEpoch(1600000000, QTimeZone::utc());
    const QDateTime t2 = QDateTime::fromSecsSinceEpoch(1650000000, QTimeZone::utc());
    const QDateTime t3 = QDateTime::fromSecsSinceEpoch(1690000000, QTimeZone::utc());

    store->upsertFile(writeFile(QStringLiteral("a/one"), "1", t1));
    store->upsertFile(writeFile(QStringLiteral("a/two"), "2", t2));
    store->upsertFile(writeFile(QStringLiteral("ab/three"), "3", t3));

    const auto underA = store->countAndMaxModTime(pathFor(QStringLiteral("a")));
    ASSERT_TRUE(underA.has_value());
    EXPECT_EQ(underA->count, 2u);
    EXPECT_DOUBLE_EQ(underA->maxMtime, 1650000000.0);

    const auto all = store->countAndMaxModTime();
    ASSERT_TRUE(all.has_value());
    EXPECT_EQ(all->count, 3u);
    EXPECT_DOUBLE_EQ(all->maxMtime, 1690000000.0);

    const auto empty = store->countAndMaxModTime(pathFor(QStringLiteral("nothing-here")));
    ASSERT_TRUE(empty.has_value());
    EXPECT_EQ(empty->count, 0u);
    EXPECT_DOUBLE_EQ(empty->maxMtime, 0.0);
}

TEST_F(CatalogStoreTest, RemoveRootDeletesOnlyFilesUnderThatRoot) {
    const QString a = pathFor(QStringLiteral("a"));
    const QString ab = pathFor(QStringLiteral("ab"));

    store->upsertFile(writeFile(QStringLiteral("a/x.txt")));
    store->upsertFile(writeFile(QStringLiteral("a/sub/y.txt")));
    const QString kept = writeFile(QStringLiteral("ab/z.txt"));
    store->upsertFile(kept);

    ASSERT_TRUE(store->addRoot(a));
    ASSERT_TRUE(store->addRoot(ab));

    QString err;
    const auto removed = store->removeRoot(a, &err);
    ASSERT_TRUE(removed.has_value()) << err.toStdString();
    EXPECT_EQ(*removed, 2);

    EXPECT_EQ(listedPaths({}), QStringList{kept});
    EXPECT_EQ(store->listRoots().value_or(QStringList{}), QStringList{ab});
}

TEST_F(CatalogStoreTest, RootPrefixTreatsLikeMetacharactersLiterally) {
    const QString underscored = writeFile(QStringLiteral("a_b/1.txt"));
    const QString lookalike = writeFile(QStringLiteral("axb/2.txt"));
    const QString percent = writeFile(QStringLiteral("100%/3.txt"));
    const QString percentLookalike = writeFile(QStringLiteral("100x/nested/4.txt"));
    for (const QString& p : {underscored, lookalike, percent, percentLookalike}) {
        ASSERT_EQ(store->upsertFile(p), CatalogStore::UpsertResult::Written);
    }

    CatalogStore::FileFilter filter;
    filter.rootPrefix = pathFor(QStringLiteral("a_b"));
    EXPECT_EQ(listedPaths(filter), QStringList{underscored});

    filter.rootPrefix = pathFor(QStringLiteral("100%"));
    EXPECT_EQ(listedPaths(filter), QStringList{percent});

    EXPECT_EQ(store->countFiles(pathFor(QStringLiteral("a_b"))).value_or(0), 1u);
}

TEST_F(CatalogStoreTest, ListFilesRequiresEveryRequestedTag) {
    const QString f1 = writeFile(QStringLiteral("f1"));
    const QString f2 = writeFile(QStringLiteral("f2"));
    const QString f3 = writeFile(QStringLiteral("f3"));
    for (const QString& p : {f1, f2, f3}) store->upsertFile(p);

    const auto work = store->ensureTag(QStringLiteral("work"));
    const auto urgent = store->ensureTag(QStringLiteral("urgent"));
    ASSERT_TRUE(work && urgent);

    ASSERT_TRUE(store->tagFiles({fileId(f1), fileId(f2)}, *work));
    ASSERT_TRUE(store->tagFiles({fileId(f2), fileId(f3)}, *urgent));

    CatalogStore::FileFilter filter;
    filter.tagIds = {*work, *urgent};
    EXPECT_EQ(listedPaths(filter), QStringList{f2});

    // The same tag twice must not change the result
    filter.tagIds = {*work, *work};
    EXPECT_EQ(listedPaths(filter), (QStringList{f1, f2}));
}

TEST_F(CatalogStoreTest, ListFilesOrdersByPathAndJoinsTagNames) {
    const QString b = writeFile(QStringLiteral("b.txt"));
    const QString a = writeFile(QStringLiteral("a.txt"));
    store->upsertFile(b);
    store->upsertFile(a);

    const auto red = store->ensureTag(QStringLiteral("red"));
    const auto blue = store->ensureTag(QStringLiteral("blue"));
    ASSERT_TRUE(red && blue);
    store->tagFiles({fileId(a)}, *red);
    store->tagFiles({fileId(a)}, *blue);

    const auto rows = store->listFiles({});
    ASSERT_TRUE(rows.has_value());
    ASSERT_EQ(rows->size(), 2);
    EXPECT_EQ(rows->at(0).path, a);
    EXPECT_EQ(rows->at(1).path, b);

    EXPECT_TRUE(rows->at(0).tags.contains(QStringLiteral("red")));
    EXPECT_TRUE(rows->at(0).tags.contains(QStringLiteral("blue")));
    EXPECT_TRUE(rows->at(0).tags.contains(QStringLiteral(", ")));
    EXPECT_TRUE(rows->at(1).tags.isEmpty());
}

TEST_F(CatalogStoreTest, ListFilesSearchAndOnlyTagged) {
    const QString report = writeFile(QStringLiteral("docs/Report_2024.pdf"));
    const QString notes = writeFile(QStringLiteral("docs/notes.txt"));
    const QString photo = writeFile(QStringLiteral("pics/report-2023.jpg"));
    for (const QString& p : {report, notes, photo}) store->upsertFile(p);

    CatalogStore::FileFilter filter;
    filter.search = QStringLiteral("Report");
    EXPECT_EQ(listedPaths(filter), QStringList{report});

    // '_' is a literal underscore, not a single-character wildcard
    filter.search = QStringLiteral("t_2");
    EXPECT_EQ(listedPaths(filter), QStringList{report});
    filter.search = QStringLiteral("t-2");
    EXPECT_EQ(listedPaths(filter), QStringList{photo});

    const auto tag = store->ensureTag(QStringLiteral("keep"));
    ASSERT_TRUE(tag);
    store->tagFiles({fileId(notes)}, *tag);

    filter = {};
    filter.onlyTagged = true;
    EXPECT_EQ(listedPaths(filter), QStringList{notes});

    filter.rootPrefix = pathFor(QStringLiteral("pics"));
    EXPECT_TRUE(listedPaths(filter).isEmpty());
}

TEST_F(CatalogStoreTest, RemoveMissingUnderPrunesDeletedFiles) {
    const QString gone = writeFile(QStringLiteral("d/gone.txt"));
    const QString stays = writeFile(QStringLiteral("d/stays.txt"));
    const QString outside = writeFile(QStringLiteral("other/outside.txt"));
    for (const QString& p : {gone, stays, outside}) store->upsertFile(p);

    ASSERT_TRUE(QFile::remove(gone));
    ASSERT_TRUE(QFile::remove(outside));

    QString err;
    const auto removed = store->removeMissingUnder(pathFor(QStringLiteral("d")), &err);
    ASSERT_TRUE(removed.has_value()) << err.toStdString();
    EXPECT_EQ(*removed, 1);

    // Rows outside the root are left alone even if their file is gone too
    EXPECT_EQ(listedPaths({}), (QStringList{stays, outside}));
}

TEST_F(CatalogStoreTest, EnsureTagIsGetOrCreate) {
    const auto a = store->ensureTag(QStringLiteral("  alpha "));
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(store->ensureTag(QStringLiteral("alpha")), a);

    QString err;
    EXPECT_FALSE(store->ensureTag(QStringLiteral("   "), &err).has_value());
    EXPECT_TRUE(err.isEmpty());

    const auto b = store->ensureTag(QStringLiteral("beta"));
    ASSERT_TRUE(b.has_value());

    const auto tags = store->listTags();
    ASSERT_TRUE(tags.has_value());
    ASSERT_EQ(tags->size(), 2);
    EXPECT_EQ(tags->at(0).name, QStringLiteral("alpha"));
    EXPECT_EQ(tags->at(1).name, QStringLiteral("beta"));
    EXPECT_LT(tags->at(0).order, tags->at(1).order);
}

TEST_F(CatalogStoreTest, RenameTagMergesIntoExistingTag) {
    const QString f1 = writeFile(QStringLiteral("f1"));
    const QString f2 = writeFile(QStringLiteral("f2"));
    const QString f3 = writeFile(QStringLiteral("f3"));
    for (const QString& p : {f1, f2, f3}) store->upsertFile(p);

    const auto todo = store->ensureTag(QStringLiteral("todo"));
    const auto later = store->ensureTag(QStringLiteral("later"));
    ASSERT_TRUE(todo && later);
    store->tagFiles({fileId(f1), fileId(f2)}, *todo);
    store->tagFiles({fileId(f2), fileId(f3)}, *later);

    QString err;
    EXPECT_EQ(store->renameOrMergeTag(*todo, QStringLiteral("later"), &err),
              CatalogStore::TagRenameResult::Merged) << err.toStdString();

    const auto tags = store->listTags();
    ASSERT_TRUE(tags.has_value());
    ASSERT_EQ(tags->size(), 1);
    EXPECT_EQ(tags->at(0).id, *later);

    CatalogStore::FileFilter filter;
    filter.tagIds = {*later};
    EXPECT_EQ(listedPaths(filter), (QStringList{f1, f2, f3}));

    const auto counts = store->fileCountsByTag();
    ASSERT_TRUE(counts.has_value());
    EXPECT_EQ(counts->value(*later), 3u);

    // f2 carried both tags; after the merge it has the surviving one exactly once
    const auto f2Tags = store->tagsForFile(fileId(f2));
    ASSERT_TRUE(f2Tags.has_value());
    EXPECT_EQ(f2Tags->size(), 1);
}

TEST_F(CatalogStoreTest, RenameTagOutcomes) {
    const auto tag = store->ensureTag(QStringLiteral("draft"));
    ASSERT_TRUE(tag);

    EXPECT_EQ(store->renameOrMergeTag(*tag, QStringLiteral("  ")), CatalogStore::TagRenameResult::Unchanged);
    EXPECT_EQ(store->renameOrMergeTag(*tag, QStringLiteral("draft")), CatalogStore::TagRenameResult::Unchanged);
    EXPECT_EQ(store->renameOrMergeTag(*tag, QStringLiteral(" final ")), CatalogStore::TagRenameResult::Renamed);
    EXPECT_EQ(store->tagIdByName(QStringLiteral("final")), tag);
    EXPECT_EQ(store->renameOrMergeTag(*tag + 1000, QStringLiteral("x")), CatalogStore::TagRenameResult::NotFound);
}

TEST_F(CatalogStoreTest, MoveTagSwapsWithNeighbour) {
    const auto a = store->ensureTag(QStringLiteral("a"));
    const auto b = store->ensureTag(QStringLiteral("b"));
    const auto c = store->ensureTag(QStringLiteral("c"));
    ASSERT_TRUE(a && b && c);

    auto names = [this]() {
        QStringList out;
        for (const auto& t : store->listTags().value_or(QList<CatalogStore::TagRow>{})) out << t.name;
        return out;
    };

    ASSERT_TRUE(store->moveTag(*c, -1));
    EXPECT_EQ(names(), (QStringList{"a", "c", "b"}));

    ASSERT_TRUE(store->moveTag(*a, 1));
    EXPECT_EQ(names(), (QStringList{"c", "a", "b"}));

    // Already at the edges
    ASSERT_TRUE(store->moveTag(*c, -1));
    ASSERT_TRUE(store->moveTag(*b, 1));
    EXPECT_EQ(names(), (QStringList{"c", "a", "b"}));
}

TEST_F(CatalogStoreTest, InitializeAssignsOrderToUnorderedTags) {
    {
        CatalogConnection conn(store->databasePath(), 1000);
        ASSERT_TRUE(conn.isOpen());
        ASSERT_TRUE(conn.exec(QStringLiteral("INSERT INTO tags(name, ord) VALUES('zeta', NULL);")));
        ASSERT_TRUE(conn.exec(QStringLiteral("INSERT INTO tags(name, ord) VALUES('alpha', NULL);")));
    }

    ASSERT_TRUE(store->initialize());

    const auto tags = store->listTags();
    ASSERT_TRUE(tags.has_value());
    ASSERT_EQ(tags->size(), 2);
    EXPECT_EQ(tags->at(0).name, QStringLiteral("alpha"));
    EXPECT_EQ(tags->at(0).order, 1);
    EXPECT_EQ(tags->at(1).name, QStringLiteral("zeta"));
    EXPECT_EQ(tags->at(1).order, 2);
}

TEST_F(CatalogStoreTest, DeletingTagRemovesItsLinks) {
    const QString f = writeFile(QStringLiteral("f"));
    store->upsertFile(f);
    const auto tag = store->ensureTag(QStringLiteral("temp"));
    ASSERT_TRUE(tag);
    store->tagFiles({fileId(f)}, *tag);

    ASSERT_TRUE(store->deleteTags({*tag}));

    CatalogStore::FileFilter filter;
    filter.onlyTagged = true;
    EXPECT_TRUE(listedPaths(filter).isEmpty());
    EXPECT_TRUE(store->listTags().value_or(QList<CatalogStore::TagRow>{}).isEmpty());
}

TEST_F(CatalogStoreTest, TagAndUntagSingleFile) {
    const QString f = writeFile(QStringLiteral("f"));
    store->upsertFile(f);
    const qint64 id = fileId(f);

    const auto x = store->ensureTag(QStringLiteral("x"));
    const auto y = store->ensureTag(QStringLiteral("y"));
    const auto unused = store->ensureTag(QStringLiteral("unused"));
    ASSERT_TRUE(x && y && unused);

    ASSERT_TRUE(store->tagFiles({id}, *x));
    ASSERT_TRUE(store->tagFiles({id}, *x));
    ASSERT_TRUE(store->tagFiles({id}, *y));

    auto tags = store->tagsForFile(id);
    ASSERT_TRUE(tags.has_value());
    ASSERT_EQ(tags->size(), 2);
    EXPECT_EQ(tags->at(0).name, QStringLiteral("x"));

    const auto counts = store->fileCountsByTag();
    ASSERT_TRUE(counts.has_value());
    EXPECT_EQ(counts->value(*x), 1u);
    EXPECT_TRUE(counts->contains(*unused));
    EXPECT_EQ(counts->value(*unused), 0u);

    ASSERT_TRUE(store->untagFile(id, {*x}));
    tags = store->tagsForFile(id);
    ASSERT_TRUE(tags.has_value());
    ASSERT_EQ(tags->size(), 1);
    EXPECT_EQ(tags->at(0).id, *y);
}

TEST_F(CatalogStoreTest, RenameFilePathKeepsIdAndTags) {
    const QString from = writeFile(QStringLiteral("old.txt"));
    store->upsertFile(from);
    const qint64 id = fileId(from);
    const auto tag = store->ensureTag(QStringLiteral("t"));
    ASSERT_TRUE(tag);
    store->tagFiles({id}, *tag);

    const QString to = pathFor(QStringLiteral("new.txt"));
    ASSERT_TRUE(QFile::rename(from, to));
    ASSERT_TRUE(store->renameFilePath(from, to));

    const auto row = store->fileById(id);
    ASSERT_TRUE(row.has_value());
    EXPECT_EQ(row->path, to);
    EXPECT_EQ(row->tags, QStringLiteral("t"));
    EXPECT_FALSE(store->fileByPath(from).has_value());
}

TEST_F(CatalogStoreTest, ForgetFileDropsRow) {
    const QString f = writeFile(QStringLiteral("f"));
    store->upsertFile(f);

    ASSERT_TRUE(store->forgetFile(f));
    EXPECT_EQ(store->countFiles().value_or(99), 0u);
    EXPECT_TRUE(QFile::exists(f));

    // Forgetting twice is fine
    EXPECT_TRUE(store->forgetFile(f));
}

TEST_F(CatalogStoreTest, RootsAreNormalizedAndDeduplicated) {
    const QString r = pathFor(QStringLiteral("music"));
    ASSERT_TRUE(store->addRoot(r + QStringLiteral("/")));
    ASSERT_TRUE(store->addRoot(r));
    ASSERT_TRUE(store->addRoot(pathFor(QStringLiteral("books"))));

    EXPECT_EQ(store->listRoots().value_or(QStringList{}),
              (QStringList{pathFor(QStringLiteral("books")), r}));

    QString err;
    EXPECT_FALSE(store->addRoot(QString(), &err));
    EXPECT_FALSE(err.isEmpty());
}

TEST_F(CatalogStoreTest, SettingsFallBackToDefaultAndUpsert) {
    EXPECT_EQ(store->setting(QStringLiteral("last_search"), QStringLiteral("none")), QStringLiteral("none"));

    ASSERT_TRUE(store->setSetting(QStringLiteral("last_search"), QStringLiteral("invoice")));
    ASSERT_TRUE(store->setSetting(QStringLiteral("last_search"), QStringLiteral("receipt")));
    EXPECT_EQ(store->setting(QStringLiteral("last_search")), QStringLiteral("receipt"));
}

TEST_F(CatalogStoreTest, UnopenableDatabaseReportsError) {
    CatalogStore broken(tmp.filePath(QStringLiteral("missing-dir/sub/catalog.db")));

    QString err;
    EXPECT_FALSE(broken.initialize(&err));
    EXPECT_FALSE(err.isEmpty());
    EXPECT_FALSE(broken.listRoots(&err).has_value());
    EXPECT_EQ(broken.upsertFile(writeFile(QStringLiteral("f"))), CatalogStore::UpsertResult::Failed);
}

TEST_F(CatalogStoreTest, TagEditsWaitForAConcurrentWriter) {
    ASSERT_TRUE(store->ensureTag(QStringLiteral("existing")).has_value());

    bool committed = false;
    const auto writer = holdWriteLock(300, &committed);

    QElapsedTimer timer;
    timer.start();
    QString err;
    const auto tag = store->ensureTag(QStringLiteral("fresh"), &err);
    const qint64 waitedMs = timer.elapsed();

    writer->wait();
    ASSERT_TRUE(committed);
    ASSERT_TRUE(tag.has_value()) << err.toStdString();
    EXPECT_GE(waitedMs, 200);
    EXPECT_EQ(store->tagIdByName(QStringLiteral("fresh")), tag);

    const auto existing = store->tagIdByName(QStringLiteral("existing"));
    ASSERT_TRUE(existing.has_value());
    bool secondCommitted = false;
    const auto second = holdWriteLock(200, &secondCommitted);
    EXPECT_TRUE(store->moveTag(*existing, 1, &err)) << err.toStdString();
    second->wait();
    EXPECT_TRUE(secondCommitted);
    EXPECT_EQ(store->setting(QStringLiteral("writer")), QStringLiteral("busy"));
}

TEST_F(CatalogStoreTest, WriterHoldingLockPastTimeoutFailsCleanly) {
    CatalogStore impatient(store->databasePath(), 100);

    bool committed = false;
    const auto writer = holdWriteLock(1500, &committed);

    QString err;
    EXPECT_FALSE(impatient.ensureTag(QStringLiteral("late"), &err).has_value());
    EXPECT_FALSE(err.isEmpty());

    writer->wait();
    EXPECT_TRUE(committed);
    EXPECT_FALSE(store->tagIdByName(QStringLiteral("late")).has_value());
}
