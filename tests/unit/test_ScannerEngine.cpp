// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include <gtest/gtest.h>
#include <QDateTime>
#include <QFile>
#include <QTimeZone>
#include <utility>
#include <vector>
#include "TestHelpers.h"
#include "../../ScannerEngine.h"

using Progress = std::vector<std::pair<quint64, quint64>>;

class ScannerEngineTest : public CatalogTestBase {};

TEST(ProgressStepTest, RoughlyOnePercent) {
    EXPECT_EQ(ScannerEngine::progressStep(0), 1u);
    EXPECT_EQ(ScannerEngine::progressStep(3), 1u);
    EXPECT_EQ(ScannerEngine::progressStep(199), 1u);
    EXPECT_EQ(ScannerEngine::progressStep(250), 2u);
    EXPECT_EQ(ScannerEngine::progressStep(100000), 1000u);
}

TEST(ProgressTrackerTest, ReportsEveryStepAndTheFinalFile) {
    Progress seen;
    ScannerEngine::ProgressTracker tracker(250, 100, [&seen](quint64 p, quint64 t) { seen.emplace_back(p, t); });

    for (int i = 0; i < 250; ++i) tracker.advance();
    tracker.finish();

    EXPECT_EQ(seen, (Progress{{100, 250}, {200, 250}, {250, 250}}));
}

TEST(ProgressTrackerTest, FinishCompletesWhenFilesVanished) {
    Progress seen;
    ScannerEngine::ProgressTracker tracker(10, 4, [&seen](quint64 p, quint64 t) { seen.emplace_back(p, t); });

    for (int i = 0; i < 9; ++i) tracker.advance();
    tracker.finish();

    EXPECT_EQ(seen, (Progress{{4, 10}, {8, 10}, {10, 10}}));
}

TEST(ProgressTrackerTest, NeverExceedsTotalWhenFilesAppeared) {
    Progress seen;
    ScannerEngine::ProgressTracker tracker(3, 1, [&seen](quint64 p, quint64 t) { seen.emplace_back(p, t); });

    for (int i = 0; i < 5; ++i) tracker.advance();
    tracker.finish();

    EXPECT_EQ(seen, (Progress{{1, 3}, {2, 3}, {3, 3}}));
}

TEST(ProgressTrackerTest, EmptyWalkReportsTotalOfOne) {
    Progress seen;
    ScannerEngine::ProgressTracker tracker(0, 1, [&seen](quint64 p, quint64 t) { seen.emplace_back(p, t); });
    tracker.finish();

    EXPECT_EQ(tracker.total(), 1u);
    EXPECT_EQ(seen, (Progress{{1, 1}}));
}

TEST(UniqueRootsTest, DropsDuplicatesAfterNormalization) {
    const QStringList out = ScannerEngine::uniqueRoots({
        QStringLiteral("/data/music/"),
        QStringLiteral("/data/music"),
        QStringLiteral("/data/x/../music"),
        QString(),
        QStringLiteral("/data/books"),
    });
    EXPECT_EQ(out, (QStringList{"/data/music", "/data/books"}));
}

TEST_F(ScannerEngineTest, FingerprintCountsNestedAndHiddenFiles) {
    writeFile(QStringLiteral("one.txt"), "1", QDateTime::fromSecsSinceEpoch(1600000000, QTimeZone::utc()));
    writeFile(QStringLiteral("deep/er/two.txt"), "2", QDateTime::fromSecsSinceEpoch(1700000000, QTimeZone::utc()));
    writeFile(QStringLiteral(".hidden"), "3", QDateTime::fromSecsSinceEpoch(1650000000, QTimeZone::utc()));
    ASSERT_TRUE(QDir(root()).mkpath(QStringLiteral("empty/dir")));

    const auto fp = ScannerEngine::fingerprintDirectory(root());
    EXPECT_EQ(fp.count, 3u);
    EXPECT_DOUBLE_EQ(fp.maxMtime, 1700000000.0);
}

TEST_F(ScannerEngineTest, FingerprintOfMissingDirectoryIsEmpty) {
    const auto fp = ScannerEngine::fingerprintDirectory(pathFor(QStringLiteral("does-not-exist")));
    EXPECT_EQ(fp.count, 0u);
    EXPECT_DOUBLE_EQ(fp.maxMtime, 0.0);
}

TEST_F(ScannerEngineTest, WalkUpsertsEveryFileAndMatchesFingerprint) {
    writeFile(QStringLiteral("a"));
    writeFile(QStringLiteral("sub/b"));
    writeFile(QStringLiteral("sub/deeper/c"));

    const auto disk = ScannerEngine::fingerprintDirectory(root());
    ASSERT_EQ(disk.count, 3u);

    Progress seen;
    ScannerEngine::ProgressTracker tracker(disk.count, ScannerEngine::progressStep(disk.count),
                                           [&seen](quint64 p, quint64 t) { seen.emplace_back(p, t); });
    ScannerEngine::BatchSummary summary;
    ScannerEngine::walkAndUpsert(*store, root(), tracker, summary);
    tracker.finish();

    EXPECT_EQ(summary.processed, 3u);
    EXPECT_EQ(summary.upserted, 3u);
    EXPECT_EQ(summary.skippedMissing, 0u);
    EXPECT_EQ(summary.skippedErrors, 0u);
    EXPECT_EQ(seen, (Progress{{1, 3}, {2, 3}, {3, 3}}));

    const auto stored = store->countAndMaxModTime(root());
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->count, disk.count);
    EXPECT_DOUBLE_EQ(stored->maxMtime, disk.maxMtime);
}

TEST_F(ScannerEngineTest, UpsertOneClassifiesOutcomes) {
    const QString present = writeFile(QStringLiteral("present"));
    EXPECT_EQ(ScannerEngine::upsertOne(*store, present), ScannerEngine::FileOutcome::Upserted);
    EXPECT_EQ(ScannerEngine::upsertOne(*store, pathFor(QStringLiteral("absent"))),
              ScannerEngine::FileOutcome::SkippedMissing);

    CatalogStore broken(tmp.filePath(QStringLiteral("no/such/dir/catalog.db")));
    EXPECT_EQ(ScannerEngine::upsertOne(broken, present), ScannerEngine::FileOutcome::SkippedStorageError);
}

TEST(BatchSummaryTest, RecordCountsEachOutcome) {
    ScannerEngine::BatchSummary s;
    s.record(ScannerEngine::FileOutcome::Upserted);
    s.record(ScannerEngine::FileOutcome::Upserted);
    s.record(ScannerEngine::FileOutcome::SkippedMissing);
    s.record(ScannerEngine::FileOutcome::SkippedStorageError);

    EXPECT_EQ(s.processed, 4u);
    EXPECT_EQ(s.upserted, 2u);
    EXPECT_EQ(s.skippedMissing, 1u);
    EXPECT_EQ(s.skippedErrors, 1u);
}
