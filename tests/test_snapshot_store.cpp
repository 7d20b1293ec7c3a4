// test_snapshot_store.cpp

#include <gtest/gtest.h>

#include <atomic>
#include <fstream>
#include <iterator>
#include <thread>

#include "snapshot_store.hpp"
#include "test_support.hpp"

namespace {

std::vector<unsigned char> read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    return std::vector<unsigned char>((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

bool exists(const std::string& path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0;
}

StoreOptions options_for(const TempDir& dir) {
    StoreOptions options;
    options.directory = dir.path();
    return options;
}

} // namespace

TEST(SnapshotStore, SaveWritesArchiveAndLatest) {
    TempDir dir;
    SnapshotStore store(options_for(dir));
    std::time_t when = make_local_time(2024, 6, 3, 9, 15, 42);

    StoredSnapshot stored = store.save(fake_image('a'), when);

    EXPECT_EQ(stored.filename, "snapshot_20240603_091542.jpg");
    EXPECT_EQ(stored.path, dir.file("snapshot_20240603_091542.jpg"));
    EXPECT_EQ(read_file(stored.path), fake_image('a'));
    EXPECT_EQ(read_file(dir.file(LATEST_FILENAME)), fake_image('a'));
    EXPECT_EQ(store.current_count(), 1);
    ASSERT_TRUE(store.latest().has_value());
    EXPECT_EQ(store.latest()->filename, stored.filename);
}

TEST(SnapshotStore, SameSecondCapturesGetDistinctNames) {
    TempDir dir;
    SnapshotStore store(options_for(dir));
    std::time_t when = make_local_time(2024, 6, 3, 9, 15, 42);

    StoredSnapshot first = store.save(fake_image('a'), when);
    StoredSnapshot second = store.save(fake_image('b'), when);

    EXPECT_NE(first.filename, second.filename);
    EXPECT_EQ(second.filename, "snapshot_20240603_091542_1.jpg");
    EXPECT_EQ(read_file(first.path), fake_image('a'));
    EXPECT_EQ(read_file(dir.file(LATEST_FILENAME)), fake_image('b'));
    EXPECT_EQ(store.current_count(), 2);
}

TEST(SnapshotStore, LatestOnlyRetentionKeepsNoArchive) {
    TempDir dir;
    StoreOptions options = options_for(dir);
    options.keep_archive = false;
    SnapshotStore store(options);

    StoredSnapshot stored = store.save(fake_image('a'), make_local_time(2024, 6, 3, 9, 0));
    store.save(fake_image('b'), make_local_time(2024, 6, 3, 9, 1));

    EXPECT_EQ(stored.filename, LATEST_FILENAME);
    EXPECT_FALSE(exists(dir.file("snapshot_20240603_090000.jpg")));
    EXPECT_EQ(read_file(dir.file(LATEST_FILENAME)), fake_image('b'));
    EXPECT_EQ(store.current_count(), 2);
}

TEST(SnapshotStore, PrunesOldestArchivesBeyondLimit) {
    TempDir dir;
    StoreOptions options = options_for(dir);
    options.max_archive_files = 2;
    SnapshotStore store(options);

    store.save(fake_image('a'), make_local_time(2024, 6, 3, 9, 0));
    store.save(fake_image('b'), make_local_time(2024, 6, 3, 9, 1));
    store.save(fake_image('c'), make_local_time(2024, 6, 3, 9, 2));

    EXPECT_FALSE(exists(dir.file("snapshot_20240603_090000.jpg")));
    EXPECT_TRUE(exists(dir.file("snapshot_20240603_090100.jpg")));
    EXPECT_TRUE(exists(dir.file("snapshot_20240603_090200.jpg")));
    // The capture count does not go down when old files are pruned
    EXPECT_EQ(store.current_count(), 3);
}

TEST(SnapshotStore, CountSurvivesRestart) {
    TempDir dir;
    {
        SnapshotStore store(options_for(dir));
        store.save(fake_image('a'), make_local_time(2024, 6, 3, 9, 0));
        store.save(fake_image('b'), make_local_time(2024, 6, 3, 9, 1));
        store.save(fake_image('c'), make_local_time(2024, 6, 3, 9, 2));
    }

    SnapshotStore reopened(options_for(dir));
    EXPECT_EQ(reopened.current_count(), 3);
    ASSERT_TRUE(reopened.latest().has_value());
    EXPECT_EQ(reopened.latest()->filename, "snapshot_20240603_090200.jpg");

    reopened.save(fake_image('d'), make_local_time(2024, 6, 3, 9, 3));
    EXPECT_EQ(reopened.current_count(), 4);
}

TEST(SnapshotStore, CountSurvivesRestartWithPruning) {
    TempDir dir;
    StoreOptions options = options_for(dir);
    options.max_archive_files = 2;
    {
        SnapshotStore store(options);
        for (int i = 0; i < 5; i++) {
            store.save(fake_image('a' + i), make_local_time(2024, 6, 3, 9, i));
        }
        EXPECT_EQ(store.current_count(), 5);
    }

    SnapshotStore reopened(options);
    EXPECT_EQ(reopened.current_count(), 5);
    ASSERT_TRUE(reopened.latest().has_value());
    EXPECT_EQ(reopened.latest()->filename, "snapshot_20240603_090400.jpg");
}

TEST(SnapshotStore, CountSurvivesRestartWithLatestOnly) {
    TempDir dir;
    StoreOptions options = options_for(dir);
    options.keep_archive = false;
    {
        SnapshotStore store(options);
        for (int i = 0; i < 4; i++) {
            store.save(fake_image('a' + i), make_local_time(2024, 6, 3, 9, i));
        }
    }

    SnapshotStore reopened(options);
    EXPECT_EQ(reopened.current_count(), 4);
    reopened.save(fake_image('z'), make_local_time(2024, 6, 3, 9, 10));
    EXPECT_EQ(reopened.current_count(), 5);
}

TEST(SnapshotStore, NewestOfManySameSecondCapturesIsFoundAfterRestart) {
    TempDir dir;
    std::time_t when = make_local_time(2024, 6, 3, 9, 15, 42);
    {
        SnapshotStore store(options_for(dir));
        for (int i = 0; i < 12; i++) {
            store.save(fake_image('a' + i), when);
        }
    }
    ASSERT_EQ(unlink(dir.file(LATEST_FILENAME).c_str()), 0);

    SnapshotStore reopened(options_for(dir));
    ASSERT_TRUE(reopened.latest().has_value());
    EXPECT_EQ(reopened.latest()->filename, "snapshot_20240603_091542_11.jpg");
    EXPECT_EQ(read_file(dir.file(LATEST_FILENAME)), fake_image('a' + 11));
}

TEST(SnapshotStore, RestoresMissingLatestFromNewestArchive) {
    TempDir dir;
    {
        SnapshotStore store(options_for(dir));
        store.save(fake_image('a'), make_local_time(2024, 6, 3, 9, 0));
        store.save(fake_image('b'), make_local_time(2024, 6, 3, 9, 1));
    }
    ASSERT_EQ(unlink(dir.file(LATEST_FILENAME).c_str()), 0);

    SnapshotStore reopened(options_for(dir));
    EXPECT_EQ(reopened.current_count(), 2);
    EXPECT_EQ(read_file(dir.file(LATEST_FILENAME)), fake_image('b'));
}

TEST(SnapshotStore, IgnoresUnrelatedFiles) {
    TempDir dir;
    std::ofstream(dir.file("notes.txt")) << "hello";
    std::ofstream(dir.file("snapshot_broken.png")) << "x";

    SnapshotStore store(options_for(dir));
    EXPECT_EQ(store.current_count(), 0);
    EXPECT_FALSE(store.latest().has_value());
}

TEST(SnapshotStore, WriteFailureRaisesStorageError) {
    TempDir dir;
    std::string nested = dir.file("gone");
    StoreOptions options;
    options.directory = nested;
    SnapshotStore store(options);
    store.current_count();

    ASSERT_EQ(rmdir(nested.c_str()), 0);
    EXPECT_THROW(store.save(fake_image('a'), make_local_time(2024, 6, 3, 9, 0)), StorageError);
}

TEST(SnapshotStore, ConcurrentReaderNeverSeesPartialLatest) {
    TempDir dir;
    SnapshotStore store(options_for(dir));

    const std::vector<unsigned char> image_a = fake_image('a', 256 * 1024);
    const std::vector<unsigned char> image_b = fake_image('b', 384 * 1024);
    store.save(image_a, make_local_time(2024, 6, 3, 9, 0));

    std::atomic<bool> done(false);
    std::atomic<int> bad_reads(0);
    std::atomic<int> reads(0);

    std::thread reader([&] {
        while (!done.load()) {
            std::vector<unsigned char> seen = read_file(dir.file(LATEST_FILENAME));
            if (seen != image_a && seen != image_b) {
                bad_reads++;
            }
            reads++;
        }
    });

    std::time_t when = make_local_time(2024, 6, 3, 10, 0);
    for (int i = 0; i < 50; i++) {
        store.save(i % 2 == 0 ? image_b : image_a, when + i);
    }
    done = true;
    reader.join();

    EXPECT_GT(reads.load(), 0);
    EXPECT_EQ(bad_reads.load(), 0);
}
