// snapshot_store.hpp

#pragma once

#include <ctime>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

// --- Constants ---
#define LATEST_FILENAME "last.jpg"
#define ARCHIVE_PREFIX "snapshot_"
#define ARCHIVE_EXTENSION ".jpg"
#define COUNT_FILENAME ".image_count"

// Disk write failures while storing a snapshot.
class StorageError : public std::runtime_error {
public:
    explicit StorageError(const std::string& what) : std::runtime_error(what) {}
};

struct StoredSnapshot {
    std::string filename; // archive name, or LATEST_FILENAME without archival
    std::string path;
    std::time_t timestamp;
};

struct StoreOptions {
    std::string directory;
    bool keep_archive = true;
    int max_archive_files = 0; // 0 = unlimited
};

// Persists captures under one directory. "last.jpg" always holds the newest
// complete image; archives are named snapshot_YYYYMMDD_HHMMSS[_N].jpg. Every
// file is written to a temporary name and renamed into place. The number of
// captures ever saved is kept in ".image_count" beside them, so pruning and
// latest-only retention do not change it across restarts.
class SnapshotStore {
private:
    StoreOptions options;

    mutable std::mutex mutex;
    mutable bool reconciled;
    mutable long image_count;
    mutable std::optional<StoredSnapshot> last_snapshot;

    void reconcile() const;
    std::optional<long> read_count_file() const;
    std::vector<std::string> list_archives() const;
    std::string unique_archive_name(std::time_t timestamp) const;
    void write_atomically(const std::string& filename, const std::vector<unsigned char>& image) const;
    void prune_archives();

public:
    // Throws StorageError if the directory cannot be created.
    explicit SnapshotStore(const StoreOptions& options);

    StoredSnapshot save(const std::vector<unsigned char>& image, std::time_t timestamp);

    long current_count() const;
    std::optional<StoredSnapshot> latest() const;

    std::string latest_path() const;
    const StoreOptions& store_options() const { return options; }
};
