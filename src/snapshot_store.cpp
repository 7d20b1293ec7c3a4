// snapshot_store.cpp

#include "snapshot_store.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <dirent.h>
#include <fcntl.h>
#include <fstream>
#include <iterator>
#include <sys/stat.h>
#include <unistd.h>

#include "logger.hpp"
#include "utils.hpp"

namespace {

std::string join_path(const std::string& dir, const std::string& name) {
    if (!dir.empty() && dir.back() == '/') {
        return dir + name;
    }
    return dir + "/" + name;
}

bool has_suffix(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::time_t file_mtime(const std::string& path) {
    struct stat st;
    if (stat(path.c_str(), &st) != 0) {
        return 0;
    }
    return st.st_mtime;
}

bool file_exists(const std::string& path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0;
}

struct ArchiveEntry {
    std::string name;
    struct timespec mtime;
    std::string stamp; // YYYYMMDD_HHMMSS
    long sequence;     // _N suffix, 0 without one
};

ArchiveEntry make_archive_entry(const std::string& dir, const std::string& name) {
    ArchiveEntry entry{name, {0, 0}, "", 0};

    struct stat st;
    if (stat(join_path(dir, name).c_str(), &st) == 0) {
        entry.mtime = st.st_mtim;
    }

    size_t prefix_len = std::strlen(ARCHIVE_PREFIX);
    std::string stem = name.substr(prefix_len, name.size() - prefix_len - std::strlen(ARCHIVE_EXTENSION));
    size_t sep = stem.find('_', 9);
    entry.stamp = stem.substr(0, sep);
    if (sep != std::string::npos) {
        entry.sequence = std::strtol(stem.c_str() + sep + 1, nullptr, 10);
    }
    return entry;
}

// Write order first; the clock may step back (DST, NTP), so the name only
// breaks ties between files written within the same timestamp tick.
bool written_before(const ArchiveEntry& a, const ArchiveEntry& b) {
    if (a.mtime.tv_sec != b.mtime.tv_sec) {
        return a.mtime.tv_sec < b.mtime.tv_sec;
    }
    if (a.mtime.tv_nsec != b.mtime.tv_nsec) {
        return a.mtime.tv_nsec < b.mtime.tv_nsec;
    }
    if (a.stamp != b.stamp) {
        return a.stamp < b.stamp;
    }
    if (a.sequence != b.sequence) {
        return a.sequence < b.sequence;
    }
    return a.name < b.name;
}

} // namespace

SnapshotStore::SnapshotStore(const StoreOptions& options)
    : options(options), reconciled(false), image_count(0) {
    if (!create_dir(options.directory)) {
        throw StorageError("Failed to create snapshot directory: " + options.directory);
    }
}

// Archive names, oldest first.
std::vector<std::string> SnapshotStore::list_archives() const {
    std::vector<ArchiveEntry> entries;
    DIR* dir = opendir(options.directory.c_str());
    if (dir == nullptr) {
        throw StorageError("Could not read snapshot directory " + options.directory + ": " + strerror(errno));
    }
    while (struct dirent* entry = readdir(dir)) {
        std::string name = entry->d_name;
        if (name.compare(0, std::strlen(ARCHIVE_PREFIX), ARCHIVE_PREFIX) == 0 && has_suffix(name, ARCHIVE_EXTENSION)) {
            entries.push_back(make_archive_entry(options.directory, name));
        }
    }
    closedir(dir);

    std::sort(entries.begin(), entries.end(), written_before);

    std::vector<std::string> names;
    names.reserve(entries.size());
    for (const auto& entry : entries) {
        names.push_back(entry.name);
    }
    return names;
}

std::optional<long> SnapshotStore::read_count_file() const {
    std::string path = join_path(options.directory, COUNT_FILENAME);
    std::ifstream in(path);
    if (!in.is_open()) {
        return std::nullopt;
    }
    long count = -1;
    if (!(in >> count) || count < 0) {
        log_status("Warning: ignoring malformed " + path);
        return std::nullopt;
    }
    return count;
}

// Startup reconciliation: count what is on disk and find the newest image.
// Caller holds the mutex.
void SnapshotStore::reconcile() const {
    if (reconciled) {
        return;
    }

    std::vector<std::string> archives = list_archives();
    std::string latest_file = join_path(options.directory, LATEST_FILENAME);

    // A directory without a counter file (first run) is counted from disk
    std::optional<long> stored_count = read_count_file();
    if (stored_count) {
        image_count = *stored_count;
    } else if (!archives.empty()) {
        image_count = static_cast<long>(archives.size());
    } else if (file_exists(latest_file)) {
        image_count = 1;
    }

    if (!archives.empty()) {
        std::string newest = join_path(options.directory, archives.back());
        last_snapshot = StoredSnapshot{archives.back(), newest, file_mtime(newest)};

        if (!file_exists(latest_file)) {
            std::ifstream in(newest, std::ios::binary);
            std::vector<unsigned char> bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
            try {
                write_atomically(LATEST_FILENAME, bytes);
                log_status("Restored " + std::string(LATEST_FILENAME) + " from " + archives.back());
            } catch (const StorageError& e) {
                log_status("Warning: could not restore latest image: " + std::string(e.what()));
            }
        }
    } else if (file_exists(latest_file)) {
        last_snapshot = StoredSnapshot{LATEST_FILENAME, latest_file, file_mtime(latest_file)};
    }

    reconciled = true;
    log_status("Snapshot store " + options.directory + ": " + std::to_string(image_count) + " image(s) captured");
}

std::string SnapshotStore::unique_archive_name(std::time_t timestamp) const {
    std::string base = ARCHIVE_PREFIX + format_local_time(timestamp, "%Y%m%d_%H%M%S");
    std::string name = base + ARCHIVE_EXTENSION;
    for (int suffix = 1; file_exists(join_path(options.directory, name)); suffix++) {
        name = base + "_" + std::to_string(suffix) + ARCHIVE_EXTENSION;
    }
    return name;
}

void SnapshotStore::write_atomically(const std::string& filename, const std::vector<unsigned char>& image) const {
    std::string target = join_path(options.directory, filename);
    std::string temp = join_path(options.directory, "." + filename + ".XXXXXX");

    std::vector<char> temp_name(temp.begin(), temp.end());
    temp_name.push_back('\0');

    int fd = mkstemp(temp_name.data());
    if (fd == -1) {
        throw StorageError("Could not create temporary file in " + options.directory + ": " + strerror(errno));
    }

    size_t written = 0;
    while (written < image.size()) {
        ssize_t n = write(fd, image.data() + written, image.size() - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            std::string reason = strerror(errno);
            close(fd);
            unlink(temp_name.data());
            throw StorageError("Write to " + target + " failed: " + reason);
        }
        written += static_cast<size_t>(n);
    }

    // mkstemp creates 0600; snapshots are served to other processes
    if (fchmod(fd, 0644) != 0) {
        log_status("Warning: could not set permissions on " + target + ": " + strerror(errno));
    }

    if (fsync(fd) != 0 || close(fd) != 0) {
        std::string reason = strerror(errno);
        unlink(temp_name.data());
        throw StorageError("Flushing " + target + " failed: " + reason);
    }

    if (rename(temp_name.data(), target.c_str()) != 0) {
        std::string reason = strerror(errno);
        unlink(temp_name.data());
        throw StorageError("Rename to " + target + " failed: " + reason);
    }
}

void SnapshotStore::prune_archives() {
    if (!options.keep_archive || options.max_archive_files <= 0) {
        return;
    }

    std::vector<std::string> archives = list_archives();
    size_t limit = static_cast<size_t>(options.max_archive_files);
    if (archives.size() <= limit) {
        return;
    }

    size_t excess = archives.size() - limit;
    for (size_t i = 0; i < excess; i++) {
        std::string path = join_path(options.directory, archives[i]);
        if (unlink(path.c_str()) != 0) {
            log_status("Warning: could not prune " + path + ": " + strerror(errno));
        }
    }
}

StoredSnapshot SnapshotStore::save(const std::vector<unsigned char>& image, std::time_t timestamp) {
    std::lock_guard<std::mutex> lock(mutex);
    reconcile();

    StoredSnapshot stored;
    stored.timestamp = timestamp;

    if (options.keep_archive) {
        stored.filename = unique_archive_name(timestamp);
        write_atomically(stored.filename, image);
    } else {
        stored.filename = LATEST_FILENAME;
    }
    stored.path = join_path(options.directory, stored.filename);

    write_atomically(LATEST_FILENAME, image);

    image_count++;
    last_snapshot = stored;

    std::string count_text = std::to_string(image_count) + "\n";
    try {
        write_atomically(COUNT_FILENAME, std::vector<unsigned char>(count_text.begin(), count_text.end()));
    } catch (const StorageError& e) {
        log_status("Warning: could not persist image count: " + std::string(e.what()));
    }

    prune_archives();
    return stored;
}

long SnapshotStore::current_count() const {
    std::lock_guard<std::mutex> lock(mutex);
    reconcile();
    return image_count;
}

std::optional<StoredSnapshot> SnapshotStore::latest() const {
    std::lock_guard<std::mutex> lock(mutex);
    reconcile();
    return last_snapshot;
}

std::string SnapshotStore::latest_path() const {
    return join_path(options.directory, LATEST_FILENAME);
}
