#include <trialrun/artifacts/artifact_store.hpp>

#include <trialrun/common/error_types.hpp>
#include <trialrun/common/linux.hpp>
#include <trialrun/logging.hpp>

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>
#include <tuple>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <sys/file.h>

namespace trialrun {

namespace fs = std::filesystem;

namespace {

constexpr std::string_view GITIGNORE_NAME = ".gitignore";

/// A path component we are willing to create under the store root
bool is_plain_component(std::string_view name) {
    return !name.empty() && name != "." && name != ".." && name.find('/') == std::string_view::npos &&
           name.find('\0') == std::string_view::npos;
}

/// Entries of ``dir``. ``err`` is set if the listing could not be completed.
std::vector<fs::directory_entry> list_directory(const fs::path& dir, std::error_code& err) {
    std::vector<fs::directory_entry> entries;

    for (fs::directory_iterator it{dir, err}; !err && it != fs::directory_iterator{}; it.increment(err)) {
        entries.push_back(*it);
    }

    return entries;
}

bool is_directory(const fs::directory_entry& entry) {
    std::error_code err;
    return entry.is_directory(err);
}

bool is_partial(const fs::path& path) {
    return path.string().ends_with(ArtifactStore::PARTIAL_SUFFIX);
}

/// Whether some open file description currently holds a lock on ``path``
Expected<bool> is_locked(const fs::path& path) {
    auto fd = linux::open(path.string(), O_RDONLY | O_CLOEXEC);
    if (!fd) {
        return fd.error();
    }

    auto lock_res = linux::flock(*fd, LOCK_EX | LOCK_NB);
    std::ignore = linux::close(*fd);

    if (!lock_res) {
        if (lock_res.error() == std::errc::operation_would_block) {
            return true;
        }
        return lock_res.error();
    }

    return false;
}

} // namespace

ArtifactHandle::ArtifactHandle(int fd, fs::path final_path)
    : fd_{fd}
    , final_path_{std::move(final_path)} {}

ArtifactHandle::ArtifactHandle(ArtifactHandle&& other) noexcept
    : fd_{std::exchange(other.fd_, -1)}
    , final_path_{std::move(other.final_path_)} {}

ArtifactHandle& ArtifactHandle::operator=(ArtifactHandle&& other) noexcept {
    if (this != &other) {
        close_logged();
        fd_ = std::exchange(other.fd_, -1);
        final_path_ = std::move(other.final_path_);
    }

    return *this;
}

ArtifactHandle::~ArtifactHandle() {
    close_logged();
}

fs::path ArtifactHandle::partial_path_for(const fs::path& final_path) {
    fs::path partial = final_path;
    partial += ArtifactStore::PARTIAL_SUFFIX;
    return partial;
}

Result<void> ArtifactHandle::write(std::string_view data) {
    if (!is_open()) {
        LOG_WARN("Write to closed artifact {}", final_path_);
        return ErrorKind::BadArgument;
    }

    TRYE(linux::write_all(fd_, data), IoError);

    return {};
}

Result<void> ArtifactHandle::close() {
    if (!is_open()) {
        return {};
    }

    // Rename while the lock is still held so a concurrent sweep never sees an unlocked partial file
    std::error_code err;
    fs::rename(partial_path_for(final_path_), final_path_, err);

    auto close_res = linux::close(std::exchange(fd_, -1));

    if (err) {
        LOG_WARN("Failed to finish artifact {}: {}", final_path_, err);
        return ErrorKind::IoError;
    }

    if (!close_res) {
        return ErrorKind::SyscallFailure;
    }

    LOG_DEBUG("Finished artifact {}", final_path_);

    return {};
}

void ArtifactHandle::close_logged() {
    if (auto res = close(); !res) {
        LOG_WARN("Artifact {} was not closed cleanly: {}", final_path_, res.error());
    }
}

ArtifactStore::ArtifactStore(fs::path root, bool verbose)
    : root_{std::move(root)}
    , verbose_{verbose}
    , start_time_{fs::file_time_type::clock::now()} {}

Result<void> ArtifactStore::ensure_root() const {
    std::error_code err;
    fs::create_directories(root_, err);

    if (err) {
        LOG_ERROR("Could not create artifact directory {}: {}", root_, err);
        return ErrorKind::IoError;
    }

    const auto gitignore = root_ / GITIGNORE_NAME;

    if (!fs::exists(gitignore, err)) {
        int fd = TRYE(linux::open(gitignore.string(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644), IoError);
        auto write_res = linux::write_all(fd, "*\n");
        std::ignore = linux::close(fd);

        TRYE(write_res, IoError);
    }

    return {};
}

Result<ArtifactHandle> ArtifactStore::scoped_artifact(std::string_view unit_name, std::string_view file_name) const {
    if (!is_plain_component(unit_name) || !is_plain_component(file_name) || file_name == GITIGNORE_NAME ||
        file_name.ends_with(PARTIAL_SUFFIX)) {
        LOG_WARN("Rejected artifact name {:?} for unit {:?}", file_name, unit_name);
        return ErrorKind::BadArgument;
    }

    TRY(ensure_root());

    const auto unit_dir = root_ / unit_name;

    std::error_code err;
    fs::create_directories(unit_dir, err);
    if (err) {
        LOG_ERROR("Could not create artifact directory {}: {}", unit_dir, err);
        return ErrorKind::IoError;
    }

    auto final_path = unit_dir / file_name;
    const auto partial = ArtifactHandle::partial_path_for(final_path);

    int fd = TRYE(linux::open(partial.string(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644), IoError);

    if (auto lock_res = linux::flock(fd, LOCK_EX); !lock_res) {
        std::ignore = linux::close(fd);
        return ErrorKind::SyscallFailure;
    }

    LOG_DEBUG("Opened artifact {} for unit {:?}", final_path, unit_name);

    return ArtifactHandle{fd, std::move(final_path)};
}

Result<std::size_t> ArtifactStore::sweep(bool pin_if_verbose) const {
    if (pin_if_verbose && verbose_) {
        LOG_DEBUG("Verbose store; keeping artifacts under {}", root_);
        return std::size_t{0};
    }

    std::error_code err;
    if (!fs::is_directory(root_, err)) {
        return std::size_t{0};
    }

    auto unit_dirs = list_directory(root_, err);
    if (err) {
        LOG_ERROR("Could not list artifact root {}: {}", root_, err);
        return ErrorKind::IoError;
    }

    std::size_t num_removed = 0;
    std::size_t num_in_use = 0;

    for (const auto& unit_dir : unit_dirs) {
        if (!is_directory(unit_dir)) {
            continue;
        }

        std::error_code list_err;
        auto files = list_directory(unit_dir.path(), list_err);

        if (list_err) {
            LOG_WARN("Could not list artifacts in {}: {}", unit_dir.path(), list_err);
        }

        for (const auto& file : files) {
            auto locked = is_locked(file.path());

            if (!locked) {
                // Removed by someone else between listing and locking
                if (locked.error() == std::errc::no_such_file_or_directory) {
                    continue;
                }
                LOG_WARN("Could not inspect artifact {}: {}", file.path(), locked.error());
                continue;
            }

            if (*locked) {
                ++num_in_use;
                continue;
            }

            std::error_code remove_err;
            if (fs::remove(file.path(), remove_err)) {
                ++num_removed;
            } else if (remove_err) {
                LOG_WARN("Could not remove artifact {}: {}", file.path(), remove_err);
            }
        }

        std::error_code dir_err;
        if (fs::is_empty(unit_dir.path(), dir_err)) {
            fs::remove(unit_dir.path(), dir_err);
        }
    }

    LOG_DEBUG("Swept {} artifacts from {} ({} in use)", num_removed, root_, num_in_use);

    return num_removed;
}

std::vector<Artifact> ArtifactStore::list() const {
    std::vector<Artifact> artifacts;

    std::error_code err;
    if (!fs::is_directory(root_, err)) {
        return artifacts;
    }

    for (const auto& unit_dir : list_directory(root_, err)) {
        if (!is_directory(unit_dir)) {
            continue;
        }

        std::error_code list_err;
        for (const auto& entry : list_directory(unit_dir.path(), list_err)) {
            std::error_code entry_err;
            if (!entry.is_regular_file(entry_err) || is_partial(entry.path())) {
                continue;
            }

            auto mtime = entry.last_write_time(entry_err);
            if (entry_err) {
                continue;
            }

            artifacts.push_back({.unit_name = unit_dir.path().filename().string(),
                                 .path = entry.path(),
                                 .creation_time = mtime,
                                 .pinned = verbose_ && mtime >= start_time_});
        }

        if (list_err) {
            LOG_DEBUG("Listing of {} is incomplete: {}", unit_dir.path(), list_err);
        }
    }

    return artifacts;
}

} // namespace trialrun
