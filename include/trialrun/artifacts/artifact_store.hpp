/// \file
/// Ephemeral debugging artifacts written by units, partitioned by unit name
#pragma once

#include <trialrun/common/class_traits.hpp>
#include <trialrun/common/error_types.hpp>

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace trialrun {

struct Artifact
{
    std::string unit_name;
    std::filesystem::path path;
    std::filesystem::file_time_type creation_time;

    /// Only ever true for artifacts written by a verbose store
    bool pinned = false;
};

/// Exclusive writer for a single artifact
///
/// Data goes to ``<file>.partial`` while the handle is open, under an exclusive flock(2).
/// ``close`` renames the file to its final name; the destructor closes the handle if needed.
class ArtifactHandle : NonCopyable
{
public:
    ArtifactHandle() = default;
    ArtifactHandle(int fd, std::filesystem::path final_path);

    ArtifactHandle(ArtifactHandle&& other) noexcept;
    ArtifactHandle& operator=(ArtifactHandle&& other) noexcept;

    ~ArtifactHandle();

    Result<void> write(std::string_view data);

    /// Finish the artifact. Idempotent.
    Result<void> close();

    bool is_open() const { return fd_ != -1; }

    /// Final location of the artifact (valid once closed)
    const std::filesystem::path& path() const { return final_path_; }

    static std::filesystem::path partial_path_for(const std::filesystem::path& final_path);

private:
    void close_logged();

    int fd_ = -1;
    std::filesystem::path final_path_;
};

class ArtifactStore
{
public:
    static constexpr std::string_view PARTIAL_SUFFIX = ".partial";
    static constexpr std::string_view DEFAULT_ROOT = ".trialrun/artifacts";

    explicit ArtifactStore(std::filesystem::path root, bool verbose = false);

    /// Create the root directory (and a .gitignore covering it) if it does not exist
    Result<void> ensure_root() const;

    /// Open ``<root>/<unit_name>/<file_name>`` for writing
    ///
    /// ``file_name`` must be a plain file name; path separators and ".." are rejected.
    Result<ArtifactHandle> scoped_artifact(std::string_view unit_name, std::string_view file_name) const;

    /// Remove every artifact and leftover partial file that is not currently open for writing.
    /// A verbose store keeps everything when ``pin_if_verbose`` is set.
    ///
    /// Returns the number of files removed
    Result<std::size_t> sweep(bool pin_if_verbose = true) const;

    /// All finished artifacts currently in the store
    std::vector<Artifact> list() const;

    const std::filesystem::path& root() const { return root_; }

    bool is_verbose() const { return verbose_; }

private:
    std::filesystem::path root_;
    bool verbose_;

    /// Files at least this new were written during this store's lifetime
    std::filesystem::file_time_type start_time_;
};

} // namespace trialrun
