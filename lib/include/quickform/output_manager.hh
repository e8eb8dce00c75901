//
// Output manager
//
// Commits generated artifacts to a target directory as one unit:
//
//   1. plan      validate paths, read existing files, decide an action per file
//   2. stage     write every new content to a sibling temporary file
//   3. swap      rename temporaries into place, keeping backups of originals
//
// A failure in stage or swap removes the temporaries, restores the originals
// and throws io_error; the target is left as it was before the commit.
//
// Usage:
//   OutputManager out(root, {conflict_policy::merge});
//   commit_report report = out.commit(generator.generate(schema));
//

#pragma once

#include <quickform/artifact.hh>
#include <quickform/generator.hh>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace quickform::output {

/// What to do when an output file already exists with different content
enum class conflict_policy {
    overwrite,  ///< replace it (default)
    skip,       ///< leave it alone
    merge       ///< structured merge for YAML and dotenv, overwrite otherwise
};

std::string to_string(conflict_policy policy);
std::optional<conflict_policy> parse_conflict_policy(std::string_view text);

struct commit_options {
    conflict_policy policy = conflict_policy::overwrite;

    /// Plan and report without touching the target
    bool dry_run = false;
};

enum class commit_action {
    write,      ///< new file, or overwritten
    skip,       ///< existing file kept under the skip policy
    merge,      ///< existing file merged with the new content
    unchanged   ///< existing content already identical
};

std::string to_string(commit_action action);

/// Decision for one artifact
struct planned_write {
    std::string path;                   ///< Output-relative, normalized
    std::filesystem::path target;       ///< Absolute location under the root
    commit_action action;
    std::string content;                ///< Final content (merged when action is merge)
};

struct commit_entry {
    std::string path;
    commit_action action;
};

struct commit_report {
    std::vector<commit_entry> entries;

    [[nodiscard]] size_t count(commit_action action) const;

    /// Files whose content changes on disk
    [[nodiscard]] size_t changed() const {
        return count(commit_action::write) + count(commit_action::merge);
    }
};

class OutputManager {
public:
    explicit OutputManager(std::filesystem::path root, commit_options opts = {});

    /**
     * Decide the action for every artifact without writing anything.
     *
     * @throws io_error on duplicate, absolute or escaping paths, or when an
     *         existing target cannot be read
     */
    std::vector<planned_write> plan(const std::vector<artifact>& artifacts) const;

    /// Commit a set of artifacts atomically
    commit_report commit(const std::vector<artifact>& artifacts) const;

    /// Commit a generation run; refuses (io_error) when the run reported failures
    commit_report commit(const generator::generation_result& result) const;

    [[nodiscard]] const std::filesystem::path& root() const { return root_; }
    [[nodiscard]] const commit_options& options() const { return opts_; }

    /// Output-relative path in normalized form, or nullopt when it is empty,
    /// absolute or escapes the root
    static std::optional<std::string> normalize_relative(const std::string& path);

private:
    std::filesystem::path root_;
    commit_options opts_;
};

} // namespace quickform::output
