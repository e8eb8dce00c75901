#include <quickform/output_manager.hh>
#include <quickform/errors.hh>
#include <quickform/structured_merge.hh>
#include <algorithm>
#include <fstream>
#include <set>
#include <sstream>

namespace quickform::output {

namespace fs = std::filesystem;

std::string to_string(conflict_policy policy) {
    switch (policy) {
        case conflict_policy::overwrite: return "overwrite";
        case conflict_policy::skip: return "skip";
        case conflict_policy::merge: return "merge";
    }
    return "overwrite";
}

std::optional<conflict_policy> parse_conflict_policy(std::string_view text) {
    if (text == "overwrite") return conflict_policy::overwrite;
    if (text == "skip") return conflict_policy::skip;
    if (text == "merge") return conflict_policy::merge;
    return std::nullopt;
}

std::string to_string(commit_action action) {
    switch (action) {
        case commit_action::write: return "write";
        case commit_action::skip: return "skip";
        case commit_action::merge: return "merge";
        case commit_action::unchanged: return "unchanged";
    }
    return "write";
}

size_t commit_report::count(commit_action action) const {
    return static_cast<size_t>(std::count_if(entries.begin(), entries.end(),
        [action](const commit_entry& e) { return e.action == action; }));
}

// ============================================================================
// File helpers
// ============================================================================

namespace {
    std::string read_file(const fs::path& path) {
        std::ifstream ifs(path, std::ios::binary);
        if (!ifs) {
            throw io_error(path.string(), "cannot open existing file for reading");
        }
        std::ostringstream ss;
        ss << ifs.rdbuf();
        if (ifs.bad()) {
            throw io_error(path.string(), "failed to read existing file");
        }
        return ss.str();
    }

    void write_file(const fs::path& path, const std::string& content) {
        std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
        if (!ofs) {
            throw io_error(path.string(), "failed to open file for writing");
        }
        ofs << content;
        ofs.flush();
        if (!ofs) {
            throw io_error(path.string(), "failed to write file");
        }
    }

    fs::path sibling(const fs::path& target, const std::string& tag, size_t index) {
        return target.parent_path() /
               ("." + target.filename().string() + ".qf-" + tag + "-" + std::to_string(index));
    }

    /// Bookkeeping for one commit, undone on failure
    struct transaction {
        struct swap {
            fs::path target;
            fs::path backup;        ///< Empty when the target did not exist
        };

        std::vector<fs::path> created_dirs;     ///< In creation order, parents first
        std::vector<fs::path> staged;
        std::vector<swap> swapped;

        void create_parent(const fs::path& target) {
            fs::path dir = target.parent_path();
            std::vector<fs::path> missing;
            for (fs::path p = dir; !p.empty() && !fs::exists(p); p = p.parent_path()) {
                missing.push_back(p);
                if (p == p.parent_path()) {
                    break;
                }
            }
            std::error_code ec;
            fs::create_directories(dir, ec);
            if (ec) {
                throw io_error(dir.string(), "cannot create directory: " + ec.message());
            }
            created_dirs.insert(created_dirs.end(), missing.rbegin(), missing.rend());
        }

        void rollback() noexcept {
            std::error_code ec;
            for (auto it = swapped.rbegin(); it != swapped.rend(); ++it) {
                fs::remove(it->target, ec);
                if (!it->backup.empty()) {
                    fs::rename(it->backup, it->target, ec);
                }
            }
            for (const auto& tmp : staged) {
                fs::remove(tmp, ec);
            }
            // Children were created after their parents
            for (auto it = created_dirs.rbegin(); it != created_dirs.rend(); ++it) {
                fs::remove(*it, ec);
            }
        }

        void finish() noexcept {
            std::error_code ec;
            for (const auto& s : swapped) {
                if (!s.backup.empty()) {
                    fs::remove(s.backup, ec);
                }
            }
        }
    };
}

// ============================================================================
// OutputManager
// ============================================================================

OutputManager::OutputManager(fs::path root, commit_options opts)
    : root_(std::move(root)),
      opts_(opts) {}

std::optional<std::string> OutputManager::normalize_relative(const std::string& path) {
    if (path.empty()) {
        return std::nullopt;
    }
    fs::path p(path);
    if (p.is_absolute() || p.has_root_name() || p.has_root_directory()) {
        return std::nullopt;
    }

    fs::path normal = p.lexically_normal();
    if (normal.empty() || normal == ".") {
        return std::nullopt;
    }
    for (const auto& part : normal) {
        if (part == "..") {
            return std::nullopt;
        }
    }
    std::string text = normal.generic_string();
    if (!text.empty() && text.back() == '/') {
        return std::nullopt;
    }
    return text;
}

std::vector<planned_write> OutputManager::plan(const std::vector<artifact>& artifacts) const {
    std::vector<planned_write> plan;
    std::set<std::string> seen;

    // Reject every bad path before looking at the disk
    for (const auto& a : artifacts) {
        auto rel = normalize_relative(a.path());
        if (!rel) {
            throw io_error(a.path(), "output path is empty, absolute or escapes the output directory");
        }
        if (!seen.insert(*rel).second) {
            throw io_error(*rel, "duplicate output path (template '" + a.template_id() + "')");
        }
    }

    for (const auto& a : artifacts) {
        planned_write w;
        w.path = *normalize_relative(a.path());
        w.target = root_ / fs::path(w.path);
        w.content = a.content();
        w.action = commit_action::write;

        std::error_code ec;
        auto status = fs::status(w.target, ec);
        if (fs::is_directory(status)) {
            throw io_error(w.target.string(), "output path is an existing directory");
        }

        if (fs::exists(status)) {
            std::string existing = read_file(w.target);
            if (existing == w.content) {
                w.action = commit_action::unchanged;
            } else {
                switch (opts_.policy) {
                    case conflict_policy::overwrite:
                        w.action = commit_action::write;
                        break;
                    case conflict_policy::skip:
                        w.action = commit_action::skip;
                        break;
                    case conflict_policy::merge:
                        if (merge_kind_for(w.target) == merge_kind::none) {
                            w.action = commit_action::write;
                        } else {
                            w.content = merge_documents(w.target, existing, w.content);
                            w.action = w.content == existing ? commit_action::unchanged
                                                             : commit_action::merge;
                        }
                        break;
                }
            }
        }
        plan.push_back(std::move(w));
    }

    return plan;
}

commit_report OutputManager::commit(const generator::generation_result& result) const {
    if (!result.ok()) {
        throw io_error(root_.string(), "refusing to write: generation reported " +
                       std::to_string(result.failures.size()) + " failure(s), first: " +
                       result.failures.front().format());
    }
    return commit(result.artifacts);
}

commit_report OutputManager::commit(const std::vector<artifact>& artifacts) const {
    auto plan = this->plan(artifacts);

    commit_report report;
    for (const auto& w : plan) {
        report.entries.push_back({w.path, w.action});
    }
    if (opts_.dry_run) {
        return report;
    }

    std::vector<const planned_write*> pending;
    for (const auto& w : plan) {
        if (w.action == commit_action::write || w.action == commit_action::merge) {
            pending.push_back(&w);
        }
    }

    transaction tx;
    try {
        // Stage
        for (size_t i = 0; i < pending.size(); ++i) {
            const planned_write& w = *pending[i];
            tx.create_parent(w.target);
            fs::path tmp = sibling(w.target, "tmp", i);
            tx.staged.push_back(tmp);
            write_file(tmp, w.content);
        }

        // Swap
        for (size_t i = 0; i < pending.size(); ++i) {
            const planned_write& w = *pending[i];
            transaction::swap s{w.target, {}};
            std::error_code ec;

            if (fs::exists(w.target)) {
                s.backup = sibling(w.target, "bak", i);
                fs::rename(w.target, s.backup, ec);
                if (ec) {
                    throw io_error(w.target.string(), "cannot move original aside: " + ec.message());
                }
            }
            tx.swapped.push_back(s);

            fs::rename(tx.staged[i], w.target, ec);
            if (ec) {
                throw io_error(w.target.string(), "cannot move staged file into place: " + ec.message());
            }
        }
    } catch (const io_error&) {
        tx.rollback();
        throw;
    } catch (const fs::filesystem_error& e) {
        tx.rollback();
        throw io_error(e.path1().string(), e.code().message());
    }

    tx.finish();
    return report;
}

} // namespace quickform::output
