#include "repo_scanner.hpp"
#include "ThreadPool.hpp"
#include "content_reader.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <future>
#include <spdlog/spdlog.h>
#include <sys/stat.h>

namespace codescope {

namespace {

constexpr double MTIME_EPSILON = 1e-6;

struct FileStat {
    double mtime = 0.0;
    uint64_t size = 0;
};

FileStat stat_file(const fs::path& p) {
    struct stat st;
    if (::stat(p.c_str(), &st) != 0) return {};
    FileStat out;
    out.mtime = static_cast<double>(st.st_mtim.tv_sec) + static_cast<double>(st.st_mtim.tv_nsec) / 1e9;
    out.size = static_cast<uint64_t>(st.st_size);
    return out;
}

std::string join_rel(const std::string& parent, const std::string& name) {
    return parent.empty() ? name : parent + "/" + name;
}

} // namespace

RepoScanner::RepoScanner(std::shared_ptr<ICacheStore> cache, std::shared_ptr<IVcsClient> vcs)
    : cache_(std::move(cache)), vcs_(std::move(vcs)) {}

fs::path RepoScanner::resolve_root(const std::string& root) {
    std::string expanded = root;
    if (!expanded.empty() && expanded[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) expanded = std::string(home) + expanded.substr(1);
    }

    std::error_code ec;
    fs::path abs = fs::absolute(fs::path(expanded), ec).lexically_normal();
    if (ec) abs = fs::path(expanded).lexically_normal();
    if (!abs.has_filename() && abs.has_parent_path() && abs != abs.root_path()) abs = abs.parent_path();

    fs::path canonical = fs::weakly_canonical(abs, ec);
    return ec ? abs : canonical;
}

bool RepoScanner::recursive_scan(const fs::path& current_dir, const std::string& current_rel, WalkContext& ctx) {
    std::vector<fs::directory_entry> entries;
    std::error_code ec;
    for (fs::directory_iterator it(current_dir, fs::directory_options::skip_permission_denied, ec), end;
         !ec && it != end; it.increment(ec)) {
        entries.push_back(*it);
    }
    if (ec) {
        spdlog::debug("Scanner error at {}: {}", current_dir.string(), ec.message());
    }
    std::sort(entries.begin(), entries.end(), [](const auto& a, const auto& b) {
        return a.path().filename() < b.path().filename();
    });

    std::vector<std::pair<fs::path, std::string>> subdirs;
    for (const auto& entry : entries) {
        const std::string name = entry.path().filename().string();
        const std::string rel = join_rel(current_rel, name);
        std::error_code type_ec;

        if (entry.is_directory(type_ec)) {
            // Symlinked directories are listed but not followed.
            if (entry.is_symlink(type_ec)) continue;
            if (is_ignored_dir_name(name) || !ctx.rules.should_enter_dir(rel)) {
                spdlog::trace("DIR  | {} | SKIP", rel);
                continue;
            }
            subdirs.emplace_back(entry.path(), rel);
            continue;
        }
        if (!entry.is_regular_file(type_ec)) continue;

        if (ctx.results.size() >= ctx.max_files) return false;
        if (!ctx.rules.should_collect_file(rel)) continue;

        if (ctx.vcs_ignore) {
            auto ignored = vcs_->is_ignored(ctx.root, rel);
            if (ignored.value_or(false)) {
                spdlog::trace("FILE | {} | SKIP (gitignore)", rel);
                continue;
            }
        }

        FileStat st = stat_file(entry.path());
        ctx.results.push_back({rel, st.mtime, st.size});
    }

    for (const auto& [dir, rel] : subdirs) {
        if (ctx.results.size() >= ctx.max_files) return false;
        if (!recursive_scan(dir, rel, ctx)) return false;
    }
    return ctx.results.size() < ctx.max_files;
}

std::optional<FileRecord> RepoScanner::process_file(const fs::path& root, const std::string& rel_path, size_t max_bytes) {
    const fs::path full_path = root / rel_path;

    auto language = detect_language(rel_path, read_first_line(full_path, 256));
    if (!language) return std::nullopt;

    std::string text = read_text(full_path, max_bytes);
    if (is_blank(text)) return std::nullopt;

    FileRecord rec;
    rec.path = rel_path;
    rec.language = language;
    rec.sloc = count_sloc(text);
    rec.content_hash = sha256_hex(text);
    rec.text = std::move(text);
    return rec;
}

size_t RepoScanner::apply_budget(std::vector<CandidateFile>& changed, size_t remaining) {
    if (changed.size() <= remaining) return 0;
    auto selected = select_sampling_tiers(changed, remaining);
    const size_t dropped = changed.size() - selected.size();
    spdlog::info("Sampling {} of {} changed files (core/recent/heavy)", selected.size(), changed.size());
    changed = std::move(selected);
    return dropped;
}

std::shared_ptr<const RepoSnapshot> RepoScanner::scan(const std::string& root_arg, const ScanOptions& options) {
    const auto started = std::chrono::steady_clock::now();
    stats_ = ScanStats{};

    const fs::path root = resolve_root(root_arg);
    std::error_code ec;
    if (!fs::exists(root, ec)) {
        spdlog::error("Path not found: {}", root.string());
        throw PathNotFoundError(root);
    }
    const std::string root_str = root.string();

    spdlog::info("🔍 Scanning {} | max_files: {} | incremental: {}", root_str, options.max_files, options.incremental);

    // --- PHASE 1: cache lookup ---
    std::string head = NO_VCS_HEAD;
    auto head_res = vcs_->head(root);
    if (head_res.ok()) {
        head = *head_res.value;
    } else {
        spdlog::debug("No VCS head for {} ({}); using '{}'", root_str, to_string(head_res.error), head);
    }
    const std::string fingerprint = make_fingerprint(root_str, head);

    std::optional<CacheEntry> cached;
    if (options.incremental && cache_) {
        cached = cache_->load(fingerprint);
        stats_.cache_hit = cached.has_value();
    }

    // --- PHASE 2: walk ---
    const bool is_repo = vcs_->is_repository(root);
    PathRules rules(options.ignored_paths, options.included_paths);
    std::vector<CandidateFile> candidates;
    if (options.max_files > 0) {
        WalkContext ctx{root, rules, is_repo, options.max_files, candidates};
        recursive_scan(root, "", ctx);
    }
    stats_.candidates = candidates.size();

    std::map<std::string, double> current_mtimes;
    for (const auto& c : candidates) current_mtimes[c.rel_path] = c.mtime;

    // --- PHASE 3: partition unchanged / changed ---
    std::vector<const CandidateFile*> unchanged;
    std::vector<CandidateFile> changed;
    if (cached && !cached->mtimes.empty()) {
        for (const auto& c : candidates) {
            auto mt = cached->mtimes.find(c.rel_path);
            bool same_mtime = mt != cached->mtimes.end() && std::fabs(mt->second - c.mtime) < MTIME_EPSILON;
            if (same_mtime && cached->files.count(c.rel_path)) {
                unchanged.push_back(&c);
            } else {
                changed.push_back(c);
            }
        }
    } else {
        changed = candidates;
    }

    auto snapshot = std::make_shared<RepoSnapshot>();
    snapshot->root = root_str;

    // --- PHASE 4: reuse cached records ---
    for (const CandidateFile* c : unchanged) {
        if (snapshot->files.size() >= options.max_files) break;
        auto it = cached->files.find(c->rel_path);
        snapshot->files.emplace(c->rel_path, it->second);
        stats_.reused++;
    }

    // --- PHASE 5: budget + priority sampling ---
    // The walk already stops at max_files candidates and reused + changed ==
    // candidates, so this only trims when that bound is relaxed.
    stats_.sampled_out = apply_budget(changed, options.max_files - snapshot->files.size());

    // --- PHASE 6: reprocess on the worker pool ---
    if (!changed.empty()) {
        const size_t workers = options.workers > 0 ? std::min<size_t>(options.workers, 32) : ThreadPool::default_size();
        ThreadPool pool(std::min(workers, changed.size()));

        std::vector<std::future<std::optional<FileRecord>>> futures;
        futures.reserve(changed.size());
        for (const auto& c : changed) {
            futures.push_back(pool.enqueue(&RepoScanner::process_file, root, c.rel_path, options.max_bytes_per_file));
        }

        for (size_t i = 0; i < futures.size(); ++i) {
            stats_.reprocessed++;
            std::optional<FileRecord> rec;
            try {
                rec = futures[i].get();
            } catch (const std::exception& e) {
                spdlog::debug("Processing {} failed: {}", changed[i].rel_path, e.what());
            }
            if (!rec) {
                stats_.discarded++;
                continue;
            }
            if (snapshot->files.size() >= options.max_files) continue;
            spdlog::debug("UPDATE: {}", rec->path);
            snapshot->files[rec->path] = std::move(*rec);
        }
    }

    // --- PHASE 7: VCS metadata (sequential, each call time-boxed) ---
    snapshot->vcs.is_repo = is_repo;
    for (const auto& [rel, rec] : snapshot->files) {
        auto churn = vcs_->churn(root, rel);
        auto modified = vcs_->last_modified(root, rel);
        if (is_repo && (!churn.ok() || !modified.ok())) {
            spdlog::debug("VCS metadata for {} unavailable: churn={}, last_modified={}",
                          rel, to_string(churn.error), to_string(modified.error));
        }
        snapshot->vcs.churn_by_file[rel] = churn.value_or(0);
        snapshot->vcs.last_modified_by_file[rel] = modified.value_or(0);
    }

    snapshot->refresh_derived();

    // --- PHASE 8: persist ---
    if (options.incremental && cache_) {
        CacheEntry entry;
        entry.files = snapshot->files;
        entry.mtimes = std::move(current_mtimes);
        entry.root = root_str;
        entry.head = head;
        cache_->save(fingerprint, entry);
    }

    stats_.elapsed_ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count();
    spdlog::info("✅ Scan complete: {} files, {} SLOC | reused {} | reprocessed {} | discarded {} | sampled out {} | {:.1f} ms",
                 snapshot->summary.file_count, snapshot->summary.sloc_total,
                 stats_.reused, stats_.reprocessed, stats_.discarded, stats_.sampled_out, stats_.elapsed_ms);

    return snapshot;
}

} // namespace codescope
