#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "cache_manager.hpp"
#include "code_graph.hpp"
#include "config.hpp"
#include "repo_scanner.hpp"
#include "retrieval_engine.hpp"
#include "vcs_client.hpp"

namespace fs = std::filesystem;
using json = nlohmann::json;
using namespace codescope;

namespace {

struct CliArgs {
    std::string path = ".";
    std::vector<std::string> query;
    std::string config_file;
    std::string cache_dir;
    size_t max_files = 0;
    size_t max_bytes = 0;
    size_t workers = 0;
    size_t top_k = 0;
    size_t top = 10;
    bool no_incremental = false;
    bool as_json = false;
    bool verbose = false;
    bool quiet = false;
};

struct Overrides {
    CLI::Option* max_files = nullptr;
    CLI::Option* max_bytes = nullptr;
    CLI::Option* workers = nullptr;
    CLI::Option* top_k = nullptr;
};

class Session {
public:
    Session(const CliArgs& args, const Overrides& overrides) {
        root_ = RepoScanner::resolve_root(args.path);

        std::optional<fs::path> explicit_config;
        if (!args.config_file.empty()) explicit_config = fs::path(args.config_file);
        config_ = EngineConfig::load(root_, explicit_config);

        if (overrides.max_files && overrides.max_files->count()) {
            config_.scan.max_files = args.max_files;
            config_.index.max_files = args.max_files;
        }
        if (overrides.max_bytes && overrides.max_bytes->count()) config_.scan.max_bytes_per_file = args.max_bytes;
        if (overrides.workers && overrides.workers->count()) config_.scan.workers = args.workers;
        if (overrides.top_k && overrides.top_k->count()) config_.index.top_k = args.top_k;
        if (args.no_incremental) config_.scan.incremental = false;

        if (!args.cache_dir.empty()) cache_dir_ = fs::path(args.cache_dir);
        else cache_dir_ = config_.cache_dir.value_or(default_cache_dir());

        if (!args.verbose && !args.quiet && config_.log_level != "info") {
            spdlog::set_level(spdlog::level::from_str(config_.log_level));
        }

        VcsTimeouts timeouts;
        timeouts.query = std::chrono::seconds(config_.vcs_query_timeout_seconds);
        timeouts.history = std::chrono::seconds(config_.vcs_history_timeout_seconds);

        scanner_ = std::make_unique<RepoScanner>(std::make_shared<DiskCacheStore>(cache_dir_),
                                                 std::make_shared<GitClient>(timeouts));
    }

    std::shared_ptr<const RepoSnapshot> scan() {
        auto snapshot = scanner_->scan(root_.string(), config_.scan);
        const auto& stats = scanner_->last_stats();
        spdlog::info("Scanned {} in {:.1f}ms ({} reused, {} reprocessed, {} sampled out)",
                     snapshot->root, stats.elapsed_ms, stats.reused, stats.reprocessed, stats.sampled_out);
        return snapshot;
    }

    const EngineConfig& config() const { return config_; }
    const fs::path& cache_dir() const { return cache_dir_; }

private:
    fs::path root_;
    EngineConfig config_;
    fs::path cache_dir_;
    std::unique_ptr<RepoScanner> scanner_;
};

int run_scan(Session& session, bool as_json) {
    auto snapshot = session.scan();
    if (as_json) {
        const json out = snapshot->summary_json();
        std::cout << out.dump(2) << std::endl;
        return 0;
    }

    std::cout << "Root:      " << snapshot->root << "\n";
    std::cout << "Files:     " << snapshot->summary.file_count << "\n";
    std::cout << "SLOC:      " << snapshot->summary.sloc_total << "\n";
    std::cout << "Languages:";
    for (auto lang : snapshot->languages) std::cout << " " << to_string(lang);
    std::cout << "\n";
    std::cout << "VCS:       " << (snapshot->vcs.is_repo ? "git" : "none") << std::endl;
    return 0;
}

int run_search(Session& session, const std::vector<std::string>& words) {
    std::string query;
    for (const auto& w : words) {
        if (!query.empty()) query += ' ';
        query += w;
    }

    auto snapshot = session.scan();
    RetrievalEngine engine(session.cache_dir() / "indexes", session.config().index);
    engine.prepare(*snapshot);

    auto hits = engine.retrieve(query);
    if (hits.empty()) {
        std::cout << "No matches for \"" << query << "\"" << std::endl;
        return 0;
    }

    for (const auto& hit : hits) {
        std::cout << fmt::format("{}:{}-{} score={:.3f}", hit.chunk->path, hit.chunk->start_line,
                                 hit.chunk->end_line, hit.score)
                  << "\n    " << make_preview(hit.chunk->text) << "\n";
    }
    std::cout.flush();
    return 0;
}

int run_deps(Session& session, bool as_json) {
    auto snapshot = session.scan();
    auto graph = CodeGraph::build(*snapshot);

    if (as_json) {
        std::cout << graph.to_json().dump(2) << std::endl;
        return 0;
    }

    for (const auto& [path, deps] : graph.edges()) {
        std::cout << path << "\n";
        for (const auto& dep : deps) std::cout << "  -> " << dep << "\n";
    }
    std::cout << graph.node_count() << " files, " << graph.edge_count() << " edges" << std::endl;
    return 0;
}

int run_hotspots(Session& session, size_t limit, bool as_json) {
    auto snapshot = session.scan();
    auto ranked = CodeGraph::build(*snapshot).hotspots(*snapshot);
    if (ranked.size() > limit) ranked.resize(limit);

    if (as_json) {
        json out = json::array();
        for (const auto& h : ranked) out.push_back({{"path", h.path}, {"score", h.score}});
        std::cout << out.dump(2) << std::endl;
        return 0;
    }

    if (!snapshot->vcs.is_repo) spdlog::warn("{} is not a git repository; churn counts as zero", snapshot->root);
    for (const auto& h : ranked) {
        std::cout << fmt::format("{:.3f}  {}", h.score, h.path) << "\n";
    }
    std::cout.flush();
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    CliArgs args;
    Overrides overrides;

    CLI::App app{"codescope: incremental repository scanner and lexical code search"};
    app.require_subcommand(1);
    app.add_flag("-v,--verbose", args.verbose, "Debug logging");
    app.add_flag("-q,--quiet", args.quiet, "Only log errors");
    app.add_option("--config", args.config_file, "Configuration file (JSON)");

    auto* scan_cmd = app.add_subcommand("scan", "Scan a repository and print its summary");
    scan_cmd->add_option("path", args.path, "Repository root")->required();
    overrides.max_files = scan_cmd->add_option("--max-files", args.max_files, "Maximum files to keep");
    overrides.max_bytes = scan_cmd->add_option("--max-bytes", args.max_bytes, "Per-file read limit in bytes");
    overrides.workers = scan_cmd->add_option("--workers", args.workers, "Worker threads (0 = auto)");
    scan_cmd->add_flag("--no-incremental", args.no_incremental, "Ignore and do not update the cache");
    scan_cmd->add_option("--cache-dir", args.cache_dir, "Cache directory");
    scan_cmd->add_flag("--json", args.as_json, "Print the summary as JSON");

    auto* search_cmd = app.add_subcommand("search", "Rank code chunks against a query");
    search_cmd->add_option("path", args.path, "Repository root")->required();
    search_cmd->add_option("query", args.query, "Query words")->required();
    auto* search_top_k = search_cmd->add_option("--top-k", args.top_k, "Number of hits");
    auto* search_max_files = search_cmd->add_option("--max-files", args.max_files, "Maximum files to scan and index");
    search_cmd->add_option("--cache-dir", args.cache_dir, "Cache directory");

    auto* deps_cmd = app.add_subcommand("deps", "Print the file-level dependency graph");
    deps_cmd->add_option("path", args.path, "Repository root")->required();
    deps_cmd->add_option("--cache-dir", args.cache_dir, "Cache directory");
    deps_cmd->add_flag("--json", args.as_json, "Print the graph as JSON");

    auto* hotspots_cmd = app.add_subcommand("hotspots", "Rank files by churn, size and coupling");
    hotspots_cmd->add_option("path", args.path, "Repository root")->required();
    hotspots_cmd->add_option("--top", args.top, "Number of files to list")->capture_default_str();
    hotspots_cmd->add_option("--cache-dir", args.cache_dir, "Cache directory");
    hotspots_cmd->add_flag("--json", args.as_json, "Print the ranking as JSON");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app.exit(e);
    }

    if (search_cmd->parsed()) {
        overrides.max_files = search_max_files;
        overrides.top_k = search_top_k;
    }

    if (args.verbose) spdlog::set_level(spdlog::level::debug);
    else if (args.quiet) spdlog::set_level(spdlog::level::err);

    try {
        Session session(args, overrides);
        if (scan_cmd->parsed()) return run_scan(session, args.as_json);
        if (search_cmd->parsed()) return run_search(session, args.query);
        if (hotspots_cmd->parsed()) return run_hotspots(session, args.top, args.as_json);
        return run_deps(session, args.as_json);
    } catch (const PathNotFoundError& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("Unexpected error: {}", e.what());
        return 1;
    }
}
