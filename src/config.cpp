#include "config.hpp"
#include <cstdlib>
#include <fstream>
#include <spdlog/spdlog.h>

namespace codescope {

using json = nlohmann::json;

namespace {

std::string getenv_or(const char* key, const std::string& def) {
    const char* v = std::getenv(key);
    return (v && *v) ? std::string(v) : def;
}

} // namespace

EngineConfig EngineConfig::from_json(const json& j) {
    EngineConfig cfg;
    if (!j.is_object()) return cfg;

    cfg.scan.max_files = j.value("max_files", cfg.scan.max_files);
    cfg.scan.max_bytes_per_file = j.value("max_bytes_per_file", cfg.scan.max_bytes_per_file);
    cfg.scan.incremental = j.value("incremental", cfg.scan.incremental);
    cfg.scan.workers = j.value("workers", cfg.scan.workers);
    cfg.scan.ignored_paths = j.value("ignored_paths", std::vector<std::string>{});
    cfg.scan.included_paths = j.value("included_paths", std::vector<std::string>{});

    cfg.index.max_files = j.value("index_max_files", cfg.index.max_files);
    cfg.index.lines_per_chunk = j.value("lines_per_chunk", cfg.index.lines_per_chunk);
    cfg.index.top_k = j.value("top_k", cfg.index.top_k);

    if (j.contains("cache_dir") && j["cache_dir"].is_string()) {
        cfg.cache_dir = fs::path(j["cache_dir"].get<std::string>());
    }
    cfg.vcs_query_timeout_seconds = j.value("vcs_query_timeout_seconds", cfg.vcs_query_timeout_seconds);
    cfg.vcs_history_timeout_seconds = j.value("vcs_history_timeout_seconds", cfg.vcs_history_timeout_seconds);
    cfg.log_level = j.value("log_level", cfg.log_level);

    if (cfg.index.lines_per_chunk == 0) cfg.index.lines_per_chunk = 120;
    return cfg;
}

EngineConfig EngineConfig::load(const fs::path& root, const std::optional<fs::path>& explicit_path) {
    fs::path config_path;
    std::error_code ec;
    if (explicit_path) {
        config_path = *explicit_path;
    } else {
        config_path = root / ".codescope" / "config.json";
        if (!fs::exists(config_path, ec)) config_path = root / "codescope.json";
    }

    if (!fs::exists(config_path, ec)) {
        if (explicit_path) spdlog::warn("Config file not found: {}", config_path.string());
        return EngineConfig{};
    }

    try {
        std::ifstream f(config_path);
        auto cfg = from_json(json::parse(f));
        spdlog::info("Config loaded from {}: {} ignores, {} exceptions",
                     config_path.string(), cfg.scan.ignored_paths.size(), cfg.scan.included_paths.size());
        return cfg;
    } catch (const std::exception& e) {
        spdlog::error("Config corrupted at {}: {}", config_path.string(), e.what());
        return EngineConfig{};
    }
}

fs::path default_cache_dir() {
    std::string dir = getenv_or("CODESCOPE_CACHE_DIR", "");
    if (!dir.empty()) return fs::path(dir);

    std::string xdg = getenv_or("XDG_CACHE_HOME", "");
    if (!xdg.empty()) return fs::path(xdg) / "codescope";

    std::string home = getenv_or("HOME", "");
    if (!home.empty()) return fs::path(home) / ".cache" / "codescope";
    return fs::temp_directory_path() / "codescope";
}

} // namespace codescope
