#include "repo_snapshot.hpp"
#include <algorithm>
#include <set>
#include <spdlog/spdlog.h>

namespace codescope {

using json = nlohmann::json;

json FileRecord::to_json() const {
    return json{
        {"path", path},
        {"language", language ? json(to_string(*language)) : json(nullptr)},
        {"text", text},
        {"sloc", sloc},
        {"hash", content_hash}
    };
}

FileRecord FileRecord::from_json(const json& j) {
    FileRecord rec;
    rec.path = j.value("path", "");
    if (j.contains("language") && j["language"].is_string()) {
        rec.language = language_from_string(j["language"].get<std::string>());
    }
    rec.text = j.value("text", "");
    rec.sloc = j.value("sloc", static_cast<size_t>(0));
    rec.content_hash = j.value("hash", "");
    return rec;
}

bool FileRecord::operator==(const FileRecord& other) const {
    return path == other.path && language == other.language && text == other.text &&
           sloc == other.sloc && content_hash == other.content_hash;
}

void RepoSnapshot::refresh_derived() {
    std::set<Language> seen;
    summary = {};
    for (const auto& [path, rec] : files) {
        if (rec.language) seen.insert(*rec.language);
        summary.sloc_total += rec.sloc;
    }
    summary.file_count = files.size();
    languages.assign(seen.begin(), seen.end());
    std::sort(languages.begin(), languages.end(), [](Language a, Language b) {
        return to_string(a) < to_string(b);
    });
}

json RepoSnapshot::summary_json() const {
    json langs = json::array();
    for (Language lang : languages) langs.push_back(to_string(lang));
    return json{
        {"root", root},
        {"file_count", summary.file_count},
        {"sloc_total", summary.sloc_total},
        {"languages", langs},
        {"is_repo", vcs.is_repo}
    };
}

json file_map_to_json(const FileMap& files) {
    json j = json::object();
    for (const auto& [path, rec] : files) j[path] = rec.to_json();
    return j;
}

FileMap file_map_from_json(const json& j) {
    FileMap files;
    if (!j.is_object()) return files;
    for (auto it = j.begin(); it != j.end(); ++it) {
        try {
            FileRecord rec = FileRecord::from_json(it.value());
            if (rec.path.empty()) rec.path = it.key();
            files.emplace(it.key(), std::move(rec));
        } catch (const std::exception& e) {
            spdlog::debug("Dropping malformed cached record {}: {}", it.key(), e.what());
        }
    }
    return files;
}

} // namespace codescope
