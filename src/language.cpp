#include "language.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>

namespace codescope {

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

} // namespace

const std::vector<ExtensionMapping>& extension_table() {
    static const std::vector<ExtensionMapping> table = {
        {".py", Language::Python},
        {".pyw", Language::Python},
        {".js", Language::JavaScript},
        {".mjs", Language::JavaScript},
        {".cjs", Language::JavaScript},
        {".ts", Language::TypeScript},
        {".tsx", Language::TypeScript},
    };
    return table;
}

std::string to_string(Language lang) {
    switch (lang) {
        case Language::JavaScript: return "javascript";
        case Language::Python: return "python";
        case Language::TypeScript: return "typescript";
    }
    return "unknown";
}

std::optional<Language> language_from_string(const std::string& name) {
    const std::string lowered = to_lower(name);
    for (Language lang : {Language::JavaScript, Language::Python, Language::TypeScript}) {
        if (to_string(lang) == lowered) return lang;
    }
    return std::nullopt;
}

std::optional<Language> detect_language(const std::string& path, const std::optional<std::string>& first_line) {
    const std::string ext = to_lower(std::filesystem::path(path).extension().string());
    if (!ext.empty()) {
        for (const auto& entry : extension_table()) {
            if (entry.extension == ext) return entry.language;
        }
    }

    if (first_line && first_line->rfind("#!/", 0) == 0) {
        const std::string line = to_lower(*first_line);
        if (line.find("python") != std::string::npos) return Language::Python;
        if (line.find("node") != std::string::npos || line.find("deno") != std::string::npos) {
            return Language::JavaScript;
        }
    }
    return std::nullopt;
}

} // namespace codescope
