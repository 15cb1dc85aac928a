#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace codescope {

// Declaration order is alphabetical by name, so sorting by value sorts by name.
enum class Language {
    JavaScript,
    Python,
    TypeScript
};

struct ExtensionMapping {
    std::string_view extension;
    Language language;
};

// Single source of truth for extension -> language.
const std::vector<ExtensionMapping>& extension_table();

std::string to_string(Language lang);
std::optional<Language> language_from_string(const std::string& name);

// Extension first, then a shebang hint from the first line.
// std::nullopt means "not a supported source file".
std::optional<Language> detect_language(const std::string& path, const std::optional<std::string>& first_line);

} // namespace codescope
