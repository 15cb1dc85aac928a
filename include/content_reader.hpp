#pragma once
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace codescope {

constexpr size_t MAX_BYTES_PER_FILE_DEFAULT = 1'000'000;
constexpr size_t BINARY_SNIFF_BYTES = 4096;
constexpr double BINARY_NONTEXT_RATIO = 0.30;

// NUL byte, or more than 30% of bytes outside printable ASCII + text control codes.
bool looks_binary(std::string_view sample);

// Invalid UTF-8 sequences become U+FFFD. Never throws.
std::string decode_utf8_lossy(std::string_view bytes);

// Returns "" when the file can't be read or looks binary.
// Files larger than max_bytes are truncated, not rejected.
std::string read_text(const std::filesystem::path& path, size_t max_bytes = MAX_BYTES_PER_FILE_DEFAULT);

// Up to max_bytes of the first line (newline included), for shebang sniffing.
std::optional<std::string> read_first_line(const std::filesystem::path& path, size_t max_bytes = 256);

// First `length` code points of a valid UTF-8 string.
std::string utf8_safe_substr(const std::string& str, size_t length);

/**
 * Line boundaries: \n, \r\n, lone \r, \v, \f, \x1c-\x1e and the UTF-8
 * encodings of U+0085, U+2028 and U+2029. A trailing boundary does not
 * start an extra empty line. Views point into `text`.
 */
std::vector<std::string_view> split_lines(std::string_view text);

size_t count_sloc(std::string_view text);
bool is_blank(std::string_view text);

std::string sha256_hex(std::string_view data);
std::string sha1_hex(std::string_view data);

} // namespace codescope
