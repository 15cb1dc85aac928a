#include "content_reader.hpp"
#include <openssl/sha.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace codescope {

namespace {

bool is_text_byte(unsigned char c) {
    switch (c) {
        case 7: case 8: case 9: case 10: case 12: case 13: case 27:
            return true;
        default:
            return c >= 32 && c < 127;
    }
}

std::string to_hex(const unsigned char* md, size_t len) {
    std::ostringstream oss;
    for (size_t i = 0; i < len; ++i) {
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(md[i]);
    }
    return oss.str();
}

bool is_continuation(unsigned char c) { return (c & 0xC0) == 0x80; }

// Length of the valid sequence starting at bytes[i], or 0 with `consumed`
// set to the length of the maximal invalid subpart.
size_t utf8_sequence_length(std::string_view bytes, size_t i, size_t& consumed) {
    const auto c = static_cast<unsigned char>(bytes[i]);
    consumed = 1;
    if (c < 0x80) return 1;

    size_t need = 0;
    unsigned char lo = 0x80, hi = 0xBF;
    if (c >= 0xC2 && c <= 0xDF) { need = 1; }
    else if (c == 0xE0) { need = 2; lo = 0xA0; }
    else if ((c >= 0xE1 && c <= 0xEC) || c == 0xEE || c == 0xEF) { need = 2; }
    else if (c == 0xED) { need = 2; hi = 0x9F; }
    else if (c == 0xF0) { need = 3; lo = 0x90; }
    else if (c >= 0xF1 && c <= 0xF3) { need = 3; }
    else if (c == 0xF4) { need = 3; hi = 0x8F; }
    else return 0;

    for (size_t k = 1; k <= need; ++k) {
        if (i + k >= bytes.size()) return 0;
        const auto b = static_cast<unsigned char>(bytes[i + k]);
        const bool ok = (k == 1) ? (b >= lo && b <= hi) : is_continuation(b);
        if (!ok) return 0;
        consumed = k + 1;
    }
    return need + 1;
}

} // namespace

bool looks_binary(std::string_view sample) {
    if (sample.find('\0') != std::string_view::npos) return true;
    size_t nontext = 0;
    for (char ch : sample) {
        if (!is_text_byte(static_cast<unsigned char>(ch))) nontext++;
    }
    const size_t denom = sample.empty() ? 1 : sample.size();
    return static_cast<double>(nontext) / static_cast<double>(denom) > BINARY_NONTEXT_RATIO;
}

std::string decode_utf8_lossy(std::string_view bytes) {
    static const std::string replacement = "\xEF\xBF\xBD";
    std::string out;
    out.reserve(bytes.size());
    size_t i = 0;
    while (i < bytes.size()) {
        size_t consumed = 1;
        size_t len = utf8_sequence_length(bytes, i, consumed);
        if (len > 0) {
            out.append(bytes.data() + i, len);
            i += len;
        } else {
            out += replacement;
            i += consumed;
        }
    }
    return out;
}

std::string read_text(const std::filesystem::path& path, size_t max_bytes) {
    try {
        std::ifstream f(path, std::ios::in | std::ios::binary);
        if (!f.is_open()) {
            spdlog::debug("read_text: cannot open {}", path.string());
            return "";
        }

        std::string data(std::min(BINARY_SNIFF_BYTES, max_bytes), '\0');
        f.read(data.data(), static_cast<std::streamsize>(data.size()));
        data.resize(static_cast<size_t>(f.gcount()));
        if (looks_binary(data)) return "";

        if (data.size() < max_bytes && f) {
            std::string rest(max_bytes - data.size(), '\0');
            f.read(rest.data(), static_cast<std::streamsize>(rest.size()));
            rest.resize(static_cast<size_t>(f.gcount()));
            data += rest;
        }
        return decode_utf8_lossy(data);
    } catch (const std::exception& e) {
        spdlog::debug("read_text: {} failed: {}", path.string(), e.what());
        return "";
    }
}

std::optional<std::string> read_first_line(const std::filesystem::path& path, size_t max_bytes) {
    std::ifstream f(path, std::ios::in | std::ios::binary);
    if (!f.is_open()) return std::nullopt;

    std::string line;
    char c;
    while (line.size() < max_bytes && f.get(c)) {
        line += c;
        if (c == '\n') break;
    }
    return line;
}

std::string utf8_safe_substr(const std::string& str, size_t length) {
    size_t i = 0;
    size_t code_points = 0;
    while (i < str.size() && code_points < length) {
        const auto c = static_cast<unsigned char>(str[i]);
        size_t width = c < 0x80 ? 1 : (c >> 5) == 0x6 ? 2 : (c >> 4) == 0xE ? 3 : (c >> 3) == 0x1E ? 4 : 1;
        i += width;
        code_points++;
    }
    return str.substr(0, std::min(i, str.size()));
}

std::vector<std::string_view> split_lines(std::string_view text) {
    std::vector<std::string_view> lines;
    size_t start = 0;
    size_t i = 0;
    while (i < text.size()) {
        const auto c = static_cast<unsigned char>(text[i]);
        size_t width = 0;
        if (c == '\r') {
            width = (i + 1 < text.size() && text[i + 1] == '\n') ? 2 : 1;
        } else if (c == '\n' || c == '\v' || c == '\f' || (c >= 0x1c && c <= 0x1e)) {
            width = 1;
        } else if (c == 0xC2 && i + 1 < text.size() && static_cast<unsigned char>(text[i + 1]) == 0x85) {
            width = 2;
        } else if (c == 0xE2 && i + 2 < text.size() && static_cast<unsigned char>(text[i + 1]) == 0x80 &&
                   (static_cast<unsigned char>(text[i + 2]) == 0xA8 || static_cast<unsigned char>(text[i + 2]) == 0xA9)) {
            width = 3;
        }

        if (width == 0) {
            ++i;
            continue;
        }
        lines.push_back(text.substr(start, i - start));
        i += width;
        start = i;
    }
    if (start < text.size()) lines.push_back(text.substr(start));
    return lines;
}

size_t count_sloc(std::string_view text) {
    size_t sloc = 0;
    for (auto line : split_lines(text)) {
        if (!is_blank(line)) sloc++;
    }
    return sloc;
}

bool is_blank(std::string_view text) {
    for (char c : text) {
        if (!std::isspace(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

std::string sha256_hex(std::string_view data) {
    unsigned char md[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), md);
    return to_hex(md, SHA256_DIGEST_LENGTH);
}

std::string sha1_hex(std::string_view data) {
    unsigned char md[SHA_DIGEST_LENGTH];
    SHA1(reinterpret_cast<const unsigned char*>(data.data()), data.size(), md);
    return to_hex(md, SHA_DIGEST_LENGTH);
}

} // namespace codescope
