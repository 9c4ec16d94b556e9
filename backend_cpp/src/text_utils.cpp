#include "text_utils.hpp"
#include <algorithm>
#include <cctype>

namespace campus_rag {

std::string utf8_safe_substr(const std::string& str, size_t length) {
    if (str.length() <= length) return str;
    std::string sub = str.substr(0, length);
    if (sub.empty()) return sub;
    // Walk back over continuation bytes; drop the lead byte of a sequence that was cut.
    size_t pos = sub.size();
    size_t continuation = 0;
    while (pos > 0) {
        unsigned char c = static_cast<unsigned char>(sub[pos - 1]);
        if ((c & 0xC0) == 0x80) {
            ++continuation;
            --pos;
            continue;
        }
        if (c >= 0xC0) {
            size_t expected = (c >= 0xF0) ? 3 : (c >= 0xE0) ? 2 : 1;
            if (continuation < expected) sub.resize(pos - 1);
        }
        break;
    }
    return sub;
}

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return text;
}

std::string trim(const std::string& text) {
    auto not_space = [](unsigned char ch) { return std::isspace(ch) == 0; };
    auto begin = std::find_if(text.begin(), text.end(), not_space);
    auto end = std::find_if(text.rbegin(), text.rend(), not_space).base();
    if (begin >= end) return "";
    return std::string(begin, end);
}

bool is_blank(const std::string& text) {
    return std::all_of(text.begin(), text.end(),
                       [](unsigned char ch) { return std::isspace(ch) != 0; });
}

std::vector<std::string> split_whitespace(const std::string& text) {
    std::vector<std::string> tokens;
    size_t start = 0;
    while (start < text.size()) {
        while (start < text.size() && std::isspace(static_cast<unsigned char>(text[start])) != 0) {
            ++start;
        }
        if (start >= text.size()) break;
        size_t end = start;
        while (end < text.size() && std::isspace(static_cast<unsigned char>(text[end])) == 0) {
            ++end;
        }
        tokens.emplace_back(text.substr(start, end - start));
        start = end;
    }
    return tokens;
}

std::string collapse_whitespace(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (const auto& token : split_whitespace(text)) {
        if (!out.empty()) out.push_back(' ');
        out += token;
    }
    return out;
}

std::string strip_front_matter(const std::string& text) {
    const size_t first = text.find_first_not_of(" \t\r\n\f\v");
    if (first == std::string::npos) return text;
    if (text.compare(first, 3, "---") != 0) return text;

    const size_t close = text.find("---", first + 3);
    if (close == std::string::npos) return text;
    return text.substr(close + 3);
}

std::string shorten(const std::string& text, size_t max_bytes) {
    std::string collapsed = collapse_whitespace(text);
    if (collapsed.size() <= max_bytes) return collapsed;

    std::string cut = utf8_safe_substr(collapsed, max_bytes);
    size_t last_space = cut.find_last_of(' ');
    if (last_space != std::string::npos && last_space > 0) {
        cut.resize(last_space);
    }
    return cut + "\xE2\x80\xA6";
}

bool contains_ci(const std::string& haystack, const std::string& needle) {
    if (needle.empty()) return false;
    return to_lower(haystack).find(to_lower(needle)) != std::string::npos;
}

} // namespace campus_rag
