#pragma once
#include <string>
#include <vector>

namespace campus_rag {

// Cuts at `length` bytes without splitting a UTF-8 sequence.
std::string utf8_safe_substr(const std::string& str, size_t length);

std::string to_lower(std::string text);
std::string trim(const std::string& text);
bool is_blank(const std::string& text);

// Splits on ASCII whitespace, no other normalisation.
std::vector<std::string> split_whitespace(const std::string& text);
std::string collapse_whitespace(const std::string& text);

// Drops a leading "--- ... ---" front-matter block if present.
std::string strip_front_matter(const std::string& text);

// Collapses whitespace, then cuts to max_bytes at the last word boundary and appends an ellipsis.
std::string shorten(const std::string& text, size_t max_bytes);

bool contains_ci(const std::string& haystack, const std::string& needle);

} // namespace campus_rag
