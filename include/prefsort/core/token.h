// core/token.h - Normalized item names and wildcard patterns
// Part of the preference-sort library (C++20)
//
// DESIGN RATIONALE:
// Every ordering structure compares items by their normalized name, so
// "className", "class_name" and "class-name" all collapse to one token
// ("class name").  A token is a plain std::string: value equality, cheap
// hashing, deterministic ordering.
//
// Patterns are kept apart from tokens.  A hint entry ending in '*' is a
// prefix pattern; everywhere else a string is a concrete token.
// token_pattern is the single place that knows about the wildcard marker,
// so graph code asks "does this pattern match that node" and never
// inspects characters itself.

#ifndef PREFSORT_CORE_TOKEN_H
#define PREFSORT_CORE_TOKEN_H

#include <algorithm>
#include <cctype>
#include <regex>
#include <string>
#include <string_view>

namespace prefsort {

/// Normalized, comparable item name.
using token = std::string;

/// Trailing marker that turns a hint entry into a prefix pattern.
inline constexpr char wildcard_marker = '*';

// =============================================================================
// token_pattern
// =============================================================================

/// A hint entry: either an exact token or a prefix pattern ("data *").
class token_pattern {
public:
    token_pattern() = default;

    /// Parse a hint entry.  A trailing wildcard_marker makes it a prefix
    /// pattern; the marker itself is not part of the prefix.
    [[nodiscard]] static token_pattern parse(std::string_view entry) {
        token_pattern p;
        if (!entry.empty() && entry.back() == wildcard_marker) {
            p.text_ = std::string(entry.substr(0, entry.size() - 1));
            p.prefix_ = true;
        } else {
            p.text_ = std::string(entry);
        }
        return p;
    }

    [[nodiscard]] bool is_prefix() const noexcept { return prefix_; }

    /// Exact token, or prefix without the marker.
    [[nodiscard]] std::string const& text() const noexcept { return text_; }

    /// An empty exact entry matches nothing.  An empty prefix ("*")
    /// matches every token.
    [[nodiscard]] bool empty() const noexcept { return !prefix_ && text_.empty(); }

    [[nodiscard]] bool matches(std::string_view t) const noexcept {
        if (prefix_) {
            return t.size() >= text_.size() &&
                   t.compare(0, text_.size(), text_) == 0;
        }
        return !text_.empty() && t == text_;
    }

private:
    std::string text_;
    bool prefix_ = false;
};

// =============================================================================
// normalize
// =============================================================================

/// Split an identifier into lowercase, space separated words.
///
/// Steps, in order:
/// 1. trim surrounding whitespace
/// 2. each run of '_', '-', '.', ':' becomes a single space
/// 3. lower/digit followed by upper is split  ("camelCase" -> "camel Case")
/// 4. acronym followed by a word is split     ("XMLDocument" -> "XML Document")
/// 5. strip leading/trailing underscores and whitespace
/// 6. lowercase
///
/// Interior whitespace that was already in the input is kept as is:
/// "word1  __--word2" becomes "word1   word2".
///
/// Example:
/// ```cpp
/// normalize("onClick");      // "on click"
/// normalize("aria-label");   // "aria label"
/// normalize("XMLDocument");  // "xml document"
/// ```
[[nodiscard]] inline token normalize(std::string_view raw) {
    static std::regex const separators{"[_\\-.:]+"};
    static std::regex const lower_upper{"([a-z0-9])([A-Z])"};
    static std::regex const acronym_word{"([A-Z]+)([A-Z][a-z])"};

    auto is_space = [](char c) {
        return std::isspace(static_cast<unsigned char>(c)) != 0;
    };

    auto first = std::find_if_not(raw.begin(), raw.end(), is_space);
    auto last = std::find_if_not(raw.rbegin(), raw.rend(), is_space).base();
    std::string s = first < last ? std::string(first, last) : std::string{};

    s = std::regex_replace(s, separators, " ");
    s = std::regex_replace(s, lower_upper, "$1 $2");
    s = std::regex_replace(s, acronym_word, "$1 $2");

    auto strip = [&](char c) { return c == '_' || is_space(c); };
    auto b = std::find_if_not(s.begin(), s.end(), strip);
    auto e = std::find_if_not(s.rbegin(), s.rend(), strip).base();
    s = b < e ? std::string(b, e) : std::string{};

    std::transform(s.begin(), s.end(), s.begin(), [](char c) {
        return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    });
    return s;
}

} // namespace prefsort

#endif // PREFSORT_CORE_TOKEN_H
