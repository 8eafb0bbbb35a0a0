// sorter/sort_mode.h - How items left unordered by hints are finally ordered
// Part of the preference-sort library (C++20)

#ifndef PREFSORT_SORTER_SORT_MODE_H
#define PREFSORT_SORTER_SORT_MODE_H

#include <stdexcept>
#include <string>
#include <string_view>

namespace prefsort {

enum class sort_mode {
    direct,      ///< pairwise model breaks every remaining tie
    off,         ///< original input order breaks ties
    stabilized,  ///< model outcomes ranked by Bradley-Terry break ties
};

[[nodiscard]] constexpr std::string_view to_string(sort_mode m) noexcept {
    switch (m) {
        case sort_mode::direct: return "direct";
        case sort_mode::off: return "off";
        case sort_mode::stabilized: return "stabilized";
    }
    return "invalid";
}

[[nodiscard]] constexpr bool is_valid(sort_mode m) noexcept {
    return m == sort_mode::direct || m == sort_mode::off || m == sort_mode::stabilized;
}

/// Parse a mode name.  Accepts "direct", "off", "stabilized" and the
/// option spellings "yes", "no", "stable".
///
/// Throws std::invalid_argument for anything else.
[[nodiscard]] inline sort_mode parse_sort_mode(std::string_view s) {
    if (s == "direct" || s == "yes") return sort_mode::direct;
    if (s == "off" || s == "no") return sort_mode::off;
    if (s == "stabilized" || s == "stable") return sort_mode::stabilized;
    throw std::invalid_argument("parse_sort_mode: unknown mode '" + std::string(s) + "'");
}

} // namespace prefsort

#endif // PREFSORT_SORTER_SORT_MODE_H
