// sorter/canonical_order.h - Built-in attribute precedence
// Part of the preference-sort library (C++20)
//
// Conventional ordering of common element attributes, already
// normalized.  Identity first, then classification, styling, content,
// state, accessibility and data attributes, event handlers, children.
// Entries ending in '*' are prefix patterns.

#ifndef PREFSORT_SORTER_CANONICAL_ORDER_H
#define PREFSORT_SORTER_CANONICAL_ORDER_H

#include <prefsort/core/token.h>

#include <vector>

namespace prefsort {

[[nodiscard]] inline std::vector<token> const& canonical_order() {
    static std::vector<token> const order = {
        "key",
        "ref",
        "id",
        "name",
        "as",
        "type",
        "role",
        "class name",
        "style",
        "src",
        "href",
        "alt",
        "title",
        "label",
        "value",
        "default value",
        "checked",
        "default checked",
        "placeholder",
        "min",
        "max",
        "step",
        "required",
        "disabled",
        "read only",
        "auto focus",
        "tab index",
        "aria *",
        "data *",
        "test *",
        "on *",
        "children",
    };
    return order;
}

} // namespace prefsort

#endif // PREFSORT_SORTER_CANONICAL_ORDER_H
