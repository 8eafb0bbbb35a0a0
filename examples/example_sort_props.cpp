// examples/example_sort_props.cpp - Ordering element attributes
//
// An editor wants the attributes of every element in a conventional
// order: identity first, event handlers and children last, the team's
// own conventions ahead of the built-in table.  Attributes nobody has
// an opinion on are ordered by a pairwise model.
//
// Compile:
//   g++ -std=c++20 -O2 -I include -o example_sort_props examples/example_sort_props.cpp

#include <prefsort/prefsort.h>

#include <cstddef>
#include <iostream>
#include <string>
#include <vector>

using namespace prefsort;

namespace {

// Stand-in for a learned model: shorter names first, then alphabetical.
struct shortest_first {
    compare::raw_scores raw_compare(token const& a, token const& b) {
        double const by_len = static_cast<double>(a.size()) - static_cast<double>(b.size());
        double const by_name = a < b ? -0.5 : 0.5;
        double const signed_score = by_len != 0.0 ? by_len : by_name;
        return signed_score < 0.0 ? compare::raw_scores{0.0, -signed_score}
                                  : compare::raw_scores{signed_score, 0.0};
    }
};

void print(char const* title, std::vector<std::string> const& names,
           std::vector<std::size_t> const& perm) {
    std::cout << title << "\n";
    for (std::size_t i = 0; i < perm.size(); ++i) {
        std::cout << "  " << (i + 1) << ". " << names[perm[i]] << "\n";
    }
    std::cout << "\n";
}

} // namespace

// =========================================================================
// Runtime: sort one element's attributes in each mode
// =========================================================================

int main() {
    std::vector<std::string> const attrs = {
        "onClick", "children", "zIndex", "className", "data-testid",
        "tooltip", "id", "aria-label", "key", "variant",
    };

    std::cout << "=== Attribute Ordering ===\n\n";

    sorter_options off;
    off.mode = sort_mode::off;
    off.custom_order = {"variant", "className"};
    preference_sorter by_hint(off);
    print("Mode off (hints, then input order):", attrs, by_hint.sort_names(attrs));

    sorter_options direct = off;
    direct.mode = sort_mode::direct;
    preference_sorter by_model(direct, compare::any_pairwise_model(shortest_first{}));
    print("Mode direct (hints, then the model):", attrs, by_model.sort_names(attrs));

    sorter_options stable = off;
    stable.mode = sort_mode::stabilized;
    preference_sorter by_rank(stable, compare::any_pairwise_model(shortest_first{}));
    print("Mode stabilized (hints, then Bradley-Terry):", attrs, by_rank.sort_names(attrs));

    auto const& st = by_model.last_stats();
    std::cout << "direct: " << st.edges_added << " edges, " << st.edges_rejected
              << " rejected, " << st.model_calls << " model calls\n\n";

    // =====================================================================
    // Suggest a custom order from existing code
    // =====================================================================

    order_extractor extract;
    extract.add_names(std::vector<std::string>{"key", "variant", "className", "onClick"});
    extract.add_names(std::vector<std::string>{"variant", "className", "data-testid"});
    extract.add_names(std::vector<std::string>{"className", "variant", "data-cy"});
    extract.add_names(std::vector<std::string>{"key", "variant", "onClick"});

    std::cout << "Suggested custom order:";
    for (auto const& t : extract.suggest()) std::cout << " [" << t << "]";
    std::cout << "\n";
    return 0;
}
