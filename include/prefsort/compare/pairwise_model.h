// compare/pairwise_model.h - Learned pairwise preference capability
// Part of the preference-sort library (C++20)
//
// DESIGN RATIONALE:
// The pairwise model (an inference session in production, a table in
// tests) is external.  The library only needs one operation:
//
//   raw_compare(a, b) -> {cmp, cmp_rev}
//
// Both scores come from a single evaluation on the ordered pair.  The
// signed preference is cmp - cmp_rev: negative means `a` sorts first.
// Equivalently cmp_rev is the evidence for "a before b" and cmp the
// evidence for "b before a"; that is how the stabilized mode fills the
// Bradley-Terry win matrix.
//
// any_pairwise_model type-erases any type satisfying the concept so the
// sorter can own a model without becoming a template.

#ifndef PREFSORT_COMPARE_PAIRWISE_MODEL_H
#define PREFSORT_COMPARE_PAIRWISE_MODEL_H

#include <prefsort/core/limits.h>
#include <prefsort/core/token.h>

#include <array>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string_view>
#include <type_traits>
#include <utility>

namespace prefsort::compare {

/// Both outputs of one model evaluation on the ordered pair (a, b).
struct raw_scores {
    double cmp = 0.0;      ///< evidence that b sorts before a
    double cmp_rev = 0.0;  ///< evidence that a sorts before b

    /// Signed preference; negative -> a first.
    [[nodiscard]] constexpr double signed_score() const noexcept { return cmp - cmp_rev; }
};

// ─── pairwise_model concept ─────────────────────────────────────────────

template<typename M>
concept pairwise_model = requires(M& m, token const& a, token const& b) {
    { m.raw_compare(a, b) } -> std::convertible_to<raw_scores>;
};

// ─── any_pairwise_model type-erased wrapper ─────────────────────────────

class any_pairwise_model {
    struct concept_t {
        virtual ~concept_t() = default;
        virtual raw_scores raw_compare(token const& a, token const& b) = 0;
    };

    template<typename M>
    struct model_t final : concept_t {
        M model_;
        explicit model_t(M m) : model_(std::move(m)) {}
        raw_scores raw_compare(token const& a, token const& b) override {
            return model_.raw_compare(a, b);
        }
    };

    std::unique_ptr<concept_t> impl_;

public:
    any_pairwise_model() = default;

    template<typename M>
        requires pairwise_model<M> && (!std::same_as<std::remove_cvref_t<M>, any_pairwise_model>)
    explicit any_pairwise_model(M m)
        : impl_(std::make_unique<model_t<M>>(std::move(m))) {}

    raw_scores raw_compare(token const& a, token const& b) {
        if (!impl_) throw std::logic_error("any_pairwise_model::raw_compare: no model bound");
        return impl_->raw_compare(a, b);
    }

    explicit operator bool() const { return impl_ != nullptr; }
};

// ─── model input encoding ───────────────────────────────────────────────

/// Fixed-length integer encoding of a token for the pairwise model.
using encoded_token = std::array<std::int32_t, limits::model_sequence_length>;

/// Vocabulary "$abcdefghijklmnopqrstuvwxyz 0123456789" maps to 1..38.
/// Characters outside it encode as 0, as does padding.  Tokens longer
/// than the sequence length are truncated.
[[nodiscard]] constexpr encoded_token encode_token(std::string_view t) noexcept {
    constexpr std::string_view vocab = "$abcdefghijklmnopqrstuvwxyz 0123456789";
    encoded_token out{};
    auto const n = t.size() < out.size() ? t.size() : out.size();
    for (std::size_t i = 0; i < n; ++i) {
        auto const pos = vocab.find(t[i]);
        out[i] = pos == std::string_view::npos ? 0 : static_cast<std::int32_t>(pos + 1);
    }
    return out;
}

} // namespace prefsort::compare

#endif // PREFSORT_COMPARE_PAIRWISE_MODEL_H
