#ifndef SEEDWISE_PLAN_ERROR_HEADER
#define SEEDWISE_PLAN_ERROR_HEADER

#include "error_code.hpp"

#include <type_traits> // true_type
#include <string>

namespace seedwise {

/**
 * Errors and skip reasons produced while planning and executing a run. Some of
 * these are not failures in the usual sense: `budget_exceeded`, `already_resident`
 * and `below_eviction_margin` are normal planner outcomes recorded as the reason a
 * candidate was passed over.
 */
enum class plan_errc
{
    unknown = 1,

    // A tracker or network call failed. The affected candidates are skipped, the
    // rest of the run continues.
    fetch_failure,
    // A tracker did not answer within `fetch_settings::timeout`.
    fetch_timeout,

    // The candidate's manifest could not be resolved this run (e.g. the shortlist
    // was exhausted), so it is never admitted.
    manifest_unavailable,

    // No more room under the storage or download-volume budget.
    budget_exceeded,
    // The candidate does not score above `planner_settings::min_candidate_score`.
    below_minimum_score,
    // Room could only have been made by evicting torrents that the candidate does
    // not outscore by the eviction margin.
    below_eviction_margin,
    // The candidate's content is already on disk and cannot be cross-seeded.
    already_resident,

    // Declared sizes matched but manifests could not be compared. Reported as a
    // warning, never treated as a match.
    ambiguous_identity,

    // An eviction of a protected record, or one that would delete files another
    // resident record still depends on, was refused.
    unsafe_eviction,

    // The client adapter failed to carry out an action.
    adapter_failure
};

struct plan_error_category : public std::error_category
{
    const char* name() const noexcept override { return "plan"; }
    std::string message(int env) const override;
    std::error_condition default_error_condition(int ev) const noexcept override;
};

const plan_error_category& plan_category();
std::error_code make_error_code(plan_errc e);
std::error_condition make_error_condition(plan_errc e);

} // namespace seedwise

namespace std
{
    template<> struct is_error_code_enum<seedwise::plan_errc> : public true_type {};
}

#endif // SEEDWISE_PLAN_ERROR_HEADER
