#include "plan_error.hpp"

namespace seedwise {

std::string plan_error_category::message(int env) const
{
    switch(static_cast<plan_errc>(env))
    {
    case plan_errc::unknown: return "Unknown error";
    case plan_errc::fetch_failure: return "Tracker fetch failed";
    case plan_errc::fetch_timeout: return "Tracker fetch timed out";
    case plan_errc::manifest_unavailable: return "Manifest unavailable this run";
    case plan_errc::budget_exceeded: return "Does not fit in budget";
    case plan_errc::below_minimum_score: return "Score too low to be worth downloading";
    case plan_errc::below_eviction_margin:
        return "Does not outscore eviction candidates by the margin";
    case plan_errc::already_resident: return "Content already on disk";
    case plan_errc::ambiguous_identity:
        return "Declared sizes match but manifests could not be compared";
    case plan_errc::unsafe_eviction: return "Unsafe eviction refused";
    case plan_errc::adapter_failure: return "Client adapter action failed";
    default: return "Unknown";
    }
}

std::error_condition
plan_error_category::default_error_condition(int ev) const noexcept
{
    switch(static_cast<plan_errc>(ev))
    {
    case plan_errc::fetch_timeout:
        return std::errc::timed_out;
    default:
        return std::error_condition(ev, *this);
    }
}

const plan_error_category& plan_category()
{
    static plan_error_category instance;
    return instance;
}

std::error_code make_error_code(plan_errc e)
{
    return std::error_code(static_cast<int>(e), plan_category());
}

std::error_condition make_error_condition(plan_errc e)
{
    return std::error_condition(static_cast<int>(e), plan_category());
}

} // namespace seedwise
