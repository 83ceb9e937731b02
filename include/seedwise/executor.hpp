#ifndef SEEDWISE_EXECUTOR_HEADER
#define SEEDWISE_EXECUTOR_HEADER

#include "storage_ledger.hpp"
#include "error_code.hpp"
#include "adapters.hpp"
#include "plan.hpp"

#include <string>

namespace seedwise {

struct execution_report
{
    // The number of actions carried out, from the start of the plan.
    int num_executed = 0;

    // The index of the action that failed, or -1 if all were executed.
    int failed_action = -1;
    error_code error;
    std::string message;

    bool is_complete() const noexcept { return failed_action == -1; }
};

/**
 * Carries out the actions of `p` in order through `client`. `ledger` must be the
 * state the plan was made against (not the one the planner updated), as every
 * action is replayed on it first. Evictions it refuses (`unsafe_eviction`) are not
 * sent to the client.
 *
 * Execution stops at the first failure, the actions before it remain executed.
 */
execution_report execute_plan(const plan& p, client_adapter& client,
    storage_ledger ledger);

} // namespace seedwise

#endif // SEEDWISE_EXECUTOR_HEADER
