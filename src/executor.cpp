#include "string_utils.hpp"
#include "plan_error.hpp"
#include "executor.hpp"
#include "log.hpp"

#include <exception>

namespace seedwise {

template<typename... Args>
static void log_execution(const log::priority priority, const char* format, Args&&... args)
{
#ifdef SEEDWISE_ENABLE_LOGGING
    log::log_executor("EXECUTE", util::format(format, std::forward<Args>(args)...),
        priority);
#endif // SEEDWISE_ENABLE_LOGGING
}

/**
 * Replays `a` on the ledger, then has the client carry it out. The ledger refuses
 * anything the plan should not contain, which is then never sent to the client.
 */
static void execute_action(const plan_action& a, client_adapter& client,
    storage_ledger& ledger, error_code& error)
{
    const auto& key = a.record.key;
    switch(a.type)
    {
    case action_type::evict:
        ledger.evict(key, a.mode, error);
        if(error) { return; }
        if(a.mode == eviction_mode::reclaim)
            client.stop_and_delete(key, error);
        else
            client.stop(key, error);
        break;
    case action_type::download:
        if(ledger.contains(key))
        {
            error = make_error_code(plan_errc::already_resident);
            return;
        }
        ledger.add_download(a.record);
        client.start_download(key, error);
        break;
    case action_type::cross_seed:
    {
        const record_index_t source = ledger.find(a.source);
        if(source == invalid_index)
        {
            error = make_error_code(plan_errc::unknown);
            return;
        }
        // refused if the source's content has been evicted since
        ledger.join_cluster(ledger.cluster_of(source), a.record, error);
        if(error) { return; }
        client.register_cross_seed(key, a.source_path, error);
        break;
    }
    }
}

execution_report execute_plan(const plan& p, client_adapter& client,
    storage_ledger ledger)
{
    execution_report report;
    for(auto i = 0; i < int(p.actions.size()); ++i)
    {
        const auto& a = p.actions[i];
        error_code error;
        try
        {
            execute_action(a, client, ledger, error);
        }
        catch(const std::exception& e)
        {
            error = make_error_code(plan_errc::adapter_failure);
            report.message = e.what();
        }

        if(error)
        {
            report.failed_action = i;
            report.error = error;
            if(report.message.empty()) { report.message = error.message(); }
            report.message = util::format("%s %s failed: %s", to_string(a.type),
                to_string(a.record.key).c_str(), report.message.c_str());
            log_execution(log::priority::high, "%s", report.message.c_str());
            return report;
        }

        log_execution(log::priority::normal, "%s %s (%s)", to_string(a.type),
            to_string(a.record.key).c_str(), util::format_size(a.record.size).c_str());
        ++report.num_executed;
    }
    log_execution(log::priority::normal, "executed all %i actions", report.num_executed);
    return report;
}

} // namespace seedwise
