#include "string_utils.hpp"
#include "plan.hpp"

#include <sstream>

namespace seedwise {

plan_action plan_action::make_download(torrent_record r, double score)
{
    plan_action a;
    a.type = action_type::download;
    a.record = std::move(r);
    a.score = score;
    return a;
}

plan_action plan_action::make_evict(torrent_record r, double score,
    eviction_mode mode, bytes_t freed_bytes)
{
    plan_action a;
    a.type = action_type::evict;
    a.record = std::move(r);
    a.score = score;
    a.mode = mode;
    a.freed_bytes = freed_bytes;
    return a;
}

plan_action plan_action::make_cross_seed(torrent_record r, double score,
    const torrent_record& source)
{
    plan_action a;
    a.type = action_type::cross_seed;
    a.record = std::move(r);
    a.score = score;
    a.source = source.key;
    a.source_path = source.save_path;
    return a;
}

int plan::num_actions(const action_type t) const noexcept
{
    int n = 0;
    for(const auto& a : actions) { if(a.type == t) { ++n; } }
    return n;
}

static std::string format_budget(const bytes_t budget)
{
    return budget < 0 ? std::string("unlimited") : util::format_size(budget);
}

std::string to_string(const plan& p)
{
    using util::format_size;
    using util::format;
    using type = action_type;

    std::ostringstream ss;
    ss << "plan summary\n";
    ss << "    storage budget " << format_budget(p.storage_budget)
       << ", download budget " << format_budget(p.download_budget) << '\n';
    ss << "    occupied now " << format_size(p.occupied_before)
       << ", expected after " << format_size(p.occupied_after) << '\n';
    ss << "    evicting " << p.num_actions(type::evict)
       << " torrent(s) (" << format_size(p.freed_bytes) << " freed), downloading "
       << p.num_actions(type::download) << " torrent(s) ("
       << format_size(p.downloaded_bytes) << "), cross-seeding "
       << p.num_actions(type::cross_seed) << " torrent(s) ("
       << format_size(p.cross_seeded_bytes) << ")\n";

    if(!p.actions.empty())
    {
        ss << "actions:\n";
        int n = 1;
        for(const auto& a : p.actions)
        {
            ss << "    " << n++ << ". " << to_string(a.type) << ' '
               << to_string(a.record.key) << ' ' << a.record.title
               << format(" (score %.6f, ", a.score);
            switch(a.type)
            {
            case type::download:
                ss << format_size(a.record.size) << ')';
                break;
            case type::evict:
                ss << to_string(a.mode) << ", frees " << format_size(a.freed_bytes) << ')';
                break;
            case type::cross_seed:
                ss << "reusing " << to_string(a.source) << " at "
                   << a.source_path.string() << ')';
                break;
            }
            ss << '\n';
        }
    }

    if(!p.skipped.empty())
    {
        ss << "skipped:\n";
        for(const auto& s : p.skipped)
        {
            ss << "    " << to_string(s.key) << ' ' << s.title
               << format(" (score %.6f): ", s.score) << s.reason.message() << '\n';
        }
    }

    if(!p.warnings.empty())
    {
        ss << "warnings:\n";
        for(const auto& w : p.warnings)
        {
            ss << "    " << to_string(w.key) << ": " << w.error.message();
            if(!w.message.empty()) { ss << " (" << w.message << ')'; }
            ss << '\n';
        }
    }
    return ss.str();
}

} // namespace seedwise
