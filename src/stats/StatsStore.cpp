#include "stats/StatsStore.hpp"

namespace StatTrack
{
    namespace Stats
    {
        const char *toString(UpsertResult result) noexcept
        {
            switch (result)
            {
            case UpsertResult::Applied:   return "applied";
            case UpsertResult::Duplicate: return "duplicate";
            case UpsertResult::Failed:    return "failed";
            }
            return "unknown";
        }

    } // namespace Stats
} // namespace StatTrack
