#ifndef CORE_STAT_DELTA_HPP
#define CORE_STAT_DELTA_HPP

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace StatTrack
{
namespace Core
{

/**
 * @brief Counters a StatDelta can increment.
 *
 * Weapon* metrics also carry a weapon name; the others do not.
 */
enum class Metric : std::uint8_t
{
    Kills = 0,
    Deaths,
    Headshots,
    Assists,
    Suicides,
    FriendlyFireKills,
    WeaponKills,
    WeaponHeadshots,
    WeaponAssists,
    ObjectivesCaptured,
    ObjectivesDestroyed,
    DamageDealt,
    DamageTaken,
};

inline const char *toString(Metric metric) noexcept
{
    switch (metric)
    {
    case Metric::Kills:               return "kills";
    case Metric::Deaths:              return "deaths";
    case Metric::Headshots:           return "headshots";
    case Metric::Assists:             return "assists";
    case Metric::Suicides:            return "suicides";
    case Metric::FriendlyFireKills:   return "friendly_fire_kills";
    case Metric::WeaponKills:         return "weapon_kills";
    case Metric::WeaponHeadshots:     return "weapon_headshots";
    case Metric::WeaponAssists:       return "weapon_assists";
    case Metric::ObjectivesCaptured:  return "objectives_captured";
    case Metric::ObjectivesDestroyed: return "objectives_destroyed";
    case Metric::DamageDealt:         return "damage_dealt";
    case Metric::DamageTaken:         return "damage_taken";
    }
    return "unknown";
}

inline std::optional<Metric> parseMetric(std::string_view name) noexcept
{
    static constexpr Metric kAll[] = {
        Metric::Kills, Metric::Deaths, Metric::Headshots, Metric::Assists,
        Metric::Suicides, Metric::FriendlyFireKills, Metric::WeaponKills,
        Metric::WeaponHeadshots, Metric::WeaponAssists,
        Metric::ObjectivesCaptured, Metric::ObjectivesDestroyed,
        Metric::DamageDealt, Metric::DamageTaken,
    };
    for (Metric m : kAll)
    {
        if (name == toString(m))
        {
            return m;
        }
    }
    return std::nullopt;
}

inline bool isWeaponMetric(Metric metric) noexcept
{
    return metric == Metric::WeaponKills ||
           metric == Metric::WeaponHeadshots ||
           metric == Metric::WeaponAssists;
}

/**
 * @brief One incremental contribution to a player's stats.
 *
 * idempotencyKey is "<lineKey>:<ordinal>", so every delta derived from the
 * same log line at the same position gets the same key on replay.
 */
struct StatDelta
{
    std::string  idempotencyKey;
    std::string  matchId;
    std::string  identity;      ///< PlayerIdentity::key.
    std::string  displayName;
    Metric       metric = Metric::Kills;
    std::string  weapon;        ///< Only for weapon metrics.
    std::int64_t amount = 1;
    bool         outOfRound = false;  ///< Produced while no round was active.
};

/**
 * @brief All deltas derived from one log line.
 *
 * Applied as one unit; key is the line key the deltas' keys derive from.
 */
struct StatBatch
{
    std::string            key;
    std::vector<StatDelta> deltas;

    bool empty() const noexcept { return deltas.empty(); }
};

struct WeaponUsage
{
    std::string  weapon;
    std::int64_t kills = 0;
    std::int64_t headshots = 0;
    std::int64_t assists = 0;
};

/**
 * @brief Durable per-player totals, for one match or all-time.
 *
 * For all-time rows matchId is empty.
 */
struct PlayerMatchStats
{
    std::string  matchId;
    std::string  identity;
    std::string  displayName;

    std::int64_t kills = 0;
    std::int64_t deaths = 0;
    std::int64_t headshots = 0;
    std::int64_t assists = 0;
    std::int64_t suicides = 0;
    std::int64_t friendlyFireKills = 0;
    std::int64_t objectivesCaptured = 0;
    std::int64_t objectivesDestroyed = 0;
    std::int64_t damageDealt = 0;
    std::int64_t damageTaken = 0;

    // Part of kills/deaths above that happened outside an active round.
    std::int64_t outOfRoundKills = 0;
    std::int64_t outOfRoundDeaths = 0;

    std::map<std::string, WeaponUsage> weapons;

    /// Add one delta to these totals. Idempotency is the caller's concern.
    void apply(const StatDelta &delta)
    {
        if (!delta.displayName.empty())
        {
            displayName = delta.displayName;
        }

        switch (delta.metric)
        {
        case Metric::Kills:
            kills += delta.amount;
            if (delta.outOfRound)
                outOfRoundKills += delta.amount;
            break;
        case Metric::Deaths:
            deaths += delta.amount;
            if (delta.outOfRound)
                outOfRoundDeaths += delta.amount;
            break;
        case Metric::Headshots:           headshots += delta.amount; break;
        case Metric::Assists:             assists += delta.amount; break;
        case Metric::Suicides:            suicides += delta.amount; break;
        case Metric::FriendlyFireKills:   friendlyFireKills += delta.amount; break;
        case Metric::ObjectivesCaptured:  objectivesCaptured += delta.amount; break;
        case Metric::ObjectivesDestroyed: objectivesDestroyed += delta.amount; break;
        case Metric::DamageDealt:         damageDealt += delta.amount; break;
        case Metric::DamageTaken:         damageTaken += delta.amount; break;
        case Metric::WeaponKills:
        case Metric::WeaponHeadshots:
        case Metric::WeaponAssists:
        {
            WeaponUsage &usage = weapons[delta.weapon];
            usage.weapon = delta.weapon;
            if (delta.metric == Metric::WeaponKills)
                usage.kills += delta.amount;
            else if (delta.metric == Metric::WeaponHeadshots)
                usage.headshots += delta.amount;
            else
                usage.assists += delta.amount;
            break;
        }
        }
    }
};

} // namespace Core
} // namespace StatTrack

#endif // CORE_STAT_DELTA_HPP
