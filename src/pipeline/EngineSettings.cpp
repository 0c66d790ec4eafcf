#include "pipeline/EngineSettings.hpp"

#include <filesystem>
#include <stdexcept>

namespace StatTrack
{
    namespace Pipeline
    {
        namespace
        {
            std::chrono::milliseconds millis(const Utils::ConfigLoader &config, std::string_view key,
                                             std::chrono::milliseconds fallback)
            {
                return std::chrono::milliseconds(config.getIntOr(key, fallback.count()));
            }

            void requirePositive(long long value, const char *key)
            {
                if (value <= 0)
                {
                    throw std::invalid_argument(std::string(key) + " must be positive, got " +
                                                std::to_string(value));
                }
            }
        } // namespace

        EngineSettings EngineSettings::fromConfig(const Utils::ConfigLoader &config)
        {
            EngineSettings s;

            s.pollInterval          = millis(config, "poll_interval_ms", s.pollInterval);
            s.missingFileBackoffMax = millis(config, "missing_file_backoff_max_ms", s.missingFileBackoffMax);
            s.cursorFlushInterval   = millis(config, "cursor_flush_interval_ms", s.cursorFlushInterval);

            const long long capacity = config.getIntOr("queue_capacity", static_cast<long long>(s.queueCapacity));
            requirePositive(capacity, "queue_capacity");
            s.queueCapacity = static_cast<std::size_t>(capacity);

            s.queryInterval   = std::chrono::seconds(config.getIntOr("query_interval_secs", s.queryInterval.count()));
            s.queryTimeout    = millis(config, "query_timeout_ms", s.queryTimeout);
            s.queryMaxRetries = static_cast<int>(config.getIntOr("query_max_retries", s.queryMaxRetries));
            s.queryBackoff    = millis(config, "query_backoff_ms", s.queryBackoff);
            s.fragmentTimeout = millis(config, "fragment_timeout_ms", s.fragmentTimeout);

            s.snapshotMissThreshold =
                static_cast<int>(config.getIntOr("snapshot_miss_threshold", s.snapshotMissThreshold));
            s.identityWindow = std::chrono::seconds(config.getIntOr("identity_window_secs", s.identityWindow.count()));

            const long long window = config.getIntOr("dedup_window", static_cast<long long>(s.dedupWindow));
            requirePositive(window, "dedup_window");
            s.dedupWindow = static_cast<std::size_t>(window);

            s.stateDir     = config.getStringOr("state_dir", s.stateDir);
            s.statsJournal = config.getStringOr("stats_journal", "");
            s.logFile      = config.getStringOr("log_file", "");
            s.logLevel     = Utils::parseLogLevel(config.getStringOr("log_level", "INFO"));

            s.validate();
            return s;
        }

        void EngineSettings::validate() const
        {
            requirePositive(pollInterval.count(), "poll_interval_ms");
            requirePositive(missingFileBackoffMax.count(), "missing_file_backoff_max_ms");
            requirePositive(cursorFlushInterval.count(), "cursor_flush_interval_ms");
            requirePositive(static_cast<long long>(queueCapacity), "queue_capacity");
            requirePositive(queryInterval.count(), "query_interval_secs");
            requirePositive(queryTimeout.count(), "query_timeout_ms");
            requirePositive(fragmentTimeout.count(), "fragment_timeout_ms");
            requirePositive(snapshotMissThreshold, "snapshot_miss_threshold");
            requirePositive(identityWindow.count(), "identity_window_secs");
            requirePositive(static_cast<long long>(dedupWindow), "dedup_window");
            if (queryMaxRetries < 0)
            {
                throw std::invalid_argument("query_max_retries must not be negative");
            }
            if (queryBackoff.count() < 0)
            {
                throw std::invalid_argument("query_backoff_ms must not be negative");
            }
            if (stateDir.empty())
            {
                throw std::invalid_argument("state_dir must not be empty");
            }
        }

        std::string EngineSettings::statsJournalPath() const
        {
            if (!statsJournal.empty())
            {
                return statsJournal;
            }
            return (std::filesystem::path(stateDir) / "stats.journal").string();
        }

        Query::QueryOptions EngineSettings::queryOptions() const
        {
            Query::QueryOptions options;
            options.timeout         = queryTimeout;
            options.maxRetries      = queryMaxRetries;
            options.backoff         = queryBackoff;
            options.fragmentTimeout = fragmentTimeout;
            return options;
        }

        Tracking::TrackerOptions EngineSettings::trackerOptions() const
        {
            Tracking::TrackerOptions options;
            options.snapshotMissThreshold = snapshotMissThreshold;
            options.identityWindow        = identityWindow;
            return options;
        }

        std::vector<Core::ServerTarget> loadServerTargets(const Utils::ConfigLoader &config)
        {
            std::vector<Core::ServerTarget> targets;
            for (int n = 0;; ++n)
            {
                const std::string prefix = "server." + std::to_string(n) + ".";
                const auto name = config.getString(prefix + "name");
                if (!name)
                {
                    break;
                }

                Core::ServerTarget target;
                target.name    = *name;
                target.logPath = config.getStringOr(prefix + "log_path", "");
                target.enabled = config.getBoolOr(prefix + "enabled", true);

                const std::string address = config.getStringOr(prefix + "query_address", "");
                if (!address.empty())
                {
                    target.queryAddress = address;
                }
                targets.push_back(std::move(target));
            }
            return targets;
        }

    } // namespace Pipeline
} // namespace StatTrack
