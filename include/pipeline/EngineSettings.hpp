#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

#include "core/ServerTarget.hpp"
#include "query/A2SClient.hpp"
#include "tracking/MatchTracker.hpp"
#include "utils/ConfigLoader.hpp"
#include "utils/Logger.hpp"

namespace StatTrack
{
    namespace Pipeline
    {
        /**
         * EngineSettings
         *
         * Every tunable of the engine with its default. Built from a
         * Utils::ConfigLoader by fromConfig(); tests fill it directly.
         */
        struct EngineSettings
        {
            // Tailing
            std::chrono::milliseconds pollInterval{250};
            std::chrono::milliseconds missingFileBackoffMax{30000};
            std::chrono::milliseconds cursorFlushInterval{2000};
            std::size_t               queueCapacity = 4096;

            // Live queries
            std::chrono::seconds      queryInterval{30};
            std::chrono::milliseconds queryTimeout{2000};
            int                       queryMaxRetries = 2;
            std::chrono::milliseconds queryBackoff{250};
            std::chrono::milliseconds fragmentTimeout{3000};

            // Tracking and aggregation
            int                  snapshotMissThreshold = 3;
            std::chrono::seconds identityWindow{300};
            std::size_t          dedupWindow = 4096;

            // Persistence and logging
            std::string     stateDir = "state";
            std::string     statsJournal;  ///< Empty means <stateDir>/stats.journal.
            std::string     logFile;
            Utils::LogLevel logLevel = Utils::LogLevel::INFO;

            /**
             * Read every key, falling back to the defaults above.
             * Throws std::invalid_argument for values that cannot work
             * (non-positive intervals, zero capacity, negative retries).
             */
            static EngineSettings fromConfig(const Utils::ConfigLoader &config);

            /// Throws std::invalid_argument on the first unusable value.
            void validate() const;

            std::string statsJournalPath() const;

            Query::QueryOptions queryOptions() const;
            Tracking::TrackerOptions trackerOptions() const;
        };

        /**
         * Read server.<n>.name / log_path / enabled / query_address for
         * n = 0, 1, ... until the first missing name.
         */
        std::vector<Core::ServerTarget> loadServerTargets(const Utils::ConfigLoader &config);

    } // namespace Pipeline
} // namespace StatTrack
