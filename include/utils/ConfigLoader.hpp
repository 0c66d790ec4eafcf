#pragma once

#include <string>
#include <string_view>
#include <unordered_map>
#include <optional>
#include <istream>
#include <mutex>

namespace StatTrack
{
    namespace Utils
    {
        /**
         * ConfigLoader
         *
         * Responsibilities:
         *  - Load a simple text configuration file (key = value format).
         *  - Expose read-only access to configuration values.
         *  - Provide typed getters with defaults (for robustness).
         *
         * The same format backs the daemon configuration and the persisted
         * tailer cursors, so both are read through this class.
         *
         * Format:
         *  - Each line is: key = value
         *  - Lines starting with '#' or ';' are comments.
         *  - Empty lines are ignored.
         *  - Whitespace around key and value is trimmed.
         *
         * Example:
         *   log_level           = INFO
         *   query_interval_secs = 30
         *   server.0.name       = hardcore-1
         *   server.0.log_path   = /srv/sandstorm/Insurgency/Saved/Logs/Insurgency.log
         */
        class ConfigLoader
        {
        public:
            ConfigLoader() = default;

            ConfigLoader(const ConfigLoader &)            = delete;
            ConfigLoader &operator=(const ConfigLoader &) = delete;

            ~ConfigLoader() = default;

            /**
             * Load configuration from a file path.
             *
             * Returns true on success, false if the file cannot be opened.
             * Malformed lines are ignored; valid lines are kept.
             */
            bool loadFromFile(const std::string &filePath);

            /// Same as loadFromFile() for an already-open stream (tests, embedded defaults).
            void loadFromStream(std::istream &in);

            /// Manually set a configuration key-value pair (tests, CLI overrides).
            void set(std::string key, std::string value);

            /// Check if a key exists in the loaded configuration.
            bool hasKey(std::string_view key) const;

            /// Get raw string value for a key; returns std::nullopt if missing.
            std::optional<std::string> getString(std::string_view key) const;

            /// Get string value or a default if the key is missing.
            std::string getStringOr(std::string_view key,
                                    std::string_view defaultValue) const;

            /// Get 64-bit integer value; returns std::nullopt if missing or invalid.
            std::optional<long long> getInt(std::string_view key) const;

            /// Get integer value or a default if missing/invalid.
            long long getIntOr(std::string_view key, long long defaultValue) const;

            /**
             * Get boolean value; returns std::nullopt if missing or invalid.
             *
             * Accepted true values (case-insensitive): "1", "true", "yes", "on"
             * Accepted false values (case-insensitive): "0", "false", "no", "off"
             */
            std::optional<bool> getBool(std::string_view key) const;

            /// Get boolean value or a default if missing/invalid.
            bool getBoolOr(std::string_view key, bool defaultValue) const;

            std::size_t size() const;

        private:
            std::optional<std::string> getRawUnlocked(std::string_view key) const;

        private:
            std::unordered_map<std::string, std::string> m_values;

            // Protects m_values; a loader may be re-read while trackers run.
            mutable std::mutex m_mutex;
        };

    } // namespace Utils
} // namespace StatTrack
