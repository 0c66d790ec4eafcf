#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "core/Event.hpp"
#include "core/LogCursor.hpp"
#include "utils/TimeUtils.hpp"

namespace StatTrack
{
    namespace Input
    {
        /**
         * EventParser
         *
         * Responsibilities:
         *  - Map one raw server-log line to exactly one typed Event.
         *  - Own the log grammar: an ordered list of named matchers, each a
         *    plain function that can be unit-tested on its own.
         *  - Never fail on unknown input: lines no matcher accepts become an
         *    Unrecognized event, which callers count and drop.
         *
         * Design notes:
         *  - Stateless after construction (thread-safe, copyable).
         *  - Every recognized line starts with "[YYYY.MM.DD-HH.MM.SS:mmm][frame]";
         *    the prefix is split off once and matchers only see the body.
         *  - Matchers run in registration order and the first hit wins, so
         *    the more specific shapes are registered first.
         */
        class EventParser
        {
        public:
            /// A matcher returns an Event when it recognizes the line body.
            using Matcher = std::function<std::optional<Core::Event>(Utils::TimePoint,
                                                                     std::string_view)>;
            using NamedMatcher = std::pair<std::string, Matcher>;

            struct Prefix
            {
                Utils::TimePoint timestamp{};
                std::string_view body;
            };

            /// Construct with the built-in matchers in dispatch order.
            EventParser();

            EventParser(const EventParser &)            = default;
            EventParser &operator=(const EventParser &) = default;

            /**
             * Parse a line read by the tailer.
             *
             * The result carries the line's server id and byte range so the
             * tracker can derive idempotency keys and acknowledge the cursor.
             */
            Core::Event parse(const Core::RawLine &line) const;

            /// Parse bare text (no source metadata). Never throws on bad input.
            Core::Event parseText(std::string_view text) const;

            /// Append a matcher after the built-in ones.
            void addMatcher(std::string name, Matcher matcher);

            /// Matchers in dispatch order (for diagnostics and tests).
            const std::vector<NamedMatcher> &matchers() const noexcept { return m_matchers; }

            /// Split "[timestamp][frame]body"; std::nullopt if the prefix is malformed.
            static std::optional<Prefix> splitPrefix(std::string_view line);

            /**
             * Normalize a weapon class name for statistics:
             * "BP_Firearm_AK74_C_2147480339" -> "AK74".
             */
            static std::string normalizeWeapon(std::string_view raw);

            /**
             * Parse "Name[id, team N] + Name[id, team N]..." (also "Name[id]").
             * A bare "?" yields an empty list.
             */
            static std::vector<Core::PlayerRef> parsePlayerList(std::string_view text);

        private:
            std::vector<NamedMatcher> m_matchers;
        };

        /**
         * Individual line-shape matchers, in the order EventParser dispatches
         * them. Each receives the line body after the timestamp/frame prefix.
         */
        namespace Matchers
        {
            std::optional<Core::Event> mapChange(Utils::TimePoint ts, std::string_view body);
            std::optional<Core::Event> objectiveDestroyed(Utils::TimePoint ts, std::string_view body);
            std::optional<Core::Event> objectiveCaptured(Utils::TimePoint ts, std::string_view body);
            std::optional<Core::Event> kill(Utils::TimePoint ts, std::string_view body);
            std::optional<Core::Event> damage(Utils::TimePoint ts, std::string_view body);
            std::optional<Core::Event> playerConnect(Utils::TimePoint ts, std::string_view body);
            std::optional<Core::Event> playerDisconnect(Utils::TimePoint ts, std::string_view body);
            std::optional<Core::Event> chatMessage(Utils::TimePoint ts, std::string_view body);
            std::optional<Core::Event> roundStart(Utils::TimePoint ts, std::string_view body);
            std::optional<Core::Event> roundEnd(Utils::TimePoint ts, std::string_view body);
            std::optional<Core::Event> gameOver(Utils::TimePoint ts, std::string_view body);
        } // namespace Matchers

    } // namespace Input
} // namespace StatTrack
