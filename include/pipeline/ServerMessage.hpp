#pragma once

#include <variant>

#include "core/Event.hpp"
#include "core/LiveSnapshot.hpp"
#include "core/LogCursor.hpp"

namespace StatTrack
{
    namespace Pipeline
    {
        /**
         * Tailer position up to which every line has been queued.
         * The tracker task commits it once the stats before it are durable.
         */
        struct CursorCheckpoint
        {
            Core::LogCursor cursor;
        };

        /// One entry of a server's ordered input stream.
        using ServerMessage = std::variant<Core::Event, Core::LiveSnapshot, CursorCheckpoint>;

    } // namespace Pipeline
} // namespace StatTrack
