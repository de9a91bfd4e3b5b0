#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include "loglens/core/Event.hpp"
#include "loglens/input/FileReader.hpp"

namespace LogLens
{
    namespace Input
    {
        /**
         * LineParser
         *
         * Responsibilities:
         *  - Turn raw text lines into Core::Event values.
         *  - Skip malformed lines without stopping the stream.
         *
         * Accepted format:
         *   YYYY-MM-DD HH:MM:SS[.mmm] LEVEL [source:] message [key=value ...]
         *
         * Design notes:
         *  - Stateless; one instance may be shared across threads.
         *  - Trailing key=value tokens become metadata. Values are typed as
         *    integer, double, boolean (true/false) or string; quotes around
         *    a value are stripped and allow embedded spaces.
         *  - A dotted key ("http.status") is stored flat; Event lookups
         *    resolve it either way.
         *  - An unrecognised level makes the line malformed.
         */
        class LineParser
        {
        public:
            struct ParseResult
            {
                std::optional<Core::Event> event;
                bool        blank = false;
                std::string error;   // set when the line is malformed
            };

            struct ReadStatistics
            {
                std::size_t lines     = 0;
                std::size_t events    = 0;
                std::size_t malformed = 0;
            };

            using EventCallback = std::function<void(Core::Event)>;

            LineParser() = default;

            /// Parsed event, or std::nullopt for blank and malformed lines.
            std::optional<Core::Event> parseLine(std::string_view line) const;

            /// Same as parseLine, with the reason a line was rejected.
            ParseResult parseLineDetailed(std::string_view line) const;

            /**
             * Parse every remaining line of the reader and hand each event to
             * the callback. Malformed lines are logged at DEBUG with their
             * line number and counted.
             */
            ReadStatistics readAll(FileReader &reader, const EventCallback &onEvent) const;

            /// Typed metadata value for the text right of the first '='.
            static Core::MetadataValue parseValue(std::string_view text);
        };

    } // namespace Input
} // namespace LogLens
