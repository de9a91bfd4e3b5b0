#pragma once

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <istream>
#include <memory>
#include <optional>
#include <string>

namespace LogLens
{
    namespace Input
    {
        /**
         * FileReader
         *
         * Line source for the parser: a log file, standard input ("-"), or
         * any caller-owned stream attached with attach().
         *
         * Design notes:
         *  - Owns the file stream it opens (RAII); movable, not copyable.
         *  - A trailing '\r' is stripped so CRLF files parse like LF files.
         *  - lineNumber() is the 1-based number of the last line returned.
         */
        class FileReader
        {
        public:
            /// Name that selects standard input.
            static constexpr const char *kStdin = "-";

            FileReader() = default;

            /// Open immediately; check isOpen() for the outcome.
            explicit FileReader(const std::string &path);

            FileReader(const FileReader &)            = delete;
            FileReader &operator=(const FileReader &) = delete;

            FileReader(FileReader &&other) noexcept;
            FileReader &operator=(FileReader &&other) noexcept;

            ~FileReader() = default;

            /// Open a file, or standard input for "-". Returns false on failure.
            bool open(const std::string &path);

            /// Read from a stream the caller keeps alive; name is used in diagnostics.
            void attach(std::istream &input, std::string name);

            void close() noexcept;

            bool isOpen() const noexcept { return m_input != nullptr; }

            /// Path or stream name of the current source.
            const std::string &filePath() const noexcept { return m_name; }

            /// Next line without its terminator; std::nullopt at end of input.
            std::optional<std::string> nextLine();

            std::size_t lineNumber() const noexcept { return m_lineNumber; }
            std::uint64_t bytesRead() const noexcept { return m_bytesRead; }

            /// Back to the first line; false for standard input or a failed seek.
            bool rewind();

        private:
            std::unique_ptr<std::ifstream> m_file;
            std::istream                  *m_input = nullptr;
            std::string                    m_name;
            std::size_t                    m_lineNumber = 0;
            std::uint64_t                  m_bytesRead = 0;
        };

    } // namespace Input
} // namespace LogLens
