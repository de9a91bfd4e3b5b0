#include "loglens/input/FileReader.hpp"

#include <iostream>
#include <utility>

namespace LogLens
{
    namespace Input
    {
        FileReader::FileReader(const std::string &path)
        {
            open(path);
        }

        FileReader::FileReader(FileReader &&other) noexcept
            : m_file(std::move(other.m_file)),
              m_input(std::exchange(other.m_input, nullptr)),
              m_name(std::move(other.m_name)),
              m_lineNumber(std::exchange(other.m_lineNumber, 0)),
              m_bytesRead(std::exchange(other.m_bytesRead, 0))
        {
        }

        FileReader &FileReader::operator=(FileReader &&other) noexcept
        {
            if (this != &other)
            {
                m_file       = std::move(other.m_file);
                m_input      = std::exchange(other.m_input, nullptr);
                m_name       = std::move(other.m_name);
                m_lineNumber = std::exchange(other.m_lineNumber, 0);
                m_bytesRead  = std::exchange(other.m_bytesRead, 0);
            }
            return *this;
        }

        bool FileReader::open(const std::string &path)
        {
            close();

            if (path == kStdin)
            {
                m_input = &std::cin;
                m_name = "<stdin>";
                return true;
            }

            auto file = std::make_unique<std::ifstream>(path, std::ios::in | std::ios::binary);
            if (!file->is_open())
            {
                return false;
            }
            m_file = std::move(file);
            m_input = m_file.get();
            m_name = path;
            return true;
        }

        void FileReader::attach(std::istream &input, std::string name)
        {
            close();
            m_input = &input;
            m_name = std::move(name);
        }

        void FileReader::close() noexcept
        {
            m_input = nullptr;
            m_file.reset();
            m_name.clear();
            m_lineNumber = 0;
            m_bytesRead = 0;
        }

        std::optional<std::string> FileReader::nextLine()
        {
            if (!m_input)
            {
                return std::nullopt;
            }

            std::string line;
            if (!std::getline(*m_input, line))
            {
                return std::nullopt;
            }
            ++m_lineNumber;
            m_bytesRead += line.size() + 1;

            if (!line.empty() && line.back() == '\r')
            {
                line.pop_back();
            }
            return line;
        }

        bool FileReader::rewind()
        {
            if (!m_input || m_input == &std::cin)
            {
                return false;
            }

            m_input->clear();
            m_input->seekg(0, std::ios::beg);
            if (!*m_input)
            {
                return false;
            }
            m_lineNumber = 0;
            m_bytesRead = 0;
            return true;
        }

    } // namespace Input
} // namespace LogLens
