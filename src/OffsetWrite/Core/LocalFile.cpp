// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2026 The OffsetWrite Authors

#include "OffsetWrite/Core/LocalFile.hpp"

#include <stdexcept>
namespace OffsetWrite::Core
{
    LocalFile::LocalFile(const std::filesystem::path& path)
        : m_file(path, std::ios::in | std::ios::out | std::ios::binary | std::ios::trunc)
    {
        if (!m_file.is_open())
        {
            throw std::runtime_error("Unable to create file '" + path.string() + "'");
        }
    }

    int64_t LocalFile::Read(char* buffer, int64_t offset, int64_t length)
    {
        m_file.clear();
        m_file.seekg(static_cast<std::streamoff>(offset));
        m_file.read(buffer, static_cast<std::streamsize>(length));
        if (m_file.bad())
        {
            throw std::runtime_error("Invalid file read request at offset " + std::to_string(offset));
        }

        const auto bytesRead = m_file.gcount();
        if (bytesRead < 0)
        {
            throw std::runtime_error("Invalid file read request. Received negative number of bytes read.");
        }

        return static_cast<int64_t>(bytesRead);
    }

    void LocalFile::Append(const char* data, int64_t length)
    {
        m_file.clear();
        m_file.seekp(0, std::ios::end);
        m_file.write(data, static_cast<std::streamsize>(length));
        if (!m_file)
        {
            throw std::runtime_error("Failed to write " + std::to_string(length) + " bytes to file");
        }
    }

    void LocalFile::Flush()
    {
        m_file.flush();
        if (!m_file)
        {
            throw std::runtime_error("Failed to flush file");
        }
    }
}
