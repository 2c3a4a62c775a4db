// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2026 The OffsetWrite Authors

#include "OffsetWrite/Core/MemorySource.hpp"

#include <algorithm>
namespace OffsetWrite::Core
{
    MemorySource::MemorySource(std::vector<char> data)
        : m_data(std::move(data)),
        m_position(0)
    {
    }

    MemorySource::MemorySource(std::span<const char> data)
        : m_data(data.begin(), data.end()),
        m_position(0)
    {
    }

    int64_t MemorySource::Read(char* buffer, int64_t length)
    {
        const auto remaining = static_cast<int64_t>(m_data.size()) - m_position;
        const auto bytesToCopy = std::min(remaining, length);
        if (bytesToCopy <= 0)
        {
            return 0;
        }

        std::copy_n(m_data.data() + m_position, bytesToCopy, buffer);
        m_position += bytesToCopy;
        return bytesToCopy;
    }

    void MemorySource::Rewind()
    {
        m_position = 0;
    }

    bool MemorySource::IsRewindable() const noexcept
    {
        return true;
    }

    int64_t MemorySource::Length() const
    {
        return static_cast<int64_t>(m_data.size());
    }
}
