// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2026 The OffsetWrite Authors

#include "OffsetWrite/Core/ZeroSource.hpp"

#include <algorithm>
#include <stdexcept>
namespace OffsetWrite::Core
{
    ZeroSource::ZeroSource(const int64_t length)
        : m_length(length),
        m_position(0)
    {
        if (m_length < 0)
        {
            throw std::invalid_argument("Zero fill length cannot be negative");
        }
    }

    int64_t ZeroSource::Read(char* buffer, int64_t length)
    {
        const auto bytesToFill = std::min(m_length - m_position, length);
        if (bytesToFill <= 0)
        {
            return 0;
        }

        std::fill_n(buffer, bytesToFill, '\0');
        m_position += bytesToFill;
        return bytesToFill;
    }

    void ZeroSource::Rewind()
    {
        m_position = 0;
    }

    bool ZeroSource::IsRewindable() const noexcept
    {
        return true;
    }

    int64_t ZeroSource::Length() const
    {
        return m_length;
    }
}
