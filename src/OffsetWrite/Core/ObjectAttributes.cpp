// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2026 The OffsetWrite Authors

#include "OffsetWrite/Core/ObjectAttributes.hpp"
namespace OffsetWrite::Core
{
    ObjectAttributes::ObjectAttributes(const int64_t size, const std::chrono::system_clock::time_point lastModified)
        : m_size(size),
        m_lastModified(lastModified)
    {
    }

    int64_t ObjectAttributes::GetSize() const noexcept
    {
        return m_size;
    }

    std::chrono::system_clock::time_point ObjectAttributes::GetLastModified() const noexcept
    {
        return m_lastModified;
    }
}
