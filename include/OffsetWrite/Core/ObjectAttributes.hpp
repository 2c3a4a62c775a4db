// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2026 The OffsetWrite Authors

#pragma once
#include <chrono>
#include <cstdint>
namespace OffsetWrite::Core
{
    class ObjectAttributes
    {
        int64_t m_size;
        std::chrono::system_clock::time_point m_lastModified;

    public:
        ObjectAttributes(int64_t size, std::chrono::system_clock::time_point lastModified);
        [[nodiscard]] int64_t GetSize() const noexcept;
        [[nodiscard]] std::chrono::system_clock::time_point GetLastModified() const noexcept;
    };
}
