// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2026 The OffsetWrite Authors

#pragma once
#include "OffsetWrite/Core/ByteSource.hpp"

#include <span>
#include <vector>
namespace OffsetWrite::Core
{
    class MemorySource final : public ByteSource
    {
        std::vector<char> m_data;
        int64_t m_position;

    public:
        explicit MemorySource(std::vector<char> data);
        explicit MemorySource(std::span<const char> data);

        virtual int64_t Read(char* buffer, int64_t length) override;
        virtual void Rewind() override;
        virtual bool IsRewindable() const noexcept override;
        virtual int64_t Length() const override;
    };
}
