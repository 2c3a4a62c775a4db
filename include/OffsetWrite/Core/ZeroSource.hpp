// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2026 The OffsetWrite Authors

#pragma once
#include "OffsetWrite/Core/ByteSource.hpp"
namespace OffsetWrite::Core
{
    /// <summary>
    /// Yields a fixed number of zero bytes without holding them in memory.
    /// </summary>
    class ZeroSource final : public ByteSource
    {
        int64_t m_length;
        int64_t m_position;

    public:
        explicit ZeroSource(int64_t length);

        virtual int64_t Read(char* buffer, int64_t length) override;
        virtual void Rewind() override;
        virtual bool IsRewindable() const noexcept override;
        virtual int64_t Length() const override;
    };
}
