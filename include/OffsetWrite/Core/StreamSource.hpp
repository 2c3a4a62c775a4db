// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2026 The OffsetWrite Authors

#pragma once
#include "OffsetWrite/Core/ByteSource.hpp"

#include <istream>
namespace OffsetWrite::Core
{
    /// <summary>
    /// One-shot view over a caller owned stream. The stream must outlive the source.
    /// </summary>
    class StreamSource final : public ByteSource
    {
        std::istream& m_stream;
        int64_t m_length;
        int64_t m_consumed;

    public:
        StreamSource(std::istream& stream, int64_t length);

        virtual int64_t Read(char* buffer, int64_t length) override;
        virtual void Rewind() override;
        virtual bool IsRewindable() const noexcept override;
        virtual int64_t Length() const override;
    };
}
