// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2026 The OffsetWrite Authors

#include "OffsetWrite/Core/StreamSource.hpp"
#include "OffsetWrite/Core/ComposeException.hpp"

#include <algorithm>
namespace OffsetWrite::Core
{
    StreamSource::StreamSource(std::istream& stream, const int64_t length)
        : m_stream(stream),
        m_length(length),
        m_consumed(0)
    {
    }

    int64_t StreamSource::Read(char* buffer, int64_t length)
    {
        const auto bytesRequested = std::min(length, m_length - m_consumed);
        if (bytesRequested <= 0 || m_stream.eof())
        {
            return 0;
        }

        m_stream.read(buffer, static_cast<std::streamsize>(bytesRequested));
        if (m_stream.bad())
        {
            throw ComposeException(ErrorCode::ReadFailure, "Failed to read from the source stream");
        }

        const auto bytesRead = static_cast<int64_t>(m_stream.gcount());
        m_consumed += bytesRead;
        return bytesRead;
    }

    void StreamSource::Rewind()
    {
        throw ComposeException(ErrorCode::SourceNotSeekable, "A one-shot stream source cannot be rewound");
    }

    bool StreamSource::IsRewindable() const noexcept
    {
        return false;
    }

    int64_t StreamSource::Length() const
    {
        return m_length;
    }
}
