// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2026 The OffsetWrite Authors

#include "OffsetWrite/Kodo/Impl/MultipartBodyStream.hpp"
#include "OffsetWrite/Core/ComposeException.hpp"

#include <algorithm>
#include <cstring>
#include <iomanip>
#include <random>
#include <sstream>
#include <stdexcept>
namespace OffsetWrite::Kodo::Impl
{
    using Core::ComposeException;
    using Core::ErrorCode;

    MultipartBodyStream::MultipartBodyStream(std::string boundary)
        : m_boundary(std::move(boundary)),
        m_hasParts(false),
        m_closed(false),
        m_current(0),
        m_segmentOffset(0)
    {
        if (m_boundary.empty() || m_boundary.size() > 70)
        {
            throw std::invalid_argument("Multipart boundary must be between 1 and 70 characters");
        }
    }

    void MultipartBodyStream::AddField(const std::string& name, const std::string& value)
    {
        WriteDelimiter();
        AppendText("Content-Disposition: form-data; name=\"" + EscapeQuotes(name) + "\"\r\n\r\n" + value);
    }

    void MultipartBodyStream::AddFile(const std::string& name,
        std::shared_ptr<Core::ByteSource> source,
        const int64_t partIndex,
        const std::string& contentType)
    {
        WriteDelimiter();
        const auto escaped = EscapeQuotes(name);
        AppendText("Content-Disposition: form-data; name=\"" + escaped + "\"; filename=\"" + escaped + "\"\r\n"
            "Content-Type: " + contentType + "\r\n\r\n");

        const auto length = source->Length();
        m_segments.push_back(Segment{ {}, std::move(source), length, partIndex });
    }

    void MultipartBodyStream::Close()
    {
        if (m_closed)
        {
            return;
        }

        AppendText("\r\n--" + m_boundary + "--\r\n");
        m_closed = true;
    }

    const std::string& MultipartBodyStream::GetBoundary() const noexcept
    {
        return m_boundary;
    }

    std::string MultipartBodyStream::GetContentType() const
    {
        return "multipart/form-data; boundary=" + m_boundary;
    }

    int64_t MultipartBodyStream::Length() const
    {
        int64_t length = 0;
        for (const auto& segment : m_segments)
        {
            length += segment.length;
        }

        return length;
    }

    void MultipartBodyStream::Rewind()
    {
        for (auto& segment : m_segments)
        {
            if (segment.source && !segment.source->IsRewindable())
            {
                throw ComposeException(ErrorCode::SourceNotSeekable,
                    "Request body cannot be replayed, part " + std::to_string(segment.partIndex) + " is not rewindable",
                    std::nullopt,
                    segment.partIndex);
            }
        }

        for (auto& segment : m_segments)
        {
            if (segment.source)
            {
                segment.source->Rewind();
            }
        }

        m_current = 0;
        m_segmentOffset = 0;
    }

    std::string MultipartBodyStream::GenerateBoundary()
    {
        std::random_device rd;
        std::uniform_int_distribution<int> dist(0, 255);
        std::stringstream ss;
        ss << std::hex << std::setfill('0');
        for (size_t i = 0; i < Configuration::Multipart::BoundaryBytes; ++i)
        {
            ss << std::setw(2) << dist(rd);
        }

        return ss.str();
    }

    std::string MultipartBodyStream::EscapeQuotes(const std::string& value)
    {
        std::string escaped;
        escaped.reserve(value.size());
        for (const auto c : value)
        {
            if (c == '\\' || c == '"')
            {
                escaped.push_back('\\');
            }

            escaped.push_back(c);
        }

        return escaped;
    }

    size_t MultipartBodyStream::OnRead(uint8_t* buffer, const size_t count, ::Azure::Core::Context const& context)
    {
        context.ThrowIfCancelled();
        if (!m_closed)
        {
            throw std::logic_error("Multipart body read before it was closed");
        }

        size_t total = 0;
        while (total < count && m_current < m_segments.size())
        {
            auto& segment = m_segments[m_current];
            const auto remaining = segment.length - m_segmentOffset;
            if (remaining <= 0)
            {
                ++m_current;
                m_segmentOffset = 0;
                continue;
            }

            const auto toCopy = std::min<int64_t>(remaining, static_cast<int64_t>(count - total));
            auto* destination = reinterpret_cast<char*>(buffer + total);
            int64_t copied;
            if (segment.source)
            {
                copied = ReadSource(segment, destination, toCopy);
            }
            else
            {
                std::memcpy(destination, segment.text.data() + m_segmentOffset, static_cast<size_t>(toCopy));
                copied = toCopy;
            }

            m_segmentOffset += copied;
            total += static_cast<size_t>(copied);
        }

        return total;
    }

    void MultipartBodyStream::AppendText(const std::string& text)
    {
        if (m_closed)
        {
            throw std::logic_error("Multipart body is already closed");
        }

        if (m_segments.empty() || m_segments.back().source)
        {
            m_segments.push_back(Segment{ {}, nullptr, 0, -1 });
        }

        auto& segment = m_segments.back();
        segment.text += text;
        segment.length = static_cast<int64_t>(segment.text.size());
    }

    void MultipartBodyStream::WriteDelimiter()
    {
        AppendText((m_hasParts ? "\r\n--" : "--") + m_boundary + "\r\n");
        m_hasParts = true;
    }

    int64_t MultipartBodyStream::ReadSource(Segment& segment, char* buffer, const int64_t length)
    {
        int64_t bytesRead;
        try
        {
            bytesRead = segment.source->Read(buffer, length);
        }
        catch (const std::exception& ex)
        {
            throw ComposeException(ErrorCode::TransportFailure,
                "Failed to read part " + std::to_string(segment.partIndex) + " while sending: " + ex.what(),
                std::nullopt,
                segment.partIndex);
        }

        if (bytesRead <= 0)
        {
            throw ComposeException(ErrorCode::TransportFailure,
                "Part " + std::to_string(segment.partIndex) + " ended after " + std::to_string(m_segmentOffset)
                + " of " + std::to_string(segment.length) + " bytes",
                std::nullopt,
                segment.partIndex);
        }

        return bytesRead;
    }
}
