// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2026 The OffsetWrite Authors

#pragma once
#include "OffsetWrite/Core/ByteSource.hpp"
#include "OffsetWrite/Kodo/Impl/Configuration.hpp"

#include <azure/core/context.hpp>
#include <azure/core/io/body_stream.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>
namespace OffsetWrite::Kodo::Impl
{
    /// <summary>
    /// multipart/form-data request body that pulls file bytes from their sources only
    /// while the transport reads it, so no attachment is held in memory.
    /// 
    /// Fields are appended with AddField and AddFile, then Close writes the final delimiter.
    /// Length() is exact once closed and is suitable for Content-Length.
    /// </summary>
    class MultipartBodyStream final : public ::Azure::Core::IO::BodyStream
    {
        struct Segment
        {
            std::string text;
            std::shared_ptr<Core::ByteSource> source;
            int64_t length;
            int64_t partIndex;
        };

        std::string m_boundary;
        std::vector<Segment> m_segments;
        bool m_hasParts;
        bool m_closed;
        size_t m_current;
        int64_t m_segmentOffset;

    public:
        explicit MultipartBodyStream(std::string boundary = GenerateBoundary());

        void AddField(const std::string& name, const std::string& value);

        /// <summary>
        /// Appends a file attachment named name whose content is the whole of source.
        /// </summary>
        /// <param name="partIndex">Manifest position reported if reading source fails.</param>
        void AddFile(const std::string& name,
            std::shared_ptr<Core::ByteSource> source,
            int64_t partIndex,
            const std::string& contentType = std::string(Configuration::Multipart::FileContentType));
        void Close();

        [[nodiscard]] const std::string& GetBoundary() const noexcept;
        [[nodiscard]] std::string GetContentType() const;

        virtual int64_t Length() const override;
        virtual void Rewind() override;

        [[nodiscard]] static std::string GenerateBoundary();
        [[nodiscard]] static std::string EscapeQuotes(const std::string& value);

    private:
        virtual size_t OnRead(uint8_t* buffer, size_t count, ::Azure::Core::Context const& context) override;
        void AppendText(const std::string& text);
        void WriteDelimiter();
        int64_t ReadSource(Segment& segment, char* buffer, int64_t length);
    };
}
