// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2026 The OffsetWrite Authors

#pragma once
#include "OffsetWrite/Core/ByteSource.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>
namespace OffsetWrite::Core
{
    /// <summary>
    /// Manifest entry whose bytes are uploaded in the same request.
    /// </summary>
    class DirectPart
    {
        std::shared_ptr<ByteSource> m_source;
        bool m_checkCrc;
        std::optional<uint32_t> m_crc32;

    public:
        explicit DirectPart(std::shared_ptr<ByteSource> source, bool checkCrc = false, std::optional<uint32_t> crc32 = {});

        [[nodiscard]] ByteSource& GetSource() const noexcept;
        [[nodiscard]] const std::shared_ptr<ByteSource>& GetSourcePtr() const noexcept;
        [[nodiscard]] int64_t GetLength() const;
        [[nodiscard]] bool GetCheckCrc() const noexcept;
        [[nodiscard]] const std::optional<uint32_t>& GetCrc32() const noexcept;
        void SetCrc32(uint32_t crc32) noexcept;

        /// <summary>
        /// True when a checksum was asked for and none has been supplied or computed yet.
        /// </summary>
        [[nodiscard]] bool RequiresChecksum() const noexcept;
    };

    /// <summary>
    /// Manifest entry referencing the byte range [from, to) of an object already in the bucket.
    /// A range end of OpenEnded means the end of the source object at compose time.
    /// </summary>
    class CopyPart
    {
        std::string m_sourceKey;
        int64_t m_from;
        int64_t m_to;

    public:
        static const constexpr int64_t OpenEnded = -1;

        CopyPart(std::string sourceKey, int64_t from, int64_t to = OpenEnded);

        [[nodiscard]] const std::string& GetSourceKey() const noexcept;
        [[nodiscard]] int64_t GetFrom() const noexcept;
        [[nodiscard]] int64_t GetTo() const noexcept;
        [[nodiscard]] bool IsOpenEnded() const noexcept;
        [[nodiscard]] bool IsValid() const noexcept;

        /// <summary>
        /// The range as sent on the wire, e.g. "0-30" or "50--1".
        /// </summary>
        [[nodiscard]] std::string RangeString() const;

        /// <summary>
        /// Number of bytes this part contributes when the source object is existingSize bytes long.
        /// </summary>
        [[nodiscard]] int64_t ResolvedLength(int64_t existingSize) const noexcept;
    };

    using PartDescriptor = std::variant<DirectPart, CopyPart>;

    class PartManifest
    {
        std::string m_mimeType;
        std::vector<PartDescriptor> m_parts;

    public:
        static const constexpr std::string_view DefaultMimeType = "application/octet-stream";

        explicit PartManifest(std::string mimeType = std::string(DefaultMimeType));

        PartManifest& AddDirect(DirectPart part);
        PartManifest& AddCopy(CopyPart part);

        [[nodiscard]] const std::string& GetMimeType() const noexcept;
        [[nodiscard]] const std::vector<PartDescriptor>& GetParts() const noexcept;
        [[nodiscard]] std::vector<PartDescriptor>& GetParts() noexcept;
        [[nodiscard]] size_t Size() const noexcept;
        [[nodiscard]] bool Empty() const noexcept;

        /// <summary>
        /// Throws a ComposeException with ErrorCode::InvalidManifest naming the first copy part
        /// whose range is neither open ended nor strictly increasing.
        /// </summary>
        void Validate() const;

        /// <summary>
        /// Size of the object a compose of this manifest produces when every copy part
        /// references an object of existingSize bytes.
        /// </summary>
        [[nodiscard]] int64_t ResolvedLength(int64_t existingSize) const;
    };
}
