// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2026 The OffsetWrite Authors

#include "OffsetWrite/Core/PartManifest.hpp"
#include "OffsetWrite/Core/ComposeException.hpp"

#include <algorithm>
#include <stdexcept>
namespace OffsetWrite::Core
{
    DirectPart::DirectPart(std::shared_ptr<ByteSource> source, const bool checkCrc, std::optional<uint32_t> crc32)
        : m_source(std::move(source)),
        m_checkCrc(checkCrc),
        m_crc32(crc32)
    {
        if (!m_source)
        {
            throw std::invalid_argument("A direct part requires a byte source");
        }
    }

    ByteSource& DirectPart::GetSource() const noexcept
    {
        return *m_source;
    }

    const std::shared_ptr<ByteSource>& DirectPart::GetSourcePtr() const noexcept
    {
        return m_source;
    }

    int64_t DirectPart::GetLength() const
    {
        return m_source->Length();
    }

    bool DirectPart::GetCheckCrc() const noexcept
    {
        return m_checkCrc;
    }

    const std::optional<uint32_t>& DirectPart::GetCrc32() const noexcept
    {
        return m_crc32;
    }

    void DirectPart::SetCrc32(const uint32_t crc32) noexcept
    {
        m_crc32 = crc32;
    }

    bool DirectPart::RequiresChecksum() const noexcept
    {
        return m_checkCrc && !m_crc32.has_value();
    }

    CopyPart::CopyPart(std::string sourceKey, const int64_t from, const int64_t to)
        : m_sourceKey(std::move(sourceKey)),
        m_from(from),
        m_to(to)
    {
    }

    const std::string& CopyPart::GetSourceKey() const noexcept
    {
        return m_sourceKey;
    }

    int64_t CopyPart::GetFrom() const noexcept
    {
        return m_from;
    }

    int64_t CopyPart::GetTo() const noexcept
    {
        return m_to;
    }

    bool CopyPart::IsOpenEnded() const noexcept
    {
        return m_to == OpenEnded;
    }

    bool CopyPart::IsValid() const noexcept
    {
        return m_from >= 0 && (IsOpenEnded() || m_to > m_from);
    }

    std::string CopyPart::RangeString() const
    {
        return std::to_string(m_from) + "-" + std::to_string(m_to);
    }

    int64_t CopyPart::ResolvedLength(const int64_t existingSize) const noexcept
    {
        const auto end = IsOpenEnded() ? existingSize : std::min(m_to, existingSize);
        return std::max<int64_t>(0, end - m_from);
    }

    PartManifest::PartManifest(std::string mimeType)
        : m_mimeType(std::move(mimeType))
    {
    }

    PartManifest& PartManifest::AddDirect(DirectPart part)
    {
        m_parts.emplace_back(std::move(part));
        return *this;
    }

    PartManifest& PartManifest::AddCopy(CopyPart part)
    {
        m_parts.emplace_back(std::move(part));
        return *this;
    }

    const std::string& PartManifest::GetMimeType() const noexcept
    {
        return m_mimeType;
    }

    const std::vector<PartDescriptor>& PartManifest::GetParts() const noexcept
    {
        return m_parts;
    }

    std::vector<PartDescriptor>& PartManifest::GetParts() noexcept
    {
        return m_parts;
    }

    size_t PartManifest::Size() const noexcept
    {
        return m_parts.size();
    }

    bool PartManifest::Empty() const noexcept
    {
        return m_parts.empty();
    }

    void PartManifest::Validate() const
    {
        for (size_t i = 0; i < m_parts.size(); ++i)
        {
            const auto* copy = std::get_if<CopyPart>(&m_parts[i]);
            if (copy != nullptr && !copy->IsValid())
            {
                throw ComposeException(ErrorCode::InvalidManifest,
                    "Invalid copy range '" + copy->RangeString() + "' of '" + copy->GetSourceKey() + "' at part " + std::to_string(i),
                    std::nullopt,
                    static_cast<int64_t>(i));
            }
        }
    }

    int64_t PartManifest::ResolvedLength(const int64_t existingSize) const
    {
        int64_t total = 0;
        for (const auto& part : m_parts)
        {
            if (const auto* direct = std::get_if<DirectPart>(&part))
            {
                total += direct->GetLength();
            }
            else
            {
                total += std::get<CopyPart>(part).ResolvedLength(existingSize);
            }
        }

        return total;
    }
}
