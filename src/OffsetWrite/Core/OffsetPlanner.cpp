// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2026 The OffsetWrite Authors

#include "OffsetWrite/Core/OffsetPlanner.hpp"
#include "OffsetWrite/Core/ZeroSource.hpp"

#include <stdexcept>
namespace OffsetWrite::Core
{
    OffsetPlan::OffsetPlan(const WriteMode mode, PartManifest manifest)
        : m_mode(mode),
        m_manifest(std::move(manifest))
    {
    }

    WriteMode OffsetPlan::GetMode() const noexcept
    {
        return m_mode;
    }

    const PartManifest& OffsetPlan::GetManifest() const noexcept
    {
        return m_manifest;
    }

    PartManifest& OffsetPlan::GetManifest() noexcept
    {
        return m_manifest;
    }

    OffsetPlan OffsetPlanner::Plan(const std::string& key,
        const std::optional<int64_t> existingSize,
        const int64_t offset,
        std::shared_ptr<ByteSource> data,
        const bool checkCrc,
        const std::string& mimeType)
    {
        if (offset < 0)
        {
            throw std::invalid_argument("Write offset must not be negative, got " + std::to_string(offset));
        }

        if (existingSize.has_value() && *existingSize < 0)
        {
            throw std::invalid_argument("Existing object size must not be negative, got " + std::to_string(*existingSize));
        }

        if (!data)
        {
            throw std::invalid_argument("Write data must not be null");
        }

        const auto newLength = data->Length();
        PartManifest manifest(mimeType);

        if (!existingSize.has_value())
        {
            if (offset == 0)
            {
                manifest.AddDirect(DirectPart(std::move(data), checkCrc));
                return OffsetPlan(WriteMode::WholeObject, std::move(manifest));
            }

            // Nothing to copy from, so the gap before offset is uploaded as zeros.
            manifest.AddDirect(DirectPart(std::make_shared<ZeroSource>(offset), checkCrc));
            manifest.AddDirect(DirectPart(std::move(data), checkCrc));
            return OffsetPlan(WriteMode::Compose, std::move(manifest));
        }

        const auto size = *existingSize;
        if (offset == 0)
        {
            manifest.AddDirect(DirectPart(std::move(data), checkCrc));
            if (newLength < size)
            {
                manifest.AddCopy(CopyPart(key, newLength));
            }
        }
        else if (offset == size)
        {
            manifest.AddCopy(CopyPart(key, 0));
            manifest.AddDirect(DirectPart(std::move(data), checkCrc));
        }
        else if (offset < size)
        {
            manifest.AddCopy(CopyPart(key, 0, offset));
            manifest.AddDirect(DirectPart(std::move(data), checkCrc));
            if (offset + newLength < size)
            {
                manifest.AddCopy(CopyPart(key, offset + newLength));
            }
        }
        else
        {
            if (size > 0)
            {
                manifest.AddCopy(CopyPart(key, 0));
            }

            manifest.AddDirect(DirectPart(std::make_shared<ZeroSource>(offset - size), checkCrc));
            manifest.AddDirect(DirectPart(std::move(data), checkCrc));
        }

        return OffsetPlan(WriteMode::Compose, std::move(manifest));
    }
}
