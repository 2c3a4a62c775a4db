// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2026 The OffsetWrite Authors

#pragma once
#include "OffsetWrite/Core/ByteSource.hpp"
#include "OffsetWrite/Core/PartManifest.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
namespace OffsetWrite::Core
{
    enum class WriteMode
    {
        WholeObject,
        Compose,
    };

    class OffsetPlan
    {
        WriteMode m_mode;
        PartManifest m_manifest;

    public:
        OffsetPlan(WriteMode mode, PartManifest manifest);

        [[nodiscard]] WriteMode GetMode() const noexcept;
        [[nodiscard]] const PartManifest& GetManifest() const noexcept;
        [[nodiscard]] PartManifest& GetManifest() noexcept;
    };

    struct OffsetPlanner
    {
        /// <summary>
        /// Builds the parts that turn the current object into one holding data at offset.
        /// </summary>
        /// <param name="key">The object being written. Copy parts reference it as their source.</param>
        /// <param name="existingSize">Current size of the object, or nullopt if it does not exist.</param>
        /// <param name="offset">First byte of the object replaced by data.</param>
        /// <param name="data">The new bytes. Its Length() is the length of the write.</param>
        /// <param name="checkCrc">Whether direct parts ask for a checksum.</param>
        /// <param name="mimeType">Content type of the resulting object.</param>
        /// <exception cref="std::invalid_argument">offset or existingSize is negative.</exception>
        [[nodiscard]] static OffsetPlan Plan(const std::string& key,
            std::optional<int64_t> existingSize,
            int64_t offset,
            std::shared_ptr<ByteSource> data,
            bool checkCrc,
            const std::string& mimeType = std::string(PartManifest::DefaultMimeType));
    };
}
