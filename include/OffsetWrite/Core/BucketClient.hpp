// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2026 The OffsetWrite Authors

#pragma once
#include "OffsetWrite/Core/ObjectAttributes.hpp"
#include "OffsetWrite/Core/PartManifest.hpp"

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
namespace OffsetWrite::Core
{
    class BucketClient
    {
    public:
        virtual ~BucketClient() = default;

        /// <summary>
        /// Returns the size and modification time of an object.
        /// </summary>
        /// <param name="key">The object key.</param>
        /// <returns>The attributes, or nullopt if no object is stored under key.</returns>
        virtual std::optional<ObjectAttributes> Probe(const std::string& key) = 0;

        /// <summary>
        /// Replaces the whole object with the bytes of part.
        /// </summary>
        /// <param name="key">The object key.</param>
        /// <param name="part">The payload, with its checksum if one is wanted.</param>
        /// <param name="mimeType">Content type stored with the object.</param>
        virtual void Put(const std::string& key, DirectPart& part, const std::string& mimeType) = 0;

        /// <summary>
        /// Atomically replaces the object with the concatenation of the manifest's parts.
        /// </summary>
        /// <param name="key">The object key.</param>
        /// <param name="manifest">The ordered parts. Direct part sources are read once.</param>
        virtual void Compose(const std::string& key, PartManifest& manifest) = 0;

        /// <summary>
        /// Streams the object from offset to its end into output.
        /// </summary>
        /// <returns>The number of bytes written to output.</returns>
        virtual int64_t DownloadTo(const std::string& key, int64_t offset, std::ostream& output) = 0;

        /// <summary>
        /// Returns a URL from which the object can be fetched directly, signed where the bucket is private.
        /// </summary>
        virtual std::string DownloadUrl(const std::string& key) = 0;
    };
}
