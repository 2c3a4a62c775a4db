// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2026 The OffsetWrite Authors

#pragma once
#include "OffsetWrite/Core/ByteSource.hpp"
#include "OffsetWrite/Core/PartManifest.hpp"

#include <cstdint>
namespace OffsetWrite::Core
{
    struct ChecksumVerifier
    {
        static const constexpr int64_t ChunkSize = 64 * 1024;

        /// <summary>
        /// Computes the IEEE CRC-32 of the whole source and leaves it rewound to its first byte.
        /// </summary>
        /// <exception cref="ComposeException">
        /// SourceNotSeekable if the source cannot be rewound, checked before anything is read.
        /// ReadFailure if reading the source fails.
        /// </exception>
        [[nodiscard]] static uint32_t Compute(ByteSource& source);

        /// <summary>
        /// Fills in the checksum of every direct part that asks for one and does not have one.
        /// </summary>
        static void Apply(PartManifest& manifest);
    };
}
