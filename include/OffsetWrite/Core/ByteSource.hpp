// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2026 The OffsetWrite Authors

#pragma once
#include <cstdint>
namespace OffsetWrite::Core
{
    class ByteSource
    {
    public:
        virtual ~ByteSource() = default;

        /// <summary>
        /// Reads up to length bytes from the current position.
        /// </summary>
        /// <param name="buffer">Destination for the bytes read.</param>
        /// <param name="length">Maximum number of bytes to read.</param>
        /// <returns>The number of bytes read, 0 once the source is exhausted.</returns>
        virtual int64_t Read(char* buffer, int64_t length) = 0;

        /// <summary>
        /// Moves the read position back to the first byte.
        /// </summary>
        virtual void Rewind() = 0;

        /// <summary>
        /// Returns true if Rewind can be called.
        /// </summary>
        virtual bool IsRewindable() const noexcept = 0;

        /// <summary>
        /// Returns the total number of bytes the source yields from its start.
        /// </summary>
        virtual int64_t Length() const = 0;
    };
}
