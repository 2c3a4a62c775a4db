// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2026 The OffsetWrite Authors

#pragma once
#include <cstdint>
namespace OffsetWrite::Core
{
    class File
    {
    public:
        virtual ~File() = default;

        virtual int64_t Read(char* buffer, int64_t offset, int64_t length) = 0;
        virtual void Append(const char* data, int64_t length) = 0;
        virtual void Flush() = 0;
    };
}
