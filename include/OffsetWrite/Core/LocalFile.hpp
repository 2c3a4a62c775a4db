// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2026 The OffsetWrite Authors

#pragma once
#include "OffsetWrite/Core/File.hpp"
#include <fstream>
#include <filesystem>
namespace OffsetWrite::Core
{
    class LocalFile final : public File
    {
        std::fstream m_file;
    public:
        explicit LocalFile(const std::filesystem::path& path);
        virtual int64_t Read(char* buffer, int64_t offset, int64_t length) override;
        virtual void Append(const char* data, int64_t length) override;
        virtual void Flush() override;
    };
}
