// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2026 The OffsetWrite Authors

#pragma once
#include "OffsetWrite/Core/File.hpp"
#include <filesystem>
#include <memory>
namespace OffsetWrite::Core
{
    class Filesystem
    {
    public:
        virtual ~Filesystem() = default;

        virtual std::unique_ptr<File> Create(const std::filesystem::path& path) = 0;
        virtual bool DeleteFile(const std::filesystem::path& path) = 0;
        virtual bool CreateDir(const std::filesystem::path& path) = 0;
    };
}
