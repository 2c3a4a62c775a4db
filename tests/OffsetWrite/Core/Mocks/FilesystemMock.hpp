// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2026 The OffsetWrite Authors

#pragma once
#include "OffsetWrite/Core/Filesystem.hpp"
#include <gmock/gmock.h>

namespace OffsetWrite::Core::Mocks
{
    class FilesystemMock : public Filesystem
    {
    public:
        FilesystemMock();
        virtual ~FilesystemMock();

        MOCK_METHOD(std::unique_ptr<File>, Create, (const std::filesystem::path& path), (override));
        MOCK_METHOD(bool, DeleteFile, (const std::filesystem::path& path), (override));
        MOCK_METHOD(bool, CreateDir, (const std::filesystem::path& path), (override));
    };
}
