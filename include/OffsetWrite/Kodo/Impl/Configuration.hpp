// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2026 The OffsetWrite Authors

#pragma once
#include <chrono>
#include <cstdint>
#include <string_view>
namespace OffsetWrite::Kodo::Impl
{
    struct Configuration
    {
        struct Multipart
        {
            static const constexpr size_t BoundaryBytes = 30;
            static const constexpr std::string_view FileContentType = "application/octet-stream";
        };

        struct Fields
        {
            static const constexpr std::string_view Token = "token";
            static const constexpr std::string_view Key = "key";
            static const constexpr std::string_view Crc32 = "crc32";
            static const constexpr std::string_view File = "file";
            static const constexpr std::string_view Parts = "parts";
            static const constexpr std::string_view PartPrefix = "part-";
            static const constexpr std::string_view MetadataPrefix = "x:";
        };

        static const constexpr std::string_view ComposePath = "parts";
        static const constexpr int NoSuchFileStatus = 612;
        static const constexpr int64_t DownloadChunkSize = 256 * 1024;
        static const constexpr std::chrono::seconds DefaultTokenExpiry = std::chrono::seconds(3600);
        static const constexpr std::string_view DefaultStagingDirectory = "/tmp";
    };
}
