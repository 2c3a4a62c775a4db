// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2026 The OffsetWrite Authors

#pragma once
#include <chrono>
#include <filesystem>
#include <map>
#include <string>
#include <utility>
#include <vector>
namespace OffsetWrite::Kodo::Models
{
    class DriverParameters
    {
        std::string m_bucket;
        std::string m_uploadHost;
        std::string m_downloadDomain;
        std::string m_uploadToken;
        std::filesystem::path m_stagingDirectory;
        std::string m_mimeType;
        std::chrono::seconds m_tokenExpiry;
        bool m_checkCrc;
        std::vector<std::pair<std::string, std::string>> m_metadata;
    public:
        DriverParameters(const std::string& bucket,
            const std::string& uploadHost,
            const std::string& downloadDomain,
            const std::string& uploadToken,
            const std::filesystem::path& stagingDirectory,
            const std::string& mimeType,
            std::chrono::seconds tokenExpiry,
            bool checkCrc,
            std::vector<std::pair<std::string, std::string>> metadata = {});

        /// <summary>
        /// Reads parameters from a string map.
        /// Required: bucket, uploadhost, domain, uptoken.
        /// Optional: stagingdir, mimetype, tokenexpiry (seconds), checkcrc (true/false).
        /// Keys starting with "x:" are passed through as upload metadata, in key order.
        /// </summary>
        /// <exception cref="std::invalid_argument">A required key is missing or empty, or a value does not parse.</exception>
        static DriverParameters FromParameters(const std::map<std::string, std::string>& parameters);

        const std::string& GetBucket() const noexcept;
        const std::string& GetUploadHost() const noexcept;
        const std::string& GetDownloadDomain() const noexcept;
        const std::string& GetUploadToken() const noexcept;
        const std::filesystem::path& GetStagingDirectory() const noexcept;
        const std::string& GetMimeType() const noexcept;
        std::chrono::seconds GetTokenExpiry() const noexcept;
        bool GetCheckCrc() const noexcept;

        /// <summary>
        /// Extra form fields sent with every upload, e.g. x:user variables.
        /// </summary>
        const std::vector<std::pair<std::string, std::string>>& GetMetadata() const noexcept;
    };
}
