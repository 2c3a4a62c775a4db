// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2026 The OffsetWrite Authors

#include "OffsetWrite/Kodo/Models/DriverParameters.hpp"
#include "OffsetWrite/Kodo/Impl/Configuration.hpp"
#include "OffsetWrite/Core/PartManifest.hpp"

#include <stdexcept>
namespace OffsetWrite::Kodo::Models
{
    static const std::string* Find(const std::map<std::string, std::string>& parameters, const std::string& name)
    {
        const auto it = parameters.find(name);
        if (it == parameters.end() || it->second.empty())
        {
            return nullptr;
        }

        return &it->second;
    }

    static const std::string& Require(const std::map<std::string, std::string>& parameters, const std::string& name, const std::string& displayName)
    {
        const auto* value = Find(parameters, name);
        if (value == nullptr)
        {
            throw std::invalid_argument("No " + displayName + " parameter provided");
        }

        return *value;
    }

    DriverParameters::DriverParameters(const std::string& bucket,
        const std::string& uploadHost,
        const std::string& downloadDomain,
        const std::string& uploadToken,
        const std::filesystem::path& stagingDirectory,
        const std::string& mimeType,
        const std::chrono::seconds tokenExpiry,
        const bool checkCrc,
        std::vector<std::pair<std::string, std::string>> metadata)
        : m_bucket(bucket),
        m_uploadHost(uploadHost),
        m_downloadDomain(downloadDomain),
        m_uploadToken(uploadToken),
        m_stagingDirectory(stagingDirectory),
        m_mimeType(mimeType),
        m_tokenExpiry(tokenExpiry),
        m_checkCrc(checkCrc),
        m_metadata(std::move(metadata))
    {
    }

    DriverParameters DriverParameters::FromParameters(const std::map<std::string, std::string>& parameters)
    {
        const auto& bucket = Require(parameters, "bucket", "bucket");
        const auto& uploadHost = Require(parameters, "uploadhost", "uploadHost");
        const auto& domain = Require(parameters, "domain", "domain");
        const auto& uploadToken = Require(parameters, "uptoken", "upToken");

        std::filesystem::path stagingDirectory(std::string(Impl::Configuration::DefaultStagingDirectory));
        if (const auto* value = Find(parameters, "stagingdir"))
        {
            stagingDirectory = *value;
        }

        std::string mimeType(Core::PartManifest::DefaultMimeType);
        if (const auto* value = Find(parameters, "mimetype"))
        {
            mimeType = *value;
        }

        auto tokenExpiry = Impl::Configuration::DefaultTokenExpiry;
        if (const auto* value = Find(parameters, "tokenexpiry"))
        {
            size_t consumed = 0;
            long long seconds = 0;
            try
            {
                seconds = std::stoll(*value, &consumed);
            }
            catch (const std::exception&)
            {
                consumed = 0;
            }

            if (consumed != value->size() || seconds <= 0)
            {
                throw std::invalid_argument("Invalid tokenExpiry parameter '" + *value + "'");
            }

            tokenExpiry = std::chrono::seconds(seconds);
        }

        bool checkCrc = true;
        if (const auto* value = Find(parameters, "checkcrc"))
        {
            if (*value == "true")
            {
                checkCrc = true;
            }
            else if (*value == "false")
            {
                checkCrc = false;
            }
            else
            {
                throw std::invalid_argument("Invalid checkCrc parameter '" + *value + "'");
            }
        }

        std::vector<std::pair<std::string, std::string>> metadata;
        for (const auto& [name, value] : parameters)
        {
            if (name.starts_with(Impl::Configuration::Fields::MetadataPrefix))
            {
                metadata.emplace_back(name, value);
            }
        }

        return DriverParameters(bucket, uploadHost, domain, uploadToken, stagingDirectory, mimeType, tokenExpiry, checkCrc, std::move(metadata));
    }

    const std::string& DriverParameters::GetBucket() const noexcept
    {
        return m_bucket;
    }

    const std::string& DriverParameters::GetUploadHost() const noexcept
    {
        return m_uploadHost;
    }

    const std::string& DriverParameters::GetDownloadDomain() const noexcept
    {
        return m_downloadDomain;
    }

    const std::string& DriverParameters::GetUploadToken() const noexcept
    {
        return m_uploadToken;
    }

    const std::filesystem::path& DriverParameters::GetStagingDirectory() const noexcept
    {
        return m_stagingDirectory;
    }

    const std::string& DriverParameters::GetMimeType() const noexcept
    {
        return m_mimeType;
    }

    std::chrono::seconds DriverParameters::GetTokenExpiry() const noexcept
    {
        return m_tokenExpiry;
    }

    bool DriverParameters::GetCheckCrc() const noexcept
    {
        return m_checkCrc;
    }

    const std::vector<std::pair<std::string, std::string>>& DriverParameters::GetMetadata() const noexcept
    {
        return m_metadata;
    }
}
