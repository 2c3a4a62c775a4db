// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2026 The OffsetWrite Authors

#include "OffsetWrite/Core/TokenProvider.hpp"
namespace OffsetWrite::Core
{
    UploadPolicy::UploadPolicy(std::string scope, const std::chrono::seconds expiry, std::vector<std::string> allowedKeys)
        : m_scope(std::move(scope)),
        m_expiry(expiry),
        m_allowedKeys(std::move(allowedKeys))
    {
    }

    const std::string& UploadPolicy::GetScope() const noexcept
    {
        return m_scope;
    }

    std::chrono::seconds UploadPolicy::GetExpiry() const noexcept
    {
        return m_expiry;
    }

    const std::vector<std::string>& UploadPolicy::GetAllowedKeys() const noexcept
    {
        return m_allowedKeys;
    }

    StaticTokenProvider::StaticTokenProvider(std::string uploadToken)
        : m_uploadToken(std::move(uploadToken))
    {
    }

    std::string StaticTokenProvider::MintUploadToken([[maybe_unused]] const UploadPolicy& policy)
    {
        return m_uploadToken;
    }

    std::string StaticTokenProvider::SignDownloadUrl(const std::string& url)
    {
        return url;
    }
}
