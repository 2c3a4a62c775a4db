// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2026 The OffsetWrite Authors

#pragma once
#include <chrono>
#include <string>
#include <vector>
namespace OffsetWrite::Core
{
    class UploadPolicy
    {
        std::string m_scope;
        std::chrono::seconds m_expiry;
        std::vector<std::string> m_allowedKeys;

    public:
        UploadPolicy(std::string scope, std::chrono::seconds expiry, std::vector<std::string> allowedKeys = {});

        [[nodiscard]] const std::string& GetScope() const noexcept;
        [[nodiscard]] std::chrono::seconds GetExpiry() const noexcept;

        /// <summary>
        /// Keys an upload with this token may reference as copy sources. Empty means any key in scope.
        /// </summary>
        [[nodiscard]] const std::vector<std::string>& GetAllowedKeys() const noexcept;
    };

    class TokenProvider
    {
    public:
        virtual ~TokenProvider() = default;

        virtual std::string MintUploadToken(const UploadPolicy& policy) = 0;
        virtual std::string SignDownloadUrl(const std::string& url) = 0;
    };

    /// <summary>
    /// Hands out a token issued ahead of time and leaves download URLs untouched,
    /// for buckets with public read access.
    /// </summary>
    class StaticTokenProvider final : public TokenProvider
    {
        std::string m_uploadToken;

    public:
        explicit StaticTokenProvider(std::string uploadToken);

        virtual std::string MintUploadToken(const UploadPolicy& policy) override;
        virtual std::string SignDownloadUrl(const std::string& url) override;
    };
}
