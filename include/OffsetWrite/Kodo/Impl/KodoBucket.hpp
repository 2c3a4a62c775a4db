// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2026 The OffsetWrite Authors

#pragma once
#include "OffsetWrite/Core/BucketClient.hpp"
#include "OffsetWrite/Core/TokenProvider.hpp"
#include "OffsetWrite/Kodo/Models/DriverParameters.hpp"

#include <azure/core/http/http.hpp>
#include <azure/core/http/transport.hpp>
#include <azure/core/url.hpp>

#include <boost/log/trivial.hpp>
#include <boost/log/sources/severity_logger.hpp>

#include <memory>
#include <string>
#include <vector>
namespace OffsetWrite::Kodo::Impl
{
    /// <summary>
    /// Bucket operations over Kodo's form upload, parts upload and download endpoints.
    /// Non-success responses are thrown as ::Azure::Core::RequestFailedException with the
    /// status and the message from the body's error field.
    /// </summary>
    class KodoBucket final : public Core::BucketClient
    {
        Models::DriverParameters m_parameters;
        std::shared_ptr<::Azure::Core::Http::HttpTransport> m_transport;
        std::shared_ptr<Core::TokenProvider> m_tokenProvider;
        std::shared_ptr<boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>> m_logger;

    public:
        KodoBucket(Models::DriverParameters parameters,
            std::shared_ptr<::Azure::Core::Http::HttpTransport> transport,
            std::shared_ptr<Core::TokenProvider> tokenProvider,
            std::shared_ptr<boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>> logger);

        virtual std::optional<Core::ObjectAttributes> Probe(const std::string& key) override;
        virtual void Put(const std::string& key, Core::DirectPart& part, const std::string& mimeType) override;
        virtual void Compose(const std::string& key, Core::PartManifest& manifest) override;
        virtual int64_t DownloadTo(const std::string& key, int64_t offset, std::ostream& output) override;
        virtual std::string DownloadUrl(const std::string& key) override;

        /// <summary>
        /// Public URL of key on the download domain, before signing.
        /// </summary>
        [[nodiscard]] std::string MakeBaseUrl(const std::string& key) const;

    private:
        std::string MintToken(const std::string& key) const;
        ::Azure::Core::Url UploadUrl(const std::string& path) const;
        std::unique_ptr<::Azure::Core::Http::RawResponse> Send(::Azure::Core::Http::Request& request) const;
        static void ThrowIfFailed(::Azure::Core::Http::RawResponse& response, const std::string& context);
    };
}
