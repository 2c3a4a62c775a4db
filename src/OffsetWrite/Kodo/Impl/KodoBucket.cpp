// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2026 The OffsetWrite Authors

#include "OffsetWrite/Kodo/Impl/KodoBucket.hpp"
#include "OffsetWrite/Kodo/Impl/Configuration.hpp"
#include "OffsetWrite/Kodo/Impl/ManifestEncoder.hpp"
#include "OffsetWrite/Kodo/Impl/MultipartBodyStream.hpp"
#include "OffsetWrite/Core/ChecksumVerifier.hpp"

#include <azure/core/context.hpp>
#include <azure/core/datetime.hpp>
#include <azure/core/exception.hpp>
#include <azure/core/internal/json/json.hpp>
#include <azure/core/io/body_stream.hpp>

#include <boost/log/trivial.hpp>

#include <stdexcept>
#include <vector>
using namespace boost::log::trivial;
namespace OffsetWrite::Kodo::Impl
{
    using ::Azure::Core::Http::HttpMethod;
    using ::Azure::Core::Http::HttpStatusCode;
    using ::Azure::Core::Http::RawResponse;
    using ::Azure::Core::Http::Request;

    static std::string ReadBody(RawResponse& response)
    {
        std::vector<uint8_t> body;
        auto stream = response.ExtractBodyStream();
        if (stream)
        {
            body = stream->ReadToEnd(::Azure::Core::Context{});
        }
        else
        {
            body = response.GetBody();
        }

        return std::string(body.begin(), body.end());
    }

    KodoBucket::KodoBucket(Models::DriverParameters parameters,
        std::shared_ptr<::Azure::Core::Http::HttpTransport> transport,
        std::shared_ptr<Core::TokenProvider> tokenProvider,
        std::shared_ptr<boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>> logger)
        : m_parameters(std::move(parameters)),
        m_transport(std::move(transport)),
        m_tokenProvider(std::move(tokenProvider)),
        m_logger(std::move(logger))
    {
    }

    std::optional<Core::ObjectAttributes> KodoBucket::Probe(const std::string& key)
    {
        Request request(HttpMethod::Head, ::Azure::Core::Url(DownloadUrl(key)));
        auto response = Send(request);
        const auto status = response->GetStatusCode();
        if (status == HttpStatusCode::NotFound || static_cast<int>(status) == Configuration::NoSuchFileStatus)
        {
            BOOST_LOG_SEV(*m_logger, debug) << "Probe of '" << key << "' found no object";
            return std::nullopt;
        }

        ThrowIfFailed(*response, "Failed to probe '" + key + "'");

        const auto& headers = response->GetHeaders();
        const auto length = headers.find("Content-Length");
        if (length == headers.end())
        {
            throw ::Azure::Core::Http::TransportException("Probe of '" + key + "' returned no Content-Length");
        }

        int64_t size = -1;
        size_t consumed = 0;
        std::chrono::system_clock::time_point lastModified{};
        try
        {
            size = std::stoll(length->second, &consumed);

            const auto modified = headers.find("Last-Modified");
            if (modified != headers.end())
            {
                lastModified = static_cast<std::chrono::system_clock::time_point>(
                    ::Azure::DateTime::Parse(modified->second, ::Azure::DateTime::DateFormat::Rfc1123));
            }
        }
        catch (const std::logic_error& ex)
        {
            // Malformed numbers and dates surface as invalid_argument or out_of_range.
            throw ::Azure::Core::Http::TransportException("Probe of '" + key + "' returned malformed headers: " + ex.what());
        }

        if (consumed != length->second.size() || size < 0)
        {
            throw ::Azure::Core::Http::TransportException("Probe of '" + key + "' returned Content-Length '" + length->second + "'");
        }

        BOOST_LOG_SEV(*m_logger, debug) << "Probe of '" << key << "' found " << size << " bytes";
        return Core::ObjectAttributes(size, lastModified);
    }

    void KodoBucket::Put(const std::string& key, Core::DirectPart& part, const std::string& mimeType)
    {
        if (part.RequiresChecksum())
        {
            part.SetCrc32(Core::ChecksumVerifier::Compute(part.GetSource()));
        }

        MultipartBodyStream body;
        body.AddField(std::string(Configuration::Fields::Token), MintToken(key));
        body.AddField(std::string(Configuration::Fields::Key), key);
        for (const auto& [name, value] : m_parameters.GetMetadata())
        {
            body.AddField(name, value);
        }

        if (part.GetCrc32().has_value())
        {
            body.AddField(std::string(Configuration::Fields::Crc32), std::to_string(*part.GetCrc32()));
        }

        body.AddFile(std::string(Configuration::Fields::File), part.GetSourcePtr(), 0, mimeType);
        body.Close();

        Request request(HttpMethod::Post, UploadUrl(""), &body);
        request.SetHeader("Content-Type", body.GetContentType());
        request.SetHeader("Content-Length", std::to_string(body.Length()));

        BOOST_LOG_SEV(*m_logger, debug) << "Uploading " << part.GetLength() << " bytes to '" << key << "'";
        auto response = Send(request);
        ThrowIfFailed(*response, "Failed to upload '" + key + "'");
    }

    void KodoBucket::Compose(const std::string& key, Core::PartManifest& manifest)
    {
        auto body = ManifestEncoder::Encode(MintToken(key), key, m_parameters.GetMetadata(), manifest);

        Request request(HttpMethod::Post, UploadUrl(std::string(Configuration::ComposePath)), body.get());
        request.SetHeader("Content-Type", body->GetContentType());
        request.SetHeader("Content-Length", std::to_string(body->Length()));

        BOOST_LOG_SEV(*m_logger, debug) << "Composing '" << key << "' from " << manifest.Size() << " parts";
        auto response = Send(request);
        ThrowIfFailed(*response, "Failed to compose '" + key + "'");
    }

    int64_t KodoBucket::DownloadTo(const std::string& key, const int64_t offset, std::ostream& output)
    {
        Request request(HttpMethod::Get, ::Azure::Core::Url(DownloadUrl(key)), false);
        request.SetHeader("Range", "bytes=" + std::to_string(offset) + "-");
        auto response = Send(request);
        ThrowIfFailed(*response, "Failed to download '" + key + "'");

        int64_t total = 0;
        auto stream = response->ExtractBodyStream();
        if (!stream)
        {
            const auto& body = response->GetBody();
            output.write(reinterpret_cast<const char*>(body.data()), static_cast<std::streamsize>(body.size()));
            total = static_cast<int64_t>(body.size());
        }
        else
        {
            std::vector<uint8_t> chunk(static_cast<size_t>(Configuration::DownloadChunkSize));
            size_t bytesRead;
            while ((bytesRead = stream->Read(chunk.data(), chunk.size(), ::Azure::Core::Context{})) > 0)
            {
                output.write(reinterpret_cast<const char*>(chunk.data()), static_cast<std::streamsize>(bytesRead));
                total += static_cast<int64_t>(bytesRead);
            }
        }

        if (!output)
        {
            throw std::runtime_error("Failed to write downloaded bytes of '" + key + "'");
        }

        return total;
    }

    std::string KodoBucket::DownloadUrl(const std::string& key)
    {
        return m_tokenProvider->SignDownloadUrl(MakeBaseUrl(key));
    }

    std::string KodoBucket::MakeBaseUrl(const std::string& key) const
    {
        const auto& domain = m_parameters.GetDownloadDomain();
        const auto scheme = domain.find("://") == std::string::npos ? std::string("http://") : std::string();
        return scheme + domain + "/" + ::Azure::Core::Url::Encode(key, "/");
    }

    std::string KodoBucket::MintToken(const std::string& key) const
    {
        return m_tokenProvider->MintUploadToken(Core::UploadPolicy(m_parameters.GetBucket() + ":" + key,
            m_parameters.GetTokenExpiry(),
            { key }));
    }

    ::Azure::Core::Url KodoBucket::UploadUrl(const std::string& path) const
    {
        const auto& host = m_parameters.GetUploadHost();
        ::Azure::Core::Url url(host.find("://") == std::string::npos ? "http://" + host : host);
        if (!path.empty())
        {
            url.AppendPath(path);
        }

        return url;
    }

    std::unique_ptr<RawResponse> KodoBucket::Send(Request& request) const
    {
        auto response = m_transport->Send(request, ::Azure::Core::Context{});
        if (!response)
        {
            throw ::Azure::Core::Http::TransportException("No response received from " + request.GetUrl().GetAbsoluteUrl());
        }

        return response;
    }

    void KodoBucket::ThrowIfFailed(RawResponse& response, const std::string& context)
    {
        const auto status = static_cast<int>(response.GetStatusCode());
        if (status >= 200 && status < 300)
        {
            return;
        }

        auto message = response.GetReasonPhrase();
        const auto body = ReadBody(response);
        const auto document = ::Azure::Core::Json::_internal::json::parse(body, nullptr, false);
        if (!document.is_discarded() && document.is_object() && document.contains("error") && document["error"].is_string())
        {
            message = document["error"].get<std::string>();
        }

        ::Azure::Core::RequestFailedException ex(context + ": " + message);
        ex.StatusCode = response.GetStatusCode();
        ex.ReasonPhrase = response.GetReasonPhrase();
        ex.Message = message;
        throw ex;
    }
}
