// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2026 The OffsetWrite Authors

#include "OffsetWrite/Kodo/Driver.hpp"
#include "OffsetWrite/Kodo/ErrorTranslator.hpp"
#include "OffsetWrite/Kodo/Impl/KodoBucket.hpp"
#include "OffsetWrite/Core/ComposeException.hpp"
#include "OffsetWrite/Core/LocalFilesystem.hpp"
#include "OffsetWrite/Core/MemorySource.hpp"

#include <azure/core/exception.hpp>
#include <azure/core/http/curl_transport.hpp>

#include <boost/log/trivial.hpp>

#include <sstream>
using namespace boost::log::trivial;
namespace OffsetWrite::Kodo
{
    using Core::ComposeException;
    using Core::ErrorCode;

    Driver::Driver(const Models::DriverParameters& parameters,
        std::shared_ptr<Core::BucketClient> bucket,
        std::shared_ptr<Core::Filesystem> filesystem,
        std::shared_ptr<boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>> logger)
        : m_bucket(bucket),
        m_writer(std::move(bucket), std::move(filesystem), parameters.GetStagingDirectory(), parameters.GetMimeType(), parameters.GetCheckCrc(), logger),
        m_mimeType(parameters.GetMimeType()),
        m_checkCrc(parameters.GetCheckCrc()),
        m_logger(std::move(logger))
    {
    }

    std::unique_ptr<Driver> Driver::Create(const Models::DriverParameters& parameters,
        std::shared_ptr<::Azure::Core::Http::HttpTransport> transport,
        std::shared_ptr<Core::TokenProvider> tokenProvider,
        std::shared_ptr<boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>> logger)
    {
        auto bucket = std::make_shared<Impl::KodoBucket>(parameters, std::move(transport), std::move(tokenProvider), logger);
        auto filesystem = std::make_shared<Core::LocalFilesystem>(logger);
        return std::make_unique<Driver>(parameters, std::move(bucket), std::move(filesystem), std::move(logger));
    }

    std::unique_ptr<Driver> Driver::FromParameters(const std::map<std::string, std::string>& parameters,
        std::shared_ptr<boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>> logger)
    {
        const auto driverParameters = Models::DriverParameters::FromParameters(parameters);
        return Create(driverParameters,
            std::make_shared<::Azure::Core::Http::CurlTransport>(),
            std::make_shared<Core::StaticTokenProvider>(driverParameters.GetUploadToken()),
            std::move(logger));
    }

    int64_t Driver::WriteStream(const std::string& path, const int64_t offset, std::istream& input)
    {
        try
        {
            return m_writer.WriteAtOffset(path, offset, input);
        }
        catch (const ComposeException& ex)
        {
            BOOST_LOG_SEV(*m_logger, error) << "[" << Core::ToString(ex.GetCode()) << "] Failed to write '" << path << "': " << ex.what();
            throw;
        }
        catch (const ::Azure::Core::RequestFailedException& ex)
        {
            BOOST_LOG_SEV(*m_logger, error) << "[" << ex.ErrorCode << "]" << " (Status Code: " << static_cast<int>(ex.StatusCode) << ") " << ex.Message;
            throw ErrorTranslator::FromRequestFailed("Failed to write '" + path + "'", ex);
        }
    }

    int64_t Driver::ReadStream(const std::string& path, const int64_t offset, std::ostream& output)
    {
        if (offset < 0)
        {
            throw std::invalid_argument("Read offset must not be negative, got " + std::to_string(offset));
        }

        const auto attributes = Stat(path);
        if (offset >= attributes.GetSize())
        {
            return 0;
        }

        try
        {
            return m_bucket->DownloadTo(path, offset, output);
        }
        catch (const ::Azure::Core::RequestFailedException& ex)
        {
            BOOST_LOG_SEV(*m_logger, error) << "[" << ex.ErrorCode << "]" << " (Status Code: " << static_cast<int>(ex.StatusCode) << ") " << ex.Message;
            throw ErrorTranslator::FromRequestFailed("Failed to read '" + path + "'", ex);
        }
        catch (const ComposeException&)
        {
            throw;
        }
        catch (const std::exception& ex)
        {
            BOOST_LOG_SEV(*m_logger, error) << ex.what();
            throw ComposeException(ErrorCode::ReadFailure, "Failed to read '" + path + "': " + ex.what());
        }
    }

    std::vector<char> Driver::GetContent(const std::string& path)
    {
        std::stringstream buffer;
        ReadStream(path, 0, buffer);
        const auto content = buffer.str();
        return std::vector<char>(content.begin(), content.end());
    }

    void Driver::PutContent(const std::string& path, std::span<const char> contents)
    {
        Core::DirectPart part(std::make_shared<Core::MemorySource>(contents), m_checkCrc);
        try
        {
            m_bucket->Put(path, part, m_mimeType);
        }
        catch (const ::Azure::Core::RequestFailedException& ex)
        {
            BOOST_LOG_SEV(*m_logger, error) << "[" << ex.ErrorCode << "]" << " (Status Code: " << static_cast<int>(ex.StatusCode) << ") " << ex.Message;
            throw ErrorTranslator::FromRequestFailed("Failed to put '" + path + "'", ex);
        }
    }

    Core::ObjectAttributes Driver::Stat(const std::string& path)
    {
        std::optional<Core::ObjectAttributes> attributes;
        try
        {
            attributes = m_bucket->Probe(path);
        }
        catch (const ::Azure::Core::RequestFailedException& ex)
        {
            BOOST_LOG_SEV(*m_logger, error) << "[" << ex.ErrorCode << "]" << " (Status Code: " << static_cast<int>(ex.StatusCode) << ") " << ex.Message;
            throw ErrorTranslator::FromRequestFailed("Failed to stat '" + path + "'", ex);
        }

        if (!attributes.has_value())
        {
            throw ComposeException(ErrorCode::NotFound, "Path not found: " + path, static_cast<int32_t>(404));
        }

        return *attributes;
    }

    std::string Driver::URLFor(const std::string& path)
    {
        return m_bucket->DownloadUrl(path);
    }
}
