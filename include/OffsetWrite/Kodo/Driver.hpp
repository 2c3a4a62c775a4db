// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2026 The OffsetWrite Authors

#pragma once
#include "OffsetWrite/Core/BucketClient.hpp"
#include "OffsetWrite/Core/Filesystem.hpp"
#include "OffsetWrite/Core/ObjectAttributes.hpp"
#include "OffsetWrite/Core/TokenProvider.hpp"
#include "OffsetWrite/Kodo/Impl/StreamWriterImpl.hpp"
#include "OffsetWrite/Kodo/Models/DriverParameters.hpp"

#include <azure/core/http/transport.hpp>

#include <boost/log/trivial.hpp>
#include <boost/log/sources/severity_logger.hpp>

#include <cstdint>
#include <istream>
#include <map>
#include <memory>
#include <ostream>
#include <span>
#include <string>
#include <string_view>
#include <vector>
namespace OffsetWrite::Kodo
{
    /// <summary>
    /// Storage driver over a Kodo bucket. Every failure is thrown as a Core::ComposeException,
    /// except invalid arguments which are thrown as std::invalid_argument.
    /// </summary>
    class Driver final
    {
        std::shared_ptr<Core::BucketClient> m_bucket;
        Impl::StreamWriterImpl m_writer;
        std::string m_mimeType;
        bool m_checkCrc;
        std::shared_ptr<boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>> m_logger;

    public:
        static const constexpr std::string_view Name = "kodo";

        Driver(const Models::DriverParameters& parameters,
            std::shared_ptr<Core::BucketClient> bucket,
            std::shared_ptr<Core::Filesystem> filesystem,
            std::shared_ptr<boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>> logger);

        /// <summary>
        /// Creates a driver talking to Kodo over the given transport.
        /// </summary>
        static std::unique_ptr<Driver> Create(const Models::DriverParameters& parameters,
            std::shared_ptr<::Azure::Core::Http::HttpTransport> transport,
            std::shared_ptr<Core::TokenProvider> tokenProvider,
            std::shared_ptr<boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>> logger);

        /// <summary>
        /// Creates a driver from a parameter map using the curl transport and the configured upload token.
        /// </summary>
        static std::unique_ptr<Driver> FromParameters(const std::map<std::string, std::string>& parameters,
            std::shared_ptr<boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>> logger);

        /// <summary>
        /// Writes the contents of input at offset, keeping the rest of the object.
        /// Offsets past the current size zero fill the gap.
        /// </summary>
        /// <returns>The number of bytes read from input.</returns>
        int64_t WriteStream(const std::string& path, int64_t offset, std::istream& input);

        /// <summary>
        /// Copies the object from offset to its end into output.
        /// </summary>
        /// <returns>The number of bytes copied, 0 if offset is at or past the end.</returns>
        int64_t ReadStream(const std::string& path, int64_t offset, std::ostream& output);

        std::vector<char> GetContent(const std::string& path);
        void PutContent(const std::string& path, std::span<const char> contents);
        Core::ObjectAttributes Stat(const std::string& path);

        /// <summary>
        /// Returns a URL that serves the content at path, signed through the token provider.
        /// </summary>
        std::string URLFor(const std::string& path);
    };
}
