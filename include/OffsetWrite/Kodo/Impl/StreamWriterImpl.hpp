// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2026 The OffsetWrite Authors

#pragma once
#include "OffsetWrite/Core/BucketClient.hpp"
#include "OffsetWrite/Core/Filesystem.hpp"

#include <boost/log/trivial.hpp>
#include <boost/log/sources/severity_logger.hpp>

#include <cstdint>
#include <filesystem>
#include <istream>
#include <memory>
#include <string>
namespace OffsetWrite::Kodo::Impl
{
    class StreamWriterImpl
    {
        std::shared_ptr<Core::BucketClient> m_bucket;
        std::shared_ptr<Core::Filesystem> m_filesystem;
        std::filesystem::path m_stagingDirectory;
        std::string m_mimeType;
        bool m_checkCrc;
        std::shared_ptr<boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>> m_logger;

    public:
        StreamWriterImpl(std::shared_ptr<Core::BucketClient> bucket,
            std::shared_ptr<Core::Filesystem> filesystem,
            std::filesystem::path stagingDirectory,
            std::string mimeType,
            bool checkCrc,
            std::shared_ptr<boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>> logger);

        /// <summary>
        /// Writes the whole of input into the object at key starting at offset.
        /// 
        /// Bytes before offset are kept, or zero filled where the object is shorter than offset.
        /// Bytes after the written range are kept. The input is staged locally while the current
        /// object is probed, and the staging file is removed before this returns or throws.
        /// </summary>
        /// <returns>The number of bytes read from input.</returns>
        int64_t WriteAtOffset(const std::string& key, int64_t offset, std::istream& input);
    };
}
