// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2026 The OffsetWrite Authors

#include "OffsetWrite/Kodo/Impl/StreamWriterImpl.hpp"
#include "OffsetWrite/Core/OffsetPlanner.hpp"
#include "OffsetWrite/Core/StagingBuffer.hpp"

#include <boost/log/trivial.hpp>

#include <future>
#include <stdexcept>
#include <variant>
using namespace boost::log::trivial;
namespace OffsetWrite::Kodo::Impl
{
    StreamWriterImpl::StreamWriterImpl(std::shared_ptr<Core::BucketClient> bucket,
        std::shared_ptr<Core::Filesystem> filesystem,
        std::filesystem::path stagingDirectory,
        std::string mimeType,
        const bool checkCrc,
        std::shared_ptr<boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>> logger)
        : m_bucket(std::move(bucket)),
        m_filesystem(std::move(filesystem)),
        m_stagingDirectory(std::move(stagingDirectory)),
        m_mimeType(std::move(mimeType)),
        m_checkCrc(checkCrc),
        m_logger(std::move(logger))
    {
        if (!m_filesystem->CreateDir(m_stagingDirectory))
        {
            BOOST_LOG_SEV(*m_logger, warning) << "Staging directory '" << m_stagingDirectory.string() << "' could not be created";
        }
    }

    int64_t StreamWriterImpl::WriteAtOffset(const std::string& key, const int64_t offset, std::istream& input)
    {
        if (offset < 0)
        {
            throw std::invalid_argument("Write offset must not be negative, got " + std::to_string(offset));
        }

        BOOST_LOG_SEV(*m_logger, debug) << "Writing '" << key << "' at offset " << offset << ": staging";

        // The probe only needs the key, so it overlaps with copying the caller's stream.
        auto probe = std::async(std::launch::async, [this, &key]()
            {
                return m_bucket->Probe(key);
            });

        std::shared_ptr<Core::StagingBuffer> staging;
        try
        {
            staging = Core::StagingBuffer::Stage(input, m_filesystem, m_stagingDirectory, m_logger);
        }
        catch (const std::exception&)
        {
            probe.wait();
            throw;
        }

        const auto existing = probe.get();
        const auto stagedLength = staging->Length();
        std::optional<int64_t> existingSize;
        if (existing.has_value())
        {
            existingSize = existing->GetSize();
        }

        BOOST_LOG_SEV(*m_logger, debug) << "Writing '" << key << "': planning " << stagedLength << " bytes against "
            << (existingSize.has_value() ? std::to_string(*existingSize) + " existing bytes" : std::string("no object"));

        if (stagedLength == 0 && existingSize.has_value() && offset <= *existingSize)
        {
            BOOST_LOG_SEV(*m_logger, debug) << "Writing '" << key << "': nothing to change";
            return 0;
        }

        auto plan = Core::OffsetPlanner::Plan(key, existingSize, offset, staging, m_checkCrc, m_mimeType);
        auto& manifest = plan.GetManifest();

        BOOST_LOG_SEV(*m_logger, debug) << "Writing '" << key << "': composing " << manifest.Size() << " parts";
        if (plan.GetMode() == Core::WriteMode::WholeObject)
        {
            m_bucket->Put(key, std::get<Core::DirectPart>(manifest.GetParts().front()), m_mimeType);
        }
        else
        {
            m_bucket->Compose(key, manifest);
        }

        BOOST_LOG_SEV(*m_logger, debug) << "Writing '" << key << "': done, " << stagedLength << " bytes staged";
        return stagedLength;
    }
}
