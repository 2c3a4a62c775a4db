// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2026 The OffsetWrite Authors

#include "OffsetWrite/Core/StagingBuffer.hpp"
#include "OffsetWrite/Core/ComposeException.hpp"

#include <boost/log/trivial.hpp>

#include <algorithm>
#include <iomanip>
#include <random>
#include <sstream>
#include <vector>
using namespace boost::log::trivial;
namespace OffsetWrite::Core
{
    static std::string GenerateStagingFileName()
    {
        std::random_device rd;
        std::mt19937_64 gen(rd());
        std::stringstream ss;
        ss << "offsetwrite-staging-" << std::hex << std::setfill('0') << std::setw(16) << gen();
        return ss.str();
    }

    /// <summary>
    /// Turns off the caller's stream exceptions while staging, since reading to the end sets failbit.
    /// End of input is cleared on exit and the mask restored, unless the stream is bad and the mask would throw.
    /// </summary>
    class StreamExceptionMask
    {
        std::istream& m_input;
        std::ios::iostate m_mask;

    public:
        explicit StreamExceptionMask(std::istream& input)
            : m_input(input),
            m_mask(input.exceptions())
        {
            m_input.exceptions(std::ios::goodbit);
        }

        ~StreamExceptionMask()
        {
            m_input.clear(m_input.rdstate() & std::ios::badbit);
            if ((m_input.rdstate() & m_mask) == 0)
            {
                m_input.exceptions(m_mask);
            }
        }

        StreamExceptionMask(const StreamExceptionMask&) = delete;
        StreamExceptionMask& operator=(const StreamExceptionMask&) = delete;
    };

    StagingBuffer::StagingBuffer(std::shared_ptr<Filesystem> filesystem,
        const std::filesystem::path& directory,
        std::shared_ptr<boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>> logger)
        : m_filesystem(std::move(filesystem)),
        m_logger(std::move(logger)),
        m_path(directory / GenerateStagingFileName()),
        m_length(0),
        m_position(0)
    {
        try
        {
            m_file = m_filesystem->Create(m_path);
        }
        catch (const std::exception& ex)
        {
            throw ComposeException(ErrorCode::ReadFailure, "Unable to create staging file: " + std::string(ex.what()));
        }
    }

    StagingBuffer::~StagingBuffer()
    {
        // The handle has to be closed before the file can be removed on every platform.
        m_file.reset();
        if (!m_filesystem->DeleteFile(m_path))
        {
            BOOST_LOG_SEV(*m_logger, warning) << "Failed to release staging file '" << m_path.string() << "'";
        }
    }

    std::shared_ptr<StagingBuffer> StagingBuffer::Stage(std::istream& input,
        std::shared_ptr<Filesystem> filesystem,
        const std::filesystem::path& directory,
        std::shared_ptr<boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>> logger)
    {
        auto buffer = std::make_shared<StagingBuffer>(std::move(filesystem), directory, std::move(logger));
        buffer->Fill(input);
        return buffer;
    }

    int64_t StagingBuffer::Read(char* buffer, int64_t length)
    {
        const auto bytesRequested = std::min(length, m_length - m_position);
        if (bytesRequested <= 0)
        {
            return 0;
        }

        int64_t bytesRead;
        try
        {
            bytesRead = m_file->Read(buffer, m_position, bytesRequested);
        }
        catch (const std::exception& ex)
        {
            throw ComposeException(ErrorCode::ReadFailure, "Failed to re-read staging file '" + m_path.string() + "': " + ex.what());
        }

        m_position += bytesRead;
        return bytesRead;
    }

    void StagingBuffer::Rewind()
    {
        m_position = 0;
    }

    bool StagingBuffer::IsRewindable() const noexcept
    {
        return true;
    }

    int64_t StagingBuffer::Length() const
    {
        return m_length;
    }

    const std::filesystem::path& StagingBuffer::GetPath() const noexcept
    {
        return m_path;
    }

    void StagingBuffer::Fill(std::istream& input)
    {
        StreamExceptionMask mask(input);
        std::vector<char> chunk(static_cast<size_t>(ChunkSize));
        try
        {
            while (input)
            {
                input.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
                const auto count = static_cast<int64_t>(input.gcount());
                if (count > 0)
                {
                    m_file->Append(chunk.data(), count);
                    m_length += count;
                }
            }

            m_file->Flush();
        }
        catch (const std::exception& ex)
        {
            throw ComposeException(ErrorCode::ReadFailure, "Failed to stage input: " + std::string(ex.what()));
        }

        if (input.bad())
        {
            throw ComposeException(ErrorCode::ReadFailure, "Failed to read the input stream after " + std::to_string(m_length) + " bytes");
        }

        BOOST_LOG_SEV(*m_logger, debug) << "Staged " << m_length << " bytes to '" << m_path.string() << "'";
        m_position = 0;
    }
}
