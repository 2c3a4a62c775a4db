// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2026 The OffsetWrite Authors

#pragma once
#include "OffsetWrite/Core/ByteSource.hpp"
#include "OffsetWrite/Core/Filesystem.hpp"

#include <boost/log/trivial.hpp>
#include <boost/log/sources/severity_logger.hpp>

#include <cstdint>
#include <filesystem>
#include <istream>
#include <memory>
namespace OffsetWrite::Core
{
    /// <summary>
    /// Re-readable local copy of the bytes supplied to a single write call.
    /// 
    /// The bytes are spooled to a uniquely named file which is deleted when the buffer is destroyed,
    /// whatever the outcome of the write.
    /// </summary>
    class StagingBuffer final : public ByteSource
    {
        std::shared_ptr<Filesystem> m_filesystem;
        std::shared_ptr<boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>> m_logger;
        std::filesystem::path m_path;
        std::unique_ptr<File> m_file;
        int64_t m_length;
        int64_t m_position;

    public:
        static const constexpr int64_t ChunkSize = 64 * 1024;

        StagingBuffer(std::shared_ptr<Filesystem> filesystem,
            const std::filesystem::path& directory,
            std::shared_ptr<boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>> logger);
        ~StagingBuffer();
        StagingBuffer(const StagingBuffer&) = delete;
        StagingBuffer& operator=(const StagingBuffer&) = delete;
        StagingBuffer(StagingBuffer&&) = delete;
        StagingBuffer& operator=(StagingBuffer&&) = delete;

        /// <summary>
        /// Copies the whole of input into a new staging buffer and rewinds it.
        /// </summary>
        [[nodiscard]] static std::shared_ptr<StagingBuffer> Stage(std::istream& input,
            std::shared_ptr<Filesystem> filesystem,
            const std::filesystem::path& directory,
            std::shared_ptr<boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>> logger);

        virtual int64_t Read(char* buffer, int64_t length) override;
        virtual void Rewind() override;
        virtual bool IsRewindable() const noexcept override;
        virtual int64_t Length() const override;
        [[nodiscard]] const std::filesystem::path& GetPath() const noexcept;

    private:
        void Fill(std::istream& input);
    };
}
