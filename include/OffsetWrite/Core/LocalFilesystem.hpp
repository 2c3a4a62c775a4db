// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2026 The OffsetWrite Authors

#pragma once
#include "OffsetWrite/Core/Filesystem.hpp"

#include <boost/log/trivial.hpp>
#include <boost/log/sources/severity_logger.hpp>

#include <memory>
namespace OffsetWrite::Core
{
    class LocalFilesystem final : public Filesystem
    {
    private:
        std::shared_ptr<boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>> m_logger;
    public:
        explicit LocalFilesystem(std::shared_ptr<boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>> logger);
        virtual std::unique_ptr<File> Create(const std::filesystem::path& path) override;
        virtual bool DeleteFile(const std::filesystem::path& path) override;
        virtual bool CreateDir(const std::filesystem::path& path) override;
    };
}
