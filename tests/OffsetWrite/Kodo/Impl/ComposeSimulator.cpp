// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2026 The OffsetWrite Authors

#include "OffsetWrite/Kodo/Impl/ComposeSimulator.hpp"
#include "OffsetWrite/Core/ChecksumVerifier.hpp"
#include "OffsetWrite/Core/ComposeException.hpp"

#include <boost/crc.hpp>

#include <chrono>
#include <variant>
namespace OffsetWrite::Kodo::Impl::Testing
{
    using Core::ComposeException;
    using Core::ErrorCode;
    using ::testing::_;

    ComposeSimulator::ComposeSimulator(Core::Mocks::BucketClientMock& bucket)
        : m_composeCount(0),
        m_putCount(0)
    {
        ON_CALL(bucket, Probe(_))
            .WillByDefault([this](const std::string& key)
                {
                    return Probe(key);
                });
        ON_CALL(bucket, Put(_, _, _))
            .WillByDefault([this](const std::string& key, Core::DirectPart& part, const std::string&)
                {
                    Put(key, part);
                });
        ON_CALL(bucket, Compose(_, _))
            .WillByDefault([this](const std::string& key, Core::PartManifest& manifest)
                {
                    Compose(key, manifest);
                });
        ON_CALL(bucket, DownloadTo(_, _, _))
            .WillByDefault([this](const std::string& key, const int64_t offset, std::ostream& output)
                {
                    return DownloadTo(key, offset, output);
                });
    }

    void ComposeSimulator::SetObject(const std::string& key, const std::string& content)
    {
        std::lock_guard lock(m_mutex);
        m_objects[key] = std::vector<char>(content.begin(), content.end());
    }

    std::optional<std::string> ComposeSimulator::GetObject(const std::string& key) const
    {
        std::lock_guard lock(m_mutex);
        const auto it = m_objects.find(key);
        if (it == m_objects.end())
        {
            return std::nullopt;
        }

        return std::string(it->second.begin(), it->second.end());
    }

    int ComposeSimulator::GetComposeCount() const
    {
        std::lock_guard lock(m_mutex);
        return m_composeCount;
    }

    int ComposeSimulator::GetPutCount() const
    {
        std::lock_guard lock(m_mutex);
        return m_putCount;
    }

    std::vector<char> ComposeSimulator::ReadAll(Core::ByteSource& source)
    {
        std::vector<char> data;
        std::vector<char> chunk(4096);
        int64_t bytesRead;
        while ((bytesRead = source.Read(chunk.data(), static_cast<int64_t>(chunk.size()))) > 0)
        {
            data.insert(data.end(), chunk.begin(), chunk.begin() + bytesRead);
        }

        return data;
    }

    std::optional<Core::ObjectAttributes> ComposeSimulator::Probe(const std::string& key) const
    {
        std::lock_guard lock(m_mutex);
        const auto it = m_objects.find(key);
        if (it == m_objects.end())
        {
            return std::nullopt;
        }

        return Core::ObjectAttributes(static_cast<int64_t>(it->second.size()), std::chrono::system_clock::now());
    }

    void ComposeSimulator::Put(const std::string& key, Core::DirectPart& part)
    {
        auto data = ReadDirect(part, 0);
        std::lock_guard lock(m_mutex);
        m_objects[key] = std::move(data);
        ++m_putCount;
    }

    void ComposeSimulator::Compose(const std::string& key, Core::PartManifest& manifest)
    {
        manifest.Validate();
        Core::ChecksumVerifier::Apply(manifest);

        auto& parts = manifest.GetParts();
        std::vector<std::vector<char>> directData(parts.size());
        for (size_t i = 0; i < parts.size(); ++i)
        {
            if (auto* direct = std::get_if<Core::DirectPart>(&parts[i]))
            {
                directData[i] = ReadDirect(*direct, static_cast<int64_t>(i));
            }
        }

        std::lock_guard lock(m_mutex);
        std::vector<char> result;
        for (size_t i = 0; i < parts.size(); ++i)
        {
            const auto* copy = std::get_if<Core::CopyPart>(&parts[i]);
            if (copy == nullptr)
            {
                result.insert(result.end(), directData[i].begin(), directData[i].end());
                continue;
            }

            const auto source = m_objects.find(copy->GetSourceKey());
            if (source == m_objects.end())
            {
                throw ComposeException(ErrorCode::ComposeRejected, "no such file or directory", 612, static_cast<int64_t>(i));
            }

            const auto size = static_cast<int64_t>(source->second.size());
            const auto end = copy->IsOpenEnded() ? size : copy->GetTo();
            if (copy->GetFrom() > size || end > size)
            {
                throw ComposeException(ErrorCode::ComposeRejected, "range out of bounds", 400, static_cast<int64_t>(i));
            }

            result.insert(result.end(), source->second.begin() + copy->GetFrom(), source->second.begin() + end);
        }

        m_objects[key] = std::move(result);
        ++m_composeCount;
    }

    int64_t ComposeSimulator::DownloadTo(const std::string& key, const int64_t offset, std::ostream& output) const
    {
        std::lock_guard lock(m_mutex);
        const auto it = m_objects.find(key);
        if (it == m_objects.end())
        {
            throw ComposeException(ErrorCode::NotFound, "no such file or directory", 404);
        }

        const auto size = static_cast<int64_t>(it->second.size());
        if (offset >= size)
        {
            return 0;
        }

        output.write(it->second.data() + offset, size - offset);
        return size - offset;
    }

    std::vector<char> ComposeSimulator::ReadDirect(Core::DirectPart& part, const int64_t index)
    {
        auto data = ReadAll(part.GetSource());
        if (static_cast<int64_t>(data.size()) != part.GetLength())
        {
            throw ComposeException(ErrorCode::TransportFailure, "short part", std::nullopt, index);
        }

        if (part.GetCrc32().has_value())
        {
            boost::crc_32_type crc;
            crc.process_bytes(data.data(), data.size());
            if (crc.checksum() != *part.GetCrc32())
            {
                throw ComposeException(ErrorCode::ComposeRejected, "crc32 mismatch", 406, index);
            }
        }

        return data;
    }
}
