// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2026 The OffsetWrite Authors

#include "OffsetWrite/Core/ChecksumVerifier.hpp"
#include "OffsetWrite/Core/ComposeException.hpp"

#include <boost/crc.hpp>

#include <variant>
#include <vector>
namespace OffsetWrite::Core
{
    uint32_t ChecksumVerifier::Compute(ByteSource& source)
    {
        if (!source.IsRewindable())
        {
            throw ComposeException(ErrorCode::SourceNotSeekable, "Checksum requested on a source that cannot be rewound");
        }

        boost::crc_32_type crc;
        std::vector<char> chunk(static_cast<size_t>(ChunkSize));
        try
        {
            source.Rewind();
            int64_t bytesRead;
            while ((bytesRead = source.Read(chunk.data(), ChunkSize)) > 0)
            {
                crc.process_bytes(chunk.data(), static_cast<size_t>(bytesRead));
            }

            source.Rewind();
        }
        catch (const ComposeException&)
        {
            throw;
        }
        catch (const std::exception& ex)
        {
            throw ComposeException(ErrorCode::ReadFailure, "Failed to read source for checksum: " + std::string(ex.what()));
        }

        return crc.checksum();
    }

    void ChecksumVerifier::Apply(PartManifest& manifest)
    {
        auto& parts = manifest.GetParts();
        for (size_t i = 0; i < parts.size(); ++i)
        {
            auto* direct = std::get_if<DirectPart>(&parts[i]);
            if (direct == nullptr || !direct->RequiresChecksum())
            {
                continue;
            }

            try
            {
                direct->SetCrc32(Compute(direct->GetSource()));
            }
            catch (const ComposeException& ex)
            {
                throw ComposeException(ex.GetCode(), ex.what(), ex.GetStatusCode(), static_cast<int64_t>(i));
            }
        }
    }
}
