// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2026 The OffsetWrite Authors

#pragma once
#include "OffsetWrite/Core/PartManifest.hpp"
#include "OffsetWrite/Kodo/Impl/MultipartBodyStream.hpp"

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>
namespace OffsetWrite::Kodo::Impl
{
    struct ManifestEncoder
    {
        /// <summary>
        /// Builds the body of a compose request.
        /// 
        /// Fields are written in the order token, key, metadata, one file per direct part named
        /// after its manifest position (part-0, part-1, ...) and finally the parts document.
        /// The manifest is validated and its checksums computed before the body is built,
        /// so an invalid manifest never reaches the network.
        /// </summary>
        [[nodiscard]] static std::unique_ptr<MultipartBodyStream> Encode(const std::string& token,
            const std::optional<std::string>& key,
            const std::vector<std::pair<std::string, std::string>>& metadata,
            Core::PartManifest& manifest,
            const std::optional<std::string>& boundary = {});

        /// <summary>
        /// The JSON document sent in the parts field.
        /// </summary>
        [[nodiscard]] static std::string SerializeManifest(const Core::PartManifest& manifest);
    };
}
