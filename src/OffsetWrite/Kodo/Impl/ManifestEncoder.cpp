// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2026 The OffsetWrite Authors

#include "OffsetWrite/Kodo/Impl/ManifestEncoder.hpp"
#include "OffsetWrite/Kodo/Impl/Configuration.hpp"
#include "OffsetWrite/Core/ChecksumVerifier.hpp"

#include <azure/core/internal/json/json.hpp>

#include <variant>
namespace OffsetWrite::Kodo::Impl
{
    using ::Azure::Core::Json::_internal::ordered_json;

    std::unique_ptr<MultipartBodyStream> ManifestEncoder::Encode(const std::string& token,
        const std::optional<std::string>& key,
        const std::vector<std::pair<std::string, std::string>>& metadata,
        Core::PartManifest& manifest,
        const std::optional<std::string>& boundary)
    {
        manifest.Validate();
        Core::ChecksumVerifier::Apply(manifest);

        auto body = boundary.has_value()
            ? std::make_unique<MultipartBodyStream>(*boundary)
            : std::make_unique<MultipartBodyStream>();

        body->AddField(std::string(Configuration::Fields::Token), token);
        if (key.has_value())
        {
            body->AddField(std::string(Configuration::Fields::Key), *key);
        }

        for (const auto& [name, value] : metadata)
        {
            body->AddField(name, value);
        }

        const auto& parts = manifest.GetParts();
        for (size_t i = 0; i < parts.size(); ++i)
        {
            if (const auto* direct = std::get_if<Core::DirectPart>(&parts[i]))
            {
                const auto index = static_cast<int64_t>(i);
                body->AddFile(std::string(Configuration::Fields::PartPrefix) + std::to_string(index), direct->GetSourcePtr(), index);
            }
        }

        body->AddField(std::string(Configuration::Fields::Parts), SerializeManifest(manifest));
        body->Close();
        return body;
    }

    std::string ManifestEncoder::SerializeManifest(const Core::PartManifest& manifest)
    {
        // The service reads every field of every part, so unused ones are sent empty.
        ordered_json parts = ordered_json::array();
        for (const auto& part : manifest.GetParts())
        {
            ordered_json entry = ordered_json::object();
            if (const auto* direct = std::get_if<Core::DirectPart>(&part))
            {
                entry["type"] = "direct";
                entry["crc32"] = direct->GetCrc32().value_or(0);
                entry["storageFile"] = "";
                entry["range"] = "";
            }
            else
            {
                const auto& copy = std::get<Core::CopyPart>(part);
                entry["type"] = "copy";
                entry["crc32"] = 0;
                entry["storageFile"] = copy.GetSourceKey();
                entry["range"] = copy.RangeString();
            }

            parts.push_back(std::move(entry));
        }

        ordered_json document = ordered_json::object();
        document["mimeType"] = manifest.GetMimeType();
        document["parts"] = std::move(parts);
        return document.dump();
    }
}
