// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2026 The OffsetWrite Authors

#include "OffsetWrite/Kodo/Impl/ManifestEncoder.hpp"
#include "OffsetWrite/Core/ComposeException.hpp"
#include "OffsetWrite/Core/MemorySource.hpp"
#include "OffsetWrite/Core/Mocks/ByteSourceMock.hpp"

#include <azure/core/internal/json/json.hpp>
#include <gtest/gtest.h>

#include <regex>
#include <tuple>
using OffsetWrite::Core::ComposeException;
using OffsetWrite::Core::CopyPart;
using OffsetWrite::Core::DirectPart;
using OffsetWrite::Core::ErrorCode;
using OffsetWrite::Core::MemorySource;
using OffsetWrite::Core::PartManifest;
using OffsetWrite::Core::Mocks::ByteSourceMock;
using OffsetWrite::Kodo::Impl::ManifestEncoder;
using ::Azure::Core::Json::_internal::json;
using ::testing::_;
using ::testing::Return;

class ManifestEncoderTests : public ::testing::Test
{
protected:
    static std::shared_ptr<MemorySource> Source(const std::string& text)
    {
        return std::make_shared<MemorySource>(std::vector<char>(text.begin(), text.end()));
    }

    static std::string ReadBody(OffsetWrite::Kodo::Impl::MultipartBodyStream& body)
    {
        const auto bytes = body.ReadToEnd(::Azure::Core::Context{});
        return std::string(bytes.begin(), bytes.end());
    }

    static std::vector<std::string> FieldNames(const std::string& body)
    {
        static const std::regex nameExpression("; name=\"([^\"]*)\"");
        std::vector<std::string> names;
        for (auto it = std::sregex_iterator(body.begin(), body.end(), nameExpression); it != std::sregex_iterator(); ++it)
        {
            names.push_back((*it)[1].str());
        }

        return names;
    }

    static json PartsDocument(const std::string& body, const std::string& boundary)
    {
        const std::string marker = "name=\"parts\"\r\n\r\n";
        const auto start = body.find(marker) + marker.size();
        const auto end = body.find("\r\n--" + boundary + "--\r\n");
        return json::parse(body.substr(start, end - start));
    }
};

TEST_F(ManifestEncoderTests, Encode_OverwriteMiddle_FieldsInProtocolOrder)
{
    // Arrange
    PartManifest manifest;
    manifest.AddCopy(CopyPart("obj", 0, 30));
    manifest.AddDirect(DirectPart(Source("new bytes"), false));
    manifest.AddCopy(CopyPart("obj", 39));
    const std::vector<std::pair<std::string, std::string>> metadata{ { "x:user", "alice" }, { "x:tag", "v1" } };

    // Act
    auto body = ManifestEncoder::Encode("tok", std::string("obj"), metadata, manifest, std::string("B"));

    // Assert
    const auto content = ReadBody(*body);
    const std::vector<std::string> expected{ "token", "key", "x:user", "x:tag", "part-1", "parts" };
    ASSERT_EQ(expected, FieldNames(content));
    ASSERT_NE(std::string::npos, content.find("name=\"token\"\r\n\r\ntok\r\n"));
    ASSERT_NE(std::string::npos, content.find("filename=\"part-1\"\r\nContent-Type: application/octet-stream\r\n\r\nnew bytes\r\n"));
}

TEST_F(ManifestEncoderTests, Encode_NoKey_KeyFieldOmitted)
{
    // Arrange
    PartManifest manifest;
    manifest.AddDirect(DirectPart(Source("x")));

    // Act
    auto body = ManifestEncoder::Encode("tok", std::nullopt, {}, manifest, std::string("B"));

    // Assert
    const std::vector<std::string> expected{ "token", "part-0", "parts" };
    ASSERT_EQ(expected, FieldNames(ReadBody(*body)));
}

TEST_F(ManifestEncoderTests, Encode_ChecksumRequested_PartsDocumentCarriesCrc)
{
    // Arrange
    PartManifest manifest("application/vnd.docker.image.rootfs.diff.tar.gzip");
    manifest.AddCopy(CopyPart("obj", 0));
    manifest.AddDirect(DirectPart(Source("123456789"), true));
    manifest.AddDirect(DirectPart(Source("no crc"), false));

    // Act
    auto body = ManifestEncoder::Encode("tok", std::string("obj"), {}, manifest, std::string("B"));

    // Assert
    const auto document = PartsDocument(ReadBody(*body), "B");
    ASSERT_EQ("application/vnd.docker.image.rootfs.diff.tar.gzip", document["mimeType"].get<std::string>());
    const auto& parts = document["parts"];
    ASSERT_EQ(3, parts.size());
    ASSERT_EQ("copy", parts[0]["type"].get<std::string>());
    ASSERT_EQ("obj", parts[0]["storageFile"].get<std::string>());
    ASSERT_EQ("0--1", parts[0]["range"].get<std::string>());
    ASSERT_EQ("direct", parts[1]["type"].get<std::string>());
    ASSERT_EQ(0xCBF43926u, parts[1]["crc32"].get<uint32_t>());
    ASSERT_EQ(0u, parts[2]["crc32"].get<uint32_t>());
}

TEST_F(ManifestEncoderTests, Encode_InvalidCopyRange_RejectedBeforeAnyRead)
{
    // Arrange
    auto source = std::make_shared<ByteSourceMock>();
    EXPECT_CALL(*source, Read(_, _)).Times(0);
    EXPECT_CALL(*source, Rewind()).Times(0);
    PartManifest manifest;
    manifest.AddDirect(DirectPart(source, true));
    manifest.AddCopy(CopyPart("obj", 10, 10));

    // Act
    try
    {
        std::ignore = ManifestEncoder::Encode("tok", std::string("obj"), {}, manifest);
        FAIL() << "Expected ComposeException";
    }
    catch (const ComposeException& ex)
    {
        // Assert
        ASSERT_EQ(ErrorCode::InvalidManifest, ex.GetCode());
        ASSERT_EQ(1, ex.GetPartIndex());
    }
}

TEST_F(ManifestEncoderTests, SerializeManifest_DirectWithoutChecksum_CrcZero)
{
    // Arrange
    PartManifest manifest;
    manifest.AddDirect(DirectPart(Source("abc")));

    // Act
    const auto document = json::parse(ManifestEncoder::SerializeManifest(manifest));

    // Assert
    ASSERT_EQ("application/octet-stream", document["mimeType"].get<std::string>());
    ASSERT_EQ(0u, document["parts"][0]["crc32"].get<uint32_t>());
    ASSERT_EQ("", document["parts"][0]["range"].get<std::string>());
}

TEST_F(ManifestEncoderTests, SerializeManifest_MixedParts_FieldsInWireOrder)
{
    // Arrange
    PartManifest manifest("text/plain");
    manifest.AddCopy(CopyPart("obj", 0, 5));
    manifest.AddDirect(DirectPart(Source("abc"), false, 7u));
    manifest.AddCopy(CopyPart("obj", 8));

    // Act
    const auto serialized = ManifestEncoder::SerializeManifest(manifest);

    // Assert
    ASSERT_EQ("{\"mimeType\":\"text/plain\",\"parts\":["
        "{\"type\":\"copy\",\"crc32\":0,\"storageFile\":\"obj\",\"range\":\"0-5\"},"
        "{\"type\":\"direct\",\"crc32\":7,\"storageFile\":\"\",\"range\":\"\"},"
        "{\"type\":\"copy\",\"crc32\":0,\"storageFile\":\"obj\",\"range\":\"8--1\"}]}", serialized);
}
