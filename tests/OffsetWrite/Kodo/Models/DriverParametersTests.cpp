// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2026 The OffsetWrite Authors

#include "OffsetWrite/Kodo/Models/DriverParameters.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <tuple>
using OffsetWrite::Kodo::Models::DriverParameters;

class DriverParametersTests : public ::testing::Test
{
protected:
    std::map<std::string, std::string> m_parameters;

    void SetUp() override
    {
        m_parameters = {
            { "bucket", "registry" },
            { "uploadhost", "up.example.com" },
            { "domain", "cdn.example.com" },
            { "uptoken", "token" },
        };
    }

    void ExpectMessage(const std::string& expected)
    {
        try
        {
            std::ignore = DriverParameters::FromParameters(m_parameters);
            FAIL() << "Expected std::invalid_argument";
        }
        catch (const std::invalid_argument& ex)
        {
            ASSERT_EQ(expected, ex.what());
        }
    }
};

TEST_F(DriverParametersTests, FromParameters_RequiredOnly_Defaults)
{
    // Act
    const auto parameters = DriverParameters::FromParameters(m_parameters);

    // Assert
    ASSERT_EQ("registry", parameters.GetBucket());
    ASSERT_EQ("up.example.com", parameters.GetUploadHost());
    ASSERT_EQ("cdn.example.com", parameters.GetDownloadDomain());
    ASSERT_EQ("token", parameters.GetUploadToken());
    ASSERT_EQ(std::filesystem::path("/tmp"), parameters.GetStagingDirectory());
    ASSERT_EQ("application/octet-stream", parameters.GetMimeType());
    ASSERT_EQ(std::chrono::seconds(3600), parameters.GetTokenExpiry());
    ASSERT_TRUE(parameters.GetCheckCrc());
}

TEST_F(DriverParametersTests, FromParameters_Optionals_Read)
{
    // Arrange
    m_parameters["stagingdir"] = "/var/tmp/staging";
    m_parameters["mimetype"] = "application/json";
    m_parameters["tokenexpiry"] = "120";
    m_parameters["checkcrc"] = "false";

    // Act
    const auto parameters = DriverParameters::FromParameters(m_parameters);

    // Assert
    ASSERT_EQ(std::filesystem::path("/var/tmp/staging"), parameters.GetStagingDirectory());
    ASSERT_EQ("application/json", parameters.GetMimeType());
    ASSERT_EQ(std::chrono::seconds(120), parameters.GetTokenExpiry());
    ASSERT_FALSE(parameters.GetCheckCrc());
}

TEST_F(DriverParametersTests, FromParameters_NoBucket_Throws)
{
    m_parameters.erase("bucket");
    ExpectMessage("No bucket parameter provided");
}

TEST_F(DriverParametersTests, FromParameters_NoUploadHost_Throws)
{
    m_parameters.erase("uploadhost");
    ExpectMessage("No uploadHost parameter provided");
}

TEST_F(DriverParametersTests, FromParameters_EmptyDomain_Throws)
{
    m_parameters["domain"] = "";
    ExpectMessage("No domain parameter provided");
}

TEST_F(DriverParametersTests, FromParameters_NoUploadToken_Throws)
{
    m_parameters.erase("uptoken");
    ExpectMessage("No upToken parameter provided");
}

TEST_F(DriverParametersTests, FromParameters_TokenExpiryNotNumber_Throws)
{
    m_parameters["tokenexpiry"] = "10m";
    ExpectMessage("Invalid tokenExpiry parameter '10m'");
}

TEST_F(DriverParametersTests, FromParameters_TokenExpiryZero_Throws)
{
    m_parameters["tokenexpiry"] = "0";
    ExpectMessage("Invalid tokenExpiry parameter '0'");
}

TEST_F(DriverParametersTests, FromParameters_CheckCrcNotBoolean_Throws)
{
    m_parameters["checkcrc"] = "yes";
    ExpectMessage("Invalid checkCrc parameter 'yes'");
}

TEST_F(DriverParametersTests, FromParameters_PrefixedKeys_MetadataInKeyOrder)
{
    // Arrange
    m_parameters["x:tag"] = "latest";
    m_parameters["x:repository"] = "library/alpine";
    m_parameters["xtra"] = "ignored";

    // Act
    const auto parameters = DriverParameters::FromParameters(m_parameters);

    // Assert
    const std::vector<std::pair<std::string, std::string>> expected = {
        { "x:repository", "library/alpine" },
        { "x:tag", "latest" },
    };
    ASSERT_EQ(expected, parameters.GetMetadata());
}

TEST_F(DriverParametersTests, FromParameters_NoPrefixedKeys_NoMetadata)
{
    const auto parameters = DriverParameters::FromParameters(m_parameters);

    ASSERT_TRUE(parameters.GetMetadata().empty());
}
