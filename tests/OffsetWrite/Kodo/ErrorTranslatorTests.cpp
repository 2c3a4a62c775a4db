// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2026 The OffsetWrite Authors

#include "OffsetWrite/Kodo/ErrorTranslator.hpp"

#include <azure/core/http/http.hpp>
#include <gtest/gtest.h>

#include <string>
using OffsetWrite::Core::ErrorCode;
using OffsetWrite::Kodo::ErrorTranslator;
using ::Azure::Core::Http::HttpStatusCode;

TEST(ErrorTranslatorTests, FromStatus_NotFound_NotFound)
{
    const auto ex = ErrorTranslator::FromStatus("stat", HttpStatusCode::NotFound);

    ASSERT_EQ(ErrorCode::NotFound, ex.GetCode());
    ASSERT_EQ(404, ex.GetStatusCode());
}

TEST(ErrorTranslatorTests, FromStatus_NoSuchFile_NotFound)
{
    const auto ex = ErrorTranslator::FromStatus("compose", static_cast<HttpStatusCode>(612));

    ASSERT_EQ(ErrorCode::NotFound, ex.GetCode());
    ASSERT_EQ(612, ex.GetStatusCode());
}

TEST(ErrorTranslatorTests, FromStatus_BadRequest_ComposeRejected)
{
    const auto ex = ErrorTranslator::FromStatus("compose", HttpStatusCode::BadRequest);

    ASSERT_EQ(ErrorCode::ComposeRejected, ex.GetCode());
    ASSERT_EQ(400, ex.GetStatusCode());
    ASSERT_EQ(std::string("compose"), ex.what());
}

TEST(ErrorTranslatorTests, FromStatus_None_TransportFailure)
{
    const auto ex = ErrorTranslator::FromStatus("compose", HttpStatusCode::None);

    ASSERT_EQ(ErrorCode::TransportFailure, ex.GetCode());
    ASSERT_FALSE(ex.GetStatusCode().has_value());
}

TEST(ErrorTranslatorTests, FromRequestFailed_ServiceMessage_Appended)
{
    // Arrange
    ::Azure::Core::RequestFailedException failed("raw");
    failed.StatusCode = static_cast<HttpStatusCode>(579);
    failed.Message = "callback failed";

    // Act
    const auto ex = ErrorTranslator::FromRequestFailed("Failed to write 'k'", failed);

    // Assert
    ASSERT_EQ(ErrorCode::ComposeRejected, ex.GetCode());
    ASSERT_EQ(579, ex.GetStatusCode());
    ASSERT_EQ(std::string("Failed to write 'k': callback failed"), ex.what());
}

TEST(ErrorTranslatorTests, FromRequestFailed_TransportException_TransportFailure)
{
    // Arrange
    ::Azure::Core::Http::TransportException failed("connection refused");

    // Act
    const auto ex = ErrorTranslator::FromRequestFailed("Failed to read 'k'", failed);

    // Assert
    ASSERT_EQ(ErrorCode::TransportFailure, ex.GetCode());
    ASSERT_NE(std::string::npos, std::string(ex.what()).find("connection refused"));
}
