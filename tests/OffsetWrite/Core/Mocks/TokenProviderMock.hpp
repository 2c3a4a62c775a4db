// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2026 The OffsetWrite Authors

#pragma once
#include "OffsetWrite/Core/TokenProvider.hpp"
#include <gmock/gmock.h>

namespace OffsetWrite::Core::Mocks
{
    class TokenProviderMock : public TokenProvider
    {
    public:
        TokenProviderMock();
        virtual ~TokenProviderMock();

        MOCK_METHOD(std::string, MintUploadToken, (const UploadPolicy& policy), (override));
        MOCK_METHOD(std::string, SignDownloadUrl, (const std::string& url), (override));
    };
}
