// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2026 The OffsetWrite Authors

#pragma once
#include <azure/core/context.hpp>
#include <azure/core/http/http.hpp>
#include <azure/core/http/transport.hpp>
#include <gmock/gmock.h>

namespace OffsetWrite::Kodo::Mocks
{
    class HttpTransportMock : public ::Azure::Core::Http::HttpTransport
    {
    public:
        HttpTransportMock();
        virtual ~HttpTransportMock();

        MOCK_METHOD(std::unique_ptr<::Azure::Core::Http::RawResponse>, Send,
            (::Azure::Core::Http::Request& request, ::Azure::Core::Context const& context), (override));
    };
}
