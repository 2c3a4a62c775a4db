// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2026 The OffsetWrite Authors

#pragma once
#include "OffsetWrite/Core/ComposeException.hpp"

#include <azure/core/exception.hpp>
#include <azure/core/http/http_status_code.hpp>

#include <string>
namespace OffsetWrite::Kodo
{
    struct ErrorTranslator
    {
        static Core::ComposeException FromStatus(const std::string& context, const ::Azure::Core::Http::HttpStatusCode& statusCode);
        static Core::ComposeException FromRequestFailed(const std::string& context, const ::Azure::Core::RequestFailedException& ex);
    };
}
