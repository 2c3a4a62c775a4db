// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2026 The OffsetWrite Authors

#include "OffsetWrite/Kodo/ErrorTranslator.hpp"
#include "OffsetWrite/Kodo/Impl/Configuration.hpp"

#include <azure/core/http/http.hpp>
namespace OffsetWrite::Kodo
{
    Core::ComposeException ErrorTranslator::FromStatus(const std::string& context, const ::Azure::Core::Http::HttpStatusCode& statusCode)
    {
        using ::Azure::Core::Http::HttpStatusCode;
        using Core::ComposeException;
        using Core::ErrorCode;

        const auto status = static_cast<int32_t>(statusCode);
        switch (statusCode)
        {
        case HttpStatusCode::None:
            return ComposeException(ErrorCode::TransportFailure, context);
        case HttpStatusCode::NotFound:
            return ComposeException(ErrorCode::NotFound, context, status);
        default:
            // Kodo reports a missing key as 612 on its management endpoints.
            if (status == Impl::Configuration::NoSuchFileStatus)
            {
                return ComposeException(ErrorCode::NotFound, context, status);
            }

            return ComposeException(ErrorCode::ComposeRejected, context, status);
        }
    }

    Core::ComposeException ErrorTranslator::FromRequestFailed(const std::string& context, const ::Azure::Core::RequestFailedException& ex)
    {
        if (dynamic_cast<const ::Azure::Core::Http::TransportException*>(&ex) != nullptr)
        {
            return Core::ComposeException(Core::ErrorCode::TransportFailure, context + ": " + ex.what());
        }

        const auto& detail = ex.Message.empty() ? ex.ReasonPhrase : ex.Message;
        return FromStatus(detail.empty() ? context : context + ": " + detail, ex.StatusCode);
    }
}
