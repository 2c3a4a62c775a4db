// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2026 The OffsetWrite Authors

#include "OffsetWrite/Core/ComposeException.hpp"
namespace OffsetWrite::Core
{
    std::string_view ToString(const ErrorCode code) noexcept
    {
        switch (code)
        {
        case ErrorCode::InvalidManifest:
            return "InvalidManifest";
        case ErrorCode::SourceNotSeekable:
            return "SourceNotSeekable";
        case ErrorCode::ReadFailure:
            return "ReadFailure";
        case ErrorCode::TransportFailure:
            return "TransportFailure";
        case ErrorCode::ComposeRejected:
            return "ComposeRejected";
        case ErrorCode::NotFound:
            return "NotFound";
        }

        return "Unknown";
    }

    ComposeException::ComposeException(const ErrorCode code,
        const std::string& message,
        std::optional<int32_t> statusCode,
        std::optional<int64_t> partIndex)
        : std::runtime_error(message),
        m_code(code),
        m_statusCode(statusCode),
        m_partIndex(partIndex)
    {
    }

    ErrorCode ComposeException::GetCode() const noexcept
    {
        return m_code;
    }

    std::optional<int32_t> ComposeException::GetStatusCode() const noexcept
    {
        return m_statusCode;
    }

    std::optional<int64_t> ComposeException::GetPartIndex() const noexcept
    {
        return m_partIndex;
    }
}
