// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2026 The OffsetWrite Authors

#pragma once
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
namespace OffsetWrite::Core
{
    enum class ErrorCode
    {
        InvalidManifest,
        SourceNotSeekable,
        ReadFailure,
        TransportFailure,
        ComposeRejected,
        NotFound,
    };

    [[nodiscard]] std::string_view ToString(ErrorCode code) noexcept;

    class ComposeException : public std::runtime_error
    {
        ErrorCode m_code;
        std::optional<int32_t> m_statusCode;
        std::optional<int64_t> m_partIndex;

    public:
        ComposeException(ErrorCode code,
            const std::string& message,
            std::optional<int32_t> statusCode = {},
            std::optional<int64_t> partIndex = {});

        [[nodiscard]] ErrorCode GetCode() const noexcept;

        /// <summary>
        /// The backend status for ComposeRejected and NotFound, if one was received.
        /// </summary>
        [[nodiscard]] std::optional<int32_t> GetStatusCode() const noexcept;

        /// <summary>
        /// The manifest position of the part that failed, when the failure is tied to one.
        /// </summary>
        [[nodiscard]] std::optional<int64_t> GetPartIndex() const noexcept;
    };
}
