// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace toolgate::http
{

/// @brief A buffered HTTP response. Header names are lowercased.
struct Response
{
    long status = 0;
    std::map<std::string, std::string> headers;
    std::string body;

    /// @brief Returns the header value or an empty string.
    [[nodiscard]] auto header(std::string_view name) const -> std::string;
};

/// @brief Receives stream data; returning false aborts the transfer.
using DataCallback = std::function<bool(std::string_view chunk)>;

/// @brief Polled during a streaming transfer; returning true aborts it.
using StopPredicate = std::function<bool()>;

/// @brief Builds request header lines from configured headers and an optional bearer token.
///
/// An explicit "Authorization" entry in @p headers takes precedence over @p auth.
[[nodiscard]] auto buildHeaderLines(const std::map<std::string, std::string>& headers,
                                    const std::optional<std::string>& auth) -> std::vector<std::string>;

/// @brief Resolves @p reference (absolute URL, absolute path or relative path) against @p base.
[[nodiscard]] auto resolveUrl(std::string_view base, std::string_view reference) -> std::string;

/// @brief Performs a blocking POST and buffers the whole response.
[[nodiscard]] auto post(const std::string& url, const std::vector<std::string>& headerLines, std::string_view body)
    -> Result<Response>;

/// @brief Performs a blocking DELETE.
[[nodiscard]] auto sendDelete(const std::string& url, const std::vector<std::string>& headerLines)
    -> Result<Response>;

/// @brief Performs a GET whose body is delivered incrementally until the server closes the
/// stream, @p onData returns false, or @p shouldStop returns true.
/// @return The final status code, or an error if the transfer failed for any other reason.
[[nodiscard]] auto streamGet(const std::string& url,
                             const std::vector<std::string>& headerLines,
                             DataCallback onData,
                             StopPredicate shouldStop) -> Result<long>;

} // namespace toolgate::http
