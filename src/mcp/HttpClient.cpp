// SPDX-License-Identifier: Apache-2.0
#include "HttpClient.hpp"

#include <core/Log.hpp>

#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <format>
#include <memory>
#include <mutex>

namespace toolgate::http
{

namespace
{
    struct CurlDeleter
    {
        void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
    };

    struct SlistDeleter
    {
        void operator()(curl_slist* list) const { curl_slist_free_all(list); }
    };

    using CurlHandle = std::unique_ptr<CURL, CurlDeleter>;
    using HeaderList = std::unique_ptr<curl_slist, SlistDeleter>;

    void ensureGlobalInit()
    {
        static auto once = std::once_flag {};
        std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
    }

    auto toLower(std::string_view text) -> std::string
    {
        auto lowered = std::string(text);
        std::ranges::transform(lowered, lowered.begin(), [](unsigned char ch) { return std::tolower(ch); });
        return lowered;
    }

    auto trim(std::string_view text) -> std::string_view
    {
        while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())))
            text.remove_prefix(1);
        while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())))
            text.remove_suffix(1);
        return text;
    }

    auto makeHeaderList(const std::vector<std::string>& headerLines) -> HeaderList
    {
        curl_slist* list = nullptr;
        for (const auto& line: headerLines)
            list = curl_slist_append(list, line.c_str());
        return HeaderList(list);
    }

    auto writeToString(char* data, size_t size, size_t count, void* userdata) -> size_t
    {
        auto* body = static_cast<std::string*>(userdata);
        body->append(data, size * count);
        return size * count;
    }

    auto collectHeader(char* data, size_t size, size_t count, void* userdata) -> size_t
    {
        auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);
        auto const line = std::string_view(data, size * count);
        if (auto const colon = line.find(':'); colon != std::string_view::npos)
            (*headers)[toLower(trim(line.substr(0, colon)))] = std::string(trim(line.substr(colon + 1)));
        return size * count;
    }

    struct StreamContext
    {
        DataCallback onData;
        StopPredicate shouldStop;
        bool abortedByCaller = false;
    };

    auto writeToCallback(char* data, size_t size, size_t count, void* userdata) -> size_t
    {
        auto* context = static_cast<StreamContext*>(userdata);
        if (!context->onData(std::string_view(data, size * count)))
        {
            context->abortedByCaller = true;
            return 0;
        }
        return size * count;
    }

    auto checkStop(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) -> int
    {
        auto* context = static_cast<StreamContext*>(userdata);
        if (context->shouldStop && context->shouldStop())
        {
            context->abortedByCaller = true;
            return 1;
        }
        return 0;
    }

    auto newHandle(const std::string& url) -> Result<CurlHandle>
    {
        ensureGlobalInit();
        auto handle = CurlHandle(curl_easy_init());
        if (!handle)
            return makeError(ErrorCode::TransportError, "Failed to initialize HTTP client");

        curl_easy_setopt(handle.get(), CURLOPT_URL, url.c_str());
        curl_easy_setopt(handle.get(), CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(handle.get(), CURLOPT_FOLLOWLOCATION, 1L);
        return handle;
    }

    auto perform(CURL* handle, std::string_view method, const std::string& url) -> Result<Response>
    {
        auto response = Response {};
        curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, writeToString);
        curl_easy_setopt(handle, CURLOPT_WRITEDATA, &response.body);
        curl_easy_setopt(handle, CURLOPT_HEADERFUNCTION, collectHeader);
        curl_easy_setopt(handle, CURLOPT_HEADERDATA, &response.headers);

        auto const code = curl_easy_perform(handle);
        if (code != CURLE_OK)
            return makeError(ErrorCode::TransportError,
                             std::format("{} {} failed: {}", method, url, curl_easy_strerror(code)));

        curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &response.status);
        log::trace("{} {} -> HTTP {}", method, url, response.status);
        return response;
    }
} // namespace

auto Response::header(std::string_view name) const -> std::string
{
    auto const it = headers.find(toLower(name));
    return it != headers.end() ? it->second : std::string {};
}

auto buildHeaderLines(const std::map<std::string, std::string>& headers, const std::optional<std::string>& auth)
    -> std::vector<std::string>
{
    auto lines = std::vector<std::string> {};
    auto hasAuthorization = false;
    for (const auto& [name, value]: headers)
    {
        if (toLower(name) == "authorization")
            hasAuthorization = true;
        lines.push_back(std::format("{}: {}", name, value));
    }

    if (!hasAuthorization && auth && !auth->empty())
        lines.push_back(std::format("Authorization: Bearer {}", *auth));

    return lines;
}

auto resolveUrl(std::string_view base, std::string_view reference) -> std::string
{
    if (reference.find("://") != std::string_view::npos)
        return std::string(reference);

    auto const schemeEnd = base.find("://");
    auto const authorityStart = schemeEnd == std::string_view::npos ? 0 : schemeEnd + 3;
    auto const pathStart = base.find('/', authorityStart);
    auto const origin = pathStart == std::string_view::npos ? base : base.substr(0, pathStart);

    if (reference.starts_with('/'))
        return std::format("{}{}", origin, reference);

    if (pathStart == std::string_view::npos)
        return std::format("{}/{}", origin, reference);

    auto path = base.substr(pathStart);
    if (auto const query = path.find_first_of("?#"); query != std::string_view::npos)
        path = path.substr(0, query);
    auto const lastSlash = path.rfind('/');
    return std::format("{}{}{}", origin, path.substr(0, lastSlash + 1), reference);
}

auto post(const std::string& url, const std::vector<std::string>& headerLines, std::string_view body)
    -> Result<Response>
{
    auto handle = newHandle(url);
    if (!handle)
        return std::unexpected(handle.error());

    auto headerList = makeHeaderList(headerLines);
    curl_easy_setopt(handle->get(), CURLOPT_HTTPHEADER, headerList.get());
    curl_easy_setopt(handle->get(), CURLOPT_POST, 1L);
    curl_easy_setopt(handle->get(), CURLOPT_POSTFIELDS, body.data());
    curl_easy_setopt(handle->get(), CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));

    return perform(handle->get(), "POST", url);
}

auto sendDelete(const std::string& url, const std::vector<std::string>& headerLines) -> Result<Response>
{
    auto handle = newHandle(url);
    if (!handle)
        return std::unexpected(handle.error());

    auto headerList = makeHeaderList(headerLines);
    curl_easy_setopt(handle->get(), CURLOPT_HTTPHEADER, headerList.get());
    curl_easy_setopt(handle->get(), CURLOPT_CUSTOMREQUEST, "DELETE");

    return perform(handle->get(), "DELETE", url);
}

auto streamGet(const std::string& url,
               const std::vector<std::string>& headerLines,
               DataCallback onData,
               StopPredicate shouldStop) -> Result<long>
{
    auto handle = newHandle(url);
    if (!handle)
        return std::unexpected(handle.error());

    auto context = StreamContext { .onData = std::move(onData), .shouldStop = std::move(shouldStop) };
    auto headerList = makeHeaderList(headerLines);
    curl_easy_setopt(handle->get(), CURLOPT_HTTPHEADER, headerList.get());
    curl_easy_setopt(handle->get(), CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(handle->get(), CURLOPT_WRITEFUNCTION, writeToCallback);
    curl_easy_setopt(handle->get(), CURLOPT_WRITEDATA, &context);
    curl_easy_setopt(handle->get(), CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(handle->get(), CURLOPT_XFERINFOFUNCTION, checkStop);
    curl_easy_setopt(handle->get(), CURLOPT_XFERINFODATA, &context);

    auto const code = curl_easy_perform(handle->get());
    auto status = 0L;
    curl_easy_getinfo(handle->get(), CURLINFO_RESPONSE_CODE, &status);

    if (code != CURLE_OK && !context.abortedByCaller)
        return makeError(ErrorCode::TransportError,
                         std::format("GET {} failed: {}", url, curl_easy_strerror(code)));

    return status;
}

} // namespace toolgate::http
