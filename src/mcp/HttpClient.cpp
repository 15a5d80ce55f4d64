// SPDX-License-Identifier: Apache-2.0
#include "HttpClient.hpp"

#include <core/Log.hpp>

#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <format>
#include <memory>
#include <mutex>

namespace mcphub
{

namespace
{
    void ensureCurlInitialized()
    {
        static auto once = std::once_flag {};
        std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
    }

    auto toLower(std::string_view s) -> std::string
    {
        auto out = std::string(s);
        std::ranges::transform(out, out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return out;
    }

    auto trim(std::string_view s) -> std::string_view
    {
        while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())))
            s.remove_prefix(1);
        while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())))
            s.remove_suffix(1);
        return s;
    }

    struct TransferContext
    {
        CURL* handle = nullptr;
        const HttpDataCallback* onData = nullptr;
        const HttpAbortCheck* shouldAbort = nullptr;
        HttpResponse response;
        bool aborted = false;
    };

    auto headerCallback(char* buffer, size_t size, size_t nitems, void* userdata) -> size_t
    {
        auto const total = size * nitems;
        auto* ctx = static_cast<TransferContext*>(userdata);
        auto line = trim(std::string_view(buffer, total));

        // A new status line starts a new header block (redirects, 100-continue).
        if (line.starts_with("HTTP/"))
        {
            ctx->response.headers.clear();
            return total;
        }

        auto const colon = line.find(':');
        if (colon == std::string_view::npos)
            return total;

        ctx->response.headers[toLower(trim(line.substr(0, colon)))] = std::string(trim(line.substr(colon + 1)));
        return total;
    }

    auto writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata) -> size_t
    {
        auto const total = size * nmemb;
        auto* ctx = static_cast<TransferContext*>(userdata);

        if (ctx->shouldAbort && *ctx->shouldAbort && (*ctx->shouldAbort)())
        {
            ctx->aborted = true;
            return 0;
        }

        if (ctx->response.status == 0)
            curl_easy_getinfo(ctx->handle, CURLINFO_RESPONSE_CODE, &ctx->response.status);

        if (!(*ctx->onData)(ctx->response, std::string_view(ptr, total)))
        {
            ctx->aborted = true;
            return 0;
        }
        return total;
    }

    auto progressCallback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) -> int
    {
        auto* ctx = static_cast<TransferContext*>(userdata);
        if (ctx->shouldAbort && *ctx->shouldAbort && (*ctx->shouldAbort)())
        {
            ctx->aborted = true;
            return 1;
        }
        return 0;
    }

    struct CurlDeleter
    {
        void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
    };

    struct SlistDeleter
    {
        void operator()(curl_slist* list) const { curl_slist_free_all(list); }
    };
} // namespace

auto performHttp(const HttpRequest& request, const HttpDataCallback& onData, const HttpAbortCheck& shouldAbort)
    -> Result<HttpResponse>
{
    ensureCurlInitialized();

    auto curl = std::unique_ptr<CURL, CurlDeleter>(curl_easy_init());
    if (!curl)
        return makeError(ErrorCode::TransportError, "Failed to initialize libcurl handle");

    auto headers = std::unique_ptr<curl_slist, SlistDeleter> {};
    for (const auto& [name, value]: request.headers)
    {
        auto const line = std::format("{}: {}", name, value);
        auto* head = curl_slist_append(headers.get(), line.c_str());
        if (!head)
            return makeError(ErrorCode::TransportError, "Failed to build request headers");
        if (head != headers.get())
        {
            (void) headers.release();
            headers.reset(head);
        }
    }

    auto* handle = curl.get();
    auto ctx = TransferContext { .handle = handle, .onData = &onData, .shouldAbort = &shouldAbort };

    curl_easy_setopt(handle, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(handle, CURLOPT_CUSTOMREQUEST, request.method.c_str());
    curl_easy_setopt(handle, CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(handle, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(handle, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(request.connectTimeout.count()));
    curl_easy_setopt(handle, CURLOPT_TIMEOUT_MS, static_cast<long>(request.totalTimeout.count()));
    if (request.method == "POST" || !request.body.empty())
    {
        curl_easy_setopt(handle, CURLOPT_POSTFIELDS, request.body.c_str());
        curl_easy_setopt(handle, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(request.body.size()));
    }
    curl_easy_setopt(handle, CURLOPT_HEADERFUNCTION, headerCallback);
    curl_easy_setopt(handle, CURLOPT_HEADERDATA, &ctx);
    curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(handle, CURLOPT_WRITEDATA, &ctx);
    curl_easy_setopt(handle, CURLOPT_XFERINFOFUNCTION, progressCallback);
    curl_easy_setopt(handle, CURLOPT_XFERINFODATA, &ctx);
    curl_easy_setopt(handle, CURLOPT_NOPROGRESS, 0L);

    auto const code = curl_easy_perform(handle);
    curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &ctx.response.status);

    if (ctx.aborted)
        return makeError(ErrorCode::Cancelled, std::format("{} {} aborted", request.method, request.url));

    switch (code)
    {
        case CURLE_OK: break;
        case CURLE_OPERATION_TIMEDOUT:
            return makeError(ErrorCode::TimeoutError,
                             std::format("{} {}: {}", request.method, request.url, curl_easy_strerror(code)));
        default:
            return makeError(ErrorCode::TransportError,
                             std::format("{} {}: {}", request.method, request.url, curl_easy_strerror(code)));
    }

    log::debug("{} {} -> {}", request.method, request.url, ctx.response.status);
    return std::move(ctx.response);
}

auto performHttp(const HttpRequest& request, std::string& body, const HttpAbortCheck& shouldAbort)
    -> Result<HttpResponse>
{
    return performHttp(
        request,
        [&body](const HttpResponse&, std::string_view chunk) {
            body.append(chunk);
            return true;
        },
        shouldAbort);
}

} // namespace mcphub
