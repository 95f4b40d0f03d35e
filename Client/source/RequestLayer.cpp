#include "RequestLayer.hpp"

#include <spdlog/spdlog.h>

#include "WireJson.hpp"

RequestLayer::RequestLayer(Credentials credentials)
    : credentials_(std::move(credentials))
{
}

const Credentials& RequestLayer::GetCredentials() const noexcept
{
    return credentials_;
}

std::tuple<bool, HttpResponse, UploadError> RequestLayer::Execute(HttpRequest request)
{
    if (!credentials_.api_key.empty())
        request.headers.emplace_back("X-API-Key", credentials_.api_key);
    else if (!credentials_.token.empty())
        request.headers.emplace_back("Authorization", "Bearer " + credentials_.token);

    if (!credentials_.project_id.empty())
        request.headers.emplace_back("X-Project-ID", credentials_.project_id);

    auto [ok, response, err] = Transport(request);
    if (!ok) {
        spdlog::debug("{} {}: no response: {}", request.method, request.target, err.message);
        return { false, HttpResponse{}, err };
    }

    spdlog::debug("{} {}: status {}", request.method, request.target, response.status);

    if (response.status < 200 || response.status >= 300)
        return { false, response, MakeHttpError(response.status, ErrorMessageFromBody(response.body)) };

    return { true, std::move(response), OkError() };
}

std::string RequestLayer::EscapePathSegment(std::string_view segment)
{
    static const char* kHex = "0123456789ABCDEF";

    std::string out;
    out.reserve(segment.size());

    for (const char c : segment) {
        const auto b = static_cast<unsigned char>(c);
        const bool unreserved = (b >= 'A' && b <= 'Z') || (b >= 'a' && b <= 'z')
            || (b >= '0' && b <= '9') || b == '-' || b == '.' || b == '_' || b == '~';

        if (unreserved) {
            out.push_back(c);
        } else {
            out.push_back('%');
            out.push_back(kHex[(b >> 4) & 0xF]);
            out.push_back(kHex[b & 0xF]);
        }
    }

    return out;
}
