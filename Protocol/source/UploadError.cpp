#include "UploadError.hpp"

#include "fmt/core.h"

UploadError OkError()
{
    return UploadError{};
}

UploadError MakeError(UploadErrorKind kind, std::string message, int status)
{
    UploadError error;

    error.kind = kind;
    error.status = status;
    error.message = std::move(message);

    return error;
}

UploadErrorKind KindFromHttpStatus(int status) noexcept
{
    if (status == 401)
        return UploadErrorKind::Unauthorized;
    if (status == 403)
        return UploadErrorKind::Forbidden;
    if (status == 0 || status >= 500)
        return UploadErrorKind::TransientNetworkFailure;

    return UploadErrorKind::RemoteRejected;
}

UploadError MakeHttpError(int status, std::string message)
{
    return MakeError(KindFromHttpStatus(status), std::move(message), status);
}

const char* UploadErrorKindName(UploadErrorKind kind) noexcept
{
    switch (kind) {
    case UploadErrorKind::None:                    return "None";
    case UploadErrorKind::InvalidConfiguration:    return "InvalidConfiguration";
    case UploadErrorKind::SourceNotFound:          return "SourceNotFound";
    case UploadErrorKind::SizeMismatch:            return "SizeMismatch";
    case UploadErrorKind::AlreadyCompleted:        return "AlreadyCompleted";
    case UploadErrorKind::IncompleteUpload:        return "IncompleteUpload";
    case UploadErrorKind::SessionCancelled:        return "SessionCancelled";
    case UploadErrorKind::RemoteRejected:          return "RemoteRejected";
    case UploadErrorKind::TransientNetworkFailure: return "TransientNetworkFailure";
    case UploadErrorKind::Unauthorized:            return "Unauthorized";
    case UploadErrorKind::Forbidden:               return "Forbidden";
    case UploadErrorKind::MalformedResponse:       return "MalformedResponse";
    case UploadErrorKind::LocalIoFailure:          return "LocalIoFailure";
    }

    return "Unknown";
}

std::string UploadErrorToString(const UploadError& error)
{
    std::string out = fmt::format("{}", UploadErrorKindName(error.kind));

    if (error.status != 0)
        out += fmt::format(" (status {})", error.status);

    if (!error.message.empty())
        out += fmt::format(": {}", error.message);

    if (!error.session_id.empty())
        out += fmt::format(" [session {}]", error.session_id);

    return out;
}
