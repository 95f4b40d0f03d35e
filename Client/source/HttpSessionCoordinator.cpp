#include "HttpSessionCoordinator.hpp"

#include <spdlog/spdlog.h>

#include "WireJson.hpp"

namespace {
	constexpr const char* kJson = "application/json";

	std::string SessionPath(const std::string& session_id)
	{
		return "/api/upload/" + RequestLayer::EscapePathSegment(session_id);
	}
}

HttpSessionCoordinator::HttpSessionCoordinator(RequestLayer& requests)
    : requests_(requests)
{
}

std::tuple<bool, OpenedSession, UploadError>
HttpSessionCoordinator::OpenSession(const SessionOpenRequest& request)
{
    HttpRequest req;
    req.method = "POST";
    req.target = "/api/upload/init";
    req.content_type = kJson;
    req.body = EncodeOpenRequest(request);

    auto [ok, res, err] = requests_.Execute(std::move(req));
    if (!ok)
        return { false, OpenedSession{}, err };

    return DecodeOpenResponse(res.body);
}

std::tuple<bool, SessionState, UploadError>
HttpSessionCoordinator::Status(const std::string& session_id)
{
    HttpRequest req;
    req.method = "GET";
    req.target = SessionPath(session_id) + "/status";

    auto [ok, res, err] = requests_.Execute(std::move(req));
    if (!ok)
        return { false, SessionState{}, err };

    return DecodeSessionState(res.body);
}

std::tuple<bool, CompletedFile, UploadError>
HttpSessionCoordinator::Finalize(const std::string& session_id)
{
    HttpRequest req;
    req.method = "POST";
    req.target = SessionPath(session_id) + "/complete";
    req.content_type = kJson;
    req.body = EncodeCompleteRequest();

    auto [ok, res, err] = requests_.Execute(std::move(req));
    if (!ok) {
        // Lost a race with another finalizer after the status check.
        if (res.status == 409)
            err.kind = UploadErrorKind::AlreadyCompleted;

        return { false, CompletedFile{}, err };
    }

    return DecodeCompletedFile(res.body);
}

std::optional<UploadError> HttpSessionCoordinator::Cancel(const std::string& session_id)
{
    HttpRequest req;
    req.method = "DELETE";
    req.target = SessionPath(session_id);

    auto [ok, res, err] = requests_.Execute(std::move(req));
    if (!ok) {
        if (res.status == 404) {
            spdlog::info("upload session {} already gone", session_id);
            return std::nullopt;
        }

        err.session_id = session_id;
        return err;
    }

    spdlog::info("upload session {} cancelled", session_id);

    return std::nullopt;
}
