#pragma once

#include "RequestLayer.hpp"
#include "SessionCoordinator.hpp"

class HttpSessionCoordinator final : public SessionCoordinator
{
public:
	explicit HttpSessionCoordinator(RequestLayer& requests);

public:
	std::tuple<bool, SessionState, UploadError> Status(const std::string& session_id) override;
	std::optional<UploadError> Cancel(const std::string& session_id) override;

protected:
	std::tuple<bool, OpenedSession, UploadError> OpenSession(const SessionOpenRequest& request) override;
	std::tuple<bool, CompletedFile, UploadError> Finalize(const std::string& session_id) override;

private:
	RequestLayer& requests_;
};
