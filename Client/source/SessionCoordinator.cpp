#include "SessionCoordinator.hpp"

#include <spdlog/spdlog.h>

#include "fmt/core.h"

std::tuple<bool, OpenedSession, UploadError> SessionCoordinator::Open(const SessionOpenRequest& request)
{
    if (request.chunk_size <= 0)
        return { false, OpenedSession{}, MakeError(UploadErrorKind::InvalidConfiguration,
            fmt::format("chunk size must be positive, got {}", request.chunk_size)) };

    auto [ok, session, err] = OpenSession(request);
    if (!ok)
        return { false, OpenedSession{}, err };

    spdlog::info("upload session {} opened for {} ({} bytes, {} chunks)",
                 session.session_id, request.filename, request.total_size, session.total_chunks);

    return { true, std::move(session), OkError() };
}

std::tuple<bool, CompletedFile, UploadError> SessionCoordinator::Complete(const std::string& session_id)
{
    auto [ok_status, state, serr] = Status(session_id);
    if (!ok_status) {
        serr.session_id = session_id;
        return { false, CompletedFile{}, serr };
    }

    if (state.status == SessionStatus::Completed) {
        auto err = MakeError(UploadErrorKind::AlreadyCompleted, "upload already completed");
        err.session_id = session_id;
        return { false, CompletedFile{}, err };
    }

    if (state.status == SessionStatus::Cancelled) {
        auto err = MakeError(UploadErrorKind::SessionCancelled, "upload was cancelled");
        err.session_id = session_id;
        return { false, CompletedFile{}, err };
    }

    if (!state.missing.empty()) {
        auto err = MakeError(UploadErrorKind::IncompleteUpload,
            fmt::format("{} of {} chunks still missing", state.missing.size(), state.total_chunks));
        err.session_id = session_id;
        return { false, CompletedFile{}, err };
    }

    auto [ok, file, err] = Finalize(session_id);
    if (!ok) {
        err.session_id = session_id;
        return { false, CompletedFile{}, err };
    }

    spdlog::info("upload session {} completed: {}", session_id, file.url.empty() ? file.file_id : file.url);

    return { true, std::move(file), OkError() };
}
