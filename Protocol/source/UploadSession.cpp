#include "UploadSession.hpp"

#include "fmt/core.h"

#include "ChunkLayout.hpp"

UploadSession::UploadSession(std::string session_id, std::uint64_t total_size,
                             std::int64_t chunk_size, std::uint64_t total_chunks)
    : session_id_(std::move(session_id))
    , status_(SessionStatus::Pending)
    , total_size_(total_size)
    , chunk_size_(chunk_size)
    , total_chunks_(total_chunks)
    , delivered_(static_cast<size_t>(total_chunks), false)
    , delivered_count_(0)
{
}

std::tuple<bool, UploadSession, UploadError>
UploadSession::Create(std::string session_id, std::uint64_t total_size, std::int64_t chunk_size)
{
    const auto [ok, count, err] = ChunkCount(total_size, chunk_size);
    if (!ok)
        return { false, UploadSession(session_id, 0, 0, 0), err };

    return { true, UploadSession(std::move(session_id), total_size, chunk_size, count), OkError() };
}

std::tuple<bool, UploadSession, UploadError>
UploadSession::FromState(std::string session_id, const SessionState& state)
{
    auto [ok, session, err] = Create(session_id, state.total_size, state.chunk_size);
    if (!ok) {
        err.kind = UploadErrorKind::MalformedResponse;
        err.message = "status reports " + err.message;
        return { false, std::move(session), err };
    }

    if (session.total_chunks_ != state.total_chunks)
        return { false, std::move(session), MakeError(UploadErrorKind::MalformedResponse,
            fmt::format("status reports {} chunks for {} bytes in {} byte chunks",
                        state.total_chunks, state.total_size, state.chunk_size)) };

    for (const auto index : state.delivered) {
        if (index >= session.total_chunks_)
            return { false, std::move(session), MakeError(UploadErrorKind::MalformedResponse,
                fmt::format("delivered chunk {} out of range [0, {})", index, session.total_chunks_)) };
    }

    // The missing list is authoritative: everything not listed is delivered.
    std::vector<bool> missing(static_cast<size_t>(session.total_chunks_), false);
    for (const auto index : state.missing) {
        if (index >= session.total_chunks_)
            return { false, std::move(session), MakeError(UploadErrorKind::MalformedResponse,
                fmt::format("missing chunk {} out of range [0, {})", index, session.total_chunks_)) };

        missing[static_cast<size_t>(index)] = true;
    }

    for (std::uint64_t i = 0; i < session.total_chunks_; ++i)
        if (!missing[static_cast<size_t>(i)])
            (void)session.MarkDelivered(i);

    session.status_ = state.status;

    return { true, std::move(session), OkError() };
}

const std::string& UploadSession::GetSessionId() const noexcept
{
    return session_id_;
}

SessionStatus UploadSession::GetStatus() const noexcept
{
    return status_;
}

std::uint64_t UploadSession::GetTotalSize() const noexcept
{
    return total_size_;
}

std::int64_t UploadSession::GetChunkSize() const noexcept
{
    return chunk_size_;
}

std::uint64_t UploadSession::GetTotalChunks() const noexcept
{
    return total_chunks_;
}

std::uint64_t UploadSession::GetDeliveredCount() const noexcept
{
    return delivered_count_;
}

bool UploadSession::IsDelivered(std::uint64_t index) const noexcept
{
    return index < total_chunks_ && delivered_[static_cast<size_t>(index)];
}

std::vector<std::uint64_t> UploadSession::GetMissing() const
{
    std::vector<std::uint64_t> missing;
    missing.reserve(static_cast<size_t>(total_chunks_ - delivered_count_));

    for (std::uint64_t i = 0; i < total_chunks_; ++i)
        if (!delivered_[static_cast<size_t>(i)])
            missing.push_back(i);

    return missing;
}

bool UploadSession::IsFinalizable() const noexcept
{
    return delivered_count_ == total_chunks_;
}

bool UploadSession::CanTransition(SessionStatus from, SessionStatus to) noexcept
{
    if (from == to)
        return from == SessionStatus::Uploading;

    switch (from) {
    case SessionStatus::Pending:
        return true;
    case SessionStatus::Uploading:
        return to != SessionStatus::Pending;
    case SessionStatus::Failed:
        return to == SessionStatus::Uploading || to == SessionStatus::Cancelled;
    case SessionStatus::Completed:
    case SessionStatus::Cancelled:
        return false;
    }

    return false;
}

std::optional<UploadError> UploadSession::TransitionTo(SessionStatus next)
{
    if (!CanTransition(status_, next)) {
        auto kind = UploadErrorKind::InvalidConfiguration;
        if (status_ == SessionStatus::Completed)
            kind = UploadErrorKind::AlreadyCompleted;
        else if (status_ == SessionStatus::Cancelled)
            kind = UploadErrorKind::SessionCancelled;

        auto err = MakeError(kind, fmt::format("session cannot move from {} to {}",
                                               SessionStatusName(status_), SessionStatusName(next)));
        err.session_id = session_id_;
        return err;
    }

    if (next == SessionStatus::Completed && !IsFinalizable()) {
        auto err = MakeError(UploadErrorKind::IncompleteUpload,
                             fmt::format("{} of {} chunks still missing",
                                         total_chunks_ - delivered_count_, total_chunks_));
        err.session_id = session_id_;
        return err;
    }

    status_ = next;

    return std::nullopt;
}

std::optional<UploadError> UploadSession::MarkDelivered(std::uint64_t index)
{
    if (index >= total_chunks_)
        return MakeError(UploadErrorKind::InvalidConfiguration,
                         fmt::format("chunk index {} out of range [0, {})", index, total_chunks_));

    if (!delivered_[static_cast<size_t>(index)]) {
        delivered_[static_cast<size_t>(index)] = true;
        ++delivered_count_;
    }

    return std::nullopt;
}

UploadProgress UploadSession::Progress() const
{
    UploadProgress progress;

    progress.session_id = session_id_;
    progress.delivered = delivered_count_;
    progress.total_chunks = total_chunks_;
    progress.fraction = total_chunks_ == 0
        ? 1.0
        : static_cast<double>(delivered_count_) / static_cast<double>(total_chunks_);
    progress.status = status_;

    return progress;
}
