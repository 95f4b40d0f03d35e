#include "UploadTypes.hpp"

#include <sstream>

#include "fmt/core.h"

const char* SessionStatusName(SessionStatus status) noexcept
{
    switch (status) {
    case SessionStatus::Pending:   return "pending";
    case SessionStatus::Uploading: return "uploading";
    case SessionStatus::Completed: return "completed";
    case SessionStatus::Failed:    return "failed";
    case SessionStatus::Cancelled: return "cancelled";
    }

    return "unknown";
}

std::optional<SessionStatus> ParseSessionStatus(const std::string& name) noexcept
{
    if (name == "pending")   return SessionStatus::Pending;
    if (name == "uploading") return SessionStatus::Uploading;
    if (name == "completed") return SessionStatus::Completed;
    if (name == "failed")    return SessionStatus::Failed;
    if (name == "cancelled") return SessionStatus::Cancelled;

    return std::nullopt;
}

const char* WireEncodingName(WireEncoding encoding) noexcept
{
    switch (encoding) {
    case WireEncoding::Multipart: return "multipart";
    case WireEncoding::RawPut:    return "put";
    case WireEncoding::RawPost:   return "post";
    }

    return "unknown";
}

std::optional<WireEncoding> ParseWireEncoding(const std::string& name) noexcept
{
    if (name == "multipart") return WireEncoding::Multipart;
    if (name == "put")       return WireEncoding::RawPut;
    if (name == "post")      return WireEncoding::RawPost;

    return std::nullopt;
}

std::string CompletedFileToString(const CompletedFile& file)
{
    std::stringstream ss;

    ss << "url: " << file.url << std::endl;
    ss << "file_id: " << file.file_id << std::endl;
    if (file.filename)
        ss << "filename: " << *file.filename << std::endl;
    if (file.size)
        ss << "size: " << *file.size << std::endl;

    return ss.str();
}

std::string UploadProgress::ToString() const
{
    return fmt::format("UploadProgress({}/{}, {:.1f}%)", delivered, total_chunks, fraction * 100.0);
}
