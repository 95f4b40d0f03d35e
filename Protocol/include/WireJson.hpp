#pragma once

#include <string>
#include <tuple>

#include "UploadError.hpp"
#include "UploadTypes.hpp"

// JSON bodies of the HTTP binding.

std::string EncodeOpenRequest(const SessionOpenRequest& request);
std::string EncodeCompleteRequest();

std::tuple<bool, OpenedSession, UploadError> DecodeOpenResponse(const std::string& body);
std::tuple<bool, ChunkAck, UploadError> DecodeChunkAck(const std::string& body);
std::tuple<bool, SessionState, UploadError> DecodeSessionState(const std::string& body);
std::tuple<bool, CompletedFile, UploadError> DecodeCompletedFile(const std::string& body);

// Message carried by an error response: "error", then "message", then the
// body itself when it is not a JSON object.
std::string ErrorMessageFromBody(const std::string& body);
