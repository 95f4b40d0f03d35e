#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <tuple>

#include "UploadError.hpp"
#include "UploadTypes.hpp"

// Delivers one chunk to a remote session. No retries: errors surface as-is
// and the session stays resumable. Re-sending a delivered index is not an
// error.
class ChunkTransmitter
{
public:
	virtual ~ChunkTransmitter() = default;

public:
	virtual std::tuple<bool, ChunkAck, UploadError>
	Send(const std::string& session_id, std::uint64_t index, std::string_view bytes) = 0;
};
