#pragma once

#include <cstdint>
#include <tuple>
#include <vector>

#include "UploadError.hpp"

// Half-open byte range [offset, offset + length) of one chunk.
struct ChunkRange {
	std::uint64_t index = 0;
	std::uint64_t offset = 0;
	std::uint64_t length = 0;

	std::uint64_t End() const noexcept { return offset + length; }
};

// ceil(total_size / chunk_size). Zero for an empty source.
std::tuple<bool, std::uint64_t, UploadError> ChunkCount(std::uint64_t total_size, std::int64_t chunk_size);

std::tuple<bool, ChunkRange, UploadError> ChunkRangeAt(std::uint64_t index, std::uint64_t total_size, std::int64_t chunk_size);

// Every chunk has length chunk_size except possibly the last one.
std::tuple<bool, std::vector<ChunkRange>, UploadError> PlanChunkLayout(std::uint64_t total_size, std::int64_t chunk_size);
