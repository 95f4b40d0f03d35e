#include "ChunkLayout.hpp"

#include <algorithm>

#include "fmt/core.h"

namespace {
	UploadError InvalidChunkSize(std::int64_t chunk_size)
	{
		return MakeError(UploadErrorKind::InvalidConfiguration,
				 fmt::format("chunk size must be positive, got {}", chunk_size));
	}
}

std::tuple<bool, std::uint64_t, UploadError> ChunkCount(std::uint64_t total_size, std::int64_t chunk_size)
{
	if (chunk_size <= 0)
		return { false, 0, InvalidChunkSize(chunk_size) };

	const auto size = static_cast<std::uint64_t>(chunk_size);
	const std::uint64_t count = total_size / size + (total_size % size != 0 ? 1 : 0);

	return { true, count, OkError() };
}

std::tuple<bool, ChunkRange, UploadError> ChunkRangeAt(std::uint64_t index, std::uint64_t total_size, std::int64_t chunk_size)
{
	const auto [ok, count, err] = ChunkCount(total_size, chunk_size);
	if (!ok)
		return { false, ChunkRange{}, err };

	if (index >= count)
		return { false, ChunkRange{}, MakeError(UploadErrorKind::InvalidConfiguration,
			fmt::format("chunk index {} out of range [0, {})", index, count)) };

	const auto size = static_cast<std::uint64_t>(chunk_size);

	ChunkRange range;
	range.index = index;
	range.offset = index * size;
	range.length = std::min(size, total_size - range.offset);

	return { true, range, OkError() };
}

std::tuple<bool, std::vector<ChunkRange>, UploadError> PlanChunkLayout(std::uint64_t total_size, std::int64_t chunk_size)
{
	const auto [ok, count, err] = ChunkCount(total_size, chunk_size);
	if (!ok)
		return { false, {}, err };

	const auto size = static_cast<std::uint64_t>(chunk_size);

	std::vector<ChunkRange> layout;
	layout.reserve(static_cast<size_t>(count));

	for (std::uint64_t offset = 0, index = 0; offset < total_size; offset += size, ++index)
		layout.push_back(ChunkRange{ index, offset, std::min(size, total_size - offset) });

	return { true, std::move(layout), OkError() };
}
