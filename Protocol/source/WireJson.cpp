#include "WireJson.hpp"

#include <sstream>

#include <json/json.h>
#include <spdlog/spdlog.h>

#include "fmt/core.h"

namespace {
	UploadError Malformed(std::string message)
	{
		return MakeError(UploadErrorKind::MalformedResponse, std::move(message));
	}

	std::tuple<bool, Json::Value, UploadError> ParseObject(const std::string& body)
	{
		Json::CharReaderBuilder reader;
		Json::Value root;
		std::string errs;

		std::istringstream iss(body);
		if (!Json::parseFromStream(reader, iss, &root, &errs))
			return { false, Json::Value{}, Malformed("invalid JSON response: " + errs) };

		if (!root.isObject())
			return { false, Json::Value{}, Malformed("JSON response is not an object") };

		return { true, std::move(root), OkError() };
	}

	std::tuple<bool, std::uint64_t, UploadError> GetUInt64(const Json::Value& root, const char* name)
	{
		const Json::Value& value = root[name];
		if (!value.isUInt64())
			return { false, 0, Malformed(fmt::format("field '{}' is missing or not a non-negative integer", name)) };

		return { true, value.asUInt64(), OkError() };
	}

	std::tuple<bool, std::vector<std::uint64_t>, UploadError> GetIndexArray(const Json::Value& root, const char* name)
	{
		const Json::Value& value = root[name];
		if (value.isNull())
			return { true, {}, OkError() };

		if (!value.isArray())
			return { false, {}, Malformed(fmt::format("field '{}' is not an array", name)) };

		std::vector<std::uint64_t> out;
		out.reserve(value.size());
		for (const auto& item : value) {
			if (!item.isUInt64())
				return { false, {}, Malformed(fmt::format("field '{}' holds a non-index value", name)) };

			out.push_back(item.asUInt64());
		}

		return { true, std::move(out), OkError() };
	}

	std::string Write(const Json::Value& value)
	{
		Json::StreamWriterBuilder builder;
		builder["indentation"] = "";

		return Json::writeString(builder, value);
	}
}

std::string EncodeOpenRequest(const SessionOpenRequest& request)
{
	Json::Value body(Json::objectValue);

	body["filename"] = request.filename;
	body["total_size"] = Json::UInt64(request.total_size);
	body["chunk_size"] = Json::Int64(request.chunk_size);
	body["project_id"] = request.project_id;

	if (request.content_type)
		body["content_type"] = *request.content_type;
	if (request.checksum)
		body["checksum"] = *request.checksum;

	return Write(body);
}

std::string EncodeCompleteRequest()
{
	return Write(Json::Value(Json::objectValue));
}

std::tuple<bool, OpenedSession, UploadError> DecodeOpenResponse(const std::string& body)
{
	auto [ok, root, err] = ParseObject(body);
	if (!ok)
		return { false, OpenedSession{}, err };

	OpenedSession session;

	if (!root["session_id"].isString() || root["session_id"].asString().empty())
		return { false, OpenedSession{}, Malformed("field 'session_id' is missing") };
	session.session_id = root["session_id"].asString();

	const auto [ok_count, count, cerr] = GetUInt64(root, "total_chunks");
	if (!ok_count)
		return { false, OpenedSession{}, cerr };
	session.total_chunks = count;

	return { true, std::move(session), OkError() };
}

std::tuple<bool, ChunkAck, UploadError> DecodeChunkAck(const std::string& body)
{
	ChunkAck ack;
	ack.accepted = true;

	if (body.empty())
		return { true, std::move(ack), OkError() };

	auto [ok, root, err] = ParseObject(body);
	if (!ok)
		return { false, ChunkAck{}, err };

	if (root["message"].isString())
		ack.message = root["message"].asString();
	if (root["progress"].isNumeric())
		ack.progress = root["progress"].asDouble();

	return { true, std::move(ack), OkError() };
}

std::tuple<bool, SessionState, UploadError> DecodeSessionState(const std::string& body)
{
	auto [ok, root, err] = ParseObject(body);
	if (!ok)
		return { false, SessionState{}, err };

	SessionState state;

	if (!root["status"].isString())
		return { false, SessionState{}, Malformed("field 'status' is missing") };

	const std::string status = root["status"].asString();
	if (const auto parsed = ParseSessionStatus(status)) {
		state.status = *parsed;
	} else {
		spdlog::warn("unknown session status '{}', treating it as uploading", status);
		state.status = SessionStatus::Uploading;
	}

	auto [ok_delivered, delivered, derr] = GetIndexArray(root, "uploaded_chunks");
	if (!ok_delivered)
		return { false, SessionState{}, derr };
	state.delivered = std::move(delivered);

	auto [ok_missing, missing, merr] = GetIndexArray(root, "missing_chunks");
	if (!ok_missing)
		return { false, SessionState{}, merr };
	state.missing = std::move(missing);

	const auto [ok_chunks, total_chunks, terr] = GetUInt64(root, "total_chunks");
	if (!ok_chunks)
		return { false, SessionState{}, terr };
	state.total_chunks = total_chunks;

	const auto [ok_size, chunk_size, serr] = GetUInt64(root, "chunk_size");
	if (!ok_size)
		return { false, SessionState{}, serr };
	state.chunk_size = static_cast<std::int64_t>(chunk_size);

	const auto [ok_total, total_size, zerr] = GetUInt64(root, "total_size");
	if (!ok_total)
		return { false, SessionState{}, zerr };
	state.total_size = total_size;

	return { true, std::move(state), OkError() };
}

std::tuple<bool, CompletedFile, UploadError> DecodeCompletedFile(const std::string& body)
{
	auto [ok, root, err] = ParseObject(body);
	if (!ok)
		return { false, CompletedFile{}, err };

	CompletedFile file;
	file.raw = body;

	if (root["url"].isString())
		file.url = root["url"].asString();

	// Some deployments answer with a numeric id.
	const Json::Value& file_id = root["file_id"];
	if (file_id.isString())
		file.file_id = file_id.asString();
	else if (file_id.isUInt64())
		file.file_id = std::to_string(file_id.asUInt64());
	else if (file_id.isInt64())
		file.file_id = std::to_string(file_id.asInt64());

	if (file.url.empty() && file.file_id.empty())
		return { false, CompletedFile{}, Malformed("complete response has neither 'url' nor 'file_id'") };

	if (root["filename"].isString())
		file.filename = root["filename"].asString();
	if (!root["size"].isNull()) {
		const auto [ok_size, size, serr] = GetUInt64(root, "size");
		if (!ok_size)
			return { false, CompletedFile{}, serr };
		file.size = size;
	}

	return { true, std::move(file), OkError() };
}

std::string ErrorMessageFromBody(const std::string& body)
{
	Json::CharReaderBuilder reader;
	Json::Value root;
	std::string errs;

	std::istringstream iss(body);
	if (!Json::parseFromStream(reader, iss, &root, &errs) || !root.isObject())
		return body;

	if (root["error"].isString())
		return root["error"].asString();
	if (root["message"].isString())
		return root["message"].asString();

	return body;
}
