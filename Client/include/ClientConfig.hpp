#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <tuple>

#include "UploadError.hpp"
#include "UploadTypes.hpp"

// Identity attached to every remote call. The API key wins over the token
// when both are present.
struct Credentials {
	std::string api_key;
	std::string token;
	std::string project_id;
};

enum class TransportKind {
	Http = 0,
	Grpc
};

struct ClientConfig {
	std::string base_url;
	std::string grpc_target;
	TransportKind transport = TransportKind::Http;

	Credentials credentials;

	WireEncoding encoding = WireEncoding::Multipart;
	std::int64_t chunk_size = kDefaultChunkSize;
	bool verify_checksum = true;
	std::optional<std::string> content_type;

	int timeout_seconds = 60;
	std::string loglevel = "info";
};

using ArgList = std::map<std::string, std::string>;
using EnvLookup = std::function<std::optional<std::string>(const char* name)>;

std::optional<std::string> LookupProcessEnv(const char* name);

// Builds the configuration from parsed command line options, falling back to
// UPLOAD_API_URL, UPLOAD_API_KEY, UPLOAD_TOKEN and UPLOAD_PROJECT_ID.
std::tuple<bool, ClientConfig, UploadError> MakeClientConfig(const ArgList& args, const EnvLookup& env = LookupProcessEnv);

std::optional<UploadError> ValidateConfig(const ClientConfig& config);
