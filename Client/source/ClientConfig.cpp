#include "ClientConfig.hpp"

#include <cstdlib>
#include <limits>
#include <stdexcept>

#include "fmt/core.h"

namespace {
	UploadError InvalidConfig(std::string message)
	{
		return MakeError(UploadErrorKind::InvalidConfiguration, std::move(message));
	}

	std::string Pick(const ArgList& args, const char* name, const EnvLookup& env, const char* env_name)
	{
		if (const auto it = args.find(name); it != args.end())
			return it->second;

		if (env) {
			if (const auto value = env(env_name))
				return *value;
		}

		return {};
	}

	std::tuple<bool, long long, UploadError> ParseInteger(const std::string& name, const std::string& text)
	{
		try {
			size_t pos = 0;
			const long long value = std::stoll(text, &pos);
			if (pos != text.size())
				return { false, 0, InvalidConfig(fmt::format("{}: trailing characters in '{}'", name, text)) };

			return { true, value, OkError() };
		}
		catch (const std::exception&) {
			return { false, 0, InvalidConfig(fmt::format("{}: '{}' is not an integer", name, text)) };
		}
	}
}

std::optional<std::string> LookupProcessEnv(const char* name)
{
	const char* value = std::getenv(name);
	if (!value || *value == '\0')
		return std::nullopt;

	return std::string(value);
}

std::tuple<bool, ClientConfig, UploadError> MakeClientConfig(const ArgList& args, const EnvLookup& env)
{
	ClientConfig config;

	config.base_url = Pick(args, "url", env, "UPLOAD_API_URL");
	config.credentials.api_key = Pick(args, "api-key", env, "UPLOAD_API_KEY");
	config.credentials.token = Pick(args, "token", env, "UPLOAD_TOKEN");
	config.credentials.project_id = Pick(args, "project-id", env, "UPLOAD_PROJECT_ID");

	if (const auto it = args.find("grpc-target"); it != args.end())
		config.grpc_target = it->second;

	if (const auto it = args.find("transport"); it != args.end()) {
		if (it->second == "http")
			config.transport = TransportKind::Http;
		else if (it->second == "grpc")
			config.transport = TransportKind::Grpc;
		else
			return { false, ClientConfig{}, InvalidConfig(fmt::format("unknown transport '{}'", it->second)) };
	}

	if (const auto it = args.find("encoding"); it != args.end()) {
		const auto encoding = ParseWireEncoding(it->second);
		if (!encoding)
			return { false, ClientConfig{}, InvalidConfig(fmt::format("unknown encoding '{}'", it->second)) };

		config.encoding = *encoding;
	}

	if (const auto it = args.find("chunk-size"); it != args.end()) {
		const auto [ok, value, err] = ParseInteger("chunk-size", it->second);
		if (!ok)
			return { false, ClientConfig{}, err };

		config.chunk_size = static_cast<std::int64_t>(value);
	}

	if (const auto it = args.find("timeout"); it != args.end()) {
		const auto [ok, value, err] = ParseInteger("timeout", it->second);
		if (!ok)
			return { false, ClientConfig{}, err };

		if (value <= 0 || value > std::numeric_limits<int>::max())
			return { false, ClientConfig{}, InvalidConfig(fmt::format("timeout must be positive, got {}", value)) };

		config.timeout_seconds = static_cast<int>(value);
	}

	if (args.find("no-checksum") != args.end())
		config.verify_checksum = false;

	if (const auto it = args.find("content-type"); it != args.end())
		config.content_type = it->second;

	if (const auto it = args.find("loglevel"); it != args.end())
		config.loglevel = it->second;

	if (auto err = ValidateConfig(config))
		return { false, ClientConfig{}, *err };

	return { true, std::move(config), OkError() };
}

std::optional<UploadError> ValidateConfig(const ClientConfig& config)
{
	if (config.chunk_size <= 0)
		return InvalidConfig(fmt::format("chunk size must be positive, got {}", config.chunk_size));

	if (config.timeout_seconds <= 0)
		return InvalidConfig("timeout must be positive");

	if (config.transport == TransportKind::Http && config.base_url.empty())
		return InvalidConfig("no base url: pass --url or set UPLOAD_API_URL");

	if (config.transport == TransportKind::Grpc && config.grpc_target.empty())
		return InvalidConfig("no gRPC target: pass --grpc-target");

	return std::nullopt;
}
