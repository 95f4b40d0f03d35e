#include <chrono>
#include <memory>
#include <variant>
#include <string>
#include <vector>

#include <getopt.h>

#include <grpcpp/grpcpp.h>
#include <spdlog/spdlog.h>

#include "BeastRequestLayer.hpp"
#include "ClientConfig.hpp"
#include "GrpcChunkTransmitter.hpp"
#include "GrpcSessionCoordinator.hpp"
#include "HttpChunkTransmitter.hpp"
#include "HttpSessionCoordinator.hpp"
#include "UploadOrchestrator.hpp"

namespace {
	const char* kUsage =
		"usage: {} [options] <command> [arguments]\n"
		"commands:\n"
		"  upload <file>              upload a file in chunks\n"
		"  resume <session-id> <file> send the missing chunks of a session and complete it\n"
		"  status <session-id>        show delivered and missing chunks\n"
		"  complete <session-id>      finalize a fully delivered session\n"
		"  cancel <session-id>        discard a session and its chunks\n"
		"options:\n"
		"  --url <base-url>  --api-key <key>  --token <jwt>  --project-id <id>\n"
		"  --transport http|grpc  --grpc-target <host:port>\n"
		"  --encoding multipart|put|post  --chunk-size <bytes>  --no-checksum\n"
		"  --content-type <type>  --timeout <seconds>  --loglevel <level>";

	struct Command {
		std::string name;
		std::vector<std::string> operands;
	};

	// Owns whichever binding the configuration selects.
	struct Binding {
		std::unique_ptr<RequestLayer> requests;
		std::unique_ptr<SessionCoordinator> coordinator;
		std::unique_ptr<ChunkTransmitter> transmitter;
	};

	std::pair<bool, std::variant<std::pair<ArgList, Command>, std::string>> ParseArgument(int argc, char* argv[])
	{
		ArgList arglist;

		const struct option options[] = {
			{ "url",          required_argument, nullptr, 'u' },
			{ "api-key",      required_argument, nullptr, 'k' },
			{ "token",        required_argument, nullptr, 't' },
			{ "project-id",   required_argument, nullptr, 'p' },
			{ "transport",    required_argument, nullptr, 'T' },
			{ "grpc-target",  required_argument, nullptr, 'g' },
			{ "encoding",     required_argument, nullptr, 'e' },
			{ "chunk-size",   required_argument, nullptr, 'c' },
			{ "no-checksum",  no_argument,       nullptr, 'n' },
			{ "content-type", required_argument, nullptr, 'm' },
			{ "timeout",      required_argument, nullptr, 'w' },
			{ "loglevel",     required_argument, nullptr, 'l' },
			{ nullptr, 0, nullptr, 0 }
		};

		try {
			int optidx;
			for (int opt; (opt = getopt_long(argc, argv, "u:k:t:p:T:g:e:c:nm:w:l:", options, &optidx)) != -1; ) {
				switch (opt) {
				case 'u': arglist["url"] = optarg; break;
				case 'k': arglist["api-key"] = optarg; break;
				case 't': arglist["token"] = optarg; break;
				case 'p': arglist["project-id"] = optarg; break;
				case 'T': arglist["transport"] = optarg; break;
				case 'g': arglist["grpc-target"] = optarg; break;
				case 'e': arglist["encoding"] = optarg; break;
				case 'c': arglist["chunk-size"] = optarg; break;
				case 'n': arglist["no-checksum"] = "1"; break;
				case 'm': arglist["content-type"] = optarg; break;
				case 'w': arglist["timeout"] = optarg; break;
				case 'l': arglist["loglevel"] = optarg; break;
				case ':':
					return { false, fmt::format("missing argument: {}", static_cast<char>(optopt)) };
				case '?':
				default:
					return { false, fmt::format("invalid argument: {}", argv[optind - 1]) };
				}
			}
		}
		catch (std::exception& e) {
			return { false, fmt::format("invalid argument: {}", e.what()) };
		}

		const char* program = *argv;

		argc -= optind;
		argv += optind;

		if (argc < 1)
			return { false, fmt::format(fmt::runtime(kUsage), program) };

		Command command;
		command.name = *argv++;
		for (int i = 1; i < argc; i++)
			command.operands.emplace_back(*argv++);

		const size_t expected = command.name == "resume" ? 2 : 1;
		const bool known = command.name == "upload" || command.name == "resume" || command.name == "status"
			|| command.name == "complete" || command.name == "cancel";

		if (!known || command.operands.size() != expected)
			return { false, fmt::format(fmt::runtime(kUsage), program) };

		return { true, std::make_pair(std::move(arglist), std::move(command)) };
	}

	void ShowConfig(const ClientConfig& config)
	{
		spdlog::info("transport: {}", config.transport == TransportKind::Http ? "http" : "grpc");
		if (config.transport == TransportKind::Http) {
			spdlog::info("url: {}", config.base_url);
			spdlog::info("encoding: {}", WireEncodingName(config.encoding));
		} else {
			spdlog::info("grpc-target: {}", config.grpc_target);
		}
		spdlog::info("chunk-size: {}", config.chunk_size);
		spdlog::info("checksum: {}", config.verify_checksum ? "sha256" : "off");
	}

	std::tuple<bool, Binding, UploadError> MakeBinding(const ClientConfig& config)
	{
		Binding binding;
		const std::chrono::seconds timeout(config.timeout_seconds);

		if (config.transport == TransportKind::Grpc) {
			std::shared_ptr<grpc::Channel> channel = grpc::CreateChannel(config.grpc_target, grpc::InsecureChannelCredentials());
			spdlog::info("channel opened at: {}", config.grpc_target);

			binding.coordinator = std::make_unique<GrpcSessionCoordinator>(channel, config.credentials, timeout);
			binding.transmitter = std::make_unique<GrpcChunkTransmitter>(channel, config.credentials, timeout);

			return { true, std::move(binding), OkError() };
		}

		auto [ok, base, err] = ParseBaseUrl(config.base_url);
		if (!ok)
			return { false, Binding{}, err };

		binding.requests = std::make_unique<BeastRequestLayer>(std::move(base), config.credentials, timeout);
		binding.coordinator = std::make_unique<HttpSessionCoordinator>(*binding.requests);
		binding.transmitter = std::make_unique<HttpChunkTransmitter>(*binding.requests, config.encoding);

		return { true, std::move(binding), OkError() };
	}

	int ReportFailure(const char* what, const UploadError& err)
	{
		spdlog::error("failed to {}: {}", what, UploadErrorToString(err));
		if (!err.session_id.empty() && err.kind != UploadErrorKind::AlreadyCompleted
		    && err.kind != UploadErrorKind::SessionCancelled)
			spdlog::error("the session is kept; continue with: resume {} <file>", err.session_id);

		return 1;
	}
}

int main(int argc, char* argv[])
{
	const auto &[success, result] = ParseArgument(argc, argv);
	if (!success) {
		spdlog::error("failed to ParseArgument(): {}", std::get<std::string>(result));
		return 1;
	}

	const auto& [arglist, command] = std::get<std::pair<ArgList, Command>>(result);

	auto [ok_config, config, cerr] = MakeClientConfig(arglist);
	if (!ok_config) {
		spdlog::error("invalid configuration: {}", UploadErrorToString(cerr));
		return 1;
	}

	spdlog::set_level(spdlog::level::from_str(config.loglevel));
	ShowConfig(config);

	auto [ok_binding, binding, berr] = MakeBinding(config);
	if (!ok_binding) {
		spdlog::error("invalid configuration: {}", UploadErrorToString(berr));
		return 1;
	}

	UploadOrchestrator orchestrator(*binding.coordinator, *binding.transmitter);

	const auto report = [](const UploadProgress& progress) {
		spdlog::info("{}", progress.ToString());
	};

	if (command.name == "upload") {
		UploadOrchestrator::Options options;
		options.chunk_size = config.chunk_size;
		options.verify_checksum = config.verify_checksum;
		options.content_type = config.content_type;

		const auto [ok, file, err] = orchestrator.Upload(command.operands[0], config.credentials.project_id, options, report);
		if (!ok)
			return ReportFailure("upload file", err);

		spdlog::info("file uploaded successfully: \n{}", CompletedFileToString(file));
		return 0;
	}

	if (command.name == "resume") {
		const auto [ok, file, err] = orchestrator.Resume(command.operands[0], command.operands[1], report);
		if (!ok)
			return ReportFailure("resume upload", err);

		spdlog::info("file uploaded successfully: \n{}", CompletedFileToString(file));
		return 0;
	}

	if (command.name == "status") {
		const auto [ok, state, err] = binding.coordinator->Status(command.operands[0]);
		if (!ok)
			return ReportFailure("query status", err);

		spdlog::info("status: {}", SessionStatusName(state.status));
		spdlog::info("chunks: {} delivered, {} missing, {} total",
			     state.delivered.size(), state.missing.size(), state.total_chunks);
		spdlog::info("size: {} bytes in {} byte chunks", state.total_size, state.chunk_size);
		return 0;
	}

	if (command.name == "complete") {
		const auto [ok, file, err] = binding.coordinator->Complete(command.operands[0]);
		if (!ok)
			return ReportFailure("complete upload", err);

		spdlog::info("file uploaded successfully: \n{}", CompletedFileToString(file));
		return 0;
	}

	if (auto err = orchestrator.Cancel(command.operands[0]))
		return ReportFailure("cancel upload", *err);

	return 0;
}
