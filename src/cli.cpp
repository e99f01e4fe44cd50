#include "attest/cli.hpp"
#include "attest/api_router.hpp"
#include "attest/audit.hpp"
#include "attest/chain_store.hpp"
#include "attest/config.hpp"
#include "attest/event_store.hpp"
#include "attest/provenance_engine.hpp"
#include "attest/signer.hpp"
#include "attest/storage.hpp"
#include "attest/web_server.hpp"
#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <fstream>
#include <iostream>
#include <iterator>

namespace attest::cli
{
	namespace
	{
		struct Runtime
		{
			AttestConfig cfg;
			std::shared_ptr<RocksDbStorage> storage;
			std::shared_ptr<ProvenanceEngine> engine;
		};

		Result<Runtime> open_runtime(const AttestConfig &cfg)
		{
			auto storage = RocksDbStorage::open(cfg.storage);
			if (!storage)
				return std::unexpected(storage.error());

			// No secure-element driver is linked into this binary; hardware
			// signing is available to embedders through make_signer.
			auto signer = make_signer(cfg.signer, nullptr, cfg.key_encryption_key);
			if (!signer)
				return std::unexpected(signer.error());

			auto engine = std::make_shared<ProvenanceEngine>(
				std::make_shared<RocksDbEventStore>(*storage),
				std::make_shared<RocksDbChainStore>(*storage),
				*signer,
				std::make_shared<HostClock>(),
				AuditLogger(cfg.logging.audit_enabled, cfg.device_id));

			if (auto init = engine->initialize(); !init)
				return std::unexpected(init.error());
			return Runtime{cfg, *storage, engine};
		}

		Result<crypto::Bytes> read_file(const std::string &path)
		{
			std::ifstream f(path, std::ios::binary);
			if (!f.is_open())
				return std::unexpected(AttestError(ErrorCode::IOError, "Unable to open " + path));
			return crypto::Bytes(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
		}

		int fail(const AttestError &e)
		{
			std::cerr << error_code_to_string(e.code) << ": " << e.what() << std::endl;
			return 1;
		}
	} // namespace

	int run(int argc, char *argv[])
	{
		CLI::App app{"attest: tamper-evident event provenance chain"};
		app.require_subcommand(0, 1);

		std::string config_path{"config.toml"};
		app.add_option("--config", config_path, "Path to config TOML (defaults apply if missing)");

		auto cfg_cmd = app.add_subcommand("config-print", "Print the effective configuration as JSON");

		std::string record_type;
		std::string record_artifact;
		std::string record_reference;
		std::string record_encoding{"application/octet-stream"};
		std::string record_payload{"{}"};
		auto record_cmd = app.add_subcommand("record", "Create a signed, chained event record");
		record_cmd->add_option("--type", record_type, "Event type, e.g. motion_detection")->required();
		record_cmd->add_option("--artifact", record_artifact, "Path to the artifact file")->required()->check(CLI::ExistingFile);
		record_cmd->add_option("--reference", record_reference, "Artifact reference (defaults to the path)");
		record_cmd->add_option("--encoding", record_encoding, "Artifact encoding, e.g. image/jpeg");
		record_cmd->add_option("--payload", record_payload, "Trigger payload as a JSON object");

		std::string verify_id;
		auto verify_cmd = app.add_subcommand("verify-event", "Verify the signature of one event");
		verify_cmd->add_option("--id", verify_id, "Event id")->required();

		auto chain_cmd = app.add_subcommand("verify-chain", "Verify the whole chain");

		auto status_cmd = app.add_subcommand("status", "Print chain status");

		std::size_t list_limit{50};
		std::size_t list_offset{0};
		auto list_cmd = app.add_subcommand("list", "List events, newest first");
		list_cmd->add_option("--limit", list_limit, "Maximum number of events");
		list_cmd->add_option("--offset", list_offset, "Events to skip");

		auto rotate_cmd = app.add_subcommand("rotate-key", "Add a new software signing key and make it current");

		std::optional<std::uint16_t> serve_port;
		std::optional<std::size_t> serve_threads;
		auto serve_cmd = app.add_subcommand("serve", "Run the HTTP API");
		serve_cmd->add_option("--port", serve_port, "Port to bind");
		serve_cmd->add_option("--threads", serve_threads, "Number of worker threads");

		CLI11_PARSE(app, argc, argv);

		auto cfg = ConfigLoader::load_or_default(config_path);
		if (!cfg)
			return fail(cfg.error());

		if (auto logging = init_logging(cfg->logging); !logging)
			return fail(logging.error());

		if (*cfg_cmd)
		{
			std::cout << ConfigLoader::to_json(*cfg).dump(2) << std::endl;
			return 0;
		}

		if (*rotate_cmd)
		{
			if (!cfg->signer.persist_keys)
			{
				std::cerr << "rotate-key requires signer.persist_keys = true" << std::endl;
				return 1;
			}
			auto kek = crypto::KeyManager::encryption_key_or_dev(cfg->key_encryption_key);
			auto store = crypto::KeyManager::load_or_create(cfg->signer.key_dir, kek);
			if (!store)
				return fail(store.error());
			auto index = crypto::KeyManager::rotate_keys(*store, cfg->signer.key_dir, kek);
			if (!index)
				return fail(index.error());
			auto key = store->current_key();
			if (!key)
				return fail(key.error());

			AuditLogger(cfg->logging.audit_enabled, cfg->device_id)
				.log("key_rotated", key->key_id(), "success", {{"key_index", *index}});
			std::cout << nlohmann::json{{"key_index", *index}, {"key_id", key->key_id()}}.dump(2) << std::endl;
			return 0;
		}

		if (!*record_cmd && !*verify_cmd && !*chain_cmd && !*status_cmd && !*list_cmd && !*serve_cmd)
		{
			std::cout << app.help() << std::endl;
			return 0;
		}

		auto rt = open_runtime(*cfg);
		if (!rt)
			return fail(rt.error());

		if (*record_cmd)
		{
			auto payload = nlohmann::json::parse(record_payload, nullptr, false);
			if (payload.is_discarded() || !payload.is_object())
			{
				std::cerr << "--payload must be a JSON object" << std::endl;
				return 1;
			}
			auto bytes = read_file(record_artifact);
			if (!bytes)
				return fail(bytes.error());

			Trigger trigger{record_type, payload};
			Artifact artifact{std::move(*bytes),
							  record_reference.empty() ? record_artifact : record_reference,
							  record_encoding};
			auto record = rt->engine->create_record(trigger, artifact);
			if (!record)
			{
				if (!record.error().subject.empty())
					std::cerr << "orphaned event: " << record.error().subject << std::endl;
				return fail(record.error());
			}
			std::cout << record->to_json().dump(2) << std::endl;
			return 0;
		}

		if (*verify_cmd)
		{
			auto result = rt->engine->verify_event(verify_id);
			if (!result)
				return fail(result.error());
			std::cout << result->to_json().dump(2) << std::endl;
			return result->valid ? 0 : 2;
		}

		if (*chain_cmd)
		{
			auto result = rt->engine->verify_chain();
			if (!result)
				return fail(result.error());
			std::cout << result->to_json().dump(2) << std::endl;
			return result->valid ? 0 : 2;
		}

		if (*status_cmd)
		{
			auto status = rt->engine->chain_status();
			if (!status)
				return fail(status.error());
			std::cout << status->to_json().dump(2) << std::endl;
			return 0;
		}

		if (*list_cmd)
		{
			auto events = rt->engine->list_events(list_limit, list_offset);
			if (!events)
				return fail(events.error());
			nlohmann::json out = nlohmann::json::array();
			for (const auto &e : *events)
				out.push_back(e.to_json());
			std::cout << out.dump(2) << std::endl;
			return 0;
		}

		if (*serve_cmd)
		{
			nlohmann::json info{{"device_id", rt->cfg.device_id},
								{"storage", rt->storage->path()},
								{"signer_mode", rt->cfg.signer.mode}};
			WebServerConfig wsc{
				rt->cfg.server.bind,
				serve_port.value_or(rt->cfg.server.port),
				serve_threads.value_or(rt->cfg.server.threads),
				std::make_shared<ApiRouter>(rt->engine, info)};
			try
			{
				WebServer server(wsc);
				server.run();
			}
			catch (const std::exception &e)
			{
				spdlog::critical("HTTP server failed: {}", e.what());
				return 1;
			}
			return 0;
		}

		std::cout << app.help() << std::endl;
		return 0;
	}

} // namespace attest::cli
