#include "attest/config.hpp"
#include <toml++/toml.h>
#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <limits>
#include <sstream>

namespace attest
{
    namespace
    {
        Result<std::optional<crypto::AESKey>> env_encryption_key()
        {
            const char *env = std::getenv("ATTEST_KEY_ENCRYPTION_KEY");
            if (!env || !*env)
                return std::optional<crypto::AESKey>{};
            auto decoded = crypto::Base64::decode(env);
            if (!decoded || decoded->size() != 32)
            {
                return std::unexpected(AttestError::config(
                    "ATTEST_KEY_ENCRYPTION_KEY must be 32 bytes when base64-decoded"));
            }
            crypto::AESKey key{};
            std::copy_n(decoded->begin(), 32, key.begin());
            return std::optional<crypto::AESKey>(key);
        }

        bool env_flag(const char *value)
        {
            std::string v(value);
            return !(v == "0" || v == "false" || v == "no" || v == "off");
        }

        template <typename T>
        Result<T> env_number(const char *name, const char *value)
        {
            T out{};
            std::string_view sv(value);
            auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), out);
            if (ec != std::errc{} || ptr != sv.data() + sv.size())
            {
                return std::unexpected(AttestError::config(std::format("{} is not a valid number: {}", name, value)));
            }
            return out;
        }

        Result<AttestConfig> parse_toml(const toml::table &tbl, AttestConfig cfg)
        {
            if (auto device = tbl["device_id"].value<std::string>())
                cfg.device_id = *device;

            if (auto storage = tbl["storage"].as_table())
            {
                if (auto path = (*storage)["rocksdb_path"].value<std::string>())
                    cfg.storage.rocksdb_path = *path;
                if (auto sync = (*storage)["sync_writes"].value<bool>())
                    cfg.storage.sync_writes = *sync;
            }

            if (auto signer = tbl["signer"].as_table())
            {
                if (auto mode = (*signer)["mode"].value<std::string>())
                    cfg.signer.mode = *mode;
                if (auto dir = (*signer)["key_dir"].value<std::string>())
                    cfg.signer.key_dir = *dir;
                if (auto persist = (*signer)["persist_keys"].value<bool>())
                    cfg.signer.persist_keys = *persist;
                if (auto timeout = (*signer)["sign_timeout_ms"].value<int64_t>())
                    cfg.signer.sign_timeout = std::chrono::milliseconds(*timeout);
            }

            if (auto logging = tbl["logging"].as_table())
            {
                if (auto level = (*logging)["level"].value<std::string>())
                    cfg.logging.level = *level;
                if (auto file = (*logging)["file"].value<std::string>())
                    cfg.logging.file = *file;
                if (auto audit = (*logging)["audit_enabled"].value<bool>())
                    cfg.logging.audit_enabled = *audit;
            }

            if (auto server = tbl["server"].as_table())
            {
                if (auto bind = (*server)["bind"].value<std::string>())
                    cfg.server.bind = *bind;
                if (auto port = (*server)["port"].value<int64_t>())
                {
                    if (*port < 0 || *port > std::numeric_limits<std::uint16_t>::max())
                        return std::unexpected(AttestError::config(std::format("server.port out of range: {}", *port)));
                    cfg.server.port = static_cast<std::uint16_t>(*port);
                }
                if (auto threads = (*server)["threads"].value<int64_t>())
                {
                    if (*threads < 1)
                        return std::unexpected(AttestError::config(std::format("server.threads out of range: {}", *threads)));
                    cfg.server.threads = static_cast<std::size_t>(*threads);
                }
            }

            return cfg;
        }

    } // namespace

    Result<AttestConfig> ConfigLoader::load(const std::string &path)
    {
        std::ifstream file(path);
        if (!file.is_open())
        {
            return std::unexpected(AttestError::config("Unable to open config file: " + path));
        }
        std::stringstream buffer;
        buffer << file.rdbuf();
        return from_string(buffer.str());
    }

    Result<AttestConfig> ConfigLoader::load_or_default(const std::string &path)
    {
        if (!path.empty() && std::filesystem::exists(path))
            return load(path);
        return from_string("");
    }

    Result<AttestConfig> ConfigLoader::from_string(const std::string &toml_content)
    {
        AttestConfig cfg{};

        try
        {
            auto tbl = toml::parse(toml_content);
            auto parsed = parse_toml(tbl, cfg);
            if (!parsed)
                return std::unexpected(parsed.error());
            cfg = std::move(*parsed);
        }
        catch (const toml::parse_error &e)
        {
            return std::unexpected(AttestError::config(std::format("Failed to parse TOML: {}", e.description())));
        }

        if (auto env = apply_env_overrides(cfg); !env)
            return std::unexpected(env.error());
        if (auto valid = validate(cfg); !valid)
            return std::unexpected(valid.error());
        return cfg;
    }

    Result<void> ConfigLoader::apply_env_overrides(AttestConfig &cfg)
    {
        if (const char *device = std::getenv("ATTEST_DEVICE_ID"))
            cfg.device_id = device;
        if (const char *path = std::getenv("ATTEST_ROCKSDB_PATH"))
            cfg.storage.rocksdb_path = path;
        if (const char *sync = std::getenv("ATTEST_SYNC_WRITES"))
            cfg.storage.sync_writes = env_flag(sync);
        if (const char *mode = std::getenv("ATTEST_SIGNER_MODE"))
            cfg.signer.mode = mode;
        if (const char *dir = std::getenv("ATTEST_KEY_DIR"))
            cfg.signer.key_dir = dir;
        if (const char *persist = std::getenv("ATTEST_PERSIST_KEYS"))
            cfg.signer.persist_keys = env_flag(persist);
        if (const char *timeout = std::getenv("ATTEST_SIGN_TIMEOUT_MS"))
        {
            auto ms = env_number<int64_t>("ATTEST_SIGN_TIMEOUT_MS", timeout);
            if (!ms)
                return std::unexpected(ms.error());
            cfg.signer.sign_timeout = std::chrono::milliseconds(*ms);
        }
        if (const char *level = std::getenv("ATTEST_LOG_LEVEL"))
            cfg.logging.level = level;
        if (const char *file = std::getenv("ATTEST_LOG_FILE"))
            cfg.logging.file = file;
        if (const char *port = std::getenv("ATTEST_PORT"))
        {
            auto p = env_number<std::uint16_t>("ATTEST_PORT", port);
            if (!p)
                return std::unexpected(p.error());
            cfg.server.port = *p;
        }

        auto key = env_encryption_key();
        if (!key)
            return std::unexpected(key.error());
        if (*key)
            cfg.key_encryption_key = *key;
        return {};
    }

    Result<void> ConfigLoader::validate(const AttestConfig &cfg)
    {
        if (cfg.signer.mode != "auto" && cfg.signer.mode != "software" && cfg.signer.mode != "hardware")
            return std::unexpected(AttestError::config(std::format("Unknown signer.mode: {}", cfg.signer.mode)));
        if (cfg.signer.sign_timeout.count() <= 0)
            return std::unexpected(AttestError::config("signer.sign_timeout_ms must be positive"));
        if (cfg.storage.rocksdb_path.empty())
            return std::unexpected(AttestError::config("storage.rocksdb_path must not be empty"));
        if (cfg.signer.persist_keys && cfg.signer.key_dir.empty())
            return std::unexpected(AttestError::config("signer.key_dir must not be empty"));

        static const char *levels[] = {"trace", "debug", "info", "warn", "error", "critical", "off"};
        if (std::find(std::begin(levels), std::end(levels), cfg.logging.level) == std::end(levels))
            return std::unexpected(AttestError::config(std::format("Unknown logging.level: {}", cfg.logging.level)));

        if (cfg.server.threads == 0)
            return std::unexpected(AttestError::config("server.threads must be at least 1"));
        return {};
    }

    nlohmann::json ConfigLoader::to_json(const AttestConfig &cfg)
    {
        nlohmann::json j;
        j["device_id"] = cfg.device_id;
        j["storage"] = {
            {"rocksdb_path", cfg.storage.rocksdb_path},
            {"sync_writes", cfg.storage.sync_writes}};
        j["signer"] = {
            {"mode", cfg.signer.mode},
            {"key_dir", cfg.signer.key_dir},
            {"persist_keys", cfg.signer.persist_keys},
            {"sign_timeout_ms", cfg.signer.sign_timeout.count()}};
        j["logging"] = {
            {"level", cfg.logging.level},
            {"file", cfg.logging.file},
            {"audit_enabled", cfg.logging.audit_enabled}};
        j["server"] = {
            {"bind", cfg.server.bind},
            {"port", cfg.server.port},
            {"threads", cfg.server.threads}};
        j["has_key_encryption_key"] = cfg.key_encryption_key.has_value();
        return j;
    }

} // namespace attest
