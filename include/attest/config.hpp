#pragma once

#include "types.hpp"
#include "crypto.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace attest
{

    struct StorageConfig
    {
        std::string rocksdb_path{"./data/provenance"};
        bool sync_writes{true};
    };

    struct SignerConfig
    {
        std::string mode{"auto"}; // auto | software | hardware
        std::string key_dir{"./keys"};
        bool persist_keys{true};
        std::chrono::milliseconds sign_timeout{2000};
    };

    struct LoggingConfig
    {
        std::string level{"info"};
        std::string file; // empty: console only
        bool audit_enabled{true};
    };

    struct ServerConfig
    {
        std::string bind{"0.0.0.0"};
        std::uint16_t port{3000};
        std::size_t threads{2};
    };

    struct AttestConfig
    {
        std::string device_id{"camera-01"};
        StorageConfig storage{};
        SignerConfig signer{};
        LoggingConfig logging{};
        ServerConfig server{};
        std::optional<crypto::AESKey> key_encryption_key; // from ATTEST_KEY_ENCRYPTION_KEY
    };

    /**
     * ConfigLoader reads a TOML file, then applies ATTEST_* environment
     * overrides, then validates.
     */
    class ConfigLoader
    {
    public:
        static Result<AttestConfig> load(const std::string &path);

        /** Load path if it exists, defaults plus environment otherwise */
        static Result<AttestConfig> load_or_default(const std::string &path);

        static Result<AttestConfig> from_string(const std::string &toml_content);

        /** Effective configuration without secrets */
        static nlohmann::json to_json(const AttestConfig &cfg);

        static Result<void> validate(const AttestConfig &cfg);

    private:
        static Result<void> apply_env_overrides(AttestConfig &cfg);
    };

} // namespace attest
