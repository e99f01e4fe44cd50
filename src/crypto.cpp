#include "attest/crypto.hpp"
#include <sodium.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <format>
#include <fstream>
#include <limits>

using json = nlohmann::json;

namespace attest::crypto
{

    // Initialize libsodium on library load
    static struct SodiumInitializer
    {
        SodiumInitializer()
        {
            if (sodium_init() < 0)
            {
                throw std::runtime_error("Failed to initialize libsodium");
            }
        }
    } sodium_initializer;

    namespace
    {
        constexpr const char *kKeyFilePrefix = "signing_key_";
        constexpr const char *kKeyFileSuffix = ".json";
        constexpr int kKeyFileVersion = 1;

        std::string utc_now_seconds()
        {
            auto now = std::chrono::system_clock::now();
            auto time_t_now = std::chrono::system_clock::to_time_t(now);
            std::tm tm_utc;
            gmtime_r(&time_t_now, &tm_utc);
            char timestamp[32];
            std::strftime(timestamp, sizeof(timestamp), "%Y-%m-%dT%H:%M:%SZ", &tm_utc);
            return timestamp;
        }

        Bytes key_id_bytes(const std::string &key_id)
        {
            return Bytes(key_id.begin(), key_id.end());
        }
    } // namespace

    // ============================================================================
    // Ed25519KeyPair
    // ============================================================================

    Result<Ed25519KeyPair> Ed25519KeyPair::generate()
    {
        Ed25519KeyPair keypair;

        if (crypto_sign_keypair(keypair.public_key.data(), keypair.secret_key.data()) != 0)
        {
            return std::unexpected(AttestError::crypto("Failed to generate Ed25519 keypair"));
        }

        return keypair;
    }

    Result<Ed25519KeyPair> Ed25519KeyPair::from_keys(
        const Ed25519PublicKey &public_key,
        const Ed25519SecretKey &secret_key)
    {
        Ed25519PublicKey derived_pubkey;
        if (crypto_sign_ed25519_sk_to_pk(derived_pubkey.data(), secret_key.data()) != 0)
        {
            return std::unexpected(AttestError::crypto("Invalid secret key"));
        }

        if (std::memcmp(public_key.data(), derived_pubkey.data(), public_key.size()) != 0)
        {
            return std::unexpected(AttestError::crypto("Public key does not match secret key"));
        }

        Ed25519KeyPair keypair;
        keypair.public_key = public_key;
        keypair.secret_key = secret_key;
        return keypair;
    }

    Ed25519Signature Ed25519KeyPair::sign(const Bytes &message) const
    {
        Ed25519Signature signature;
        unsigned long long sig_len;

        crypto_sign_detached(
            signature.data(),
            &sig_len,
            message.data(),
            message.size(),
            secret_key.data());

        return signature;
    }

    bool Ed25519KeyPair::verify(
        const Bytes &message,
        const Ed25519Signature &signature,
        const Ed25519PublicKey &public_key)
    {
        return crypto_sign_verify_detached(
                   signature.data(),
                   message.data(),
                   message.size(),
                   public_key.data()) == 0;
    }

    // ============================================================================
    // AES256GCM
    // ============================================================================

    Result<Bytes> AES256GCM::encrypt(
        const AESKey &key,
        const Bytes &plaintext,
        const Bytes &associated_data)
    {
        if (crypto_aead_aes256gcm_is_available() == 0)
        {
            return std::unexpected(AttestError::crypto("AES-256-GCM not supported on this CPU"));
        }

        AESNonce nonce;
        randombytes_buf(nonce.data(), nonce.size());

        Bytes output(nonce.size() + plaintext.size() + crypto_aead_aes256gcm_ABYTES);
        std::copy(nonce.begin(), nonce.end(), output.begin());

        unsigned long long ciphertext_len;
        if (crypto_aead_aes256gcm_encrypt(
                output.data() + nonce.size(),
                &ciphertext_len,
                plaintext.data(),
                plaintext.size(),
                associated_data.data(),
                associated_data.size(),
                nullptr,
                nonce.data(),
                key.data()) != 0)
        {
            return std::unexpected(AttestError::crypto("AES-256-GCM encryption failed"));
        }

        output.resize(nonce.size() + ciphertext_len);
        return output;
    }

    Result<Bytes> AES256GCM::decrypt(
        const AESKey &key,
        const Bytes &ciphertext_with_nonce,
        const Bytes &associated_data)
    {
        if (crypto_aead_aes256gcm_is_available() == 0)
        {
            return std::unexpected(AttestError::crypto("AES-256-GCM not supported on this CPU"));
        }

        constexpr size_t nonce_len = std::tuple_size_v<AESNonce>;
        if (ciphertext_with_nonce.size() < nonce_len + crypto_aead_aes256gcm_ABYTES)
        {
            return std::unexpected(AttestError::crypto("Ciphertext too short"));
        }

        AESNonce nonce;
        std::copy_n(ciphertext_with_nonce.begin(), nonce_len, nonce.begin());

        Bytes plaintext(ciphertext_with_nonce.size() - nonce_len - crypto_aead_aes256gcm_ABYTES);
        unsigned long long plaintext_len;

        if (crypto_aead_aes256gcm_decrypt(
                plaintext.data(),
                &plaintext_len,
                nullptr,
                ciphertext_with_nonce.data() + nonce_len,
                ciphertext_with_nonce.size() - nonce_len,
                associated_data.data(),
                associated_data.size(),
                nonce.data(),
                key.data()) != 0)
        {
            return std::unexpected(AttestError::crypto("AES-256-GCM decryption failed (authentication failed)"));
        }

        plaintext.resize(plaintext_len);
        return plaintext;
    }

    AESKey AES256GCM::generate_key()
    {
        AESKey key;
        crypto_aead_aes256gcm_keygen(key.data());
        return key;
    }

    // ============================================================================
    // SHA256
    // ============================================================================

    SHA256Hash SHA256::hash(const Bytes &data)
    {
        SHA256Hash output;
        crypto_hash_sha256(output.data(), data.data(), data.size());
        return output;
    }

    SHA256Hash SHA256::hash(const std::string &data)
    {
        SHA256Hash output;
        crypto_hash_sha256(output.data(),
                           reinterpret_cast<const uint8_t *>(data.data()),
                           data.size());
        return output;
    }

    std::string SHA256::to_hex(const SHA256Hash &hash)
    {
        std::string hex(hash.size() * 2 + 1, '\0');
        sodium_bin2hex(hex.data(), hex.size(), hash.data(), hash.size());
        hex.resize(hash.size() * 2);
        return hex;
    }

    std::string SHA256::hex_digest(const Bytes &data)
    {
        return to_hex(hash(data));
    }

    std::string SHA256::hex_digest(const std::string &data)
    {
        return to_hex(hash(data));
    }

    // ============================================================================
    // Base64
    // ============================================================================

    std::string Base64::encode(const Bytes &data)
    {
        size_t b64_len = sodium_base64_encoded_len(data.size(), sodium_base64_VARIANT_ORIGINAL);
        std::string encoded(b64_len, '\0');

        sodium_bin2base64(
            encoded.data(),
            b64_len,
            data.data(),
            data.size(),
            sodium_base64_VARIANT_ORIGINAL);

        // Drop the trailing NUL written by libsodium
        encoded.resize(std::strlen(encoded.c_str()));
        return encoded;
    }

    Result<Bytes> Base64::decode(const std::string &encoded)
    {
        Bytes decoded(encoded.size());
        size_t decoded_len;

        if (sodium_base642bin(
                decoded.data(),
                decoded.size(),
                encoded.c_str(),
                encoded.size(),
                nullptr,
                &decoded_len,
                nullptr,
                sodium_base64_VARIANT_ORIGINAL) != 0)
        {
            return std::unexpected(AttestError::crypto("Invalid base64 encoding"));
        }

        decoded.resize(decoded_len);
        return decoded;
    }

    // ============================================================================
    // SecureRandom
    // ============================================================================

    void SecureRandom::fill_bytes(Bytes &buffer)
    {
        randombytes_buf(buffer.data(), buffer.size());
    }

    Bytes SecureRandom::generate_bytes(size_t n)
    {
        Bytes buffer(n);
        randombytes_buf(buffer.data(), n);
        return buffer;
    }

    std::string SecureRandom::uuid_v4()
    {
        std::array<uint8_t, 16> b;
        randombytes_buf(b.data(), b.size());
        b[6] = static_cast<uint8_t>((b[6] & 0x0F) | 0x40); // version 4
        b[8] = static_cast<uint8_t>((b[8] & 0x3F) | 0x80); // RFC 4122 variant

        std::string out;
        out.reserve(36);
        for (size_t i = 0; i < b.size(); ++i)
        {
            if (i == 4 || i == 6 || i == 8 || i == 10)
                out += '-';
            out += std::format("{:02x}", b[i]);
        }
        return out;
    }

    // ============================================================================
    // SigningKey
    // ============================================================================

    Result<SigningKey> SigningKey::generate()
    {
        auto kp = Ed25519KeyPair::generate();
        if (!kp)
        {
            return std::unexpected(kp.error());
        }
        return from_keypair(*kp);
    }

    SigningKey SigningKey::from_keypair(const Ed25519KeyPair &kp)
    {
        SigningKey key;
        key.keypair = kp;
        return key;
    }

    std::string SigningKey::key_id() const
    {
        auto digest = SHA256::hex_digest(Bytes(keypair.public_key.begin(), keypair.public_key.end()));
        return "ed25519:" + digest.substr(0, 16);
    }

    std::string SigningKey::public_key_b64() const
    {
        return Base64::encode(Bytes(keypair.public_key.begin(), keypair.public_key.end()));
    }

    Ed25519Signature SigningKey::sign(const Bytes &message) const
    {
        return keypair.sign(message);
    }

    bool SigningKey::verify(const Bytes &message, const Bytes &signature) const
    {
        Ed25519Signature sig;
        if (signature.size() != sig.size())
        {
            return false;
        }
        std::copy(signature.begin(), signature.end(), sig.begin());
        return Ed25519KeyPair::verify(message, sig, keypair.public_key);
    }

    Result<std::pair<SigningKey, uint32_t>> SigningKey::load_encrypted(
        const std::string &path,
        const AESKey &encryption_key)
    {
        std::ifstream file(path);
        if (!file)
        {
            return std::unexpected(AttestError(ErrorCode::IOError, std::format("Failed to open key file: {}", path)));
        }

        json j;
        try
        {
            file >> j;
        }
        catch (const json::exception &e)
        {
            return std::unexpected(AttestError(ErrorCode::ParsingError, std::format("Invalid JSON in key file {}: {}", path, e.what())));
        }

        if (!j.is_object() || !j.contains("encrypted_secret_key_b64") || !j.contains("public_key_b64") ||
            !j.contains("key_index") || !j.contains("key_id"))
        {
            return std::unexpected(AttestError::validation(std::format("Missing required fields in key file {}", path)));
        }
        if (!j["key_id"].is_string() || !j["encrypted_secret_key_b64"].is_string() ||
            !j["public_key_b64"].is_string() || !j["key_index"].is_number_unsigned() ||
            j["key_index"].get<uint64_t>() > std::numeric_limits<uint32_t>::max())
        {
            return std::unexpected(AttestError(ErrorCode::ParsingError, std::format("Wrong field types in key file {}", path)));
        }

        auto key_id = j["key_id"].get<std::string>();
        auto key_index = j["key_index"].get<uint32_t>();
        auto encrypted = Base64::decode(j["encrypted_secret_key_b64"].get<std::string>());
        if (!encrypted)
        {
            return std::unexpected(encrypted.error());
        }
        auto pub = Base64::decode(j["public_key_b64"].get<std::string>());
        if (!pub)
        {
            return std::unexpected(pub.error());
        }

        auto secret = AES256GCM::decrypt(encryption_key, *encrypted, key_id_bytes(key_id));
        if (!secret)
        {
            return std::unexpected(secret.error());
        }

        Ed25519PublicKey pk;
        Ed25519SecretKey sk;
        if (pub->size() != pk.size() || secret->size() != sk.size())
        {
            return std::unexpected(AttestError::validation(std::format("Invalid key length in {}", path)));
        }
        std::copy(pub->begin(), pub->end(), pk.begin());
        std::copy(secret->begin(), secret->end(), sk.begin());
        sodium_memzero(secret->data(), secret->size());

        auto kp = Ed25519KeyPair::from_keys(pk, sk);
        sodium_memzero(sk.data(), sk.size());
        if (!kp)
        {
            return std::unexpected(kp.error());
        }

        auto key = from_keypair(*kp);
        if (key.key_id() != key_id)
        {
            return std::unexpected(AttestError::validation(std::format("Key id mismatch in {}", path)));
        }
        return std::make_pair(key, key_index);
    }

    Result<void> SigningKey::save_encrypted(
        const std::string &path,
        const AESKey &encryption_key,
        uint32_t key_index) const
    {
        auto id = key_id();
        Bytes secret(keypair.secret_key.begin(), keypair.secret_key.end());
        auto encrypted = AES256GCM::encrypt(encryption_key, secret, key_id_bytes(id));
        sodium_memzero(secret.data(), secret.size());
        if (!encrypted)
        {
            return std::unexpected(encrypted.error());
        }

        json j;
        j["version"] = kKeyFileVersion;
        j["key_index"] = key_index;
        j["key_id"] = id;
        j["algorithm"] = "Ed25519";
        j["public_key_b64"] = public_key_b64();
        j["encrypted_secret_key_b64"] = Base64::encode(*encrypted);
        j["created_at"] = utc_now_seconds();

        std::filesystem::path p(path);
        std::error_code ec;
        if (p.has_parent_path())
        {
            std::filesystem::create_directories(p.parent_path(), ec);
            if (ec)
            {
                return std::unexpected(AttestError(ErrorCode::IOError, std::format("Failed to create key directory: {}", ec.message())));
            }
        }

        std::ofstream file(path, std::ios::trunc);
        if (!file)
        {
            return std::unexpected(AttestError(ErrorCode::IOError, std::format("Failed to open key file for writing: {}", path)));
        }
        file << j.dump(2);
        if (!file)
        {
            return std::unexpected(AttestError(ErrorCode::IOError, std::format("Failed to write key file: {}", path)));
        }
        std::filesystem::permissions(p, std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
                                     std::filesystem::perm_options::replace, ec);
        return {};
    }

    // ============================================================================
    // KeyStore
    // ============================================================================

    KeyStore::KeyStore() : current_key_index(0) {}

    void KeyStore::add_key(uint32_t key_index, const SigningKey &key)
    {
        keys.insert_or_assign(key_index, key);
        if (key_index > current_key_index)
        {
            current_key_index = key_index;
        }
    }

    Result<SigningKey> KeyStore::current_key() const
    {
        if (keys.empty())
        {
            return std::unexpected(AttestError::not_found("KeyStore is empty"));
        }
        return get_key(current_key_index);
    }

    Result<SigningKey> KeyStore::get_key(uint32_t key_index) const
    {
        auto it = keys.find(key_index);
        if (it == keys.end())
        {
            return std::unexpected(AttestError::not_found(std::format("Key index {} not found", key_index)));
        }
        return it->second;
    }

    std::optional<SigningKey> KeyStore::find_key(const std::string &key_id) const
    {
        for (const auto &[_, key] : keys)
        {
            if (key.key_id() == key_id)
                return key;
        }
        return std::nullopt;
    }

    Result<uint32_t> KeyStore::rotate_key()
    {
        auto key = SigningKey::generate();
        if (!key)
        {
            return std::unexpected(key.error());
        }
        uint32_t new_index = current_key_index + 1;
        add_key(new_index, *key);
        return new_index;
    }

    std::vector<uint32_t> KeyStore::key_indices() const
    {
        std::vector<uint32_t> indices;
        indices.reserve(keys.size());
        for (const auto &[idx, _] : keys)
        {
            indices.push_back(idx);
        }
        return indices;
    }

    Result<KeyStore> KeyStore::load_from_directory(
        const std::string &dir_path,
        const AESKey &encryption_key)
    {
        if (!std::filesystem::is_directory(dir_path))
        {
            return std::unexpected(AttestError::not_found(std::format("Key directory not found: {}", dir_path)));
        }

        KeyStore store;
        for (const auto &entry : std::filesystem::directory_iterator(dir_path))
        {
            if (!entry.is_regular_file())
                continue;

            std::string filename = entry.path().filename().string();
            if (!filename.starts_with(kKeyFilePrefix) || !filename.ends_with(kKeyFileSuffix))
                continue;

            auto loaded = SigningKey::load_encrypted(entry.path().string(), encryption_key);
            if (!loaded)
            {
                return std::unexpected(loaded.error());
            }
            store.add_key(loaded->second, loaded->first);
        }

        if (store.keys.empty())
        {
            return std::unexpected(AttestError::not_found(std::format("No signing keys in {}", dir_path)));
        }
        return store;
    }

    Result<void> KeyStore::save_to_directory(
        const std::string &dir_path,
        const AESKey &encryption_key) const
    {
        for (const auto &[key_index, key] : keys)
        {
            auto filename = std::format("{}{:04d}{}", kKeyFilePrefix, key_index, kKeyFileSuffix);
            auto filepath = (std::filesystem::path(dir_path) / filename).string();
            if (std::filesystem::exists(filepath))
                continue; // key files are write-once

            if (auto res = key.save_encrypted(filepath, encryption_key, key_index); !res)
            {
                return res;
            }
        }
        return {};
    }

    // ============================================================================
    // KeyManager
    // ============================================================================

    AESKey KeyManager::encryption_key_or_dev(const std::optional<AESKey> &configured)
    {
        if (configured)
            return *configured;

        spdlog::warn("No key-encryption key configured (ATTEST_KEY_ENCRYPTION_KEY); "
                     "software signing keys are protected by the development key");
        AESKey dev_key{};
        return dev_key;
    }

    Result<KeyStore> KeyManager::load_or_create(
        const std::string &dir_path,
        const AESKey &encryption_key)
    {
        auto loaded = KeyStore::load_from_directory(dir_path, encryption_key);
        if (loaded)
        {
            if (auto checked = verify_key_store(*loaded); !checked)
            {
                return std::unexpected(checked.error());
            }
            spdlog::info("Loaded {} software signing key(s) from {}", loaded->key_indices().size(), dir_path);
            return loaded;
        }
        if (loaded.error().code != ErrorCode::NotFound)
        {
            // Existing but unreadable keys must not be silently replaced
            return std::unexpected(loaded.error());
        }

        KeyStore store;
        auto idx = store.rotate_key();
        if (!idx)
        {
            return std::unexpected(idx.error());
        }
        if (auto saved = store.save_to_directory(dir_path, encryption_key); !saved)
        {
            return std::unexpected(saved.error());
        }
        spdlog::info("Created software signing key {} in {}", store.current_key()->key_id(), dir_path);
        return store;
    }

    Result<KeyStore> KeyManager::ephemeral()
    {
        KeyStore store;
        auto idx = store.rotate_key();
        if (!idx)
        {
            return std::unexpected(idx.error());
        }
        spdlog::warn("Using ephemeral software signing key {}; its signatures will not verify after restart",
                     store.current_key()->key_id());
        return store;
    }

    Result<uint32_t> KeyManager::rotate_keys(
        KeyStore &store,
        const std::string &dir_path,
        const AESKey &encryption_key)
    {
        auto new_index = store.rotate_key();
        if (!new_index)
        {
            return std::unexpected(new_index.error());
        }

        if (auto saved = store.save_to_directory(dir_path, encryption_key); !saved)
        {
            return std::unexpected(saved.error());
        }
        return *new_index;
    }

    Result<void> KeyManager::verify_key_store(const KeyStore &store)
    {
        if (store.empty())
        {
            return std::unexpected(AttestError::validation("KeyStore is empty"));
        }

        Bytes sample = {0x01, 0x02, 0x03, 0x04};
        for (uint32_t idx : store.key_indices())
        {
            auto key = store.get_key(idx);
            if (!key)
            {
                return std::unexpected(key.error());
            }
            auto sig = key->sign(sample);
            if (!key->verify(sample, Bytes(sig.begin(), sig.end())))
            {
                return std::unexpected(AttestError::crypto(std::format("Key {} failed verification", idx)));
            }
        }
        return {};
    }

} // namespace attest::crypto
