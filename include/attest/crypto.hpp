#pragma once

#include "types.hpp"
#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace attest::crypto
{

    using Bytes = std::vector<uint8_t>;
    using Ed25519PublicKey = std::array<uint8_t, 32>;
    using Ed25519SecretKey = std::array<uint8_t, 64>;
    using Ed25519Signature = std::array<uint8_t, 64>;
    using SHA256Hash = std::array<uint8_t, 32>;
    using AESKey = std::array<uint8_t, 32>;
    using AESNonce = std::array<uint8_t, 12>;

    /**
     * Ed25519 key pair for signing and verification
     */
    class Ed25519KeyPair
    {
    public:
        Ed25519PublicKey public_key;
        Ed25519SecretKey secret_key;

        /**
         * Generate a new random key pair
         */
        static Result<Ed25519KeyPair> generate();

        /**
         * Load from separate public/secret key bytes, checking they belong together
         */
        static Result<Ed25519KeyPair> from_keys(
            const Ed25519PublicKey &public_key,
            const Ed25519SecretKey &secret_key);

        /**
         * Sign a message, returns 64-byte detached signature
         */
        Ed25519Signature sign(const Bytes &message) const;

        /**
         * Verify detached signature against message
         */
        static bool verify(
            const Bytes &message,
            const Ed25519Signature &signature,
            const Ed25519PublicKey &public_key);
    };

    /**
     * AES-256-GCM encryption/decryption
     * Output format: [12-byte nonce][ciphertext][16-byte tag]
     */
    class AES256GCM
    {
    public:
        static Result<Bytes> encrypt(
            const AESKey &key,
            const Bytes &plaintext,
            const Bytes &associated_data = {});

        static Result<Bytes> decrypt(
            const AESKey &key,
            const Bytes &ciphertext_with_nonce,
            const Bytes &associated_data = {});

        static AESKey generate_key();
    };

    /**
     * SHA-256 hashing
     */
    class SHA256
    {
    public:
        static SHA256Hash hash(const Bytes &data);
        static SHA256Hash hash(const std::string &data);

        /** Lowercase hex of the digest */
        static std::string to_hex(const SHA256Hash &hash);

        /** Shorthand for to_hex(hash(data)) */
        static std::string hex_digest(const Bytes &data);
        static std::string hex_digest(const std::string &data);
    };

    /**
     * Base64 encoding/decoding (standard alphabet, padded)
     */
    class Base64
    {
    public:
        static std::string encode(const Bytes &data);
        static Result<Bytes> decode(const std::string &encoded);
    };

    /**
     * Cryptographically secure random number generation
     */
    class SecureRandom
    {
    public:
        static void fill_bytes(Bytes &buffer);
        static Bytes generate_bytes(size_t n);

        /**
         * RFC 4122 version 4 UUID in canonical 8-4-4-4-12 lowercase form
         */
        static std::string uuid_v4();
    };

    /**
     * Ed25519 signing key used by the software signer.
     * Identified by a key id derived from its public key.
     */
    class SigningKey
    {
    private:
        Ed25519KeyPair keypair;

    public:
        static Result<SigningKey> generate();
        static SigningKey from_keypair(const Ed25519KeyPair &kp);

        /**
         * "ed25519:" followed by the first 16 hex chars of SHA-256(public key)
         */
        std::string key_id() const;

        std::string public_key_b64() const;

        Ed25519Signature sign(const Bytes &message) const;
        bool verify(const Bytes &message, const Bytes &signature) const;

        /**
         * Load an encrypted key file. Returns (key, key_index).
         */
        static Result<std::pair<SigningKey, uint32_t>> load_encrypted(
            const std::string &path,
            const AESKey &encryption_key);

        Result<void> save_encrypted(
            const std::string &path,
            const AESKey &encryption_key,
            uint32_t key_index) const;

        const Ed25519KeyPair &get_keypair() const { return keypair; }
    };

    /**
     * Versioned set of software signing keys. The highest index is current;
     * older keys stay available to verify historical signatures.
     */
    class KeyStore
    {
    private:
        std::map<uint32_t, SigningKey> keys;
        uint32_t current_key_index;

    public:
        KeyStore();

        void add_key(uint32_t key_index, const SigningKey &key);

        Result<SigningKey> current_key() const;
        Result<SigningKey> get_key(uint32_t key_index) const;

        /** Look up a key by its key id */
        std::optional<SigningKey> find_key(const std::string &key_id) const;

        /**
         * Generate and add a new key, making it current.
         * Returns the new key index.
         */
        Result<uint32_t> rotate_key();

        std::vector<uint32_t> key_indices() const;
        bool empty() const { return keys.empty(); }

        static Result<KeyStore> load_from_directory(
            const std::string &dir_path,
            const AESKey &encryption_key);

        Result<void> save_to_directory(
            const std::string &dir_path,
            const AESKey &encryption_key) const;
    };

    /**
     * Key store lifecycle helpers
     */
    class KeyManager
    {
    public:
        /**
         * Use the configured key-encryption key, or the fixed development key
         * (logged as a warning) when none is configured.
         */
        static AESKey encryption_key_or_dev(const std::optional<AESKey> &configured);

        /**
         * Load the key store from dir_path, creating it with one key if the
         * directory holds no keys.
         */
        static Result<KeyStore> load_or_create(
            const std::string &dir_path,
            const AESKey &encryption_key);

        /**
         * Process-lifetime key store with a single fresh key. Signatures made
         * with it cannot be verified after a restart.
         */
        static Result<KeyStore> ephemeral();

        /**
         * Rotate and persist. Returns the new key index.
         */
        static Result<uint32_t> rotate_keys(
            KeyStore &store,
            const std::string &dir_path,
            const AESKey &encryption_key);

        /** Sign/verify round trip over every key */
        static Result<void> verify_key_store(const KeyStore &store);
    };

} // namespace attest::crypto
