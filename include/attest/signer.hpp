#pragma once

#include "types.hpp"
#include "crypto.hpp"
#include "event_record.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace attest
{

    inline constexpr const char *kHardwareAlgorithm = "ECDSA-P256-SHA256";
    inline constexpr const char *kSoftwareAlgorithm = "Ed25519";

    /**
     * Output of Signer::sign, and the input Signer::verify needs to check it.
     */
    struct SignResult
    {
        crypto::Bytes signature;
        std::string algorithm;
        std::string key_id;
        TrustLevel trust{TrustLevel::Absent};

        SignatureMetadata metadata() const { return SignatureMetadata{algorithm, key_id, trust}; }
        std::string signature_b64() const { return crypto::Base64::encode(signature); }

        /** Rebuild from what the event store keeps */
        static Result<SignResult> from_stored(const std::string &signature_b64,
                                              const SignatureMetadata &metadata);
    };

    /**
     * Sign bytes / verify a signature over bytes.
     */
    class Signer
    {
    public:
        virtual ~Signer() = default;

        virtual Result<SignResult> sign(const crypto::Bytes &message) = 0;

        /**
         * True only if the signature is valid AND result.trust selects this
         * signer's routine. Mismatched trust, algorithm or key id is rejected.
         */
        virtual bool verify(const crypto::Bytes &message, const SignResult &result) const = 0;

        virtual TrustLevel trust() const = 0;

        virtual nlohmann::json status() const = 0;
    };

    /**
     * Port to a physical secure element (ATECC608-class). The bus protocol
     * lives in the driver implementing this interface.
     */
    class SecureElement
    {
    public:
        virtual ~SecureElement() = default;

        /** Identifier of the key slot used for signing, e.g. ATECC608-SLOT0 */
        virtual std::string key_id() const = 0;

        /** Raw r||s ECDSA P-256 signature over a 32-byte digest */
        virtual Result<crypto::Bytes> sign_digest(const crypto::SHA256Hash &digest) = 0;

        virtual Result<bool> verify_digest(const crypto::SHA256Hash &digest,
                                           const crypto::Bytes &signature) = 0;

        virtual std::string describe() const = 0;
    };

    class HardwareSigner : public Signer
    {
    public:
        explicit HardwareSigner(std::shared_ptr<SecureElement> element);

        Result<SignResult> sign(const crypto::Bytes &message) override;
        bool verify(const crypto::Bytes &message, const SignResult &result) const override;
        TrustLevel trust() const override { return TrustLevel::Hardware; }
        nlohmann::json status() const override;

    private:
        std::shared_ptr<SecureElement> element_;
        mutable std::mutex bus_mutex_; // one command on the bus at a time
    };

    class SoftwareSigner : public Signer
    {
    public:
        explicit SoftwareSigner(crypto::KeyStore keys);

        Result<SignResult> sign(const crypto::Bytes &message) override;
        bool verify(const crypto::Bytes &message, const SignResult &result) const override;
        TrustLevel trust() const override { return TrustLevel::Software; }
        nlohmann::json status() const override;

        const crypto::KeyStore &key_store() const { return keys_; }

    private:
        crypto::KeyStore keys_;
    };

    /**
     * Hardware first, software on hardware error or timeout. At most one
     * hardware call is outstanding; while a timed-out call is still stuck on
     * the element, signing goes straight to software. Verification
     * dispatches on the stored trust tag.
     */
    class FallbackSigner : public Signer
    {
    public:
        FallbackSigner(std::shared_ptr<HardwareSigner> hardware,
                       std::shared_ptr<SoftwareSigner> software,
                       std::chrono::milliseconds timeout);

        Result<SignResult> sign(const crypto::Bytes &message) override;
        bool verify(const crypto::Bytes &message, const SignResult &result) const override;

        /** Trust level of the preferred path */
        TrustLevel trust() const override;
        nlohmann::json status() const override;

    private:
        std::shared_ptr<HardwareSigner> hardware_;
        std::shared_ptr<SoftwareSigner> software_;
        std::chrono::milliseconds timeout_;
        std::atomic<uint64_t> hardware_signatures_{0};
        std::atomic<uint64_t> software_signatures_{0};
        std::atomic<uint64_t> fallbacks_{0};
        // shared with the worker so a late return can still clear it
        std::shared_ptr<std::atomic<bool>> hardware_busy_ = std::make_shared<std::atomic<bool>>(false);
    };

    struct SignerConfig;

    /**
     * Build the signer described by cfg. mode "hardware" requires an element;
     * "auto" uses one when given. The software key store is loaded from (or
     * created in) cfg.key_dir unless cfg.persist_keys is false.
     */
    Result<std::shared_ptr<FallbackSigner>> make_signer(
        const SignerConfig &cfg,
        std::shared_ptr<SecureElement> element,
        const std::optional<crypto::AESKey> &key_encryption_key);

} // namespace attest
