#include "attest/signer.hpp"
#include "attest/config.hpp"
#include <spdlog/spdlog.h>
#include <format>
#include <future>
#include <thread>

namespace attest
{

    namespace
    {
        /**
         * Run fn on a detached thread and wait at most timeout for it. The
         * callable must own everything it touches; it may outlive the caller.
         */
        template <typename T, typename Fn>
        Result<T> run_bounded(Fn fn, std::chrono::milliseconds timeout, const std::string &what)
        {
            auto promise = std::make_shared<std::promise<Result<T>>>();
            auto future = promise->get_future();

            std::thread([promise, fn = std::move(fn)]() mutable {
                try
                {
                    promise->set_value(fn());
                }
                catch (const std::exception &e)
                {
                    promise->set_value(std::unexpected(AttestError::signer_unavailable(e.what())));
                }
            }).detach();

            if (future.wait_for(timeout) != std::future_status::ready)
            {
                return std::unexpected(AttestError::timeout(
                    std::format("{} did not complete within {} ms", what, timeout.count())));
            }
            return future.get();
        }

        /** Clears the in-flight flag when a hardware call returns, however late */
        struct InFlightRelease
        {
            std::shared_ptr<std::atomic<bool>> flag;
            ~InFlightRelease() { flag->store(false); }
        };
    } // namespace

    // ========== SignResult ==========

    Result<SignResult> SignResult::from_stored(const std::string &signature_b64,
                                               const SignatureMetadata &metadata)
    {
        auto sig = crypto::Base64::decode(signature_b64);
        if (!sig)
            return std::unexpected(sig.error());
        return SignResult{*sig, metadata.algorithm, metadata.key_id, metadata.trust};
    }

    // ========== HardwareSigner ==========

    HardwareSigner::HardwareSigner(std::shared_ptr<SecureElement> element)
        : element_(std::move(element))
    {
        if (!element_)
            throw std::invalid_argument("HardwareSigner requires a secure element");
    }

    Result<SignResult> HardwareSigner::sign(const crypto::Bytes &message)
    {
        auto digest = crypto::SHA256::hash(message);

        std::lock_guard lock(bus_mutex_);
        auto sig = element_->sign_digest(digest);
        if (!sig)
        {
            return std::unexpected(AttestError::signer_unavailable(
                std::format("{} sign failed: {}", element_->describe(), sig.error().what())));
        }
        if (sig->size() != 64)
        {
            return std::unexpected(AttestError::signer_unavailable(
                std::format("{} returned {} signature bytes, expected 64", element_->describe(), sig->size())));
        }
        return SignResult{*sig, kHardwareAlgorithm, element_->key_id(), TrustLevel::Hardware};
    }

    bool HardwareSigner::verify(const crypto::Bytes &message, const SignResult &result) const
    {
        if (result.trust != TrustLevel::Hardware || result.algorithm != kHardwareAlgorithm ||
            result.key_id != element_->key_id())
        {
            return false;
        }

        auto digest = crypto::SHA256::hash(message);
        std::lock_guard lock(bus_mutex_);
        auto ok = element_->verify_digest(digest, result.signature);
        if (!ok)
        {
            spdlog::warn("{} verify failed: {}", element_->describe(), ok.error().what());
            return false;
        }
        return *ok;
    }

    nlohmann::json HardwareSigner::status() const
    {
        return {{"type", "hardware"},
                {"element", element_->describe()},
                {"key_id", element_->key_id()},
                {"algorithm", kHardwareAlgorithm}};
    }

    // ========== SoftwareSigner ==========

    SoftwareSigner::SoftwareSigner(crypto::KeyStore keys)
        : keys_(std::move(keys))
    {
    }

    Result<SignResult> SoftwareSigner::sign(const crypto::Bytes &message)
    {
        auto key = keys_.current_key();
        if (!key)
        {
            return std::unexpected(AttestError::signer_unavailable(
                std::format("No software signing key: {}", key.error().what())));
        }
        auto sig = key->sign(message);
        return SignResult{crypto::Bytes(sig.begin(), sig.end()), kSoftwareAlgorithm, key->key_id(), TrustLevel::Software};
    }

    bool SoftwareSigner::verify(const crypto::Bytes &message, const SignResult &result) const
    {
        if (result.trust != TrustLevel::Software || result.algorithm != kSoftwareAlgorithm)
        {
            return false;
        }

        auto key = keys_.find_key(result.key_id);
        if (!key)
        {
            spdlog::warn("Unknown software key {}; signatures from an ephemeral or removed key cannot be verified",
                         result.key_id);
            return false;
        }
        return key->verify(message, result.signature);
    }

    nlohmann::json SoftwareSigner::status() const
    {
        auto current = keys_.current_key();
        return {{"type", "software"},
                {"key_id", current ? current->key_id() : ""},
                {"keys", keys_.key_indices().size()},
                {"algorithm", kSoftwareAlgorithm}};
    }

    // ========== FallbackSigner ==========

    FallbackSigner::FallbackSigner(std::shared_ptr<HardwareSigner> hardware,
                                   std::shared_ptr<SoftwareSigner> software,
                                   std::chrono::milliseconds timeout)
        : hardware_(std::move(hardware)),
          software_(std::move(software)),
          timeout_(timeout)
    {
        if (!hardware_ && !software_)
            throw std::invalid_argument("FallbackSigner needs at least one signer");
    }

    Result<SignResult> FallbackSigner::sign(const crypto::Bytes &message)
    {
        if (hardware_)
        {
            if (hardware_busy_->exchange(true))
            {
                ++fallbacks_;
                spdlog::warn("Hardware signer still busy with an earlier call, falling back to software");
            }
            else
            {
                auto hw = hardware_;
                auto busy = hardware_busy_;
                auto res = run_bounded<SignResult>(
                    [hw, busy, message]()
                    {
                        InFlightRelease release{busy};
                        return hw->sign(message);
                    },
                    timeout_, "hardware sign");
                if (res)
                {
                    ++hardware_signatures_;
                    return res;
                }
                ++fallbacks_;
                spdlog::warn("Hardware signer unavailable, falling back to software: {}", res.error().what());
            }
        }

        if (!software_)
        {
            return std::unexpected(AttestError::signer_unavailable("No signer available"));
        }
        auto res = software_->sign(message);
        if (res)
            ++software_signatures_;
        return res;
    }

    bool FallbackSigner::verify(const crypto::Bytes &message, const SignResult &result) const
    {
        switch (result.trust)
        {
        case TrustLevel::Hardware:
        {
            if (!hardware_)
            {
                spdlog::warn("Cannot verify hardware signature by {}: no secure element attached", result.key_id);
                return false;
            }
            if (hardware_busy_->exchange(true))
            {
                spdlog::warn("Hardware verification unavailable: element still busy with an earlier call");
                return false;
            }
            auto hw = hardware_;
            auto busy = hardware_busy_;
            auto res = run_bounded<bool>(
                [hw, busy, message, result]() -> Result<bool>
                {
                    InFlightRelease release{busy};
                    return hw->verify(message, result);
                },
                timeout_, "hardware verify");
            if (!res)
            {
                spdlog::warn("Hardware verification unavailable: {}", res.error().what());
                return false;
            }
            return *res;
        }
        case TrustLevel::Software:
            return software_ && software_->verify(message, result);
        case TrustLevel::Absent:
            return false;
        }
        return false;
    }

    TrustLevel FallbackSigner::trust() const
    {
        return hardware_ ? TrustLevel::Hardware : TrustLevel::Software;
    }

    nlohmann::json FallbackSigner::status() const
    {
        return {{"preferred", trust_to_string(trust())},
                {"hardware", hardware_ ? hardware_->status() : nlohmann::json(nullptr)},
                {"software", software_ ? software_->status() : nlohmann::json(nullptr)},
                {"timeout_ms", timeout_.count()},
                {"hardware_signatures", hardware_signatures_.load()},
                {"software_signatures", software_signatures_.load()},
                {"fallbacks", fallbacks_.load()},
                {"hardware_busy", hardware_busy_->load()}};
    }

    // ========== Factory ==========

    Result<std::shared_ptr<FallbackSigner>> make_signer(
        const SignerConfig &cfg,
        std::shared_ptr<SecureElement> element,
        const std::optional<crypto::AESKey> &key_encryption_key)
    {
        if (cfg.mode == "hardware" && !element)
        {
            return std::unexpected(AttestError::config("signer.mode = hardware but no secure element is attached"));
        }

        std::shared_ptr<HardwareSigner> hardware;
        if (element && cfg.mode != "software")
        {
            hardware = std::make_shared<HardwareSigner>(std::move(element));
            spdlog::info("Hardware signer enabled: {}", hardware->status().dump());
        }

        auto keys = cfg.persist_keys
                        ? crypto::KeyManager::load_or_create(cfg.key_dir,
                                                             crypto::KeyManager::encryption_key_or_dev(key_encryption_key))
                        : crypto::KeyManager::ephemeral();
        if (!keys)
        {
            if (!hardware)
                return std::unexpected(keys.error());
            spdlog::error("Software fallback unavailable: {}", keys.error().what());
            return std::make_shared<FallbackSigner>(hardware, nullptr, cfg.sign_timeout);
        }

        auto software = std::make_shared<SoftwareSigner>(std::move(*keys));
        return std::make_shared<FallbackSigner>(hardware, software, cfg.sign_timeout);
    }

} // namespace attest
