#include <catch2/catch_test_macros.hpp>
#include "attest/config.hpp"
#include "attest/signer.hpp"
#include "test_support.hpp"
#include <atomic>
#include <chrono>
#include <thread>

using namespace attest;
using attest::testing::bytes_of;

namespace
{
    /**
     * Stands in for a secure element: signs digests with an Ed25519 key (the
     * signature is 64 bytes like raw r||s) and can be told to fail or stall.
     */
    class FakeSecureElement : public SecureElement
    {
    public:
        FakeSecureElement() : keypair_(crypto::Ed25519KeyPair::generate().value()) {}

        std::string key_id() const override { return "ATECC608-SLOT0"; }

        Result<crypto::Bytes> sign_digest(const crypto::SHA256Hash &digest) override
        {
            ++sign_calls;
            auto stall = delay.load();
            if (stall.count() > 0)
                std::this_thread::sleep_for(stall);
            if (fail)
                return std::unexpected(AttestError::signer_unavailable("I2C NACK"));
            auto sig = keypair_.sign(crypto::Bytes(digest.begin(), digest.end()));
            return crypto::Bytes(sig.begin(), sig.end());
        }

        Result<bool> verify_digest(const crypto::SHA256Hash &digest, const crypto::Bytes &signature) override
        {
            if (fail)
                return std::unexpected(AttestError::signer_unavailable("I2C NACK"));
            if (signature.size() != 64)
                return false;
            crypto::Ed25519Signature sig{};
            std::copy(signature.begin(), signature.end(), sig.begin());
            return crypto::Ed25519KeyPair::verify(crypto::Bytes(digest.begin(), digest.end()), sig, keypair_.public_key);
        }

        std::string describe() const override { return "fake-element"; }

        std::atomic<bool> fail{false};
        std::atomic<std::chrono::milliseconds> delay{std::chrono::milliseconds(0)};
        std::atomic<int> sign_calls{0};

    private:
        crypto::Ed25519KeyPair keypair_;
    };

    std::shared_ptr<SoftwareSigner> software_signer()
    {
        return std::make_shared<SoftwareSigner>(crypto::KeyManager::ephemeral().value());
    }
}

TEST_CASE("Software signer signs and verifies", "[signer]")
{
    auto signer = software_signer();
    auto msg = bytes_of(R"({"event_id":"a"})");

    auto res = signer->sign(msg);
    REQUIRE(res.has_value());
    REQUIRE(res->trust == TrustLevel::Software);
    REQUIRE(res->algorithm == "Ed25519");
    REQUIRE(res->key_id.rfind("ed25519:", 0) == 0);
    REQUIRE(res->signature.size() == 64);
    REQUIRE(signer->verify(msg, *res));

    SECTION("tampered message fails")
    {
        auto other = bytes_of(R"({"event_id":"b"})");
        REQUIRE_FALSE(signer->verify(other, *res));
    }

    SECTION("unknown key id fails")
    {
        auto forged = *res;
        forged.key_id = "ed25519:ffffffffffffffff";
        REQUIRE_FALSE(signer->verify(msg, forged));
    }

    SECTION("signature from another key store fails")
    {
        REQUIRE_FALSE(software_signer()->verify(msg, *res));
    }
}

TEST_CASE("Hardware signer uses the element", "[signer]")
{
    auto element = std::make_shared<FakeSecureElement>();
    HardwareSigner signer(element);
    auto msg = bytes_of("payload");

    auto res = signer.sign(msg);
    REQUIRE(res.has_value());
    REQUIRE(res->trust == TrustLevel::Hardware);
    REQUIRE(res->algorithm == "ECDSA-P256-SHA256");
    REQUIRE(res->key_id == "ATECC608-SLOT0");
    REQUIRE(signer.verify(msg, *res));
    REQUIRE_FALSE(signer.verify(bytes_of("other"), *res));

    element->fail = true;
    REQUIRE_FALSE(signer.sign(msg).has_value());
}

TEST_CASE("Fallback signer prefers hardware", "[signer]")
{
    auto element = std::make_shared<FakeSecureElement>();
    FallbackSigner signer(std::make_shared<HardwareSigner>(element), software_signer(), std::chrono::milliseconds(500));

    auto res = signer.sign(bytes_of("payload"));
    REQUIRE(res.has_value());
    REQUIRE(res->trust == TrustLevel::Hardware);
    REQUIRE(signer.trust() == TrustLevel::Hardware);
    REQUIRE(signer.status()["hardware_signatures"] == 1);
}

TEST_CASE("Fallback signer falls back to software on hardware error", "[signer]")
{
    auto element = std::make_shared<FakeSecureElement>();
    element->fail = true;
    FallbackSigner signer(std::make_shared<HardwareSigner>(element), software_signer(), std::chrono::milliseconds(500));

    auto msg = bytes_of("payload");
    auto res = signer.sign(msg);
    REQUIRE(res.has_value());
    REQUIRE(res->trust == TrustLevel::Software);
    REQUIRE(signer.verify(msg, *res));
    REQUIRE(signer.status()["fallbacks"] == 1);
}

TEST_CASE("Fallback signer falls back to software on hardware timeout", "[signer]")
{
    auto element = std::make_shared<FakeSecureElement>();
    element->delay = std::chrono::milliseconds(500);
    FallbackSigner signer(std::make_shared<HardwareSigner>(element), software_signer(), std::chrono::milliseconds(50));

    auto started = std::chrono::steady_clock::now();
    auto res = signer.sign(bytes_of("payload"));
    auto elapsed = std::chrono::steady_clock::now() - started;

    REQUIRE(res.has_value());
    REQUIRE(res->trust == TrustLevel::Software);
    REQUIRE(elapsed < std::chrono::milliseconds(400));
}

TEST_CASE("Stalled element gets one outstanding call", "[signer]")
{
    auto element = std::make_shared<FakeSecureElement>();
    element->delay = std::chrono::milliseconds(300);
    FallbackSigner signer(std::make_shared<HardwareSigner>(element), software_signer(), std::chrono::milliseconds(20));

    for (int i = 0; i < 5; ++i)
    {
        auto res = signer.sign(bytes_of("payload"));
        REQUIRE(res.has_value());
        REQUIRE(res->trust == TrustLevel::Software);
    }
    REQUIRE(element->sign_calls == 1);
    REQUIRE(signer.status()["fallbacks"] == 5);
    REQUIRE(signer.status()["hardware_busy"] == true);

    element->delay = std::chrono::milliseconds(0);
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (signer.status()["hardware_busy"] == true && std::chrono::steady_clock::now() < deadline)
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    REQUIRE(signer.status()["hardware_busy"] == false);

    auto res = signer.sign(bytes_of("payload"));
    REQUIRE(res.has_value());
    REQUIRE(res->trust == TrustLevel::Hardware);
    REQUIRE(element->sign_calls == 2);
}

TEST_CASE("Verification dispatches on the trust tag", "[signer]")
{
    auto element = std::make_shared<FakeSecureElement>();
    FallbackSigner signer(std::make_shared<HardwareSigner>(element), software_signer(), std::chrono::milliseconds(500));
    auto msg = bytes_of("payload");

    auto hw = signer.sign(msg).value();
    REQUIRE(signer.verify(msg, hw));

    SECTION("hardware signature relabelled as software is rejected")
    {
        auto relabelled = hw;
        relabelled.trust = TrustLevel::Software;
        REQUIRE_FALSE(signer.verify(msg, relabelled));
    }

    SECTION("hardware trust with software algorithm is rejected")
    {
        auto mixed = hw;
        mixed.algorithm = "Ed25519";
        REQUIRE_FALSE(signer.verify(msg, mixed));
    }

    SECTION("absent trust never verifies")
    {
        auto absent = hw;
        absent.trust = TrustLevel::Absent;
        REQUIRE_FALSE(signer.verify(msg, absent));
    }

    SECTION("software signature relabelled as hardware is rejected")
    {
        element->fail = true;
        auto sw = signer.sign(msg).value();
        REQUIRE(sw.trust == TrustLevel::Software);
        element->fail = false;

        auto relabelled = sw;
        relabelled.trust = TrustLevel::Hardware;
        REQUIRE_FALSE(signer.verify(msg, relabelled));
    }
}

TEST_CASE("Fallback signer with no usable signer fails", "[signer]")
{
    auto element = std::make_shared<FakeSecureElement>();
    element->fail = true;
    FallbackSigner signer(std::make_shared<HardwareSigner>(element), nullptr, std::chrono::milliseconds(100));

    auto res = signer.sign(bytes_of("payload"));
    REQUIRE_FALSE(res.has_value());
    REQUIRE(res.error().code == ErrorCode::SignerUnavailable);
}

TEST_CASE("Sign results rebuild from stored form", "[signer]")
{
    auto signer = software_signer();
    auto msg = bytes_of("payload");
    auto res = signer->sign(msg).value();

    auto rebuilt = SignResult::from_stored(res.signature_b64(), res.metadata());
    REQUIRE(rebuilt.has_value());
    REQUIRE(signer->verify(msg, *rebuilt));
}

TEST_CASE("Signer factory", "[signer]")
{
    testing::TempDir dir;
    SignerConfig cfg;
    cfg.key_dir = dir.str("keys");
    auto kek = crypto::AES256GCM::generate_key();

    SECTION("hardware mode without element is a config error")
    {
        cfg.mode = "hardware";
        auto signer = make_signer(cfg, nullptr, kek);
        REQUIRE_FALSE(signer.has_value());
        REQUIRE(signer.error().code == ErrorCode::ConfigError);
    }

    SECTION("auto mode without element is software only")
    {
        auto signer = make_signer(cfg, nullptr, kek);
        REQUIRE(signer.has_value());
        REQUIRE((*signer)->trust() == TrustLevel::Software);
    }

    SECTION("software mode ignores the element")
    {
        cfg.mode = "software";
        auto signer = make_signer(cfg, std::make_shared<FakeSecureElement>(), kek);
        REQUIRE(signer.has_value());
        REQUIRE((*signer)->trust() == TrustLevel::Software);
    }

    SECTION("persisted keys verify across signer instances")
    {
        auto msg = bytes_of("payload");
        auto first = make_signer(cfg, nullptr, kek).value();
        auto res = first->sign(msg).value();

        auto second = make_signer(cfg, nullptr, kek).value();
        REQUIRE(second->verify(msg, res));
    }

    SECTION("ephemeral keys do not survive a new instance")
    {
        cfg.persist_keys = false;
        auto msg = bytes_of("payload");
        auto res = make_signer(cfg, nullptr, kek).value()->sign(msg).value();
        REQUIRE_FALSE(make_signer(cfg, nullptr, kek).value()->verify(msg, res));
    }
}
