#include <gtest/gtest.h>
#include <command_signer.h>
#include <crypto_context.h>
#include <vf_utils.h>
#include "mocks/mock_adapters.h"
#include "test_constants.h"

#include <array>
#include <memory>
#include <string>
#include <vector>

using namespace VinFastCloud;
using namespace VinFastCloud::TestConstants;

class CommandSignerTest : public ::testing::Test {
protected:
    static void SetUpTestSuite() {
        shared_crypto = std::make_shared<CryptoContext>();
        ASSERT_EQ(shared_crypto->create_private_key(), VinFastCloud_Status_E_OK);
    }

    static void TearDownTestSuite() { shared_crypto.reset(); }

    void SetUp() override {
        http = std::make_shared<MockHttpAdapter>();
        clock = std::make_shared<ManualClock>(1700000000000);
        signer = std::make_unique<CommandSigner>(http, clock);

        keys.crypto = shared_crypto;
        ASSERT_EQ(base64_decode(SHARE_KEY_B64, keys.shared_key), VinFastCloud_Status_E_OK);
        keys.session_id = "S1";
    }

    SignedCommand sign_climate() {
        auto result = signer->sign(keys, "CLIMATE_CONTROL_AIR_CONDITION_ENABLE", {{"value", 1}}, TEST_USER_ID, "S1");
        EXPECT_TRUE(result.is_success());
        return result.is_success() ? result.value() : SignedCommand();
    }

    static std::shared_ptr<CryptoContext> shared_crypto;

    std::shared_ptr<MockHttpAdapter> http;
    std::shared_ptr<ManualClock> clock;
    std::unique_ptr<CommandSigner> signer;
    SigningKeys keys;
};

std::shared_ptr<CryptoContext> CommandSignerTest::shared_crypto;

TEST_F(CommandSignerTest, ContentIsBase64OfCompactJson) {
    SignedCommand cmd = sign_climate();

    EXPECT_EQ(cmd.message_name, "CLIMATE_CONTROL_AIR_CONDITION_ENABLE");
    EXPECT_EQ(cmd.message_content, base64_encode(std::string(R"({"value":1})")));
    EXPECT_EQ(cmd.session_id, "S1");
    EXPECT_EQ(cmd.timestamp, "1700000000000");
}

TEST_F(CommandSignerTest, RsaSignatureCoversTimestampAndContent) {
    SignedCommand cmd = sign_climate();

    std::vector<uint8_t> signature;
    ASSERT_EQ(base64_decode(cmd.signature, signature), VinFastCloud_Status_E_OK);
    EXPECT_EQ(signature.size(), 256u);

    std::string input = CommandSigner::signing_input(cmd.timestamp, cmd.message_content);
    EXPECT_EQ(input, cmd.timestamp + cmd.message_content);
    EXPECT_EQ(shared_crypto->verify_sha256(reinterpret_cast<const uint8_t *>(input.data()), input.size(), signature),
              VinFastCloud_Status_E_OK);

    // Any change to the timestamp invalidates it
    std::string other = CommandSigner::signing_input("1700000000001", cmd.message_content);
    EXPECT_NE(shared_crypto->verify_sha256(reinterpret_cast<const uint8_t *>(other.data()), other.size(), signature),
              VinFastCloud_Status_E_OK);
}

TEST_F(CommandSignerTest, HmacSignatureUsesShareKey) {
    SignedCommand cmd = sign_climate();

    std::string input = CommandSigner::signing_input(cmd.timestamp, cmd.message_content);
    std::array<uint8_t, CryptoUtils::SHA256_SIZE> expected{};
    ASSERT_EQ(CryptoUtils::hmac_sha256(keys.shared_key.data(), keys.shared_key.size(),
                                       reinterpret_cast<const uint8_t *>(input.data()), input.size(), expected.data()),
              VinFastCloud_Status_E_OK);
    EXPECT_EQ(cmd.signature2, base64_encode(expected.data(), expected.size()));
}

TEST_F(CommandSignerTest, UserIdIsHashed) {
    SignedCommand cmd = sign_climate();

    std::array<uint8_t, CryptoUtils::SHA256_SIZE> digest{};
    const std::string user_id = TEST_USER_ID;
    ASSERT_EQ(CryptoUtils::sha256_hash(reinterpret_cast<const uint8_t *>(user_id.data()), user_id.size(), digest.data()),
              VinFastCloud_Status_E_OK);
    EXPECT_EQ(cmd.user_id, base64_encode(digest.data(), digest.size()));
    EXPECT_EQ(CommandSigner::hash_user_id(TEST_USER_ID), cmd.user_id);
    EXPECT_NE(cmd.user_id, TEST_USER_ID);
}

TEST_F(CommandSignerTest, TimestampsStrictlyIncreaseWhenClockStalls) {
    SignedCommand first = sign_climate();
    SignedCommand second = sign_climate();
    clock->set(1600000000000);  // stepped back
    SignedCommand third = sign_climate();

    EXPECT_EQ(first.timestamp, "1700000000000");
    EXPECT_EQ(second.timestamp, "1700000000001");
    EXPECT_EQ(third.timestamp, "1700000000002");
    EXPECT_NE(first.signature, second.signature);
    EXPECT_NE(first.signature2, second.signature2);
    EXPECT_EQ(first.message_content, second.message_content);
    EXPECT_EQ(first.user_id, second.user_id);

    clock->set(1800000000000);
    EXPECT_EQ(sign_climate().timestamp, "1800000000000");
}

TEST_F(CommandSignerTest, IncompleteKeysAreRejected) {
    SigningKeys no_share = keys;
    no_share.shared_key.clear();
    auto result = signer->sign(no_share, "LOCK", {{"value", 1}}, TEST_USER_ID, "S1");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.status(), VinFastCloud_Status_E_ERROR_PAIRING);

    SigningKeys no_key;
    no_key.shared_key = keys.shared_key;
    EXPECT_EQ(signer->sign(no_key, "LOCK", {{"value", 1}}, TEST_USER_ID, "S1").status(),
              VinFastCloud_Status_E_ERROR_PAIRING);

    SigningKeys uninitialized = keys;
    uninitialized.crypto = std::make_shared<CryptoContext>();
    EXPECT_EQ(signer->sign(uninitialized, "LOCK", {{"value", 1}}, TEST_USER_ID, "S1").status(),
              VinFastCloud_Status_E_ERROR_PAIRING);
}

TEST_F(CommandSignerTest, ToJsonUsesWireNames) {
    SignedCommand cmd = sign_climate();
    nlohmann::json body = cmd.to_json();

    EXPECT_EQ(body.size(), 10u);
    EXPECT_EQ(body["message_name"], cmd.message_name);
    EXPECT_EQ(body["message_content"], cmd.message_content);
    EXPECT_EQ(body["sess_id"], "S1");
    EXPECT_EQ(body["timestamp"], cmd.timestamp);
    EXPECT_TRUE(body["tag"].is_null());
    EXPECT_EQ(body["isMasterProfile"], true);
    EXPECT_EQ(body["wakeUpTimeOut"], 60000);
    EXPECT_EQ(body["signature2"], cmd.signature2);
}

TEST_F(CommandSignerTest, DispatchPostsToCommandEndpoint) {
    SignedCommand cmd = sign_climate();
    http->queue_response(200, R"({"code":200000})");

    EXPECT_TRUE(signer->dispatch(ACCESS_TOKEN, cmd));

    ASSERT_EQ(http->request_count(), 1u);
    const HttpRequest &req = http->last_request();
    EXPECT_EQ(req.method, HttpMethod::POST);
    EXPECT_EQ(req.url, std::string("https://ccarapi.vinfast.com") + CommandSigner::COMMAND_PATH);
    EXPECT_EQ(req.timeout_seconds, 60);
    EXPECT_EQ(req.headers.at("Authorization"), std::string("Bearer ") + ACCESS_TOKEN);
    EXPECT_EQ(nlohmann::json::parse(req.body), cmd.to_json());
}

TEST_F(CommandSignerTest, DispatchFailuresReturnFalse) {
    SignedCommand cmd = sign_climate();

    http->queue_response(500, "oops");
    EXPECT_FALSE(signer->dispatch(ACCESS_TOKEN, cmd));

    http->queue_response(401, "");
    EXPECT_FALSE(signer->dispatch(ACCESS_TOKEN, cmd));

    http->queue_transport_error("timeout");
    EXPECT_FALSE(signer->dispatch(ACCESS_TOKEN, cmd));
}
