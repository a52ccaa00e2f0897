#include <gtest/gtest.h>
#include <vehicle.h>
#include <vf_utils.h>
#include "mocks/mock_adapters.h"
#include "test_constants.h"

#include <memory>
#include <string>
#include <vector>

using namespace VinFastCloud;
using namespace VinFastCloud::TestConstants;

class VehicleTest : public ::testing::Test {
protected:
    static void SetUpTestSuite() {
        CryptoContext crypto;
        ASSERT_EQ(crypto.create_private_key(), VinFastCloud_Status_E_OK);
        ASSERT_EQ(crypto.get_private_key_pem(stored_pem), VinFastCloud_Status_E_OK);
    }

    void SetUp() override {
        http = std::make_shared<MockHttpAdapter>();
        storage = std::make_shared<MockStorageAdapter>();
        clock = std::make_shared<ManualClock>();
    }

    std::unique_ptr<Vehicle> make_vehicle() { return std::make_unique<Vehicle>(http, storage, clock); }

    void store_keys() {
        PairingKeyMaterial material;
        material.private_key_pem = stored_pem;
        material.shared_key_b64 = SHARE_KEY_B64;
        material.session_id = "S1";
        storage->set_string(Vehicle::STORAGE_KEY, material.to_json().dump());
    }

    static void sign_in(Vehicle &vehicle) {
        TokenState tokens;
        tokens.access_token = ACCESS_TOKEN;
        tokens.refresh_token = REFRESH_TOKEN;
        vehicle.client().session()->set_tokens(tokens);
    }

    void route_pairing() {
        http->set_route(ROUTE_VEHICLES, 200, VEHICLES_RESPONSE);
        http->set_route(ROUTE_VERIFY_SESSION, 200, R"({"code":200000})");
        http->set_route(ROUTE_SEND_PAIR_DATA, 200,
                        nlohmann::json({{"data", {{"base64EncryptedShareKey", SHARE_KEY_B64}}}}).dump());
    }

    static std::string stored_pem;

    std::shared_ptr<MockHttpAdapter> http;
    std::shared_ptr<MockStorageAdapter> storage;
    std::shared_ptr<ManualClock> clock;
};

std::string VehicleTest::stored_pem;

TEST_F(VehicleTest, StartsUnpairedWithEmptyStorage) {
    auto vehicle = make_vehicle();
    EXPECT_FALSE(vehicle->is_paired());
    EXPECT_EQ(vehicle->pairing().state(), PairingState::IDLE);
}

TEST_F(VehicleTest, RestoresKeysFromStorage) {
    store_keys();
    auto vehicle = make_vehicle();

    EXPECT_TRUE(vehicle->is_paired());
    EXPECT_EQ(vehicle->pairing().session_id(), "S1");
    EXPECT_EQ(vehicle->pairing().export_keys().private_key_pem, stored_pem);
}

TEST_F(VehicleTest, IgnoresCorruptStorage) {
    storage->set_string(Vehicle::STORAGE_KEY, "{not json");
    auto vehicle = make_vehicle();
    EXPECT_FALSE(vehicle->is_paired());

    storage->set_string(Vehicle::STORAGE_KEY, R"({"private_key_pem":"garbage","shared_key_b64":"MDE="})");
    auto second = make_vehicle();
    EXPECT_FALSE(second->is_paired());
}

TEST_F(VehicleTest, CommandsRequirePairing) {
    auto vehicle = make_vehicle();
    sign_in(*vehicle);

    auto result = vehicle->lock();
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.status(), VinFastCloud_Status_E_ERROR_NOT_PAIRED);
    EXPECT_EQ(http->request_count(), 0u);
}

TEST_F(VehicleTest, UnknownCommandAliasIsRejected) {
    store_keys();
    auto vehicle = make_vehicle();
    sign_in(*vehicle);

    auto result = vehicle->send_command("VEHICLE_CONTROL_WARP_DRIVE", 1);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.status(), VinFastCloud_Status_E_ERROR_INVALID_PARAMS);
    EXPECT_EQ(http->request_count(), 0u);
}

TEST_F(VehicleTest, SetClimateDispatchesSignedCommand) {
    store_keys();
    auto vehicle = make_vehicle();
    sign_in(*vehicle);
    vehicle->client().session()->set_identity_if_unset(TEST_VIN, TEST_USER_ID);
    http->set_route(ROUTE_COMMAND, 200, R"({"code":200000})");

    ASSERT_TRUE(vehicle->set_climate(true).is_success());

    ASSERT_EQ(http->request_count(), 1u);
    nlohmann::json body = nlohmann::json::parse(http->last_request().body);
    EXPECT_EQ(body["message_name"], "CLIMATE_CONTROL_AIR_CONDITION_ENABLE");
    EXPECT_EQ(body["sess_id"], "S1");
    EXPECT_EQ(body["timestamp"], "1700000000000");
    EXPECT_EQ(body["user_id"], CommandSigner::hash_user_id(TEST_USER_ID));

    std::vector<uint8_t> content;
    ASSERT_EQ(base64_decode(body["message_content"].get<std::string>(), content), VinFastCloud_Status_E_OK);
    EXPECT_EQ(std::string(content.begin(), content.end()), R"({"deviceKey":"3416_0_5850","value":1})");
}

TEST_F(VehicleTest, ShortcutsUseTheirAliases) {
    store_keys();
    auto vehicle = make_vehicle();
    sign_in(*vehicle);
    http->set_route(ROUTE_COMMAND, 200, "{}");

    ASSERT_TRUE(vehicle->set_climate(false).is_success());
    ASSERT_TRUE(vehicle->set_climate_temperature(22.5).is_success());
    ASSERT_TRUE(vehicle->unlock().is_success());
    ASSERT_TRUE(vehicle->honk_horn().is_success());
    ASSERT_TRUE(vehicle->flash_lights().is_success());

    const auto &requests = http->get_requests();
    ASSERT_EQ(requests.size(), 5u);
    EXPECT_EQ(nlohmann::json::parse(requests[1].body)["message_name"], "CLIMATE_CONTROL_TARGET_TEMPERATURE");
    EXPECT_EQ(nlohmann::json::parse(requests[2].body)["message_name"], "VEHICLE_CONTROL_DOOR_UNLOCK");
    EXPECT_EQ(nlohmann::json::parse(requests[3].body)["message_name"], "VEHICLE_CONTROL_HORN");
    EXPECT_EQ(nlohmann::json::parse(requests[4].body)["message_name"], "VEHICLE_CONTROL_LIGHTS");

    // Each command gets a fresh timestamp
    EXPECT_NE(nlohmann::json::parse(requests[0].body)["timestamp"], nlohmann::json::parse(requests[1].body)["timestamp"]);
}

TEST_F(VehicleTest, RejectedCommandIsReported) {
    store_keys();
    auto vehicle = make_vehicle();
    sign_in(*vehicle);
    http->set_route(ROUTE_COMMAND, 500, "nope");

    auto result = vehicle->lock();
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.status(), VinFastCloud_Status_E_ERROR_PROTOCOL);
}

TEST_F(VehicleTest, PairingRequiresSignIn) {
    auto vehicle = make_vehicle();

    auto result = vehicle->start_pairing(TEST_QR);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.status(), VinFastCloud_Status_E_ERROR_INVALID_STATE);
    EXPECT_EQ(http->request_count(), 0u);
}

TEST_F(VehicleTest, CompleteWithoutStartIsRejected) {
    auto vehicle = make_vehicle();
    sign_in(*vehicle);

    EXPECT_EQ(vehicle->complete_pairing("").status(), VinFastCloud_Status_E_ERROR_INVALID_PARAMS);
    EXPECT_EQ(vehicle->complete_pairing("123456").status(), VinFastCloud_Status_E_ERROR_INVALID_STATE);
    EXPECT_EQ(vehicle->resend_otp().status(), VinFastCloud_Status_E_ERROR_INVALID_STATE);
}

TEST_F(VehicleTest, FullPairingPersistsKeys) {
    route_pairing();
    auto vehicle = make_vehicle();
    sign_in(*vehicle);

    ASSERT_TRUE(vehicle->start_pairing(TEST_QR, "", "", TEST_EMAIL).is_success());
    EXPECT_EQ(vehicle->pairing().state(), PairingState::OTP_TRIGGERED);
    EXPECT_EQ(vehicle->client().vin(), TEST_VIN);
    EXPECT_EQ(http->count_requests(ROUTE_VERIFY_SESSION), 1u);

    ASSERT_TRUE(vehicle->resend_otp("", TEST_EMAIL).is_success());
    EXPECT_EQ(nlohmann::json::parse(http->last_request().body)["retry"], true);

    ASSERT_TRUE(vehicle->complete_pairing("123456").is_success());
    EXPECT_TRUE(vehicle->is_paired());
    EXPECT_EQ(nlohmann::json::parse(http->last_request().body)["otp"], "123456");

    ASSERT_TRUE(storage->has(Vehicle::STORAGE_KEY));
    nlohmann::json stored = nlohmann::json::parse(storage->get_string(Vehicle::STORAGE_KEY));
    EXPECT_EQ(stored["shared_key_b64"], SHARE_KEY_B64);
    EXPECT_EQ(stored["session_id"], "S1");

    // A restart picks the keys back up
    auto restarted = make_vehicle();
    EXPECT_TRUE(restarted->is_paired());
}

TEST_F(VehicleTest, SaveFailureIsReportedButPairingHolds) {
    route_pairing();
    storage->set_fail_saves(true);
    auto vehicle = make_vehicle();
    sign_in(*vehicle);

    ASSERT_TRUE(vehicle->start_pairing(TEST_QR).is_success());
    auto result = vehicle->complete_pairing("123456");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.status(), VinFastCloud_Status_E_ERROR_INTERNAL);
    EXPECT_TRUE(vehicle->is_paired());
}

TEST_F(VehicleTest, QrForAnotherVehicleFails) {
    route_pairing();
    http->set_route(ROUTE_VEHICLES, 200, R"({"code":200000,"data":[{"vinCode":"VF1OTHER","userId":"user-42"}]})");
    auto vehicle = make_vehicle();
    sign_in(*vehicle);

    auto result = vehicle->start_pairing(TEST_QR);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.status(), VinFastCloud_Status_E_ERROR_PAIRING);
    EXPECT_EQ(vehicle->pairing().state(), PairingState::FAILED);
    EXPECT_EQ(http->count_requests(ROUTE_VERIFY_SESSION), 0u);
}

TEST_F(VehicleTest, AccountWithoutVehicleCannotPair) {
    http->set_route(ROUTE_VEHICLES, 200, R"({"code":200000,"data":[]})");
    auto vehicle = make_vehicle();
    sign_in(*vehicle);

    EXPECT_EQ(vehicle->start_pairing(TEST_QR).status(), VinFastCloud_Status_E_ERROR_PAIRING);
}

TEST_F(VehicleTest, WrongOtpLeavesVehicleUnpaired) {
    route_pairing();
    http->set_route(ROUTE_SEND_PAIR_DATA, 400, R"({"message":"invalid otp"})");
    auto vehicle = make_vehicle();
    sign_in(*vehicle);

    ASSERT_TRUE(vehicle->start_pairing(TEST_QR).is_success());
    auto result = vehicle->complete_pairing("000000");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.status(), VinFastCloud_Status_E_ERROR_PAIRING);
    EXPECT_FALSE(vehicle->is_paired());
    EXPECT_FALSE(storage->has(Vehicle::STORAGE_KEY));

    // The pending attempt is consumed
    EXPECT_EQ(vehicle->complete_pairing("123456").status(), VinFastCloud_Status_E_ERROR_INVALID_STATE);
}

TEST_F(VehicleTest, StalledPairingCanBeRestarted) {
    route_pairing();
    auto vehicle = make_vehicle();
    sign_in(*vehicle);

    ASSERT_TRUE(vehicle->start_pairing(TEST_QR).is_success());
    ASSERT_EQ(vehicle->pairing().state(), PairingState::OTP_TRIGGERED);

    // The OTP never arrived; scanning again starts over
    ASSERT_TRUE(vehicle->start_pairing(TEST_QR).is_success());
    EXPECT_EQ(vehicle->pairing().state(), PairingState::OTP_TRIGGERED);
    EXPECT_EQ(http->count_requests(ROUTE_VERIFY_SESSION), 2u);

    ASSERT_TRUE(vehicle->complete_pairing("123456").is_success());
    EXPECT_TRUE(vehicle->is_paired());
}

TEST_F(VehicleTest, CancelPairingDropsPendingAttempt) {
    route_pairing();
    auto vehicle = make_vehicle();
    sign_in(*vehicle);

    ASSERT_TRUE(vehicle->start_pairing(TEST_QR).is_success());
    vehicle->cancel_pairing();

    EXPECT_EQ(vehicle->pairing().state(), PairingState::IDLE);
    EXPECT_EQ(vehicle->complete_pairing("123456").status(), VinFastCloud_Status_E_ERROR_INVALID_STATE);
    EXPECT_EQ(vehicle->resend_otp().status(), VinFastCloud_Status_E_ERROR_INVALID_STATE);
    EXPECT_EQ(http->count_requests(ROUTE_SEND_PAIR_DATA), 0u);
}

TEST_F(VehicleTest, CancelPairingKeepsExistingKeys) {
    store_keys();
    route_pairing();
    auto vehicle = make_vehicle();
    sign_in(*vehicle);

    ASSERT_TRUE(vehicle->start_pairing(TEST_QR).is_success());
    vehicle->cancel_pairing();

    EXPECT_TRUE(vehicle->is_paired());
    EXPECT_EQ(vehicle->pairing().state(), PairingState::PAIRED);
    EXPECT_TRUE(storage->has(Vehicle::STORAGE_KEY));
}

TEST_F(VehicleTest, UnpairRemovesStoredKeys) {
    store_keys();
    auto vehicle = make_vehicle();
    ASSERT_TRUE(vehicle->is_paired());

    vehicle->unpair();
    EXPECT_FALSE(vehicle->is_paired());
    EXPECT_FALSE(storage->has(Vehicle::STORAGE_KEY));
    EXPECT_EQ(vehicle->lock().status(), VinFastCloud_Status_E_ERROR_NOT_PAIRED);
}

TEST_F(VehicleTest, WorksWithoutStorage) {
    Vehicle vehicle(http, nullptr, clock);
    EXPECT_FALSE(vehicle.is_paired());
    vehicle.unpair();
}
