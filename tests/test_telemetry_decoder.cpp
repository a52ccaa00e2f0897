#include <gtest/gtest.h>
#include <telemetry_decoder.h>

#include <map>
#include <string>

using namespace VinFastCloud;

class TelemetryDecoderTest : public ::testing::Test {
protected:
    static AliasMapping sample_mapping() {
        return AliasResolver::build_mapping(nlohmann::json::array({
            {{"alias", "LOCATION_LATITUDE"}, {"devObjID", "6"}, {"devObjInstID", "0"}, {"devRsrcID", "0"}},
            {{"alias", "VEHICLE_STATUS_HV_BATTERY_SOC"}, {"devObjID", "34183"}, {"devObjInstID", "1"}, {"devRsrcID", "9"}},
            {{"alias", "NOT_WANTED"}, {"devObjID", "1"}},
        }));
    }
};

TEST_F(TelemetryDecoderTest, BuildRequestFollowsWantedAliasOrder) {
    TelemetryRequest request = TelemetryDecoder::build_request(sample_mapping());

    EXPECT_FALSE(request.from_fallback);
    ASSERT_EQ(request.resources.size(), 2u);
    // SOC comes before latitude in the wanted list
    EXPECT_EQ(request.resources[0].object_id, "34183");
    EXPECT_EQ(request.resources[1].object_id, "6");
    EXPECT_EQ(request.path_to_alias.at("/34183/1/9"), "VEHICLE_STATUS_HV_BATTERY_SOC");
    EXPECT_EQ(request.path_to_alias.count("/1/0/0"), 0u);

    nlohmann::json body = request.to_json();
    ASSERT_TRUE(body.is_array());
    EXPECT_EQ(body[0], nlohmann::json({{"objectId", "34183"}, {"instanceId", "1"}, {"resourceId", "9"}}));
}

TEST_F(TelemetryDecoderTest, EmptyMappingUsesFallbackTable) {
    TelemetryRequest request = TelemetryDecoder::build_request(AliasMapping());

    EXPECT_TRUE(request.from_fallback);
    EXPECT_EQ(request.resources.size(), TelemetryDecoder::fallback_paths().size());
    EXPECT_EQ(request.resources.size(), 26u);
    EXPECT_TRUE(request.path_to_alias.empty());
    EXPECT_EQ(request.resources[0].object_id, "34196");
    EXPECT_EQ(request.resources[0].instance_id, "0");
    EXPECT_EQ(request.resources[0].resource_id, "0");
}

TEST_F(TelemetryDecoderTest, DeviceKeyToPathStripsLeadingZeros) {
    std::string path;
    ASSERT_TRUE(TelemetryDecoder::device_key_to_path("34196_00000_00000", path));
    EXPECT_EQ(path, "/34196/0/0");
    ASSERT_TRUE(TelemetryDecoder::device_key_to_path("34183_00001_00009", path));
    EXPECT_EQ(path, "/34183/1/9");
    ASSERT_TRUE(TelemetryDecoder::device_key_to_path("6_0_0", path));
    EXPECT_EQ(path, "/6/0/0");

    EXPECT_FALSE(TelemetryDecoder::device_key_to_path("34196_00000", path));
    EXPECT_FALSE(TelemetryDecoder::device_key_to_path("34196_0_0_0", path));
    EXPECT_FALSE(TelemetryDecoder::device_key_to_path("abc_0_0", path));
    EXPECT_FALSE(TelemetryDecoder::device_key_to_path("1__0", path));
}

TEST_F(TelemetryDecoderTest, ZeroTripleKeepsSingleZeros) {
    std::string path;
    ASSERT_TRUE(TelemetryDecoder::device_key_to_path("0_00000_00000", path));
    EXPECT_EQ(path, "/0/0/0");
    ASSERT_TRUE(TelemetryDecoder::device_key_to_path("34183_00010_00100", path));
    EXPECT_EQ(path, "/34183/10/100");
}

TEST_F(TelemetryDecoderTest, ReverseMapGivesFriendlyKey) {
    nlohmann::json raw = nlohmann::json::array({{{"deviceKey", "34196_00000_00000"}, {"value", "87"}}});
    std::map<std::string, std::string> reverse = {{"/34196/0/0", "VEHICLE_STATUS_HV_BATTERY_SOC"}};

    TelemetrySnapshot snapshot = TelemetryDecoder::decode(raw, reverse);
    ASSERT_EQ(snapshot.size(), 1u);
    EXPECT_EQ(snapshot.at("battery_level"), TelemetryValue::from_number(87.0));
}

TEST_F(TelemetryDecoderTest, UnmappedKeyUsesCanonicalPath) {
    nlohmann::json raw = nlohmann::json::array({{{"deviceKey", "34196_00000_00000"}, {"value", "PARKED"}}});
    TelemetrySnapshot snapshot = TelemetryDecoder::decode(raw, {});

    ASSERT_EQ(snapshot.size(), 1u);
    EXPECT_EQ(snapshot.at("/34196/0/0"), TelemetryValue::from_text("PARKED"));
}

TEST_F(TelemetryDecoderTest, MappedKeysUseFriendlyNames) {
    TelemetryRequest request = TelemetryDecoder::build_request(sample_mapping());
    nlohmann::json raw = nlohmann::json::array({
        {{"deviceKey", "34183_00001_00009"}, {"value", "80"}},
        {{"deviceKey", "6_0_0"}, {"value", 33.75}},
    });

    TelemetrySnapshot snapshot = TelemetryDecoder::decode(raw, request.path_to_alias);
    ASSERT_EQ(snapshot.size(), 2u);
    EXPECT_EQ(snapshot.at("battery_level"), TelemetryValue::from_number(80.0));
    EXPECT_EQ(snapshot.at("latitude"), TelemetryValue::from_number(33.75));
}

TEST_F(TelemetryDecoderTest, SkipsUnusableItems) {
    nlohmann::json raw = nlohmann::json::array({
        {{"deviceKey", "6_0_0"}, {"value", nullptr}},
        {{"deviceKey", "6_0_1"}},
        {{"value", 5}},
        {{"deviceKey", ""}, {"value", 5}},
        {{"deviceKey", 600}, {"value", 5}},
        "junk",
        {{"deviceKey", "6_0_2"}, {"value", 1}},
    });

    TelemetrySnapshot snapshot = TelemetryDecoder::decode(raw, {});
    ASSERT_EQ(snapshot.size(), 1u);
    EXPECT_EQ(snapshot.count("/6/0/2"), 1u);
}

TEST_F(TelemetryDecoderTest, NonNumericDeviceKeyIsKeptVerbatim) {
    nlohmann::json raw = nlohmann::json::array({{{"deviceKey", "custom_key"}, {"value", "x"}}});
    TelemetrySnapshot snapshot = TelemetryDecoder::decode(raw, {});
    EXPECT_EQ(snapshot.count("custom_key"), 1u);
}

TEST_F(TelemetryDecoderTest, LaterDuplicatesOverwrite) {
    nlohmann::json raw = nlohmann::json::array({
        {{"deviceKey", "6_0_0"}, {"value", 1}},
        {{"deviceKey", "00006_00000_00000"}, {"value", 2}},
    });
    TelemetrySnapshot snapshot = TelemetryDecoder::decode(raw, {});
    ASSERT_EQ(snapshot.size(), 1u);
    EXPECT_EQ(snapshot.at("/6/0/0"), TelemetryValue::from_number(2));
}

TEST_F(TelemetryDecoderTest, NonArrayDecodesToEmpty) {
    EXPECT_TRUE(TelemetryDecoder::decode(nlohmann::json::object(), {}).empty());
    EXPECT_TRUE(TelemetryDecoder::decode(nlohmann::json(), {}).empty());
}

TEST_F(TelemetryDecoderTest, ValueCoercion) {
    EXPECT_EQ(TelemetryDecoder::coerce_value(42), TelemetryValue::from_number(42));
    EXPECT_EQ(TelemetryDecoder::coerce_value(" 12.5 "), TelemetryValue::from_number(12.5));
    EXPECT_EQ(TelemetryDecoder::coerce_value(true), TelemetryValue::from_number(1));
    EXPECT_EQ(TelemetryDecoder::coerce_value("N/A"), TelemetryValue::from_text("N/A"));
    EXPECT_EQ(TelemetryDecoder::coerce_value(nlohmann::json::array({1, 2})), TelemetryValue::from_text("[1,2]"));
}

TEST_F(TelemetryDecoderTest, FriendlyKeyFallsBackToLowercaseAlias) {
    EXPECT_EQ(TelemetryDecoder::friendly_key("VEHICLE_STATUS_REMAINING_DISTANCE"), "range");
    EXPECT_EQ(TelemetryDecoder::friendly_key("REMOTE_CONTROL_CHARGE_PORT_STATUS"), "plugged_in");
    EXPECT_EQ(TelemetryDecoder::friendly_key("SOME_NEW_ALIAS"), "some_new_alias");
}

TEST_F(TelemetryDecoderTest, SnapshotToJson) {
    TelemetrySnapshot snapshot;
    snapshot["battery_level"] = TelemetryValue::from_number(80);
    snapshot["gear"] = TelemetryValue::from_text("P");

    nlohmann::json out = snapshot_to_json(snapshot);
    EXPECT_EQ(out["battery_level"], 80.0);
    EXPECT_EQ(out["gear"], "P");
}

TEST_F(TelemetryDecoderTest, ParsePath) {
    ResourceTriple triple;
    ASSERT_TRUE(TelemetryDecoder::parse_path("/34183/1/9", triple));
    EXPECT_EQ(triple.object_id, "34183");
    EXPECT_EQ(triple.resource_id, "9");
    EXPECT_FALSE(TelemetryDecoder::parse_path("/34183/1", triple));
    EXPECT_FALSE(TelemetryDecoder::parse_path("/", triple));
}
