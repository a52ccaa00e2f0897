#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace VinFastCloud {

std::string base64_encode(const uint8_t *data, size_t length);
std::string base64_encode(const std::vector<uint8_t> &data);
std::string base64_encode(const std::string &data);

/**
 * @brief Strict standard-alphabet base64 decode.
 * @return 0 on success, an error status otherwise (output is cleared)
 */
int base64_decode(const std::string &encoded, std::vector<uint8_t> &output);

std::string bytes_to_hex_string(const uint8_t *bytes, size_t length);

std::string to_lower(const std::string &value);
std::string trim(const std::string &value);

/**
 * @brief Parse a whole string as a floating-point number.
 *
 * Leading/trailing whitespace is ignored; anything else left over makes the parse fail.
 * Decimal notation only, read in the "C" locale. "inf", "infinity" and "nan" are accepted in
 * any case; out-of-range values become infinity or zero instead of failing.
 */
bool parse_double(const std::string &text, double &out);

/**
 * @brief Render a JSON scalar the way the vendor API echoes identifiers: strings verbatim,
 * integers without a decimal point, everything else as compact JSON.
 */
std::string json_scalar_to_string(const nlohmann::json &value);

// Compact JSON (no whitespace), used for anything that gets signed
std::string to_compact_json(const nlohmann::json &value);

}  // namespace VinFastCloud
