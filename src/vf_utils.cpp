#include "vf_utils.h"

#include <mbedtls/base64.h>

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <limits>
#include <locale>
#include <sstream>

#include "errors.h"

namespace VinFastCloud {

std::string base64_encode(const uint8_t *data, size_t length) {
  if (data == nullptr || length == 0) {
    return "";
  }

  size_t required = 0;
  // First call only reports the required size
  mbedtls_base64_encode(nullptr, 0, &required, data, length);

  std::vector<unsigned char> buffer(required);
  size_t written = 0;
  if (mbedtls_base64_encode(buffer.data(), buffer.size(), &written, data, length) != 0) {
    return "";
  }
  return std::string(reinterpret_cast<const char *>(buffer.data()), written);
}

std::string base64_encode(const std::vector<uint8_t> &data) { return base64_encode(data.data(), data.size()); }

std::string base64_encode(const std::string &data) {
  return base64_encode(reinterpret_cast<const uint8_t *>(data.data()), data.size());
}

int base64_decode(const std::string &encoded, std::vector<uint8_t> &output) {
  output.clear();
  if (encoded.empty()) {
    return VinFastCloud_Status_E_OK;
  }

  const auto *src = reinterpret_cast<const unsigned char *>(encoded.data());
  size_t required = 0;
  int ret = mbedtls_base64_decode(nullptr, 0, &required, src, encoded.size());
  if (ret == MBEDTLS_ERR_BASE64_INVALID_CHARACTER) {
    return VinFastCloud_Status_E_ERROR_INVALID_PARAMS;
  }

  output.resize(required);
  size_t written = 0;
  ret = mbedtls_base64_decode(output.data(), output.size(), &written, src, encoded.size());
  if (ret != 0) {
    output.clear();
    return VinFastCloud_Status_E_ERROR_INVALID_PARAMS;
  }
  output.resize(written);
  return VinFastCloud_Status_E_OK;
}

std::string bytes_to_hex_string(const uint8_t *bytes, size_t length) {
  std::stringstream ss;
  ss << std::hex << std::setfill('0');
  for (size_t i = 0; i < length; i++) {
    ss << std::setw(2) << static_cast<unsigned>(bytes[i]);
  }
  return ss.str();
}

std::string to_lower(const std::string &value) {
  std::string out = value;
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

std::string trim(const std::string &value) {
  size_t begin = 0;
  size_t end = value.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(value[begin]))) {
    begin++;
  }
  while (end > begin && std::isspace(static_cast<unsigned char>(value[end - 1]))) {
    end--;
  }
  return value.substr(begin, end - begin);
}

bool parse_double(const std::string &text, double &out) {
  std::string trimmed = trim(text);
  if (trimmed.empty()) {
    return false;
  }

  size_t pos = 0;
  bool negative = false;
  if (trimmed[pos] == '+' || trimmed[pos] == '-') {
    negative = trimmed[pos] == '-';
    pos++;
  }

  std::string word = trimmed.substr(pos);
  std::transform(word.begin(), word.end(), word.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (word == "inf" || word == "infinity") {
    out = negative ? -std::numeric_limits<double>::infinity() : std::numeric_limits<double>::infinity();
    return true;
  }
  if (word == "nan") {
    out = std::numeric_limits<double>::quiet_NaN();
    return true;
  }

  // Decimal only: [sign] digits [. digits] [e [sign] digits], at least one mantissa digit
  auto digits = [&trimmed, &pos]() {
    size_t start = pos;
    while (pos < trimmed.size() && std::isdigit(static_cast<unsigned char>(trimmed[pos]))) {
      pos++;
    }
    return pos - start;
  };
  size_t mantissa_digits = digits();
  if (pos < trimmed.size() && trimmed[pos] == '.') {
    pos++;
    mantissa_digits += digits();
  }
  if (mantissa_digits == 0) {
    return false;
  }
  bool negative_exponent = false;
  if (pos < trimmed.size() && (trimmed[pos] == 'e' || trimmed[pos] == 'E')) {
    pos++;
    if (pos < trimmed.size() && (trimmed[pos] == '+' || trimmed[pos] == '-')) {
      negative_exponent = trimmed[pos] == '-';
      pos++;
    }
    if (digits() == 0) {
      return false;
    }
  }
  if (pos != trimmed.size()) {
    return false;
  }

  std::istringstream stream(trimmed);
  stream.imbue(std::locale::classic());
  double parsed = 0.0;
  stream >> parsed;
  if (stream.fail()) {
    // Out of range: overflow saturates to infinity, underflow to zero
    parsed = negative_exponent ? 0.0 : std::numeric_limits<double>::infinity();
    if (negative) {
      parsed = -parsed;
    }
  }
  out = parsed;
  return true;
}

std::string json_scalar_to_string(const nlohmann::json &value) {
  if (value.is_string()) {
    return value.get<std::string>();
  }
  if (value.is_number_integer()) {
    return std::to_string(value.get<long long>());
  }
  if (value.is_number_unsigned()) {
    return std::to_string(value.get<unsigned long long>());
  }
  return value.dump();
}

// Non-ASCII is escaped so the signed bytes do not depend on the payload's encoding
std::string to_compact_json(const nlohmann::json &value) { return value.dump(-1, ' ', true); }

}  // namespace VinFastCloud
