#ifndef VINFAST_CLOUD_ERRORS_H
#define VINFAST_CLOUD_ERRORS_H

namespace VinFastCloud {

// Macro to define error codes and their string representations
#define VINFAST_CLOUD_ERROR_CODES \
  VINFAST_CLOUD_ERROR_DEF(VinFastCloud_Status_E_OK, 0, "OK") \
  VINFAST_CLOUD_ERROR_DEF(VinFastCloud_Status_E_ERROR_INTERNAL, 1, "ERROR_INTERNAL") \
  VINFAST_CLOUD_ERROR_DEF(VinFastCloud_Status_E_ERROR_INVALID_PARAMS, 2, "ERROR_INVALID_PARAMS") \
  VINFAST_CLOUD_ERROR_DEF(VinFastCloud_Status_E_ERROR_INVALID_STATE, 3, "ERROR_INVALID_STATE") \
  VINFAST_CLOUD_ERROR_DEF(VinFastCloud_Status_E_ERROR_AUTH, 4, "ERROR_AUTH") \
  VINFAST_CLOUD_ERROR_DEF(VinFastCloud_Status_E_ERROR_AUTH_EXPIRED, 5, "ERROR_AUTH_EXPIRED") \
  VINFAST_CLOUD_ERROR_DEF(VinFastCloud_Status_E_ERROR_RETRY_AFTER_REFRESH, 6, "ERROR_RETRY_AFTER_REFRESH") \
  VINFAST_CLOUD_ERROR_DEF(VinFastCloud_Status_E_ERROR_PROTOCOL, 7, "ERROR_PROTOCOL") \
  VINFAST_CLOUD_ERROR_DEF(VinFastCloud_Status_E_ERROR_JSON_DECODING, 8, "ERROR_JSON_DECODING") \
  VINFAST_CLOUD_ERROR_DEF(VinFastCloud_Status_E_ERROR_PAIRING, 9, "ERROR_PAIRING") \
  VINFAST_CLOUD_ERROR_DEF(VinFastCloud_Status_E_ERROR_CRYPTO, 10, "ERROR_CRYPTO") \
  VINFAST_CLOUD_ERROR_DEF(VinFastCloud_Status_E_ERROR_NOT_PAIRED, 11, "ERROR_NOT_PAIRED")

// Define the enum using the macro
#define VINFAST_CLOUD_ERROR_DEF(name, value, string) name = value,
typedef enum _VinFastCloud_Status_E { VINFAST_CLOUD_ERROR_CODES } VinFastCloud_Status_E;
#undef VINFAST_CLOUD_ERROR_DEF

// Add helper functions to convert error codes to strings
const char *VinFastCloud_Status_to_string(int status);

}  // namespace VinFastCloud

#endif  // VINFAST_CLOUD_ERRORS_H
