#include "errors.h"

namespace VinFastCloud {

const char *VinFastCloud_Status_to_string(int status) {
  switch (status) {
#define VINFAST_CLOUD_ERROR_DEF(name, value, string) \
  case value: \
    return string;
    VINFAST_CLOUD_ERROR_CODES
#undef VINFAST_CLOUD_ERROR_DEF
    default:
      return "ERROR_UNKNOWN";
  }
}

}  // namespace VinFastCloud
