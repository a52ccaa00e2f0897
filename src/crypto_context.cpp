#ifndef VINFAST_LOG_TAG
#define VINFAST_LOG_TAG "VinFastCloud::Crypto"
#endif

#include "crypto_context.h"

#include <cstring>
#include <mbedtls/asn1.h>
#include <mbedtls/md.h>
#include <mbedtls/oid.h>
#include <mbedtls/platform_util.h>
#include <mbedtls/rsa.h>
#include <mbedtls/sha256.h>
#include <mbedtls/x509_csr.h>

#include "defs.h"

namespace VinFastCloud {

namespace {
constexpr size_t PEM_BUFFER_SIZE = 4096;

int store_utf8_attribute(mbedtls_asn1_named_data **names, const char *oid, size_t oid_len, const std::string &value) {
  mbedtls_asn1_named_data *entry = mbedtls_asn1_store_named_data(
      names, oid, oid_len, reinterpret_cast<const unsigned char *>(value.data()), value.size());
  if (entry == nullptr) {
    return VinFastCloud_Status_E_ERROR_INTERNAL;
  }
  entry->val.tag = MBEDTLS_ASN1_UTF8_STRING;
  return VinFastCloud_Status_E_OK;
}
}  // namespace

CryptoContext::CryptoContext()
    : private_key_context_(std::make_shared<mbedtls_pk_context>()),
      drbg_context_(std::make_shared<mbedtls_ctr_drbg_context>()),
      entropy_context_(std::make_unique<mbedtls_entropy_context>()) {
  mbedtls_pk_init(private_key_context_.get());
  mbedtls_ctr_drbg_init(drbg_context_.get());
  mbedtls_entropy_init(entropy_context_.get());
}

CryptoContext::~CryptoContext() { cleanup(); }

CryptoContext::CryptoContext(CryptoContext &&other) noexcept
    : private_key_context_(std::move(other.private_key_context_)),
      drbg_context_(std::move(other.drbg_context_)),
      entropy_context_(std::move(other.entropy_context_)),
      initialized_(other.initialized_) {
  other.initialized_ = false;
}

CryptoContext &CryptoContext::operator=(CryptoContext &&other) noexcept {
  if (this != &other) {
    cleanup();

    private_key_context_ = std::move(other.private_key_context_);
    drbg_context_ = std::move(other.drbg_context_);
    entropy_context_ = std::move(other.entropy_context_);
    initialized_ = other.initialized_;

    other.initialized_ = false;
  }
  return *this;
}

void CryptoContext::cleanup() {
  if (private_key_context_) {
    mbedtls_pk_free(private_key_context_.get());
  }
  if (drbg_context_) {
    mbedtls_ctr_drbg_free(drbg_context_.get());
  }
  if (entropy_context_) {
    mbedtls_entropy_free(entropy_context_.get());
  }
}

int CryptoContext::initialize() {
  std::lock_guard<std::mutex> guard(mutex_);
  return initialize_locked_();
}

int CryptoContext::initialize_locked_() {
  if (initialized_) {
    return VinFastCloud_Status_E_OK;
  }

  static const char personalization[] = "vinfast_cloud";
  int result = mbedtls_ctr_drbg_seed(drbg_context_.get(), mbedtls_entropy_func, entropy_context_.get(),
                                     reinterpret_cast<const unsigned char *>(personalization),
                                     sizeof(personalization) - 1);
  if (result != 0) {
    LOG_ERROR("Failed to seed DRBG: -0x%04x", (unsigned int) -result);
    return VinFastCloud_Status_E_ERROR_INTERNAL;
  }

  initialized_ = true;
  return VinFastCloud_Status_E_OK;
}

void CryptoContext::reset_private_key_() {
  mbedtls_pk_free(private_key_context_.get());
  mbedtls_pk_init(private_key_context_.get());
}

int CryptoContext::create_private_key() {
  std::lock_guard<std::mutex> guard(mutex_);
  int result = initialize_locked_();
  if (result != VinFastCloud_Status_E_OK) {
    return result;
  }

  // Free existing key if any
  reset_private_key_();

  result = mbedtls_pk_setup(private_key_context_.get(), mbedtls_pk_info_from_type(MBEDTLS_PK_RSA));
  if (result != 0) {
    LOG_ERROR("Failed to setup private key: -0x%04x", (unsigned int) -result);
    return VinFastCloud_Status_E_ERROR_INTERNAL;
  }

  LOG_DEBUG("Generating %u-bit RSA key", RSA_KEY_BITS);
  result = mbedtls_rsa_gen_key(mbedtls_pk_rsa(*private_key_context_), mbedtls_ctr_drbg_random, drbg_context_.get(),
                               RSA_KEY_BITS, RSA_PUBLIC_EXPONENT);
  if (result != 0) {
    LOG_ERROR("Failed to generate private key: -0x%04x", (unsigned int) -result);
    reset_private_key_();
    return VinFastCloud_Status_E_ERROR_CRYPTO;
  }

  return VinFastCloud_Status_E_OK;
}

int CryptoContext::load_private_key(const uint8_t *private_key_buffer, size_t key_size) {
  if (!private_key_buffer || key_size == 0) {
    LOG_ERROR("Invalid private key buffer");
    return VinFastCloud_Status_E_ERROR_INVALID_PARAMS;
  }

  std::lock_guard<std::mutex> guard(mutex_);
  int result = initialize_locked_();
  if (result != VinFastCloud_Status_E_OK) {
    return result;
  }

  reset_private_key_();

  result = mbedtls_pk_parse_key(private_key_context_.get(), private_key_buffer, key_size, nullptr, 0,
                                mbedtls_ctr_drbg_random, drbg_context_.get());
  if (result != 0) {
    LOG_ERROR("Failed to parse private key: -0x%04x", (unsigned int) -result);
    reset_private_key_();
    return VinFastCloud_Status_E_ERROR_INVALID_PARAMS;
  }

  // Command signatures are RSA PKCS#1 v1.5 - nothing else will verify server side
  if (!mbedtls_pk_can_do(private_key_context_.get(), MBEDTLS_PK_RSA)) {
    LOG_ERROR("Private key is not an RSA key");
    reset_private_key_();
    return VinFastCloud_Status_E_ERROR_INVALID_PARAMS;
  }

  return VinFastCloud_Status_E_OK;
}

int CryptoContext::load_private_key(const std::string &private_key_pem) {
  if (private_key_pem.empty()) {
    return VinFastCloud_Status_E_ERROR_INVALID_PARAMS;
  }
  // c_str() is NUL-terminated, which the PEM parser needs counted in the length
  return load_private_key(reinterpret_cast<const uint8_t *>(private_key_pem.c_str()), private_key_pem.size() + 1);
}

int CryptoContext::get_private_key_pem(std::string &output) const {
  std::lock_guard<std::mutex> guard(mutex_);
  if (!mbedtls_pk_can_do(private_key_context_.get(), MBEDTLS_PK_RSA)) {
    LOG_ERROR("Private key not initialized");
    return VinFastCloud_Status_E_ERROR_INVALID_STATE;
  }

  std::vector<unsigned char> buffer(PEM_BUFFER_SIZE, 0);
  int result = mbedtls_pk_write_key_pem(private_key_context_.get(), buffer.data(), buffer.size());
  if (result != 0) {
    LOG_ERROR("Failed to write private key: -0x%04x", (unsigned int) -result);
    CryptoUtils::clear_sensitive_memory(buffer.data(), buffer.size());
    return VinFastCloud_Status_E_ERROR_CRYPTO;
  }

  output.assign(reinterpret_cast<const char *>(buffer.data()));
  CryptoUtils::clear_sensitive_memory(buffer.data(), buffer.size());
  return VinFastCloud_Status_E_OK;
}

int CryptoContext::generate_csr(const CsrSubject &subject, std::string &csr_pem) {
  if (subject.common_name.empty()) {
    return VinFastCloud_Status_E_ERROR_INVALID_PARAMS;
  }

  std::lock_guard<std::mutex> guard(mutex_);
  if (!mbedtls_pk_can_do(private_key_context_.get(), MBEDTLS_PK_RSA)) {
    LOG_ERROR("Private key not initialized for CSR");
    return VinFastCloud_Status_E_ERROR_INVALID_STATE;
  }
  int ret = initialize_locked_();
  if (ret != VinFastCloud_Status_E_OK) {
    return ret;
  }

  mbedtls_x509write_csr request;
  mbedtls_x509write_csr_init(&request);
  mbedtls_x509write_csr_set_md_alg(&request, MBEDTLS_MD_SHA256);
  mbedtls_x509write_csr_set_key(&request, private_key_context_.get());

  int status = VinFastCloud_Status_E_ERROR_CRYPTO;
  do {
    // Built as ASN.1 directly so values keep their exact bytes; the list is freed with the request
    mbedtls_asn1_named_data **names = &request.MBEDTLS_PRIVATE(subject);
    if (store_utf8_attribute(names, MBEDTLS_OID_AT_CN, MBEDTLS_OID_SIZE(MBEDTLS_OID_AT_CN), subject.common_name) !=
            VinFastCloud_Status_E_OK ||
        (!subject.organizational_unit.empty() &&
         store_utf8_attribute(names, MBEDTLS_OID_AT_ORG_UNIT, MBEDTLS_OID_SIZE(MBEDTLS_OID_AT_ORG_UNIT),
                              subject.organizational_unit) != VinFastCloud_Status_E_OK)) {
      LOG_ERROR("Failed to allocate CSR subject");
      status = VinFastCloud_Status_E_ERROR_INTERNAL;
      break;
    }

    std::vector<unsigned char> buffer(PEM_BUFFER_SIZE, 0);
    ret = mbedtls_x509write_csr_pem(&request, buffer.data(), buffer.size(), mbedtls_ctr_drbg_random,
                                    drbg_context_.get());
    if (ret != 0) {
      LOG_ERROR("Failed to write CSR: -0x%04x", (unsigned int) -ret);
      break;
    }

    csr_pem.assign(reinterpret_cast<const char *>(buffer.data()));
    status = VinFastCloud_Status_E_OK;
  } while (false);

  mbedtls_x509write_csr_free(&request);
  return status;
}

int CryptoContext::sign_sha256(const uint8_t *data, size_t length, std::vector<uint8_t> &signature) {
  if (data == nullptr && length > 0) {
    return VinFastCloud_Status_E_ERROR_INVALID_PARAMS;
  }

  std::array<uint8_t, CryptoUtils::SHA256_SIZE> hash{};
  int result = CryptoUtils::sha256_hash(data, length, hash.data());
  if (result != VinFastCloud_Status_E_OK) {
    return result;
  }

  std::lock_guard<std::mutex> guard(mutex_);
  if (!mbedtls_pk_can_do(private_key_context_.get(), MBEDTLS_PK_RSA)) {
    LOG_ERROR("Private key not initialized for signing");
    return VinFastCloud_Status_E_ERROR_INVALID_STATE;
  }
  result = initialize_locked_();
  if (result != VinFastCloud_Status_E_OK) {
    return result;
  }

  signature.assign(MBEDTLS_PK_SIGNATURE_MAX_SIZE, 0);
  size_t signature_length = 0;
  int ret = mbedtls_pk_sign(private_key_context_.get(), MBEDTLS_MD_SHA256, hash.data(), hash.size(),
                            signature.data(), signature.size(), &signature_length, mbedtls_ctr_drbg_random,
                            drbg_context_.get());
  if (ret != 0) {
    LOG_ERROR("RSA signing failed: -0x%04x", (unsigned int) -ret);
    signature.clear();
    return VinFastCloud_Status_E_ERROR_CRYPTO;
  }
  signature.resize(signature_length);
  return VinFastCloud_Status_E_OK;
}

int CryptoContext::verify_sha256(const uint8_t *data, size_t length, const std::vector<uint8_t> &signature) const {
  if ((data == nullptr && length > 0) || signature.empty()) {
    return VinFastCloud_Status_E_ERROR_INVALID_PARAMS;
  }

  std::array<uint8_t, CryptoUtils::SHA256_SIZE> hash{};
  int result = CryptoUtils::sha256_hash(data, length, hash.data());
  if (result != VinFastCloud_Status_E_OK) {
    return result;
  }

  std::lock_guard<std::mutex> guard(mutex_);
  if (!mbedtls_pk_can_do(private_key_context_.get(), MBEDTLS_PK_RSA)) {
    return VinFastCloud_Status_E_ERROR_INVALID_STATE;
  }

  int ret = mbedtls_pk_verify(private_key_context_.get(), MBEDTLS_MD_SHA256, hash.data(), hash.size(),
                              signature.data(), signature.size());
  if (ret != 0) {
    LOG_DEBUG("Signature verification failed: -0x%04x", (unsigned int) -ret);
    return VinFastCloud_Status_E_ERROR_CRYPTO;
  }
  return VinFastCloud_Status_E_OK;
}

int CryptoContext::generate_random_bytes(uint8_t *output, size_t length) {
  if (!output || length == 0) {
    return VinFastCloud_Status_E_ERROR_INVALID_PARAMS;
  }

  std::lock_guard<std::mutex> guard(mutex_);
  int result = initialize_locked_();
  if (result != VinFastCloud_Status_E_OK) {
    return result;
  }

  int ret = mbedtls_ctr_drbg_random(drbg_context_.get(), output, length);
  if (ret != 0) {
    LOG_ERROR("Failed to generate random bytes: -0x%04x", (unsigned int) -ret);
    return VinFastCloud_Status_E_ERROR_CRYPTO;
  }

  return VinFastCloud_Status_E_OK;
}

bool CryptoContext::is_private_key_initialized() const {
  std::lock_guard<std::mutex> guard(mutex_);
  return private_key_context_ && mbedtls_pk_can_do(private_key_context_.get(), MBEDTLS_PK_RSA);
}

// CryptoUtils implementation
int CryptoUtils::sha256_hash(const uint8_t *input, size_t input_length, uint8_t *output) {
  if ((!input && input_length > 0) || !output) {
    return VinFastCloud_Status_E_ERROR_INVALID_PARAMS;
  }

  int result = mbedtls_sha256(input, input_length, output, 0);
  if (result != 0) {
    LOG_ERROR("SHA256 hash failed: -0x%04x", (unsigned int) -result);
    return VinFastCloud_Status_E_ERROR_CRYPTO;
  }

  return VinFastCloud_Status_E_OK;
}

int CryptoUtils::hmac_sha256(const uint8_t *key, size_t key_length, const uint8_t *input, size_t input_length,
                             uint8_t *output) {
  if (!key || key_length == 0 || (!input && input_length > 0) || !output) {
    return VinFastCloud_Status_E_ERROR_INVALID_PARAMS;
  }

  const mbedtls_md_info_t *md_info = mbedtls_md_info_from_type(MBEDTLS_MD_SHA256);
  if (md_info == nullptr) {
    LOG_ERROR("SHA256 not available");
    return VinFastCloud_Status_E_ERROR_INTERNAL;
  }

  int result = mbedtls_md_hmac(md_info, key, key_length, input, input_length, output);
  if (result != 0) {
    LOG_ERROR("HMAC-SHA256 failed: -0x%04x", (unsigned int) -result);
    return VinFastCloud_Status_E_ERROR_CRYPTO;
  }

  return VinFastCloud_Status_E_OK;
}

void CryptoUtils::clear_sensitive_memory(void *memory, size_t length) {
  if (memory && length > 0) {
    mbedtls_platform_zeroize(memory, length);
  }
}

}  // namespace VinFastCloud
