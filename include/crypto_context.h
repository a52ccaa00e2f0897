#pragma once

#include <array>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "mbedtls/ctr_drbg.h"
#include "mbedtls/entropy.h"
#include "mbedtls/pk.h"
#include "errors.h"

namespace VinFastCloud {

// Attribute values are stored verbatim, without DN string parsing
struct CsrSubject {
  std::string common_name;
  std::string organizational_unit;  // omitted when empty
};

/**
 * @brief RAII wrapper for mbedTLS contexts
 *
 * Owns the RSA signing key used for enrollment and command signatures together with the
 * DRBG that feeds key generation, CSR signing and random seeds.
 */
class CryptoContext {
 public:
  static constexpr unsigned int RSA_KEY_BITS = 2048;
  static constexpr int RSA_PUBLIC_EXPONENT = 65537;

  CryptoContext();
  ~CryptoContext();

  // Delete copy constructor and assignment operator
  CryptoContext(const CryptoContext &) = delete;
  CryptoContext &operator=(const CryptoContext &) = delete;

  // Allow move constructor and assignment
  CryptoContext(CryptoContext &&) noexcept;
  CryptoContext &operator=(CryptoContext &&) noexcept;

  /**
   * @brief Seed the DRBG from the platform entropy source
   * @return Error code (0 on success)
   */
  int initialize();

  /**
   * @brief Create a new 2048-bit RSA private key, replacing any loaded key
   * @return Error code (0 on success)
   */
  int create_private_key();

  /**
   * @brief Load a private key from a PEM (PKCS#1 or PKCS#8) or DER buffer
   *
   * PEM input must include the terminating NUL in key_size, as mbedTLS requires.
   * Only RSA keys are accepted.
   * @return Error code (0 on success)
   */
  int load_private_key(const uint8_t *private_key_buffer, size_t key_size);
  int load_private_key(const std::string &private_key_pem);

  /**
   * @brief Get the private key in unencrypted PEM format
   * @return Error code (0 on success)
   */
  int get_private_key_pem(std::string &output) const;

  /**
   * @brief Build a PEM certificate signing request signed with SHA-256
   * @return Error code (0 on success), ERROR_INVALID_PARAMS for an empty common name
   */
  int generate_csr(const CsrSubject &subject, std::string &csr_pem);

  /**
   * @brief RSA PKCS#1 v1.5 signature over SHA-256(data)
   * @return Error code (0 on success)
   */
  int sign_sha256(const uint8_t *data, size_t length, std::vector<uint8_t> &signature);

  /**
   * @brief Verify an RSA PKCS#1 v1.5 SHA-256 signature with this key's public half
   * @return Error code (0 when the signature matches)
   */
  int verify_sha256(const uint8_t *data, size_t length, const std::vector<uint8_t> &signature) const;

  int generate_random_bytes(uint8_t *output, size_t length);

  bool is_private_key_initialized() const;

  std::shared_ptr<mbedtls_pk_context> get_private_key_context() const { return private_key_context_; }

 private:
  std::shared_ptr<mbedtls_pk_context> private_key_context_;
  std::shared_ptr<mbedtls_ctr_drbg_context> drbg_context_;
  std::unique_ptr<mbedtls_entropy_context> entropy_context_;

  // DRBG and key are shared between pairing and signing paths
  mutable std::mutex mutex_;
  bool initialized_ = false;

  int initialize_locked_();
  void reset_private_key_();
  void cleanup();
};

/**
 * @brief Utility class for common cryptographic operations
 */
class CryptoUtils {
 public:
  static constexpr size_t SHA256_SIZE = 32;

  /**
   * @brief Calculate SHA-256 hash
   * @param output Output buffer (must be at least 32 bytes)
   * @return Error code (0 on success)
   */
  static int sha256_hash(const uint8_t *input, size_t input_length, uint8_t *output);

  /**
   * @brief HMAC-SHA256
   * @param output Output buffer (must be at least 32 bytes)
   * @return Error code (0 on success)
   */
  static int hmac_sha256(const uint8_t *key, size_t key_length, const uint8_t *input, size_t input_length,
                         uint8_t *output);

  static void clear_sensitive_memory(void *memory, size_t length);
};

}  // namespace VinFastCloud
