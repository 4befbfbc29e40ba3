#ifndef FINGERPRINT_HPP
#define FINGERPRINT_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// OpenSSH style "SHA256:<base64 without padding>" of a host key blob
std::string sha256_fingerprint(const uint8_t *data, size_t len);
std::string sha256_fingerprint(const std::vector<uint8_t> &blob);

// Length check, then CRYPTO_memcmp over the bytes
bool constant_time_equal(const std::vector<uint8_t> &a, const std::vector<uint8_t> &b);

#endif
