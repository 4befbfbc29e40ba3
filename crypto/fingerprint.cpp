#include "fingerprint.hpp"
#include <stdexcept>
#include <openssl/crypto.h>
#include <openssl/evp.h>

std::string sha256_fingerprint(const uint8_t *data, size_t len)
{
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;

    if (EVP_Digest(data, len, digest, &digest_len, EVP_sha256(), nullptr) != 1)
    {
        throw std::runtime_error("SHA256 digest failed");
    }

    // 4 output chars per 3 input bytes, plus NUL
    std::vector<unsigned char> encoded(((digest_len + 2) / 3) * 4 + 1);
    int encoded_len = EVP_EncodeBlock(encoded.data(), digest, digest_len);

    std::string b64(reinterpret_cast<const char *>(encoded.data()), encoded_len);
    while (!b64.empty() && b64.back() == '=')
        b64.pop_back();

    return "SHA256:" + b64;
}

std::string sha256_fingerprint(const std::vector<uint8_t> &blob)
{
    return sha256_fingerprint(blob.data(), blob.size());
}

bool constant_time_equal(const std::vector<uint8_t> &a, const std::vector<uint8_t> &b)
{
    if (a.size() != b.size())
        return false;
    if (a.empty())
        return true;
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}
