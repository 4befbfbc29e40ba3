#ifndef SECURE_BUFFER_HPP
#define SECURE_BUFFER_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// Byte buffer for credentials. Contents are wiped with OPENSSL_cleanse on
// wipe() and on destruction. Copies made by libraries the bytes are handed
// to are out of reach, so erasure is best-effort.
class SecureBuffer
{
private:
    std::vector<uint8_t> bytes;

public:
    SecureBuffer() = default;
    explicit SecureBuffer(const std::string &value);
    ~SecureBuffer();

    SecureBuffer(const SecureBuffer &) = delete;
    SecureBuffer &operator=(const SecureBuffer &) = delete;
    SecureBuffer(SecureBuffer &&other) noexcept;
    SecureBuffer &operator=(SecureBuffer &&other) noexcept;

    void assign(const std::string &value);
    void wipe();

    bool empty() const { return bytes.empty(); }
    size_t size() const { return bytes.size(); }
    const char *c_str() const;
    const uint8_t *data() const { return bytes.data(); }
};

#endif
