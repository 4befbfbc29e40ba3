#include "secure_buffer.hpp"
#include <openssl/crypto.h>

SecureBuffer::SecureBuffer(const std::string &value)
{
    assign(value);
}

SecureBuffer::~SecureBuffer()
{
    wipe();
}

SecureBuffer::SecureBuffer(SecureBuffer &&other) noexcept : bytes(std::move(other.bytes))
{
    other.bytes.clear();
}

SecureBuffer &SecureBuffer::operator=(SecureBuffer &&other) noexcept
{
    if (this != &other)
    {
        wipe();
        bytes = std::move(other.bytes);
        other.bytes.clear();
    }
    return *this;
}

void SecureBuffer::assign(const std::string &value)
{
    wipe();
    // Trailing NUL so the buffer can be handed to C APIs.
    bytes.reserve(value.size() + 1);
    bytes.assign(value.begin(), value.end());
    bytes.push_back(0);
}

void SecureBuffer::wipe()
{
    if (!bytes.empty())
    {
        OPENSSL_cleanse(bytes.data(), bytes.size());
    }
    bytes.clear();
}

const char *SecureBuffer::c_str() const
{
    if (bytes.empty())
        return "";
    return reinterpret_cast<const char *>(bytes.data());
}
