#ifndef HOST_KEY_STORE_HPP
#define HOST_KEY_STORE_HPP

#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

struct HostKey
{
    std::string type; // "ssh-ed25519", "ssh-rsa", ...
    std::vector<uint8_t> blob;
};

// In-memory trust-on-first-use store. The first key seen for a host is
// pinned; every later key for that host must match it byte for byte or
// HostKeyMismatchError is thrown. Nothing is persisted.
class HostKeyStore
{
private:
    std::unordered_map<std::string, HostKey> known_hosts;
    mutable std::mutex mutex;

public:
    // Returns true when the key was pinned by this call, false when it
    // matched an existing pin.
    bool verify(const std::string &host, const HostKey &key);

    bool is_pinned(const std::string &host) const;
    size_t size() const;
};

#endif
