#include "host_key_store.hpp"
#include "errors.hpp"
#include "crypto/fingerprint.hpp"
#include <spdlog/spdlog.h>

bool HostKeyStore::verify(const std::string &host, const HostKey &key)
{
    std::lock_guard<std::mutex> lock(mutex);

    auto it = known_hosts.find(host);
    if (it == known_hosts.end())
    {
        known_hosts.emplace(host, key);
        spdlog::warn("Host key for {} ({}) pinned on first use: {}",
                     host, key.type, sha256_fingerprint(key.blob));
        return true;
    }

    const HostKey &stored = it->second;
    bool same_type = stored.type == key.type;
    bool same_blob = constant_time_equal(stored.blob, key.blob);
    if (!same_type || !same_blob)
    {
        throw HostKeyMismatchError(
            "host key mismatch for " + host + " -- possible MITM attack (expected " +
            stored.type + " " + sha256_fingerprint(stored.blob) + ", got " +
            key.type + " " + sha256_fingerprint(key.blob) + ")");
    }
    return false;
}

bool HostKeyStore::is_pinned(const std::string &host) const
{
    std::lock_guard<std::mutex> lock(mutex);
    return known_hosts.count(host) != 0;
}

size_t HostKeyStore::size() const
{
    std::lock_guard<std::mutex> lock(mutex);
    return known_hosts.size();
}
