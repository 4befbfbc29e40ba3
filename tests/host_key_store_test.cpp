#include <cassert>
#include <cstring>
#include <iostream>
#include <string>
#include "errors.hpp"
#include "host_key_store.hpp"
#include "crypto/fingerprint.hpp"
#include "crypto/secure_buffer.hpp"

HostKey make_key(const std::string &type, const std::string &bytes)
{
    HostKey key;
    key.type = type;
    key.blob.assign(bytes.begin(), bytes.end());
    return key;
}

void test_fingerprint()
{
    std::string abc = "abc";
    assert(sha256_fingerprint(reinterpret_cast<const uint8_t *>(abc.data()), abc.size()) ==
           "SHA256:ungWv48Bz+pBQUDeXa4iI7ADYaOWF3qctBD/YfIAFa0");
    assert(sha256_fingerprint(std::vector<uint8_t>()) == "SHA256:47DEQpj8HBSa+/TImW+5JCeuQeRkm5NMpJWZG3hSuFU");

    assert(constant_time_equal({1, 2, 3}, {1, 2, 3}));
    assert(!constant_time_equal({1, 2, 3}, {1, 2, 4}));
    assert(!constant_time_equal({1, 2, 3}, {1, 2}));
    std::cout << "[OK] fingerprint smoke test\n";
}

void test_pin_on_first_use()
{
    HostKeyStore store;
    HostKey key = make_key("ssh-ed25519", "first-key-blob");

    assert(!store.is_pinned("10.0.0.1"));
    assert(store.verify("10.0.0.1", key));
    assert(store.is_pinned("10.0.0.1"));
    assert(!store.verify("10.0.0.1", key));
    assert(store.size() == 1);
    std::cout << "[OK] pin on first use smoke test\n";
}

void test_mismatch_is_fatal()
{
    HostKeyStore store;
    store.verify("10.0.0.1", make_key("ssh-ed25519", "first-key-blob"));

    bool threw = false;
    try
    {
        store.verify("10.0.0.1", make_key("ssh-ed25519", "other-key-blob"));
    }
    catch (const HostKeyMismatchError &e)
    {
        threw = true;
        assert(std::string(e.what()).find("10.0.0.1") != std::string::npos);
    }
    assert(threw);

    threw = false;
    try
    {
        store.verify("10.0.0.1", make_key("ssh-rsa", "first-key-blob"));
    }
    catch (const HostKeyMismatchError &)
    {
        threw = true;
    }
    assert(threw);

    // The pin itself is unchanged
    assert(!store.verify("10.0.0.1", make_key("ssh-ed25519", "first-key-blob")));

    // Other hosts pin independently
    assert(store.verify("10.0.0.2", make_key("ssh-rsa", "second-host")));
    assert(store.size() == 2);
    std::cout << "[OK] host key mismatch smoke test\n";
}

void test_secure_buffer()
{
    SecureBuffer password("hunter2");
    assert(std::strcmp(password.c_str(), "hunter2") == 0);
    assert(!password.empty());

    SecureBuffer moved(std::move(password));
    assert(std::strcmp(moved.c_str(), "hunter2") == 0);

    moved.wipe();
    assert(moved.empty());
    assert(std::strcmp(moved.c_str(), "") == 0);
    std::cout << "[OK] secure buffer smoke test\n";
}

int main()
{
    test_fingerprint();
    test_pin_on_first_use();
    test_mismatch_is_fatal();
    test_secure_buffer();
    std::cout << "All HostKeyStore tests passed!\n";
    return 0;
}
