#include "connection.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <unistd.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <spdlog/spdlog.h>
#include "config.hpp"
#include "errors.hpp"
#include "network_utils.hpp"
#include "ssh_utils.hpp"
#include "string_utils.hpp"

struct SessionCore
{
    std::mutex mutex;
    LIBSSH2_SESSION *session = nullptr;
    int sockfd = -1;
};

namespace
{

using Clock = std::chrono::steady_clock;

constexpr int RC_CANCELLED = -10000;

void ensure_libssh2()
{
    static std::once_flag once;
    static int init_rc = 0;
    std::call_once(once, [] { init_rc = libssh2_init(0); });
    if (init_rc != 0)
    {
        throw NetworkError("ssh: libssh2 initialisation failed (" + std::to_string(init_rc) + ")");
    }
}

std::string last_error(LIBSSH2_SESSION *session)
{
    char *msg = nullptr;
    int len = 0;
    libssh2_session_last_error(session, &msg, &len, 0);
    if (msg == nullptr || len <= 0)
        return "unknown libssh2 error";
    return std::string(msg, len);
}

std::string describe(int rc, const std::string &message)
{
    if (rc == RC_CANCELLED)
        return "cancelled";
    if (rc == LIBSSH2_ERROR_TIMEOUT)
        return "timed out";
    if (!message.empty())
        return message;
    return "libssh2 error " + std::to_string(rc);
}

void wait_socket(int fd, int directions, int timeout_ms)
{
    if (fd < 0)
        return;

    pollfd pfd{};
    pfd.fd = fd;
    if (directions & LIBSSH2_SESSION_BLOCK_INBOUND)
        pfd.events |= POLLIN;
    if (directions & LIBSSH2_SESSION_BLOCK_OUTBOUND)
        pfd.events |= POLLOUT;
    if (pfd.events == 0)
        pfd.events = POLLIN;

    poll(&pfd, 1, timeout_ms);
}

// Runs op under the session lock, retrying on EAGAIN until it completes,
// the deadline passes or one of the scopes is cancelled. The lock is
// released while waiting on the socket.
int run_session_op(SessionCore &core, const std::function<int(LIBSSH2_SESSION *)> &op,
                   Clock::time_point deadline, const CancellationScope &first,
                   const CancellationScope &second, std::string *error_message)
{
    while (true)
    {
        int fd;
        int directions;
        {
            std::lock_guard<std::mutex> lock(core.mutex);
            if (core.session == nullptr)
            {
                if (error_message)
                    *error_message = "session closed";
                return LIBSSH2_ERROR_SOCKET_DISCONNECT;
            }

            int rc = op(core.session);
            if (rc != LIBSSH2_ERROR_EAGAIN)
            {
                if (rc < 0 && error_message)
                    *error_message = last_error(core.session);
                return rc;
            }

            fd = core.sockfd;
            directions = libssh2_session_block_directions(core.session);
        }

        if (first.is_cancelled() || second.is_cancelled())
            return RC_CANCELLED;

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
        if (remaining.count() <= 0)
            return LIBSSH2_ERROR_TIMEOUT;

        int wait_ms = static_cast<int>(std::min<long long>(remaining.count(), SPLICE_POLL_MS));
        wait_socket(fd, directions, wait_ms);
    }
}

// Closes and frees a channel, bounded so a dead peer cannot stall us.
void release_channel(SessionCore &core, LIBSSH2_CHANNEL *channel)
{
    auto deadline = Clock::now() + std::chrono::milliseconds(1000);
    run_session_op(core, [channel](LIBSSH2_SESSION *) { return libssh2_channel_close(channel); },
                   deadline, never_cancelled(), never_cancelled(), nullptr);

    while (true)
    {
        {
            std::lock_guard<std::mutex> lock(core.mutex);
            // Freeing the session already released its channels
            if (core.session == nullptr)
                return;
            if (libssh2_channel_free(channel) != LIBSSH2_ERROR_EAGAIN)
                return;
        }
        if (Clock::now() >= deadline)
        {
            spdlog::debug("Channel free still pending after close timeout");
            return;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
}

std::string hostkey_type_name(int type)
{
    switch (type)
    {
    case LIBSSH2_HOSTKEY_TYPE_RSA:
        return "ssh-rsa";
    case LIBSSH2_HOSTKEY_TYPE_DSS:
        return "ssh-dss";
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_256:
        return "ecdsa-sha2-nistp256";
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_384:
        return "ecdsa-sha2-nistp384";
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_521:
        return "ecdsa-sha2-nistp521";
    case LIBSSH2_HOSTKEY_TYPE_ED25519:
        return "ssh-ed25519";
    default:
        return "unknown";
    }
}

// Stream over a direct-tcpip channel. Keeps the session core alive so a
// closed Connection turns every call into a clean failure.
class ChannelStream : public Stream
{
private:
    std::shared_ptr<SessionCore> core;
    LIBSSH2_CHANNEL *channel;
    int sockfd;
    bool closed = false;

public:
    ChannelStream(std::shared_ptr<SessionCore> core, LIBSSH2_CHANNEL *channel, int sockfd)
        : core(std::move(core)), channel(channel), sockfd(sockfd)
    {
    }

    ~ChannelStream() override
    {
        close();
    }

    ssize_t read_some(uint8_t *buffer, size_t max_len) override
    {
        std::lock_guard<std::mutex> lock(core->mutex);
        if (closed || core->session == nullptr)
            return -1;

        ssize_t n = libssh2_channel_read(channel, reinterpret_cast<char *>(buffer), max_len);
        if (n == 0)
            n = channel_read_result(n, libssh2_channel_eof(channel) != 0);
        if (n == LIBSSH2_ERROR_EAGAIN)
            return STREAM_WOULD_BLOCK;
        if (n < 0)
            return -1;
        return n;
    }

    ssize_t write_some(const uint8_t *data, size_t len) override
    {
        std::lock_guard<std::mutex> lock(core->mutex);
        if (closed || core->session == nullptr)
            return -1;

        ssize_t n = libssh2_channel_write(channel, reinterpret_cast<const char *>(data), len);
        if (n == LIBSSH2_ERROR_EAGAIN)
            return STREAM_WOULD_BLOCK;
        if (n < 0)
            return -1;
        return n;
    }

    int poll_fd() const override
    {
        return sockfd;
    }

    void close() override
    {
        if (closed)
            return;
        closed = true;
        release_channel(*core, channel);
    }
};

} // namespace

Connection::Connection(std::shared_ptr<HostKeyStore> trust_store)
    : trust_store(std::move(trust_store)), core(std::make_shared<SessionCore>())
{
    if (!this->trust_store)
    {
        throw std::invalid_argument("Connection requires a host key store");
    }
}

Connection::~Connection()
{
    close();
}

std::shared_ptr<Connection> Connection::open(std::shared_ptr<HostKeyStore> trust_store,
                                             const std::string &host, int port,
                                             const std::string &user, const std::string &password)
{
    auto conn = std::make_shared<Connection>(trust_store);
    try
    {
        conn->connect(host, port, user, password);
        return conn;
    }
    catch (const HandshakeError &e)
    {
        spdlog::info("Default host key algorithms failed for {} ({}), retrying with {}",
                     join_host_port(host, port), e.what(), LEGACY_HOSTKEY_ALGORITHMS);
    }

    auto legacy = std::make_shared<Connection>(trust_store);
    legacy->connect(host, port, user, password, LEGACY_HOSTKEY_ALGORITHMS);
    return legacy;
}

int Connection::tcp_connect(const std::string &target_host, int port)
{
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo *results = nullptr;
    std::string port_str = std::to_string(port);
    int gai = getaddrinfo(target_host.c_str(), port_str.c_str(), &hints, &results);
    if (gai != 0)
    {
        throw NetworkError("ssh: resolve " + target_host + ": " + gai_strerror(gai));
    }

    std::string last_failure = "no addresses";
    int fd = -1;
    for (addrinfo *ai = results; ai != nullptr; ai = ai->ai_next)
    {
        fd = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd < 0)
        {
            last_failure = strerror(errno);
            continue;
        }

        int flag = 1;
        setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &flag, sizeof(flag));
        setsockopt(fd, SOL_SOCKET, SO_KEEPALIVE, &flag, sizeof(flag));
        set_nonblocking(fd);

        int rc = ::connect(fd, ai->ai_addr, ai->ai_addrlen);
        if (rc < 0 && errno == EINPROGRESS)
        {
            pollfd pfd{};
            pfd.fd = fd;
            pfd.events = POLLOUT;
            rc = poll(&pfd, 1, CONNECT_TIMEOUT_MS);
            if (rc == 0)
            {
                last_failure = "timed out after " + std::to_string(CONNECT_TIMEOUT_MS) + "ms";
                rc = -1;
            }
            else if (rc > 0)
            {
                int so_error = 0;
                socklen_t len = sizeof(so_error);
                getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len);
                if (so_error == 0)
                {
                    rc = 0;
                }
                else
                {
                    last_failure = strerror(so_error);
                    rc = -1;
                }
            }
            else
            {
                last_failure = strerror(errno);
            }
        }
        else if (rc < 0)
        {
            last_failure = strerror(errno);
        }

        if (rc == 0)
        {
            freeaddrinfo(results);
            return fd;
        }

        ::close(fd);
        fd = -1;
    }

    freeaddrinfo(results);
    throw NetworkError("ssh: connect to " + join_host_port(target_host, port) + ": " + last_failure);
}

void Connection::verify_host_key(LIBSSH2_SESSION *session)
{
    size_t len = 0;
    int type = LIBSSH2_HOSTKEY_TYPE_UNKNOWN;
    const char *key = libssh2_session_hostkey(session, &len, &type);
    if (key == nullptr || len == 0)
    {
        throw HandshakeError("ssh: " + gateway + " presented no host key");
    }

    HostKey presented;
    presented.type = hostkey_type_name(type);
    presented.blob.assign(reinterpret_cast<const uint8_t *>(key),
                          reinterpret_cast<const uint8_t *>(key) + len);

    // Pinned per host so that every port on the host shares one identity.
    trust_store->verify(host, presented);
}

void Connection::authenticate(LIBSSH2_SESSION *session)
{
    int rc = libssh2_userauth_password_ex(session, user.c_str(), user.size(),
                                          password.c_str(), password.size() - 1, nullptr);
    if (rc != 0)
    {
        throw AuthError("ssh: authentication failed for " + user + "@" + gateway + ": " +
                        last_error(session));
    }
}

void Connection::connect(const std::string &target_host, int port, const std::string &username,
                         const std::string &secret, const std::string &hostkey_algorithms)
{
    std::lock_guard<std::mutex> state(state_mutex);

    if (connected)
    {
        throw NetworkError("ssh: already connected to " + gateway);
    }
    if (used)
    {
        throw NetworkError("ssh: connection object already used, create a new one");
    }
    used = true;

    ensure_libssh2();

    host = target_host;
    gateway = join_host_port(target_host, port);
    user = username;
    password.assign(secret);

    int fd = -1;
    LIBSSH2_SESSION *session = nullptr;

    try
    {
        fd = tcp_connect(target_host, port);

        session = libssh2_session_init();
        if (session == nullptr)
        {
            throw NetworkError("ssh: cannot allocate session for " + gateway);
        }

        if (!hostkey_algorithms.empty())
        {
            int rc = libssh2_session_method_pref(session, LIBSSH2_METHOD_HOSTKEY,
                                                 hostkey_algorithms.c_str());
            if (rc != 0)
            {
                throw NetworkError("ssh: unsupported host key algorithms \"" + hostkey_algorithms +
                                   "\": " + last_error(session));
            }
        }

        libssh2_session_set_blocking(session, 1);
        libssh2_session_set_timeout(session, CONNECT_TIMEOUT_MS);

        if (libssh2_session_handshake(session, fd) != 0)
        {
            throw HandshakeError("ssh: handshake with " + gateway + ": " + last_error(session));
        }

        const char *server_id = libssh2_session_banner_get(session);
        banner = server_id ? server_id : "";

        verify_host_key(session);
        authenticate(session);

        libssh2_session_set_timeout(session, 0);
        libssh2_session_set_blocking(session, 0);
    }
    catch (const TunnelerError &)
    {
        if (session != nullptr)
        {
            libssh2_session_disconnect(session, "connection aborted");
            libssh2_session_free(session);
        }
        if (fd >= 0)
        {
            ::close(fd);
        }
        password.wipe();
        throw;
    }

    {
        std::lock_guard<std::mutex> lock(core->mutex);
        core->session = session;
        core->sockfd = fd;
    }
    connected = true;

    spdlog::info("Connected to {} as {} ({})", gateway, user, banner.empty() ? "no banner" : banner);
}

std::string Connection::exec(const std::string &cmd, const CancellationScope &cancel,
                             std::chrono::milliseconds timeout)
{
    if (!is_connected())
    {
        throw ExecError(cmd, "not connected to " + gateway);
    }

    auto deadline = Clock::now() + timeout;
    std::string message;

    LIBSSH2_CHANNEL *channel = nullptr;
    int rc = run_session_op(*core, [&channel](LIBSSH2_SESSION *session) {
        channel = libssh2_channel_open_session(session);
        return channel ? 0 : libssh2_session_last_errno(session);
    }, deadline, cancel, scope, &message);
    if (rc != 0 || channel == nullptr)
    {
        throw ExecError(cmd, "open session on " + gateway + ": " + describe(rc, message));
    }

    std::string output;
    int exit_status = 0;
    std::string failure;

    // Skipped by run_session_op once close() has freed the session and its channels
    rc = run_session_op(*core, [channel](LIBSSH2_SESSION *) {
        return libssh2_channel_handle_extended_data2(channel, LIBSSH2_CHANNEL_EXTENDED_DATA_MERGE);
    }, deadline, cancel, scope, &message);

    if (rc == 0)
    {
        rc = run_session_op(*core, [channel, &cmd](LIBSSH2_SESSION *) {
            return libssh2_channel_exec(channel, cmd.c_str());
        }, deadline, cancel, scope, &message);
    }

    if (rc != 0)
    {
        failure = describe(rc, message);
    }
    else
    {
        char buffer[BUFFER_SIZE];
        while (true)
        {
            rc = run_session_op(*core, [channel, &buffer](LIBSSH2_SESSION *) {
                ssize_t n = libssh2_channel_read(channel, buffer, sizeof(buffer));
                if (n == 0)
                    n = channel_read_result(n, libssh2_channel_eof(channel) != 0);
                return static_cast<int>(n);
            }, deadline, cancel, scope, &message);

            if (rc > 0)
            {
                output.append(buffer, rc);
                continue;
            }
            if (rc < 0)
            {
                failure = describe(rc, message);
            }
            break;
        }
    }

    if (failure.empty())
    {
        run_session_op(*core, [channel](LIBSSH2_SESSION *) { return libssh2_channel_close(channel); },
                       deadline, cancel, scope, nullptr);
        std::lock_guard<std::mutex> lock(core->mutex);
        if (core->session != nullptr)
        {
            exit_status = libssh2_channel_get_exit_status(channel);
        }
    }

    release_channel(*core, channel);

    output = trim(output);
    if (!failure.empty())
    {
        throw ExecError(cmd, failure, output);
    }
    if (exit_status != 0)
    {
        throw ExecError(cmd, "exit status " + std::to_string(exit_status), output);
    }
    return output;
}

LIBSSH2_CHANNEL *Connection::open_direct(const std::string &remote_host, int remote_port,
                                         std::chrono::milliseconds timeout)
{
    std::string target = join_host_port(remote_host, remote_port);
    if (!is_connected())
    {
        throw NetworkError("ssh: not connected, cannot dial " + target);
    }

    std::string message;
    LIBSSH2_CHANNEL *channel = nullptr;
    int rc = run_session_op(*core, [&](LIBSSH2_SESSION *session) {
        channel = libssh2_channel_direct_tcpip_ex(session, remote_host.c_str(), remote_port,
                                                  "127.0.0.1", 0);
        return channel ? 0 : libssh2_session_last_errno(session);
    }, Clock::now() + timeout, scope, never_cancelled(), &message);

    if (rc != 0 || channel == nullptr)
    {
        throw NetworkError("ssh: dial " + target + " through " + gateway + ": " + describe(rc, message));
    }
    return channel;
}

std::unique_ptr<Stream> Connection::dial(const std::string &remote_host, int remote_port)
{
    LIBSSH2_CHANNEL *channel = open_direct(remote_host, remote_port,
                                           std::chrono::milliseconds(CONNECT_TIMEOUT_MS));
    int fd;
    {
        std::lock_guard<std::mutex> lock(core->mutex);
        fd = core->sockfd;
    }
    return std::make_unique<ChannelStream>(core, channel, fd);
}

bool Connection::probe(const std::string &remote_host, int remote_port, std::chrono::milliseconds timeout)
{
    try
    {
        LIBSSH2_CHANNEL *channel = open_direct(remote_host, remote_port, timeout);
        release_channel(*core, channel);
        return true;
    }
    catch (const NetworkError &e)
    {
        spdlog::debug("Probe {} closed: {}", join_host_port(remote_host, remote_port), e.what());
        return false;
    }
}

void Connection::start_keepalive(std::chrono::seconds interval)
{
    std::lock_guard<std::mutex> state(state_mutex);
    if (!connected || keepalive_thread.joinable())
        return;

    {
        std::lock_guard<std::mutex> lock(core->mutex);
        libssh2_keepalive_config(core->session, 1, static_cast<unsigned>(interval.count()));
    }
    keepalive_thread = std::thread(&Connection::keepalive_loop, this, interval);
}

void Connection::keepalive_loop(std::chrono::seconds interval)
{
    KeepaliveTracker tracker;

    while (!scope.wait_for(interval))
    {
        int rc;
        {
            std::lock_guard<std::mutex> lock(core->mutex);
            if (core->session == nullptr)
                return;
            int next = 0;
            rc = libssh2_keepalive_send(core->session, &next);
        }

        bool alive = tracker.record(rc);
        if (tracker.failures() == 0)
            continue;

        spdlog::warn("Keepalive to {} failed ({}/{})", gateway, tracker.failures(), KEEPALIVE_MAX_FAILURES);
        if (!alive)
        {
            connected = false;
            spdlog::error("Connection to {} considered dead after {} keepalive failures",
                          gateway, tracker.failures());
            return;
        }
    }
}

bool Connection::is_connected() const
{
    return connected.load();
}

std::string Connection::server_banner() const
{
    std::lock_guard<std::mutex> state(state_mutex);
    return banner;
}

void Connection::close()
{
    scope.cancel();
    if (keepalive_thread.joinable())
    {
        keepalive_thread.join();
    }

    std::lock_guard<std::mutex> state(state_mutex);
    password.wipe();
    bool was_connected = connected.exchange(false);

    std::lock_guard<std::mutex> lock(core->mutex);
    if (core->session != nullptr)
    {
        libssh2_session_set_blocking(core->session, 1);
        libssh2_session_set_timeout(core->session, 2000);
        int rc = libssh2_session_disconnect(core->session, "closing");
        if (rc != 0)
        {
            spdlog::debug("Disconnect from {} reported {}", gateway, last_error(core->session));
        }
        libssh2_session_free(core->session);
        core->session = nullptr;
    }
    if (core->sockfd >= 0)
    {
        ::close(core->sockfd);
        core->sockfd = -1;
    }

    if (was_connected)
    {
        spdlog::info("Closed connection to {}", gateway);
    }
}
