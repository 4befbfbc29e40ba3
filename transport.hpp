#ifndef TRANSPORT_HPP
#define TRANSPORT_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <sys/types.h>

constexpr ssize_t STREAM_WOULD_BLOCK = -2;

// Bidirectional byte stream to a remote host, opened through a Transport.
// read_some/write_some never block: they return a byte count, 0 at EOF
// (reads only), STREAM_WOULD_BLOCK when nothing can be moved right now,
// or -1 on failure.
class Stream
{
public:
    virtual ~Stream() = default;
    virtual ssize_t read_some(uint8_t *buffer, size_t max_len) = 0;
    virtual ssize_t write_some(const uint8_t *data, size_t len) = 0;
    // Descriptor worth polling for incoming data, -1 if there is none
    virtual int poll_fd() const = 0;
    virtual void close() = 0;
};

// What tunnels need from the gateway session.
class Transport
{
public:
    virtual ~Transport() = default;
    // Throws NetworkError when the stream cannot be opened
    virtual std::unique_ptr<Stream> dial(const std::string &host, int port) = 0;
    virtual bool is_connected() const = 0;
    virtual void close() = 0;
};

#endif
