#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <cstddef>
#include <stdexcept>
#include <string>

// Root of every error the tunneler raises. Messages carry the host, port
// and operation involved.
class TunnelerError : public std::runtime_error
{
public:
    explicit TunnelerError(const std::string &what) : std::runtime_error(what) {}
};

// Resolve, TCP connect, SSH negotiation and dial failures.
class NetworkError : public TunnelerError
{
public:
    explicit NetworkError(const std::string &what) : TunnelerError(what) {}
};

// Failure during key exchange. Triggers the one legacy-algorithm retry.
class HandshakeError : public NetworkError
{
public:
    explicit HandshakeError(const std::string &what) : NetworkError(what) {}
};

class AuthError : public TunnelerError
{
public:
    explicit AuthError(const std::string &what) : TunnelerError(what) {}
};

// Pinned host key differs from the one presented. Never bypassed.
class HostKeyMismatchError : public TunnelerError
{
public:
    explicit HostKeyMismatchError(const std::string &what) : TunnelerError(what) {}
};

class ExecError : public TunnelerError
{
private:
    std::string command;
    std::string partial_output;

public:
    ExecError(const std::string &cmd, const std::string &reason, const std::string &output = "")
        : TunnelerError("exec \"" + cmd + "\": " + reason), command(cmd), partial_output(output)
    {
    }

    const std::string &cmd() const { return command; }
    const std::string &output() const { return partial_output; }
};

class ValidationError : public TunnelerError
{
public:
    explicit ValidationError(const std::string &what) : TunnelerError(what) {}
};

// Bind failure, port window exhaustion, accept error storm.
class ResourceError : public TunnelerError
{
public:
    explicit ResourceError(const std::string &what) : TunnelerError(what) {}
};

class DrainTimeoutError : public TunnelerError
{
private:
    size_t residual_count;

public:
    DrainTimeoutError(const std::string &what, size_t residual)
        : TunnelerError(what), residual_count(residual)
    {
    }

    size_t residual() const { return residual_count; }
};

class CancelledError : public TunnelerError
{
public:
    explicit CancelledError(const std::string &what) : TunnelerError(what) {}
};

#endif
