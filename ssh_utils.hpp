#ifndef SSH_UTILS_HPP
#define SSH_UTILS_HPP

#include <sys/types.h>
#include <libssh2.h>
#include "config.hpp"

// libssh2 returns 0 from a channel read both at EOF and when nothing has
// arrived yet. Maps the second case to LIBSSH2_ERROR_EAGAIN.
inline ssize_t channel_read_result(ssize_t n, bool at_eof)
{
    if (n == 0 && !at_eof)
        return LIBSSH2_ERROR_EAGAIN;
    return n;
}

// Consecutive keepalive failures. EAGAIN means the request is queued, not
// lost, so it counts as a success.
class KeepaliveTracker
{
private:
    int max_failures;
    int consecutive = 0;

public:
    explicit KeepaliveTracker(int max_failures = KEEPALIVE_MAX_FAILURES) : max_failures(max_failures) {}

    // False once the peer should be considered dead
    bool record(int rc)
    {
        if (rc == 0 || rc == LIBSSH2_ERROR_EAGAIN)
        {
            consecutive = 0;
            return true;
        }
        consecutive++;
        return consecutive < max_failures;
    }

    int failures() const { return consecutive; }
};

#endif
