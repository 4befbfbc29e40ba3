#ifndef TUNNEL_MANAGER_HPP
#define TUNNEL_MANAGER_HPP

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <vector>
#include "cancellation.hpp"
#include "port_allocator.hpp"
#include "transport.hpp"
#include "event_queue.hpp"
#include "tunnel.hpp"

enum class TunnelEventType
{
    Started,
    Active,
    Failed,
    Closed
};

const char *to_string(TunnelEventType type);

struct TunnelEvent
{
    std::shared_ptr<Tunnel> tunnel;
    TunnelEventType type;
};

// Runs many tunnels over one transport and reports their lifecycle on a
// bounded event queue. Events are best effort: a full queue drops them.
class TunnelManager
{
private:
    std::shared_ptr<Transport> transport;
    std::vector<std::shared_ptr<Tunnel>> managed;
    mutable std::mutex tunnels_mutex;
    EventQueue<TunnelEvent> events;
    CancellationScope build_scope;
    std::atomic<bool> closing{false};

    void emit(const std::shared_ptr<Tunnel> &tunnel, TunnelEventType type);

public:
    TunnelManager(std::shared_ptr<Transport> transport, size_t event_capacity);
    ~TunnelManager();

    TunnelManager(const TunnelManager &) = delete;
    TunnelManager &operator=(const TunnelManager &) = delete;

    // Queue size that holds every event of a build over n specs, with headroom
    static size_t suggested_capacity(size_t n) { return 4 * n + 4; }

    // Starts one tunnel per spec, in order. Returns how many became active.
    // Throws ValidationError for an empty list and CancelledError when
    // close_all() interrupts it.
    size_t build(const std::vector<TunnelSpec> &specs);

    bool next_event(TunnelEvent &event, std::chrono::milliseconds timeout);
    bool try_next_event(TunnelEvent &event);
    bool events_finished() const { return events.finished(); }

    std::vector<std::shared_ptr<Tunnel>> tunnels() const;

    // Stops everything and closes the transport. The first error met is
    // rethrown once all steps have run. Later calls do nothing.
    void close_all();
};

#endif
