#include "tunnel_manager.hpp"
#include <exception>
#include <spdlog/spdlog.h>
#include "config.hpp"
#include "errors.hpp"
#include "network_utils.hpp"

const char *to_string(TunnelEventType type)
{
    switch (type)
    {
    case TunnelEventType::Started:
        return "started";
    case TunnelEventType::Active:
        return "active";
    case TunnelEventType::Failed:
        return "failed";
    case TunnelEventType::Closed:
        return "closed";
    }
    return "unknown";
}

TunnelManager::TunnelManager(std::shared_ptr<Transport> transport, size_t event_capacity)
    : transport(std::move(transport)), events(event_capacity)
{
}

TunnelManager::~TunnelManager()
{
    try
    {
        close_all();
    }
    catch (const TunnelerError &e)
    {
        spdlog::warn("Tunnel manager shutdown: {}", e.what());
    }
}

void TunnelManager::emit(const std::shared_ptr<Tunnel> &tunnel, TunnelEventType type)
{
    if (!events.try_push(TunnelEvent{tunnel, type}))
    {
        spdlog::debug("Dropped {} event for 127.0.0.1:{}", to_string(type), tunnel->local_port());
    }
}

size_t TunnelManager::build(const std::vector<TunnelSpec> &specs)
{
    if (specs.empty())
    {
        throw ValidationError("tunnel: no specs provided");
    }

    size_t active = 0;
    for (const auto &spec : specs)
    {
        auto tunnel = std::make_shared<Tunnel>(transport, spec.local_port, spec.remote_host, spec.remote_port);

        {
            // Checked under the list lock so close_all() never misses a tunnel
            std::lock_guard<std::mutex> lock(tunnels_mutex);
            if (build_scope.is_cancelled())
                throw CancelledError("tunnel: build cancelled");
            managed.push_back(tunnel);
        }

        emit(tunnel, TunnelEventType::Started);

        try
        {
            tunnel->start();
            active++;
            emit(tunnel, TunnelEventType::Active);
        }
        catch (const ResourceError &e)
        {
            spdlog::error("Tunnel to {} failed: {}", join_host_port(spec.remote_host, spec.remote_port), e.what());
            emit(tunnel, TunnelEventType::Failed);
        }

        if (build_scope.wait_for(std::chrono::milliseconds(BUILD_PACING_MS)))
        {
            throw CancelledError("tunnel: build cancelled");
        }
    }

    return active;
}

bool TunnelManager::next_event(TunnelEvent &event, std::chrono::milliseconds timeout)
{
    return events.next(event, timeout);
}

bool TunnelManager::try_next_event(TunnelEvent &event)
{
    return events.try_next(event);
}

std::vector<std::shared_ptr<Tunnel>> TunnelManager::tunnels() const
{
    std::lock_guard<std::mutex> lock(tunnels_mutex);
    return managed;
}

void TunnelManager::close_all()
{
    if (closing.exchange(true))
        return;

    build_scope.cancel();

    std::vector<std::shared_ptr<Tunnel>> snapshot;
    {
        std::lock_guard<std::mutex> lock(tunnels_mutex);
        snapshot = managed;
    }

    std::exception_ptr first_error;
    for (const auto &tunnel : snapshot)
    {
        try
        {
            tunnel->stop();
        }
        catch (const TunnelerError &e)
        {
            spdlog::warn("Stopping tunnel 127.0.0.1:{}: {}", tunnel->local_port(), e.what());
            if (!first_error)
                first_error = std::current_exception();
        }
        emit(tunnel, TunnelEventType::Closed);
    }

    events.close();

    try
    {
        transport->close();
    }
    catch (const TunnelerError &e)
    {
        spdlog::warn("Closing transport: {}", e.what());
        if (!first_error)
            first_error = std::current_exception();
    }

    spdlog::info("Closed {} tunnels", snapshot.size());

    if (first_error)
        std::rethrow_exception(first_error);
}
