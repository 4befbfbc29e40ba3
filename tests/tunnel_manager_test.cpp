#include <cassert>
#include <csignal>
#include <iostream>
#include <thread>
#include "errors.hpp"
#include "loopback_transport.hpp"
#include "tunnels/tunnel_manager.hpp"

std::vector<TunnelEvent> drain(TunnelManager &manager)
{
    std::vector<TunnelEvent> events;
    TunnelEvent event;
    while (manager.try_next_event(event))
        events.push_back(event);
    return events;
}

void test_build_event_order()
{
    EchoServer echo;
    auto transport = std::make_shared<LoopbackTransport>(echo.port());

    // Holds a port so the second spec fails to bind
    Tunnel squatter(transport, 0, "10.0.0.250", 80);
    squatter.start();
    int taken = port_of(squatter.bound_address());

    TunnelManager manager(transport, TunnelManager::suggested_capacity(3));
    std::vector<TunnelSpec> specs = {
        {"10.0.0.5", 80, 0},
        {"10.0.0.6", 443, taken},
        {"10.0.0.7", 554, 0},
    };
    assert(manager.build(specs) == 2);

    auto events = drain(manager);
    assert(events.size() == 6);
    assert(events[0].type == TunnelEventType::Started && events[0].tunnel->remote_host() == "10.0.0.5");
    assert(events[1].type == TunnelEventType::Active && events[1].tunnel == events[0].tunnel);
    assert(events[2].type == TunnelEventType::Started && events[2].tunnel->remote_host() == "10.0.0.6");
    assert(events[3].type == TunnelEventType::Failed && events[3].tunnel == events[2].tunnel);
    assert(events[4].type == TunnelEventType::Started && events[4].tunnel->remote_host() == "10.0.0.7");
    assert(events[5].type == TunnelEventType::Active && events[5].tunnel == events[4].tunnel);

    auto tunnels = manager.tunnels();
    assert(tunnels.size() == 3);
    assert(tunnels[1]->status() == TunnelStatus::Failed);

    // Traffic flows through a managed tunnel
    int client = connect_client(port_of(tunnels[0]->bound_address()));
    const char ping[] = "ping";
    ssize_t sent = send(client, ping, 4, MSG_NOSIGNAL);
    assert(sent == 4);
    char reply[4];
    ssize_t got = recv(client, reply, 4, MSG_WAITALL);
    assert(got == 4);
    close(client);

    manager.close_all();
    auto closing = drain(manager);
    assert(closing.size() == 3);
    for (size_t i = 0; i < closing.size(); i++)
    {
        assert(closing[i].type == TunnelEventType::Closed);
        assert(closing[i].tunnel == tunnels[i]);
    }
    assert(manager.events_finished());
    assert(!transport->is_connected());
    assert(tunnels[0]->status() == TunnelStatus::Disconnected);
    assert(tunnels[1]->status() == TunnelStatus::Disconnected);
    assert(!tunnels[1]->error().empty());

    TunnelEvent event;
    assert(!manager.next_event(event, std::chrono::milliseconds(10)));

    manager.close_all();
    squatter.stop();
    std::cout << "[OK] build event order smoke test\n";
}

void test_empty_build()
{
    auto transport = std::make_shared<LoopbackTransport>(1);
    TunnelManager manager(transport, 4);

    bool threw = false;
    try
    {
        manager.build({});
    }
    catch (const ValidationError &)
    {
        threw = true;
    }
    assert(threw);
    assert(manager.tunnels().empty());

    manager.close_all();
    manager.close_all();
    assert(!transport->is_connected());
    std::cout << "[OK] empty build smoke test\n";
}

void test_full_queue_drops()
{
    auto transport = std::make_shared<LoopbackTransport>(1);
    TunnelManager manager(transport, 1);
    manager.build({{"10.0.0.5", 80, 0}, {"10.0.0.6", 80, 0}});

    auto events = drain(manager);
    assert(events.size() == 1);
    assert(events[0].type == TunnelEventType::Started);
    assert(manager.tunnels().size() == 2);
    manager.close_all();
    std::cout << "[OK] full queue smoke test\n";
}

void test_close_all_cancels_build()
{
    auto transport = std::make_shared<LoopbackTransport>(1);
    TunnelManager manager(transport, TunnelManager::suggested_capacity(100));

    std::vector<TunnelSpec> specs;
    for (int i = 1; i <= 100; i++)
        specs.push_back(TunnelSpec{"10.0.0." + std::to_string(i), 80, 0});

    bool cancelled = false;
    std::thread builder([&] {
        try
        {
            manager.build(specs);
        }
        catch (const CancelledError &)
        {
            cancelled = true;
        }
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    manager.close_all();
    builder.join();

    assert(cancelled);
    auto tunnels = manager.tunnels();
    assert(!tunnels.empty());
    assert(tunnels.size() < specs.size());
    for (const auto &tunnel : tunnels)
        assert(tunnel->status() != TunnelStatus::Active);

    size_t closed = 0;
    for (const auto &event : drain(manager))
    {
        if (event.type == TunnelEventType::Closed)
            closed++;
    }
    assert(closed == tunnels.size());
    assert(manager.events_finished());

    manager.close_all();
    std::cout << "[OK] cancelled build smoke test\n";
}

int main()
{
    signal(SIGPIPE, SIG_IGN);
    test_build_event_order();
    test_empty_build();
    test_full_queue_drops();
    test_close_all_cancels_build();
    std::cout << "All TunnelManager tests passed!\n";
    return 0;
}
