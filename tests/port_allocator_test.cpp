#include <cassert>
#include <iostream>
#include <set>
#include "errors.hpp"
#include "port_allocator.hpp"

void test_port_base()
{
    assert(port_base(443) == 4430);
    assert(port_base(80) == 8030);
    assert(port_base(22) == 2230);
    assert(port_base(554) == 5540);
    assert(port_base(8080) == 90800);
    assert(port_base(21) == 10210);

    assert(local_port_for("10.0.0.5", 443) == 4435);
    assert(local_port_for("192.168.1.254", 22) == 2484);
    assert(local_port_for("not-an-ip", 80) == 8030);
    std::cout << "[OK] port base smoke test\n";
}

void test_collisions_bump()
{
    PortAllocator allocator;
    assert(allocator.allocate("10.0.0.5", 443) == 4435);
    assert(allocator.allocate("10.0.0.5", 443) == 4436);
    assert(allocator.allocate("10.0.1.5", 443) == 4437);

    allocator.release(4436);
    assert(allocator.allocate("10.0.0.6", 443) == 4436);
    std::cout << "[OK] collision smoke test\n";
}

void test_window_exhaustion()
{
    PortAllocator allocator;
    std::set<int> seen;
    for (int i = 0; i < 256; i++)
    {
        int port = allocator.allocate("10.0.0.1", 80);
        assert(seen.insert(port).second);
    }
    assert(seen.size() == 256);

    bool threw = false;
    try
    {
        allocator.allocate("10.0.0.1", 80);
    }
    catch (const ResourceError &)
    {
        threw = true;
    }
    assert(threw);
    std::cout << "[OK] window exhaustion smoke test\n";
}

void test_never_above_max_port()
{
    PortAllocator allocator;
    // 10000 + 10 * 5553 = 65530; with octet 5 the first candidate is 65535
    assert(allocator.allocate("10.0.0.5", 5553) == 65535);

    bool threw = false;
    try
    {
        allocator.allocate("10.0.0.5", 5553);
    }
    catch (const ResourceError &)
    {
        threw = true;
    }
    assert(threw);
    std::cout << "[OK] port ceiling smoke test\n";
}

void test_mappings_sorted()
{
    PortAllocator allocator;
    allocator.allocate("10.0.0.9", 443);
    allocator.allocate("10.0.0.2", 22);
    allocator.allocate("10.0.0.3", 80);

    auto mappings = allocator.mappings();
    assert(mappings.size() == 3);
    assert(mappings[0].local_port == 2232 && mappings[0].remote_host == "10.0.0.2" && mappings[0].remote_port == 22);
    assert(mappings[1].local_port == 4439);
    assert(mappings[2].local_port == 8033);
    std::cout << "[OK] mappings smoke test\n";
}

void test_specs_for_selection()
{
    PortAllocator allocator;
    std::vector<DeviceSelection> selection = {
        {"10.0.0.5", "C0:56:E3:00:00:01", {22, 80, 443, 554}},
        {"10.0.0.7", "00:11:32:00:00:02", {443}},
    };

    auto specs = specs_for(selection, allocator);
    assert(specs.size() == 5);
    assert(specs[0].remote_host == "10.0.0.5" && specs[0].remote_port == 22 && specs[0].local_port == 2235);
    assert(specs[3].remote_port == 554 && specs[3].local_port == 5545);
    assert(specs[4].remote_host == "10.0.0.7" && specs[4].local_port == 4437);
    assert(allocator.mappings().size() == 5);
    std::cout << "[OK] specs_for smoke test\n";
}

int main()
{
    test_port_base();
    test_collisions_bump();
    test_window_exhaustion();
    test_never_above_max_port();
    test_mappings_sorted();
    test_specs_for_selection();
    std::cout << "All PortAllocator tests passed!\n";
    return 0;
}
