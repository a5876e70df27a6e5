#include <cassert>
#include <iostream>
#include <stdexcept>
#include <vector>

#include "application/ResourceAdmissionController.hpp"

using namespace assetbridge;
using application::ResourceAdmissionController;
using application::ResourceHandle;

int main() {
    std::cout << "[Test] Starting ResourceAdmission Test..." << std::endl;

    // 1. Quota validation
    bool threw = false;
    try {
        ResourceAdmissionController invalid(0, 0);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
    threw = false;
    try {
        ResourceAdmissionController invalid(2, 3);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    ResourceAdmissionController previews(3, 2);
    std::vector<std::pair<std::uint64_t, std::string>> evicted;
    previews.setEvictionCallback([&](const ResourceHandle& handle, const std::string& owner) {
        evicted.emplace_back(handle.id, owner);
    });

    // 2. Fill with history
    auto h1 = previews.acquire(false, "old1.glb");
    auto h2 = previews.acquire(false, "old2.glb");
    auto h3 = previews.acquire(false, "old3.glb");
    assert(h1 && h2 && h3);
    assert(previews.activeCount() == 3);

    // 3. Historical request at capacity is rejected, nothing changes
    assert(!previews.acquire(false, "old4.glb").has_value());
    assert(previews.activeCount() == 3);
    assert(evicted.empty());
    std::cout << "[PASS] Historical rejection at capacity." << std::endl;

    // 4. Session request evicts exactly one, the least recently used
    auto s1 = previews.acquire(true, "new1.glb");
    assert(s1 && s1->sessionScoped);
    assert(evicted.size() == 1 && evicted[0].first == h1->id && evicted[0].second == "old1.glb");
    assert(!previews.isActive(*h1));
    assert(previews.activeCount() == 3);
    assert(previews.sessionActiveCount() == 1);

    previews.touch(*h2); // h3 is now the oldest
    auto s2 = previews.acquire(true, "new2.glb");
    assert(s2);
    assert(evicted.size() == 2 && evicted[1].first == h3->id);
    assert(previews.isActive(*h2));
    std::cout << "[PASS] Session eviction follows LRU." << std::endl;

    // 5. Session quota
    assert(!previews.acquire(true, "new3.glb").has_value());
    assert(previews.sessionActiveCount() == 2);
    assert(evicted.size() == 2);

    // 6. Release
    assert(previews.release(*s1));
    assert(!previews.release(*s1));
    assert(!previews.release(*h1)); // already evicted
    assert(previews.sessionActiveCount() == 1);
    assert(previews.activeCount() == 2);
    auto s3 = previews.acquire(true, "new3.glb");
    assert(s3);
    assert(evicted.size() == 2); // free slot, no eviction
    std::cout << "[PASS] Session quota and release." << std::endl;

    // 7. Session request with only session handles left is rejected
    ResourceAdmissionController sessionOnly(2, 2);
    auto a = sessionOnly.acquire(true);
    auto b = sessionOnly.acquire(true);
    assert(a && b);
    assert(!sessionOnly.acquire(true).has_value());

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
