// Fuzz target for discovery beacon parsing
// Beacons arrive from any host on the multicast group, so every byte is untrusted

#include "network/peer.hpp"
#include "network/wire.hpp"
#include <cstdint>
#include <cstddef>
#include <string>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    using namespace nearlink;

    std::string datagram(reinterpret_cast<const char *>(data), size);
    auto beacon = wire::DecodeBeacon(datagram);
    if (!beacon) {
        return 0;
    }

    // CRITICAL: Oversized datagrams must be rejected before parsing
    if (size > wire::MAX_BEACON_SIZE) {
        __builtin_trap();
    }

    // CRITICAL: Decoded peers always carry a token
    if (beacon->peer.token().empty()) {
        __builtin_trap();
    }

    // Peer construction must not throw on anything the decoder accepts
    std::string error;
    auto peer = network::Peer::FromDiscovery(beacon->peer, beacon->info, &error);
    if (!peer && error.empty()) {
        // Rejected without a reason - BUG!
        __builtin_trap();
    }

    // Re-encoding must decode to the same peer and port
    auto again = wire::DecodeBeacon(wire::EncodeBeacon(*beacon));
    if (again && (again->peer != beacon->peer || again->port != beacon->port ||
                  again->op != beacon->op)) {
        __builtin_trap();
    }

    return 0;
}
