// Fuzz target for INVITE frame bodies
// Tests JSON decoding of the inviter identity and hex invitation context

#include "network/wire.hpp"
#include <cstdint>
#include <cstddef>
#include <vector>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    using namespace nearlink::wire;

    std::vector<uint8_t> body(data, data + size);
    auto invite = DecodeInvite(body);
    if (!invite) {
        return 0;
    }

    // CRITICAL: Decoded inviters are always valid identities
    if (!invite->from.IsValid()) {
        __builtin_trap();
    }

    auto again = DecodeInvite(EncodeInvite(*invite));
    if (!again) {
        // DecodeInvite() failed on EncodeInvite() output - BUG!
        __builtin_trap();
    }
    if (again->from != invite->from ||
        again->from.display_name() != invite->from.display_name() ||
        again->context != invite->context) {
        __builtin_trap();
    }

    return 0;
}
