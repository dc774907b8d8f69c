// Fuzz target for LinkRecord deserialization
// Tests link record parsing from untrusted gossip data

#include "primitives/link.hpp"
#include <cstddef>
#include <cstdint>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    using namespace timechunk;

    LinkRecord record;
    if (!record.Deserialize(data, size)) {
        return 0;
    }

    // Accepted input is canonical: it re-serializes to the same bytes
    auto serialized = record.Serialize();
    if (serialized.size() != size) {
        __builtin_trap();
    }
    for (size_t i = 0; i < size; ++i) {
        if (serialized[i] != data[i]) {
            __builtin_trap();
        }
    }

    (void)record.GetHash();
    (void)record.ToString();
    return 0;
}
