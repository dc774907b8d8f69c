// Fuzz target for chunk entry decoding
// Chunk entries arrive from untrusted peers; decoding and the window check
// must handle any bytes, including windows at the int64 limits

#include "chunk/chunk.hpp"
#include "chunk/network_params.hpp"
#include "validation/validation.hpp"
#include <cstddef>
#include <cstdint>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    using namespace timechunk;

    static const auto params = chunk::NetworkParams::CreateMainNet();
    const auto &p = params->GetChunkParams();

    Entry entry;
    entry.type = EntryType::CHUNK;
    entry.payload.assign(data, data + size);

    auto decoded = chunk::Chunk::FromEntry(entry);
    if (!decoded) {
        return 0;
    }

    // Re-encoding must reproduce the same address
    if (decoded->GetHash() != entry.GetHash()) {
        __builtin_trap();
    }

    validation::ValidationState state;
    bool canonical = validation::CheckChunkWindow(*decoded, p, state);
    if (canonical != decoded->HasCanonicalWindow(p)) {
        __builtin_trap();
    }
    if (canonical) {
        (void)validation::CheckChunkNotFuture(decoded->GetWindow(), p, 0, state);
    }

    return 0;
}
