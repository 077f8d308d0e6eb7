#include "nodefs/stream.hpp"
#include <algorithm>

namespace nodefs {

uint64_t ReadStream::skip(uint64_t count) {
    std::byte scratch[16384];
    uint64_t skipped = 0;
    while (skipped < count) {
        size_t want = static_cast<size_t>(std::min<uint64_t>(sizeof(scratch), count - skipped));
        size_t got = read(scratch, want);
        if (got == 0) {
            break;
        }
        skipped += got;
    }
    return skipped;
}

Block ReadStream::read_block(size_t max_size) {
    Block block(max_size);
    size_t filled = 0;
    // Short reads are allowed by read(); keep going until full or end of stream
    while (filled < max_size) {
        size_t got = read(block.data() + filled, max_size - filled);
        if (got == 0) {
            break;
        }
        filled += got;
    }
    block.resize(filled);
    return block;
}

} // namespace nodefs
