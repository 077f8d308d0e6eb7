#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace nodefs {

using Block = std::vector<std::byte>;

// Open read handle produced by Readable::open_for_reading()
// Exclusively owned by the opener (always handed out as std::unique_ptr).
// The destructor releases the backend resource; implementations call close()
// from their destructor and must tolerate close() being called twice.
class ReadStream {
public:
    virtual ~ReadStream() = default;

    // Read up to size bytes into buffer; returns 0 at end of stream
    // Throws FSError on failure
    virtual size_t read(std::byte* buffer, size_t size) = 0;

    // Advance past count bytes without delivering them
    // Returns the number of bytes actually skipped (less at end of stream).
    // Default implementation reads and discards; seekable backends override.
    virtual uint64_t skip(uint64_t count);

    virtual void close() = 0;

    // Read up to max_size bytes; empty block at end of stream
    Block read_block(size_t max_size);
};

// Open write handle produced by Writable::open_for_writing()
// A write() that returns has been acknowledged by the backend.
class WriteStream {
public:
    virtual ~WriteStream() = default;

    // Throws FSError on failure; nothing is acknowledged in that case
    virtual void write(const std::byte* data, size_t size) = 0;

    virtual void flush() {}

    virtual void close() = 0;

    void write(const Block& block) { write(block.data(), block.size()); }
    void write(const std::string& text) {
        write(reinterpret_cast<const std::byte*>(text.data()), text.size());
    }
};

} // namespace nodefs
