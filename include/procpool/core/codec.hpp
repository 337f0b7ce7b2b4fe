#pragma once

/**
 * @file codec.hpp
 * @brief Binary encoding of values and length-prefixed pipe frames
 *
 * Frames travel between the submitting process and its workers over pipes:
 * a 32-bit length in host byte order followed by the encoded message. Both
 * ends are the same binary on the same host, so no byte swapping is done.
 */

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "procpool/core/value.hpp"

namespace procpool {

/**
 * @brief Upper bound on a single frame, guards against corrupt length prefixes
 */
constexpr std::uint32_t MAX_FRAME_SIZE = 256u * 1024u * 1024u;

/**
 * @brief Appends primitive fields to a growing buffer
 */
class Encoder {
public:
    void put_u8(std::uint8_t value);
    void put_u32(std::uint32_t value);
    void put_u64(std::uint64_t value);
    void put_i64(std::int64_t value);
    void put_f64(double value);
    void put_string(const std::string& value);
    void put_blob(const Blob& value);
    void put_value(const Value& value);

    [[nodiscard]] const Blob& buffer() const noexcept { return buffer_; }
    [[nodiscard]] Blob take() noexcept { return std::move(buffer_); }

private:
    void put_raw(const void* data, std::size_t size);

    Blob buffer_;
};

/**
 * @brief Reads primitive fields back in the order they were written
 *
 * Every getter throws SerializationError when the buffer is exhausted or a
 * tag is unknown.
 */
class Decoder {
public:
    Decoder(const std::byte* data, std::size_t size) noexcept
        : data_(data)
        , size_(size) {}

    explicit Decoder(const Blob& blob) noexcept
        : Decoder(blob.data(), blob.size()) {}

    std::uint8_t get_u8();
    std::uint32_t get_u32();
    std::uint64_t get_u64();
    std::int64_t get_i64();
    double get_f64();
    std::string get_string();
    Blob get_blob();
    Value get_value();

    [[nodiscard]] std::size_t remaining() const noexcept { return size_ - offset_; }
    [[nodiscard]] bool done() const noexcept { return offset_ == size_; }

private:
    void get_raw(void* out, std::size_t size);

    const std::byte* data_;
    std::size_t size_;
    std::size_t offset_{0};
};

/**
 * @brief Write one length-prefixed frame, retrying on EINTR and short writes
 * @throws std::system_error on write failure (EPIPE when the reader is gone)
 */
void write_frame(int fd, const Blob& payload);

/**
 * @brief Read one length-prefixed frame
 * @return The payload, or nullopt on a clean EOF before the length prefix
 * @throws SerializationError if EOF arrives mid-frame or the length is absurd
 * @throws std::system_error on read failure
 */
[[nodiscard]] std::optional<Blob> read_frame(int fd);

} // namespace procpool
