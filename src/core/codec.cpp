/**
 * @file codec.cpp
 * @brief Value encoding and pipe framing
 */

#include "procpool/core/codec.hpp"

#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <system_error>

namespace procpool {

namespace {

enum class ValueTag : std::uint8_t {
    None = 0,
    Bool = 1,
    Int = 2,
    Double = 3,
    String = 4,
    Blob = 5
};

} // namespace

// ---------------------------------------------------------------------------
// Encoder
// ---------------------------------------------------------------------------

void Encoder::put_raw(const void* data, std::size_t size) {
    const auto* bytes = static_cast<const std::byte*>(data);
    buffer_.insert(buffer_.end(), bytes, bytes + size);
}

void Encoder::put_u8(std::uint8_t value) { put_raw(&value, sizeof(value)); }
void Encoder::put_u32(std::uint32_t value) { put_raw(&value, sizeof(value)); }
void Encoder::put_u64(std::uint64_t value) { put_raw(&value, sizeof(value)); }
void Encoder::put_i64(std::int64_t value) { put_raw(&value, sizeof(value)); }
void Encoder::put_f64(double value) { put_raw(&value, sizeof(value)); }

void Encoder::put_string(const std::string& value) {
    if (value.size() > MAX_FRAME_SIZE) {
        throw SerializationError("string too large to encode");
    }
    put_u32(static_cast<std::uint32_t>(value.size()));
    put_raw(value.data(), value.size());
}

void Encoder::put_blob(const Blob& value) {
    if (value.size() > MAX_FRAME_SIZE) {
        throw SerializationError("blob too large to encode");
    }
    put_u32(static_cast<std::uint32_t>(value.size()));
    put_raw(value.data(), value.size());
}

void Encoder::put_value(const Value& value) {
    std::visit([this](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            put_u8(static_cast<std::uint8_t>(ValueTag::None));
        } else if constexpr (std::is_same_v<T, bool>) {
            put_u8(static_cast<std::uint8_t>(ValueTag::Bool));
            put_u8(v ? 1 : 0);
        } else if constexpr (std::is_same_v<T, std::int64_t>) {
            put_u8(static_cast<std::uint8_t>(ValueTag::Int));
            put_i64(v);
        } else if constexpr (std::is_same_v<T, double>) {
            put_u8(static_cast<std::uint8_t>(ValueTag::Double));
            put_f64(v);
        } else if constexpr (std::is_same_v<T, std::string>) {
            put_u8(static_cast<std::uint8_t>(ValueTag::String));
            put_string(v);
        } else if constexpr (std::is_same_v<T, Blob>) {
            put_u8(static_cast<std::uint8_t>(ValueTag::Blob));
            put_blob(v);
        }
    }, value);
}

// ---------------------------------------------------------------------------
// Decoder
// ---------------------------------------------------------------------------

void Decoder::get_raw(void* out, std::size_t size) {
    if (remaining() < size) {
        throw SerializationError(
            "truncated message: need " + std::to_string(size) +
            " bytes, have " + std::to_string(remaining())
        );
    }
    std::memcpy(out, data_ + offset_, size);
    offset_ += size;
}

std::uint8_t Decoder::get_u8() {
    std::uint8_t value{};
    get_raw(&value, sizeof(value));
    return value;
}

std::uint32_t Decoder::get_u32() {
    std::uint32_t value{};
    get_raw(&value, sizeof(value));
    return value;
}

std::uint64_t Decoder::get_u64() {
    std::uint64_t value{};
    get_raw(&value, sizeof(value));
    return value;
}

std::int64_t Decoder::get_i64() {
    std::int64_t value{};
    get_raw(&value, sizeof(value));
    return value;
}

double Decoder::get_f64() {
    double value{};
    get_raw(&value, sizeof(value));
    return value;
}

std::string Decoder::get_string() {
    auto size = get_u32();
    if (remaining() < size) {
        throw SerializationError("truncated string");
    }
    std::string value(reinterpret_cast<const char*>(data_ + offset_), size);
    offset_ += size;
    return value;
}

Blob Decoder::get_blob() {
    auto size = get_u32();
    if (remaining() < size) {
        throw SerializationError("truncated blob");
    }
    Blob value(data_ + offset_, data_ + offset_ + size);
    offset_ += size;
    return value;
}

Value Decoder::get_value() {
    auto tag = static_cast<ValueTag>(get_u8());
    switch (tag) {
        case ValueTag::None:
            return Value{};
        case ValueTag::Bool:
            return Value{get_u8() != 0};
        case ValueTag::Int:
            return Value{get_i64()};
        case ValueTag::Double:
            return Value{get_f64()};
        case ValueTag::String:
            return Value{get_string()};
        case ValueTag::Blob:
            return Value{get_blob()};
    }
    throw SerializationError("unknown value tag " + std::to_string(static_cast<int>(tag)));
}

// ---------------------------------------------------------------------------
// Framing
// ---------------------------------------------------------------------------

namespace {

void write_all(int fd, const std::byte* data, std::size_t size) {
    std::size_t written = 0;
    while (written < size) {
        ssize_t n = ::write(fd, data + written, size - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw std::system_error(errno, std::generic_category(), "pipe write failed");
        }
        written += static_cast<std::size_t>(n);
    }
}

// Returns the number of bytes read; less than size only on EOF.
std::size_t read_all(int fd, std::byte* data, std::size_t size) {
    std::size_t got = 0;
    while (got < size) {
        ssize_t n = ::read(fd, data + got, size - got);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw std::system_error(errno, std::generic_category(), "pipe read failed");
        }
        if (n == 0) {
            break;
        }
        got += static_cast<std::size_t>(n);
    }
    return got;
}

} // namespace

void write_frame(int fd, const Blob& payload) {
    if (payload.size() > MAX_FRAME_SIZE) {
        throw SerializationError("frame too large: " + std::to_string(payload.size()) + " bytes");
    }

    // One buffer so a frame is never interleaved with another writer's
    Blob frame(sizeof(std::uint32_t) + payload.size());
    auto size = static_cast<std::uint32_t>(payload.size());
    std::memcpy(frame.data(), &size, sizeof(size));
    if (!payload.empty()) {
        std::memcpy(frame.data() + sizeof(size), payload.data(), payload.size());
    }
    write_all(fd, frame.data(), frame.size());
}

std::optional<Blob> read_frame(int fd) {
    std::uint32_t size = 0;
    auto got = read_all(fd, reinterpret_cast<std::byte*>(&size), sizeof(size));
    if (got == 0) {
        return std::nullopt;
    }
    if (got < sizeof(size)) {
        throw SerializationError("EOF inside frame header");
    }
    if (size > MAX_FRAME_SIZE) {
        throw SerializationError("frame length " + std::to_string(size) + " exceeds limit");
    }

    Blob payload(size);
    if (read_all(fd, payload.data(), size) < size) {
        throw SerializationError("EOF inside frame body");
    }
    return payload;
}

} // namespace procpool
