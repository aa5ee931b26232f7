#pragma once
/**
 * @file envelope.hpp
 * @brief Length-prefixed envelope framing (read, write, incremental decode).
 *
 * Wire layout:
 * @code
 *   byte 0       header length H (0..255)
 *   bytes 1-2    body length L (0..65535), big-endian
 *   next H bytes header payload
 *   next L bytes body payload
 * @endcode
 *
 * The reader never looks inside header or body.
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include "bmux/config/constants.hpp"
#include "bmux/core/error.hpp"

namespace bmux::wire {

/** @struct PacketEnvelope
 *  @brief One decoded frame; head.size() == head_len, body.size() == body_len.
 */
struct PacketEnvelope {
    std::uint8_t           head_len{0};
    std::uint16_t          body_len{0};
    std::vector<std::byte> head;
    std::vector<std::byte> body;

    /// Bytes this envelope occupies on the wire.
    std::size_t wire_size() const noexcept {
        return config::constants::WIRE_PREFIX_SIZE + head.size() + body.size();
    }
};

/// Decoded 3-byte prefix.
struct Prefix {
    std::uint8_t  head_len{0};
    std::uint16_t body_len{0};
};

/// Parse a prefix (no validation possible: every value is legal).
Prefix decode_prefix(std::span<const std::byte, config::constants::WIRE_PREFIX_SIZE> raw) noexcept;

/**
 * @brief Build the full wire image of one envelope.
 * @return Framing error, before anything is produced, if head > 255 or body > 65535 bytes.
 */
Result<std::vector<std::byte>> encode_envelope(std::span<const std::byte> head,
                                               std::span<const std::byte> body);

/** @struct ReadDeadlines
 *  @brief Time allowed for each stage of an envelope read, counted from the stage start.
 */
struct ReadDeadlines {
    std::chrono::milliseconds prefix{0};  ///< Wait for the next envelope (idle or read timeout)
    std::chrono::milliseconds payload{0}; ///< Header and body reads (read timeout)
};

/**
 * @brief Blocking read of exactly one envelope from a socket.
 *
 * A fresh deadline is fixed at the start of each of the three reads (prefix,
 * header, body). Each read must finish by it however the bytes are spread,
 * so a peer that stalls or trickles mid-frame is cut off. Any short read
 * aborts the envelope with a Framing error; there is no resume.
 *
 * @param consumed If set, receives the bytes of this envelope read so far.
 *                 Zero after a failure means the stream ended or went idle
 *                 on an envelope boundary.
 */
Result<PacketEnvelope> read_envelope(int fd, const ReadDeadlines& deadlines,
                                     std::size_t* consumed = nullptr);

/**
 * @brief Encode then write one envelope with an optional write deadline.
 * @return Framing error for oversized parts (nothing written), Io error on send failure.
 */
Result<void> write_envelope(int fd, std::span<const std::byte> head, std::span<const std::byte> body,
                            std::chrono::milliseconds write_timeout);

/**
 * @brief Incremental decoder for non-blocking transports.
 *
 * Bytes may arrive in any split; feed() buffers them and next() returns
 * complete envelopes in arrival order. A partial frame stays buffered until
 * the rest arrives.
 *
 * Thread safety: NOT thread-safe. One decoder per connection.
 */
class FrameDecoder {
public:
    /// Part of the current envelope still awaited.
    enum class Stage : std::uint8_t { Prefix, Header, Body };

    /// Append received bytes.
    void feed(std::span<const std::byte> data);

    /// Pop the next complete envelope, or nullopt if more bytes are needed.
    std::optional<PacketEnvelope> next();

    /// Bytes held that do not yet form a complete envelope (after next() returned nullopt).
    std::size_t buffered() const noexcept { return buf_.size() - read_pos_; }

    /// True when part of a frame is buffered.
    bool mid_frame() const noexcept { return buffered() > 0; }

    /// Stage of the buffered partial frame (meaningful after next() returned nullopt).
    Stage stage() const noexcept;

private:
    void compact();

    std::vector<std::byte> buf_;
    std::size_t            read_pos_{0};
};

} // namespace bmux::wire
