#include "bmux/wire/envelope.hpp"

#include <algorithm>
#include <array>
#include <string>

#include "bmux/net/socket.hpp"

namespace bmux::wire {

using config::constants::WIRE_MAX_BODY_LEN;
using config::constants::WIRE_MAX_HEAD_LEN;
using config::constants::WIRE_PREFIX_SIZE;

Prefix decode_prefix(std::span<const std::byte, WIRE_PREFIX_SIZE> raw) noexcept {
    // body length in network byte order: big-endian
    const auto b1 = std::to_integer<std::uint16_t>(raw[1]);
    const auto b2 = std::to_integer<std::uint16_t>(raw[2]);
    return Prefix{
        .head_len = std::to_integer<std::uint8_t>(raw[0]),
        .body_len = static_cast<std::uint16_t>((b1 << 8) | b2),
    };
}

Result<std::vector<std::byte>> encode_envelope(std::span<const std::byte> head,
                                               std::span<const std::byte> body) {
    if (head.size() > WIRE_MAX_HEAD_LEN) {
        return make_error(ErrorKind::Framing,
                          "header is " + std::to_string(head.size()) + " bytes, limit is " +
                          std::to_string(WIRE_MAX_HEAD_LEN));
    }
    if (body.size() > WIRE_MAX_BODY_LEN) {
        return make_error(ErrorKind::Framing,
                          "body is " + std::to_string(body.size()) + " bytes, limit is " +
                          std::to_string(WIRE_MAX_BODY_LEN));
    }

    std::vector<std::byte> out;
    out.reserve(WIRE_PREFIX_SIZE + head.size() + body.size());
    const auto body_len = static_cast<std::uint16_t>(body.size());
    out.push_back(static_cast<std::byte>(head.size()));
    out.push_back(static_cast<std::byte>(body_len >> 8));
    out.push_back(static_cast<std::byte>(body_len & 0xFF));
    out.insert(out.end(), head.begin(), head.end());
    out.insert(out.end(), body.begin(), body.end());
    return out;
}

Result<PacketEnvelope> read_envelope(int fd, const ReadDeadlines& deadlines, std::size_t* consumed) {
    std::size_t total = 0;
    auto stage = [&](std::span<std::byte> out, std::chrono::milliseconds timeout) {
        std::size_t got = 0;
        auto r = net::read_full(fd, out, timeout, &got);
        total += got;
        if (consumed != nullptr) *consumed = total;
        return r;
    };

    std::array<std::byte, WIRE_PREFIX_SIZE> raw{};
    if (auto r = stage(raw, deadlines.prefix); !r) {
        return make_error(ErrorKind::Framing, "prefix: " + r.error().message);
    }
    const Prefix p = decode_prefix(raw);

    PacketEnvelope env;
    env.head_len = p.head_len;
    env.body_len = p.body_len;
    env.head.resize(p.head_len);
    env.body.resize(p.body_len);

    if (auto r = stage(env.head, deadlines.payload); !r) {
        return make_error(ErrorKind::Framing, "header: " + r.error().message);
    }
    if (auto r = stage(env.body, deadlines.payload); !r) {
        return make_error(ErrorKind::Framing, "body: " + r.error().message);
    }
    return env;
}

Result<void> write_envelope(int fd, std::span<const std::byte> head, std::span<const std::byte> body,
                            std::chrono::milliseconds write_timeout) {
    auto frame = encode_envelope(head, body);
    if (!frame) return bmux_detail::unexpected(frame.error());
    if (auto r = net::set_write_timeout(fd, write_timeout); !r) return r;
    return net::write_full(fd, *frame);
}

// ---------------------------- FrameDecoder ----------------------------------

void FrameDecoder::feed(std::span<const std::byte> data) {
    compact();
    buf_.insert(buf_.end(), data.begin(), data.end());
}

std::optional<PacketEnvelope> FrameDecoder::next() {
    const std::size_t avail = buf_.size() - read_pos_;
    if (avail < WIRE_PREFIX_SIZE) return std::nullopt;

    const std::span<const std::byte, WIRE_PREFIX_SIZE> raw(buf_.data() + read_pos_, WIRE_PREFIX_SIZE);
    const Prefix p = decode_prefix(raw);
    const std::size_t total = WIRE_PREFIX_SIZE + p.head_len + p.body_len;
    if (avail < total) return std::nullopt;

    const auto* head_begin = buf_.data() + read_pos_ + WIRE_PREFIX_SIZE;
    const auto* body_begin = head_begin + p.head_len;

    PacketEnvelope env;
    env.head_len = p.head_len;
    env.body_len = p.body_len;
    env.head.assign(head_begin, body_begin);
    env.body.assign(body_begin, body_begin + p.body_len);

    read_pos_ += total;
    if (read_pos_ == buf_.size()) {
        buf_.clear();
        read_pos_ = 0;
    }
    return env;
}

FrameDecoder::Stage FrameDecoder::stage() const noexcept {
    const std::size_t avail = buffered();
    if (avail < WIRE_PREFIX_SIZE) return Stage::Prefix;
    const std::span<const std::byte, WIRE_PREFIX_SIZE> raw(buf_.data() + read_pos_, WIRE_PREFIX_SIZE);
    return avail < WIRE_PREFIX_SIZE + decode_prefix(raw).head_len ? Stage::Header : Stage::Body;
}

void FrameDecoder::compact() {
    if (read_pos_ == 0) return;
    buf_.erase(buf_.begin(), buf_.begin() + static_cast<std::ptrdiff_t>(read_pos_));
    read_pos_ = 0;
}

} // namespace bmux::wire
