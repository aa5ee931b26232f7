/**
 * @file test_wire.cpp
 * @brief Tests for envelope framing: encode limits, blocking reads, incremental decode.
 *
 * Validates:
 *  - Prefix layout (1-byte header length, big-endian 16-bit body length)
 *  - Oversized header/body rejected before anything is written
 *  - read_envelope over a socketpair, including short reads mid-frame
 *  - Read deadlines are fixed per stage, so trickled bytes cannot extend them
 *  - FrameDecoder buffering across arbitrary splits
 *  - Every header length with the edge body lengths round-trips through the decoder
 */

#include <gtest/gtest.h>
#include <array>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <thread>
#include <vector>

#include <sys/socket.h>
#include <unistd.h>

#include "bmux/net/socket.hpp"
#include "bmux/wire/envelope.hpp"

using namespace std::chrono_literals;
using bmux::ErrorKind;
using bmux::net::UniqueFd;
namespace wire = bmux::wire;

///
/// Helpers
///
static std::vector<std::byte> bytes_of(std::size_t n, unsigned seed = 0) {
  std::vector<std::byte> v(n);
  for (std::size_t i = 0; i < n; ++i) v[i] = static_cast<std::byte>((i * 31 + seed) & 0xFF);
  return v;
}

struct SocketPair {
  UniqueFd a, b;
  SocketPair() {
    int fds[2] = {-1, -1};
    EXPECT_EQ(::socketpair(AF_UNIX, SOCK_STREAM, 0, fds), 0);
    a.reset(fds[0]);
    b.reset(fds[1]);
  }
};

static void write_raw(int fd, const std::vector<std::byte>& data) {
  auto r = bmux::net::write_full(fd, data);
  ASSERT_TRUE(r) << r.error().message;
}

static const wire::ReadDeadlines kDeadlines{200ms, 200ms};

// --------------------------- Encoding -------------------------------------

/**
 * @test Encode_Prefix_Layout
 * @brief Byte 0 is the header length, bytes 1-2 the body length in network order.
 */
TEST(Envelope, Encode_Prefix_Layout) {
  auto head = bytes_of(7);
  auto body = bytes_of(0x0102);

  auto frame = wire::encode_envelope(head, body);
  ASSERT_TRUE(frame);
  ASSERT_EQ(frame->size(), 3u + 7u + 0x0102u);
  EXPECT_EQ((*frame)[0], std::byte{7});
  EXPECT_EQ((*frame)[1], std::byte{0x01});
  EXPECT_EQ((*frame)[2], std::byte{0x02});
  EXPECT_TRUE(std::equal(head.begin(), head.end(), frame->begin() + 3));
  EXPECT_TRUE(std::equal(body.begin(), body.end(), frame->begin() + 10));
}

/**
 * @test Encode_Boundaries_Accepted
 * @brief 255-byte header and 65535-byte body are the largest legal parts.
 */
TEST(Envelope, Encode_Boundaries_Accepted) {
  auto frame = wire::encode_envelope(bytes_of(255), bytes_of(65535));
  ASSERT_TRUE(frame);
  EXPECT_EQ((*frame)[0], std::byte{0xFF});
  EXPECT_EQ((*frame)[1], std::byte{0xFF});
  EXPECT_EQ((*frame)[2], std::byte{0xFF});

  auto empty = wire::encode_envelope({}, {});
  ASSERT_TRUE(empty);
  EXPECT_EQ(empty->size(), 3u);
}

/**
 * @test Encode_Oversize_Rejected
 * @brief One byte past either limit is a Framing error.
 */
TEST(Envelope, Encode_Oversize_Rejected) {
  auto big_head = wire::encode_envelope(bytes_of(256), {});
  ASSERT_FALSE(big_head);
  EXPECT_EQ(big_head.error().kind, ErrorKind::Framing);

  auto big_body = wire::encode_envelope({}, bytes_of(65536));
  ASSERT_FALSE(big_body);
  EXPECT_EQ(big_body.error().kind, ErrorKind::Framing);
}

/**
 * @test Write_Oversize_Sends_Nothing
 * @brief write_envelope fails before touching the socket.
 */
TEST(Envelope, Write_Oversize_Sends_Nothing) {
  SocketPair sp;
  auto r = wire::write_envelope(sp.a.get(), bytes_of(300), {}, 0ms);
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error().kind, ErrorKind::Framing);

  ASSERT_TRUE(bmux::net::set_nonblocking(sp.b.get()));
  std::array<std::byte, 8> buf{};
  EXPECT_LT(::recv(sp.b.get(), buf.data(), buf.size(), 0), 0);  // nothing buffered
}

// --------------------------- Blocking reads -------------------------------

/**
 * @test Read_Roundtrip_Samples
 * @brief Representative (H, L) pairs read back byte-identical.
 */
TEST(Envelope, Read_Roundtrip_Samples) {
  SocketPair sp;
  const std::array<std::pair<std::size_t, std::size_t>, 5> sizes{{
      {0, 0}, {1, 0}, {0, 1}, {255, 300}, {12, 65535}}};

  std::thread writer([&] {
    for (const auto& [h, l] : sizes) {
      ASSERT_TRUE(wire::write_envelope(sp.a.get(), bytes_of(h, 1), bytes_of(l, 2), 1s));
    }
  });

  for (const auto& [h, l] : sizes) {
    auto env = wire::read_envelope(sp.b.get(), {1s, 1s});
    ASSERT_TRUE(env) << env.error().message;
    EXPECT_EQ(env->head_len, h);
    EXPECT_EQ(env->body_len, l);
    EXPECT_EQ(env->head, bytes_of(h, 1));
    EXPECT_EQ(env->body, bytes_of(l, 2));
    EXPECT_EQ(env->wire_size(), 3 + h + l);
  }
  writer.join();
}

/**
 * @test Read_Closed_Mid_Body
 * @brief Prefix announces 20 body bytes, stream ends after 10: Framing error.
 */
TEST(Envelope, Read_Closed_Mid_Body) {
  SocketPair sp;
  std::vector<std::byte> partial{std::byte{2}, std::byte{0}, std::byte{20}};
  auto head = bytes_of(2);
  auto body = bytes_of(10);
  partial.insert(partial.end(), head.begin(), head.end());
  partial.insert(partial.end(), body.begin(), body.end());
  write_raw(sp.a.get(), partial);
  sp.a.reset();

  auto env = wire::read_envelope(sp.b.get(), kDeadlines);
  ASSERT_FALSE(env);
  EXPECT_EQ(env.error().kind, ErrorKind::Framing);
  EXPECT_NE(env.error().message.find("body"), std::string::npos);
}

/**
 * @test Read_Closed_Mid_Prefix
 * @brief Two prefix bytes then EOF is a Framing error.
 */
TEST(Envelope, Read_Closed_Mid_Prefix) {
  SocketPair sp;
  write_raw(sp.a.get(), {std::byte{1}, std::byte{0}});
  sp.a.reset();

  auto env = wire::read_envelope(sp.b.get(), kDeadlines);
  ASSERT_FALSE(env);
  EXPECT_EQ(env.error().kind, ErrorKind::Framing);
  EXPECT_NE(env.error().message.find("prefix"), std::string::npos);
}

/**
 * @test Read_Stalled_Peer_Times_Out
 * @brief A peer that stops mid-header hits the read deadline.
 */
TEST(Envelope, Read_Stalled_Peer_Times_Out) {
  SocketPair sp;
  write_raw(sp.a.get(), {std::byte{4}, std::byte{0}, std::byte{0}, std::byte{9}});

  const auto t0 = std::chrono::steady_clock::now();
  auto env = wire::read_envelope(sp.b.get(), {1s, 100ms});
  const auto waited = std::chrono::steady_clock::now() - t0;

  ASSERT_FALSE(env);
  EXPECT_EQ(env.error().kind, ErrorKind::Framing);
  EXPECT_GE(waited, 90ms);
  EXPECT_LT(waited, 900ms);
}

/**
 * @test Read_Trickling_Peer_Times_Out
 * @brief One body byte every 100 ms does not keep a 300 ms stage deadline alive.
 */
TEST(Envelope, Read_Trickling_Peer_Times_Out) {
  SocketPair sp;
  write_raw(sp.a.get(), {std::byte{0}, std::byte{0}, std::byte{10}});

  std::atomic<bool> done{false};
  std::thread trickler([&] {
    for (int i = 0; i < 10 && !done; ++i) {
      std::this_thread::sleep_for(100ms);
      const std::byte b{0x5A};
      if (::send(sp.a.get(), &b, 1, MSG_NOSIGNAL) != 1) break;
    }
  });

  std::size_t consumed = 0;
  const auto t0 = std::chrono::steady_clock::now();
  auto env = wire::read_envelope(sp.b.get(), {300ms, 300ms}, &consumed);
  const auto waited = std::chrono::steady_clock::now() - t0;
  done = true;
  trickler.join();

  ASSERT_FALSE(env);
  EXPECT_EQ(env.error().kind, ErrorKind::Framing);
  EXPECT_NE(env.error().message.find("body"), std::string::npos);
  EXPECT_GE(waited, 250ms);
  EXPECT_LT(waited, 800ms);
  EXPECT_GT(consumed, 3u);   // prefix plus some trickled bytes
  EXPECT_LT(consumed, 13u);  // never the whole envelope
}

/**
 * @test Read_Reports_Consumed_Bytes
 * @brief Zero consumed means the stream ended on an envelope boundary.
 */
TEST(Envelope, Read_Reports_Consumed_Bytes) {
  {
    SocketPair sp;
    sp.a.reset();
    std::size_t consumed = 99;
    auto env = wire::read_envelope(sp.b.get(), kDeadlines, &consumed);
    ASSERT_FALSE(env);
    EXPECT_EQ(consumed, 0u);
  }
  {
    SocketPair sp;
    write_raw(sp.a.get(), {std::byte{1}, std::byte{0}});
    sp.a.reset();
    std::size_t consumed = 0;
    auto env = wire::read_envelope(sp.b.get(), kDeadlines, &consumed);
    ASSERT_FALSE(env);
    EXPECT_EQ(consumed, 2u);
  }
}

// --------------------------- Incremental decode ---------------------------

/**
 * @test Decoder_Byte_By_Byte
 * @brief Feeding one byte at a time yields each envelope once it is complete.
 */
TEST(FrameDecoder, Decoder_Byte_By_Byte) {
  auto f1 = wire::encode_envelope(bytes_of(3), bytes_of(5));
  auto f2 = wire::encode_envelope(bytes_of(0), bytes_of(2, 7));
  ASSERT_TRUE(f1 && f2);
  std::vector<std::byte> stream(*f1);
  stream.insert(stream.end(), f2->begin(), f2->end());

  wire::FrameDecoder dec;
  std::vector<wire::PacketEnvelope> out;
  for (std::byte b : stream) {
    dec.feed(std::span<const std::byte>(&b, 1));
    while (auto env = dec.next()) out.push_back(std::move(*env));
  }

  ASSERT_EQ(out.size(), 2u);
  EXPECT_EQ(out[0].head, bytes_of(3));
  EXPECT_EQ(out[0].body, bytes_of(5));
  EXPECT_TRUE(out[1].head.empty());
  EXPECT_EQ(out[1].body, bytes_of(2, 7));
  EXPECT_FALSE(dec.mid_frame());
}

/**
 * @test Decoder_Partial_Stays_Buffered
 * @brief Bytes of an incomplete frame are kept until the rest arrives.
 */
TEST(FrameDecoder, Decoder_Partial_Stays_Buffered) {
  auto f = wire::encode_envelope(bytes_of(4), bytes_of(100));
  ASSERT_TRUE(f);
  const std::span<const std::byte> all(*f);

  wire::FrameDecoder dec;
  dec.feed(all.first(2));
  EXPECT_FALSE(dec.next());
  EXPECT_EQ(dec.buffered(), 2u);

  dec.feed(all.subspan(2, 50));
  EXPECT_FALSE(dec.next());
  EXPECT_TRUE(dec.mid_frame());
  EXPECT_EQ(dec.buffered(), 52u);

  dec.feed(all.subspan(52));
  auto env = dec.next();
  ASSERT_TRUE(env);
  EXPECT_EQ(env->body, bytes_of(100));
  EXPECT_EQ(dec.buffered(), 0u);
}

/**
 * @test Decoder_Stage_Progression
 * @brief stage() follows the prefix, header and body of a partial frame.
 */
TEST(FrameDecoder, Decoder_Stage_Progression) {
  using Stage = wire::FrameDecoder::Stage;
  auto f = wire::encode_envelope(bytes_of(4), bytes_of(6));
  ASSERT_TRUE(f);
  const std::span<const std::byte> all(*f);

  wire::FrameDecoder dec;
  EXPECT_EQ(dec.stage(), Stage::Prefix);
  dec.feed(all.first(2));
  EXPECT_EQ(dec.stage(), Stage::Prefix);
  dec.feed(all.subspan(2, 3));
  EXPECT_EQ(dec.stage(), Stage::Header);
  dec.feed(all.subspan(5, 3));
  EXPECT_EQ(dec.stage(), Stage::Body);
  dec.feed(all.subspan(8));
  ASSERT_TRUE(dec.next());
  EXPECT_EQ(dec.stage(), Stage::Prefix);

  // No header: the prefix leads straight to the body.
  auto g = wire::encode_envelope({}, bytes_of(6));
  ASSERT_TRUE(g);
  dec.feed(std::span<const std::byte>(*g).first(4));
  EXPECT_EQ(dec.stage(), Stage::Body);
}

/**
 * @test Decoder_Roundtrip_All_Header_Lengths
 * @brief Every H in [0, 255] with the edge body lengths comes back byte-identical.
 */
TEST(FrameDecoder, Decoder_Roundtrip_All_Header_Lengths) {
  const std::array<std::size_t, 6> body_lens{0, 1, 255, 256, 65534, 65535};
  std::vector<std::vector<std::byte>> bodies;
  for (std::size_t l : body_lens) bodies.push_back(bytes_of(l, 3));

  wire::FrameDecoder dec;
  for (std::size_t h = 0; h <= 255; ++h) {
    const auto head = bytes_of(h, static_cast<unsigned>(h));
    for (const auto& body : bodies) {
      auto frame = wire::encode_envelope(head, body);
      ASSERT_TRUE(frame) << "H=" << h << " L=" << body.size();
      ASSERT_EQ(frame->size(), 3 + h + body.size());

      // Split inside the frame so both halves go through the buffer.
      const std::span<const std::byte> all(*frame);
      const std::size_t cut = all.size() / 2;
      dec.feed(all.first(cut));
      EXPECT_FALSE(dec.next());
      dec.feed(all.subspan(cut));

      auto env = dec.next();
      ASSERT_TRUE(env) << "H=" << h << " L=" << body.size();
      EXPECT_EQ(env->head_len, h);
      EXPECT_EQ(env->body_len, body.size());
      EXPECT_TRUE(env->head == head) << "H=" << h << " L=" << body.size();
      EXPECT_TRUE(env->body == body) << "H=" << h << " L=" << body.size();
      EXPECT_FALSE(dec.mid_frame());
    }
  }
}

/**
 * @test Decoder_Many_In_One_Feed
 * @brief Several frames in one chunk come out in order.
 */
TEST(FrameDecoder, Decoder_Many_In_One_Feed) {
  std::vector<std::byte> chunk;
  for (unsigned i = 0; i < 10; ++i) {
    auto f = wire::encode_envelope(bytes_of(1, i), bytes_of(i, i));
    ASSERT_TRUE(f);
    chunk.insert(chunk.end(), f->begin(), f->end());
  }

  wire::FrameDecoder dec;
  dec.feed(chunk);
  for (unsigned i = 0; i < 10; ++i) {
    auto env = dec.next();
    ASSERT_TRUE(env) << "frame " << i;
    EXPECT_EQ(env->head, bytes_of(1, i));
    EXPECT_EQ(env->body.size(), i);
  }
  EXPECT_FALSE(dec.next());
}
