/**
 * @file test_header.cpp
 * @brief Tests for header schemas: fixed layout and protobuf-backed.
 *
 * Validates:
 *  - Field-by-field big-endian decode in registration order
 *  - Exactly one MessageId field enforced at build time
 *  - Unsupported kinds and short input rejected with Decode
 *  - Range-checked narrowing of wide ids
 *  - Protobuf id resolution by normalized name ("msgid")
 */

#include <gtest/gtest.h>
#include <cstdint>
#include <limits>
#include <string>
#include <vector>

#include "bmux/header/fixed_layout.hpp"
#include "bmux/header/self_describing.hpp"
#include "test_header.pb.h"

using bmux::ErrorKind;
using bmux::header::FieldKind;
using bmux::header::FieldRole;
using bmux::header::FixedLayout;
using bmux::header::SchemaKind;

///
/// Helpers
///
static std::vector<std::byte> raw(std::initializer_list<unsigned> v) {
  std::vector<std::byte> out;
  for (unsigned b : v) out.push_back(static_cast<std::byte>(b));
  return out;
}

static std::vector<std::byte> serialize(const google::protobuf::Message& m) {
  const std::string s = m.SerializeAsString();
  std::vector<std::byte> out(s.size());
  for (std::size_t i = 0; i < s.size(); ++i) out[i] = static_cast<std::byte>(s[i]);
  return out;
}

struct GameHeader {
  std::uint8_t  version{0};
  std::uint16_t msg_id{0};
  std::uint32_t seq{0};
};

struct SignedHeader {
  std::int8_t  delta{0};
  std::int16_t msg_id{0};
  std::int32_t offset{0};
};

struct WideHeader {
  std::uint32_t msg_id{0};
  std::uint64_t stamp{0};
};

static FixedLayout<GameHeader> game_layout() {
  auto built = FixedLayout<GameHeader>::builder()
                   .field("version", &GameHeader::version)
                   .field("msg_id", &GameHeader::msg_id, FieldRole::MessageId)
                   .field("seq", &GameHeader::seq)
                   .build();
  EXPECT_TRUE(built);
  return std::move(*built);
}

// --------------------------- Fixed layout: build ---------------------------

/**
 * @test Layout_Describes_Fields_In_Order
 * @brief fields() mirrors registration order with kind, width and role.
 */
TEST(FixedLayout, Layout_Describes_Fields_In_Order) {
  auto layout = game_layout();
  auto fields = layout.fields();
  ASSERT_EQ(fields.size(), 3u);
  EXPECT_EQ(fields[0].name, "version");
  EXPECT_EQ(fields[0].kind, FieldKind::U8);
  EXPECT_EQ(fields[1].kind, FieldKind::U16);
  EXPECT_EQ(fields[1].role, FieldRole::MessageId);
  EXPECT_EQ(fields[2].width, 4u);
  EXPECT_EQ(layout.wire_size(), 7u);
}

/**
 * @test Build_Without_Id_Fails
 * @brief No MessageId role is a Schema error.
 */
TEST(FixedLayout, Build_Without_Id_Fails) {
  auto built = FixedLayout<GameHeader>::builder()
                   .field("version", &GameHeader::version)
                   .field("seq", &GameHeader::seq)
                   .build();
  ASSERT_FALSE(built);
  EXPECT_EQ(built.error().kind, ErrorKind::Schema);
}

/**
 * @test Build_With_Two_Ids_Fails
 * @brief Two MessageId roles are ambiguous: Schema error.
 */
TEST(FixedLayout, Build_With_Two_Ids_Fails) {
  auto built = FixedLayout<GameHeader>::builder()
                   .field("version", &GameHeader::version, FieldRole::MessageId)
                   .field("msg_id", &GameHeader::msg_id, FieldRole::MessageId)
                   .build();
  ASSERT_FALSE(built);
  EXPECT_EQ(built.error().kind, ErrorKind::Schema);
}

// --------------------------- Fixed layout: decode --------------------------

/**
 * @test Decode_Big_Endian_Fields
 * @brief Each field is read big-endian at its running offset.
 */
TEST(FixedLayout, Decode_Big_Endian_Fields) {
  auto schema = bmux::header::make_fixed_layout_schema(game_layout());
  EXPECT_EQ(schema->kind(), SchemaKind::FixedLayout);

  auto decoded = schema->decode(raw({0x02, 0x01, 0x2C, 0x00, 0x00, 0x10, 0x01}));
  ASSERT_TRUE(decoded) << decoded.error().message;
  EXPECT_EQ(decoded->msg_id, 300);

  const auto* h = std::any_cast<GameHeader>(&decoded->value);
  ASSERT_NE(h, nullptr);
  EXPECT_EQ(h->version, 2);
  EXPECT_EQ(h->msg_id, 300);
  EXPECT_EQ(h->seq, 0x1001u);
}

/**
 * @test Decode_Ignores_Trailing_Bytes
 * @brief Bytes past the last field do not affect the result.
 */
TEST(FixedLayout, Decode_Ignores_Trailing_Bytes) {
  auto layout = game_layout();
  GameHeader h;
  auto id = layout.decode_into(raw({0x01, 0x00, 0x05, 0, 0, 0, 9, 0xAA, 0xBB}), h);
  ASSERT_TRUE(id);
  EXPECT_EQ(*id, 5);
  EXPECT_EQ(h.seq, 9u);
}

/**
 * @test Decode_Signed_Fields
 * @brief Signed kinds are sign-extended; a negative id is a valid int32.
 */
TEST(FixedLayout, Decode_Signed_Fields) {
  auto built = FixedLayout<SignedHeader>::builder()
                   .field("delta", &SignedHeader::delta)
                   .field("msg_id", &SignedHeader::msg_id, FieldRole::MessageId)
                   .field("offset", &SignedHeader::offset)
                   .build();
  ASSERT_TRUE(built);

  SignedHeader h;
  auto id = built->decode_into(raw({0xFF, 0xFF, 0xFE, 0x80, 0x00, 0x00, 0x00}), h);
  ASSERT_TRUE(id);
  EXPECT_EQ(*id, -2);
  EXPECT_EQ(h.delta, -1);
  EXPECT_EQ(h.offset, std::numeric_limits<std::int32_t>::min());
}

/**
 * @test Decode_Short_Input_Fails
 * @brief Input shorter than the layout is a Decode error naming the field.
 */
TEST(FixedLayout, Decode_Short_Input_Fails) {
  auto schema = bmux::header::make_fixed_layout_schema(game_layout());
  auto decoded = schema->decode(raw({0x01, 0x00, 0x05, 0x00}));
  ASSERT_FALSE(decoded);
  EXPECT_EQ(decoded.error().kind, ErrorKind::Decode);
  EXPECT_NE(decoded.error().message.find("seq"), std::string::npos);
}

/**
 * @test Decode_Unsupported_Kind_Fails
 * @brief A 64-bit field is describable but not decodable.
 */
TEST(FixedLayout, Decode_Unsupported_Kind_Fails) {
  auto built = FixedLayout<WideHeader>::builder()
                   .field("msg_id", &WideHeader::msg_id, FieldRole::MessageId)
                   .field("stamp", &WideHeader::stamp)
                   .build();
  ASSERT_TRUE(built);
  EXPECT_EQ(built->fields()[1].kind, FieldKind::U64);

  WideHeader h;
  auto id = built->decode_into(std::vector<std::byte>(12, std::byte{0}), h);
  ASSERT_FALSE(id);
  EXPECT_EQ(id.error().kind, ErrorKind::Decode);
  EXPECT_NE(id.error().message.find("u64"), std::string::npos);
}

/**
 * @test Decode_Id_Overflow_Fails
 * @brief A u32 id above INT32_MAX does not wrap: Decode error.
 */
TEST(FixedLayout, Decode_Id_Overflow_Fails) {
  auto built = FixedLayout<WideHeader>::builder()
                   .field("msg_id", &WideHeader::msg_id, FieldRole::MessageId)
                   .build();
  ASSERT_TRUE(built);

  WideHeader h;
  auto ok = built->decode_into(raw({0x7F, 0xFF, 0xFF, 0xFF}), h);
  ASSERT_TRUE(ok);
  EXPECT_EQ(*ok, std::numeric_limits<std::int32_t>::max());

  auto bad = built->decode_into(raw({0x80, 0x00, 0x00, 0x00}), h);
  ASSERT_FALSE(bad);
  EXPECT_EQ(bad.error().kind, ErrorKind::Decode);
}

// --------------------------- Narrowing ------------------------------------

/**
 * @test Narrow_Range_Checked
 * @brief Exactly the int32 range passes.
 */
TEST(NarrowMsgId, Narrow_Range_Checked) {
  using bmux::header::narrow_msg_id;
  constexpr std::int64_t lo = std::numeric_limits<std::int32_t>::min();
  constexpr std::int64_t hi = std::numeric_limits<std::int32_t>::max();

  EXPECT_TRUE(narrow_msg_id(lo));
  EXPECT_TRUE(narrow_msg_id(hi));
  EXPECT_FALSE(narrow_msg_id(lo - 1));
  EXPECT_FALSE(narrow_msg_id(hi + 1));
  EXPECT_TRUE(narrow_msg_id(static_cast<std::uint64_t>(hi)));
  EXPECT_FALSE(narrow_msg_id(static_cast<std::uint64_t>(hi) + 1));
}

// --------------------------- Self-describing -------------------------------

/**
 * @test Proto_Normalize_Names
 * @brief Case, '_' and '-' do not matter.
 */
TEST(SelfDescribing, Proto_Normalize_Names) {
  using bmux::header::normalize_field_name;
  EXPECT_EQ(normalize_field_name("msg_id"), "msgid");
  EXPECT_EQ(normalize_field_name("MsgId"), "msgid");
  EXPECT_EQ(normalize_field_name("MSG-ID"), "msgid");
  EXPECT_NE(normalize_field_name("message_id"), "msgid");
}

/**
 * @test Proto_Decode_Game_Header
 * @brief Parsed message travels as the header value; id comes from msg_id.
 */
TEST(SelfDescribing, Proto_Decode_Game_Header) {
  auto schema = bmux::header::make_self_describing_schema<bmux::test::GameHeader>();
  ASSERT_TRUE(schema) << schema.error().message;
  EXPECT_EQ((*schema)->kind(), SchemaKind::SelfDescribing);

  bmux::test::GameHeader msg;
  msg.set_msg_id(42);
  msg.set_seq(7);
  msg.set_trace("abc");

  auto decoded = (*schema)->decode(serialize(msg));
  ASSERT_TRUE(decoded) << decoded.error().message;
  EXPECT_EQ(decoded->msg_id, 42);
  const auto* h = std::any_cast<bmux::test::GameHeader>(&decoded->value);
  ASSERT_NE(h, nullptr);
  EXPECT_EQ(h->seq(), 7u);
  EXPECT_EQ(h->trace(), "abc");
}

/**
 * @test Proto_Decode_Into_Message
 * @brief decode_message() fills the destination and resolves CamelCase ids.
 */
TEST(SelfDescribing, Proto_Decode_Into_Message) {
  bmux::test::WideHeader msg;
  msg.set_msgid(1234);
  bmux::test::WideHeader dest;
  auto id = bmux::header::decode_message(serialize(msg), dest);
  ASSERT_TRUE(id) << id.error().message;
  EXPECT_EQ(*id, 1234);
  EXPECT_EQ(dest.msgid(), 1234u);
}

/**
 * @test Proto_Wide_Id_Overflow
 * @brief A uint64 id beyond int32 is a Decode error.
 */
TEST(SelfDescribing, Proto_Wide_Id_Overflow) {
  auto schema = bmux::header::make_self_describing_schema<bmux::test::WideHeader>();
  ASSERT_TRUE(schema);

  bmux::test::WideHeader msg;
  msg.set_msgid(std::uint64_t{1} << 40);
  auto decoded = (*schema)->decode(serialize(msg));
  ASSERT_FALSE(decoded);
  EXPECT_EQ(decoded.error().kind, ErrorKind::Decode);
}

/**
 * @test Proto_Missing_Id_Is_Schema_Error
 * @brief A message without a msgid field cannot become a schema.
 */
TEST(SelfDescribing, Proto_Missing_Id_Is_Schema_Error) {
  auto schema = bmux::header::make_self_describing_schema<bmux::test::NoIdHeader>();
  ASSERT_FALSE(schema);
  EXPECT_EQ(schema.error().kind, ErrorKind::Schema);

  bmux::test::NoIdHeader dest;
  auto id = bmux::header::decode_message({}, dest);
  ASSERT_FALSE(id);
  EXPECT_EQ(id.error().kind, ErrorKind::Schema);
}

/**
 * @test Proto_Non_Integer_Id_Is_Decode_Error
 * @brief String or repeated id fields are rejected with Decode.
 */
TEST(SelfDescribing, Proto_Non_Integer_Id_Is_Decode_Error) {
  auto s = bmux::header::make_self_describing_schema<bmux::test::StringIdHeader>();
  ASSERT_FALSE(s);
  EXPECT_EQ(s.error().kind, ErrorKind::Decode);

  auto r = bmux::header::make_self_describing_schema<bmux::test::RepeatedIdHeader>();
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error().kind, ErrorKind::Decode);
}

/**
 * @test Proto_Malformed_Payload
 * @brief Truncated protobuf bytes are a Decode error.
 */
TEST(SelfDescribing, Proto_Malformed_Payload) {
  auto schema = bmux::header::make_self_describing_schema<bmux::test::GameHeader>();
  ASSERT_TRUE(schema);

  // Field 3 (string) announces 5 bytes, only 1 follows.
  auto decoded = (*schema)->decode(raw({0x1A, 0x05, 0x61}));
  ASSERT_FALSE(decoded);
  EXPECT_EQ(decoded.error().kind, ErrorKind::Decode);
}
