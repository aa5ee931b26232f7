#pragma once
/**
 * @file self_describing.hpp
 * @brief Protobuf-backed header schemas.
 *
 * The message parses itself; the id is the field whose name normalizes
 * (lowercase, '_' and '-' removed) to "msgid", e.g. `msg_id`, `MsgId`,
 * `msgid`. The field must be a singular int32/int64/uint32/uint64
 * (or the sint/fixed variants).
 */

#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>

#include <google/protobuf/descriptor.h>
#include <google/protobuf/message.h>

#include "bmux/header/header_schema.hpp"

namespace bmux::header {

/// Lowercase @p name and drop '_' / '-'.
std::string normalize_field_name(std::string_view name);

/**
 * @brief Find the id field of a message type.
 * @return Schema error if no field normalizes to "msgid";
 *         Decode error if it is repeated or not an integer type.
 */
Result<const google::protobuf::FieldDescriptor*>
resolve_msg_id_field(const google::protobuf::Descriptor& desc);

/// Read and narrow the id from a parsed message (Decode error on overflow).
Result<std::int32_t> read_msg_id(const google::protobuf::Message& msg,
                                 const google::protobuf::FieldDescriptor& field);

/**
 * @brief Parse @p raw into @p dest and return its id (resolves the field on every call).
 * @return Decode error for a malformed payload, plus the errors of resolve_msg_id_field().
 */
Result<std::int32_t> decode_message(std::span<const std::byte> raw, google::protobuf::Message& dest);

/** @class SelfDescribingSchema
 *  @brief HeaderSchema for a generated protobuf message type; id field resolved once.
 */
template <class Msg>
class SelfDescribingSchema final : public HeaderSchema {
    static_assert(std::is_base_of_v<google::protobuf::Message, Msg>,
                  "self-describing headers must be protobuf messages");

public:
    explicit SelfDescribingSchema(const google::protobuf::FieldDescriptor* id_field) noexcept
        : id_field_(id_field) {}

    SchemaKind kind() const noexcept override { return SchemaKind::SelfDescribing; }

    std::string_view type_name() const noexcept override {
        return Msg::descriptor()->full_name();
    }

    Result<DecodedHeader> decode(std::span<const std::byte> raw) const override {
        Msg msg;
        if (!msg.ParseFromArray(raw.data(), static_cast<int>(raw.size()))) {
            return make_error(ErrorKind::Decode,
                              "failed to unmarshal protobuf header " + std::string(type_name()));
        }
        auto id = read_msg_id(msg, *id_field_);
        if (!id) return bmux_detail::unexpected(id.error());
        return DecodedHeader{*id, std::any(std::move(msg))};
    }

private:
    const google::protobuf::FieldDescriptor* id_field_;
};

/**
 * @brief Build the schema for Msg, resolving its id field now.
 * @return Schema/Decode error from resolve_msg_id_field().
 */
template <class Msg>
Result<SchemaPtr> make_self_describing_schema() {
    auto field = resolve_msg_id_field(*Msg::descriptor());
    if (!field) return bmux_detail::unexpected(field.error());
    return SchemaPtr(std::make_shared<const SelfDescribingSchema<Msg>>(*field));
}

} // namespace bmux::header
