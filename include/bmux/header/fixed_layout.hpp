#pragma once
/**
 * @file fixed_layout.hpp
 * @brief Explicit, registration-built description of a fixed binary header.
 *
 * A FixedLayout<H> is an ordered list of (kind, width, role) entries, one per
 * registered member of H, built once through FixedLayout<H>::Builder. Fields
 * are decoded in registration order as big-endian integers; exactly one entry
 * carries FieldRole::MessageId.
 *
 * Example:
 * @code
 *   struct GameHeader { std::uint8_t version; std::uint16_t msg_id; std::uint32_t seq; };
 *   auto layout = bmux::header::FixedLayout<GameHeader>::builder()
 *                     .field("version", &GameHeader::version)
 *                     .field("msg_id",  &GameHeader::msg_id, FieldRole::MessageId)
 *                     .field("seq",     &GameHeader::seq)
 *                     .build();
 * @endcode
 */

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeinfo>
#include <utility>
#include <vector>

#include "bmux/header/header_schema.hpp"

namespace bmux::header {

/// Field kinds a layout can describe. Only the 8/16/32-bit integers decode.
enum class FieldKind : std::uint8_t { U8, U16, U32, I8, I16, I32, U64, I64, F32, F64 };

/// Role of a field inside the header.
enum class FieldRole : std::uint8_t { Data, MessageId };

constexpr std::size_t width_of(FieldKind k) noexcept {
    switch (k) {
        case FieldKind::U8:  case FieldKind::I8:  return 1;
        case FieldKind::U16: case FieldKind::I16: return 2;
        case FieldKind::U32: case FieldKind::I32: case FieldKind::F32: return 4;
        case FieldKind::U64: case FieldKind::I64: case FieldKind::F64: return 8;
    }
    return 0;
}

/// True for the kinds the fixed-layout codec can read.
constexpr bool is_decodable(FieldKind k) noexcept {
    switch (k) {
        case FieldKind::U8: case FieldKind::U16: case FieldKind::U32:
        case FieldKind::I8: case FieldKind::I16: case FieldKind::I32:
            return true;
        default:
            return false;
    }
}

constexpr std::string_view to_string(FieldKind k) noexcept {
    switch (k) {
        case FieldKind::U8:  return "u8";
        case FieldKind::U16: return "u16";
        case FieldKind::U32: return "u32";
        case FieldKind::I8:  return "i8";
        case FieldKind::I16: return "i16";
        case FieldKind::I32: return "i32";
        case FieldKind::U64: return "u64";
        case FieldKind::I64: return "i64";
        case FieldKind::F32: return "f32";
        case FieldKind::F64: return "f64";
    }
    return "unknown";
}

/// Map a member type to its FieldKind at compile time.
template <class M>
constexpr FieldKind field_kind_of() noexcept {
    if constexpr (std::is_same_v<M, std::uint8_t>)       return FieldKind::U8;
    else if constexpr (std::is_same_v<M, std::uint16_t>) return FieldKind::U16;
    else if constexpr (std::is_same_v<M, std::uint32_t>) return FieldKind::U32;
    else if constexpr (std::is_same_v<M, std::int8_t>)   return FieldKind::I8;
    else if constexpr (std::is_same_v<M, std::int16_t>)  return FieldKind::I16;
    else if constexpr (std::is_same_v<M, std::int32_t>)  return FieldKind::I32;
    else if constexpr (std::is_same_v<M, std::uint64_t>) return FieldKind::U64;
    else if constexpr (std::is_same_v<M, std::int64_t>)  return FieldKind::I64;
    else if constexpr (std::is_same_v<M, float>)         return FieldKind::F32;
    else {
        static_assert(std::is_same_v<M, double>, "header fields must be fixed-width integers or floats");
        return FieldKind::F64;
    }
}

/** @struct FieldSpec
 *  @brief One entry of a layout description.
 */
struct FieldSpec {
    std::string name;
    FieldKind   kind{FieldKind::U8};
    std::size_t width{1};
    FieldRole   role{FieldRole::Data};
};

/** @class FixedLayout
 *  @brief Immutable decoder for header type H.
 *  @tparam H Plain record type; decoded into a value-initialized instance.
 */
template <class H>
class FixedLayout {
    static_assert(std::is_class_v<H> && !std::is_const_v<H>,
                  "fixed-layout destination must be a mutable record type");

    struct Entry {
        FieldSpec spec;
        std::function<void(H&, std::uint64_t)>                store;    ///< Assign raw big-endian value
        std::function<Result<std::int32_t>(const H&)>         read_id;  ///< Only set for integer kinds
    };

public:
    class Builder {
    public:
        /**
         * @brief Append the next field in wire order.
         * @param name Label used in errors.
         * @param member Pointer to the member receiving the value.
         * @param role FieldRole::MessageId marks the identifier.
         */
        template <class M>
        Builder& field(std::string name, M H::*member, FieldRole role = FieldRole::Data) {
            constexpr FieldKind kind = field_kind_of<M>();
            Entry e;
            e.spec = FieldSpec{std::move(name), kind, width_of(kind), role};
            if constexpr (std::is_integral_v<M>) {
                e.store = [member](H& h, std::uint64_t raw) {
                    // Truncate to the field width, then reinterpret (sign-extends signed kinds).
                    h.*member = static_cast<M>(static_cast<std::make_unsigned_t<M>>(raw));
                };
                e.read_id = [member](const H& h) -> Result<std::int32_t> {
                    if constexpr (std::is_signed_v<M>) {
                        return narrow_msg_id(static_cast<std::int64_t>(h.*member));
                    } else {
                        return narrow_msg_id(static_cast<std::uint64_t>(h.*member));
                    }
                };
            }
            entries_.push_back(std::move(e));
            return *this;
        }

        /**
         * @brief Freeze the description.
         * @return Schema error when no field (or more than one) has the MessageId role.
         */
        Result<FixedLayout> build() {
            std::size_t id_index = entries_.size();
            for (std::size_t i = 0; i < entries_.size(); ++i) {
                if (entries_[i].spec.role != FieldRole::MessageId) continue;
                if (id_index != entries_.size()) {
                    return make_error(ErrorKind::Schema,
                                      std::string("more than one msg id field in ") + typeid(H).name());
                }
                id_index = i;
            }
            if (id_index == entries_.size()) {
                return make_error(ErrorKind::Schema,
                                  std::string("no field tagged as msg id in ") + typeid(H).name());
            }
            return FixedLayout(std::move(entries_), id_index);
        }

    private:
        std::vector<Entry> entries_;
    };

    static Builder builder() { return Builder{}; }

    /// Ordered description (for logs and tests).
    std::vector<FieldSpec> fields() const {
        std::vector<FieldSpec> out;
        out.reserve(entries_.size());
        for (const auto& e : entries_) out.push_back(e.spec);
        return out;
    }

    /// Bytes consumed by a full decode.
    std::size_t wire_size() const noexcept {
        std::size_t n = 0;
        for (const auto& e : entries_) n += e.spec.width;
        return n;
    }

    /**
     * @brief Decode @p raw into @p dest in registration order.
     * @return Message id, or Decode error (short input, unsupported kind, id out of range).
     * @note Bytes past the last field are ignored.
     */
    Result<std::int32_t> decode_into(std::span<const std::byte> raw, H& dest) const {
        std::size_t off = 0;
        for (const auto& e : entries_) {
            if (!is_decodable(e.spec.kind)) {
                return make_error(ErrorKind::Decode,
                                  "unsupported field kind '" + std::string(to_string(e.spec.kind)) +
                                  "' for field '" + e.spec.name + "'");
            }
            if (raw.size() - off < e.spec.width) {
                return make_error(ErrorKind::Decode,
                                  "failed to decode " + std::string(to_string(e.spec.kind)) + " field '" +
                                  e.spec.name + "': need " + std::to_string(e.spec.width) + " bytes, have " +
                                  std::to_string(raw.size() - off));
            }
            std::uint64_t v = 0;
            for (std::size_t i = 0; i < e.spec.width; ++i) {
                v = (v << 8) | std::to_integer<std::uint64_t>(raw[off + i]);
            }
            e.store(dest, v);
            off += e.spec.width;
        }

        const Entry& id = entries_[id_index_];
        if (!id.read_id) {
            return make_error(ErrorKind::Decode,
                              "msg id field '" + id.spec.name + "' has non-integer kind " +
                              std::string(to_string(id.spec.kind)));
        }
        return id.read_id(dest);
    }

private:
    FixedLayout(std::vector<Entry> entries, std::size_t id_index)
        : entries_(std::move(entries)), id_index_(id_index) {}

    std::vector<Entry> entries_;
    std::size_t        id_index_{0};
};

/** @class FixedLayoutSchema
 *  @brief HeaderSchema adapter over a FixedLayout<H>.
 */
template <class H>
class FixedLayoutSchema final : public HeaderSchema {
public:
    explicit FixedLayoutSchema(FixedLayout<H> layout) : layout_(std::move(layout)) {}

    SchemaKind kind() const noexcept override { return SchemaKind::FixedLayout; }
    std::string_view type_name() const noexcept override { return typeid(H).name(); }

    Result<DecodedHeader> decode(std::span<const std::byte> raw) const override {
        H h{};
        auto id = layout_.decode_into(raw, h);
        if (!id) return bmux_detail::unexpected(id.error());
        return DecodedHeader{*id, std::any(std::move(h))};
    }

    const FixedLayout<H>& layout() const noexcept { return layout_; }

private:
    FixedLayout<H> layout_;
};

/// Wrap a built layout as the server's header schema.
template <class H>
SchemaPtr make_fixed_layout_schema(FixedLayout<H> layout) {
    return std::make_shared<const FixedLayoutSchema<H>>(std::move(layout));
}

} // namespace bmux::header
