#pragma once
/**
 * @file header_schema.hpp
 * @brief Header decoding seam: one schema per server, picked at registration.
 *
 * Two implementations exist:
 *  - FixedLayoutSchema<H>    (fixed_layout.hpp)    field-by-field big-endian integers
 *  - SelfDescribingSchema<M> (self_describing.hpp) protobuf message decoding itself
 *
 * The strategy is fixed when the schema object is built; decode() never
 * re-inspects the destination type.
 */

#include <any>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string_view>

#include "bmux/core/error.hpp"

namespace bmux::header {

/// Which decoding strategy a schema uses.
enum class SchemaKind : std::uint8_t { FixedLayout, SelfDescribing };

/** @struct DecodedHeader
 *  @brief Result of decoding one header: resolved id plus the typed value.
 */
struct DecodedHeader {
    std::int32_t msg_id{0};
    std::any     value;       ///< Holds the schema's header type (H or the protobuf message)
    std::size_t  head_len{0}; ///< Raw header bytes on the wire; filled in by the engine
};

/** @class HeaderSchema
 *  @brief Immutable decoder shared by every connection; decode() is thread-safe.
 */
class HeaderSchema {
public:
    virtual ~HeaderSchema() = default;

    virtual SchemaKind kind() const noexcept = 0;

    /// Header type name for logs.
    virtual std::string_view type_name() const noexcept = 0;

    /**
     * @brief Decode raw header bytes.
     * @return Decode error for malformed payloads, unsupported field kinds or ids
     *         outside the int32 range; Schema error when no id field resolves.
     */
    virtual Result<DecodedHeader> decode(std::span<const std::byte> raw) const = 0;
};

using SchemaPtr = std::shared_ptr<const HeaderSchema>;

/**
 * @brief Narrow a signed id to int32 (range-checked).
 * @return Decode error if @p v is outside [INT32_MIN, INT32_MAX].
 */
Result<std::int32_t> narrow_msg_id(std::int64_t v);

/**
 * @brief Narrow an unsigned id to int32 (range-checked).
 * @return Decode error if @p v exceeds INT32_MAX.
 */
Result<std::int32_t> narrow_msg_id(std::uint64_t v);

} // namespace bmux::header
