#include "bmux/header/header_schema.hpp"

#include <limits>
#include <string>

namespace bmux::header {

Result<std::int32_t> narrow_msg_id(std::int64_t v) {
    if (v < std::numeric_limits<std::int32_t>::min() || v > std::numeric_limits<std::int32_t>::max()) {
        return make_error(ErrorKind::Decode, "msg id " + std::to_string(v) + " does not fit in int32");
    }
    return static_cast<std::int32_t>(v);
}

Result<std::int32_t> narrow_msg_id(std::uint64_t v) {
    if (v > static_cast<std::uint64_t>(std::numeric_limits<std::int32_t>::max())) {
        return make_error(ErrorKind::Decode, "msg id " + std::to_string(v) + " does not fit in int32");
    }
    return static_cast<std::int32_t>(v);
}

} // namespace bmux::header
