#include "bmux/header/self_describing.hpp"

#include <cctype>

namespace bmux::header {

using google::protobuf::FieldDescriptor;

std::string normalize_field_name(std::string_view name) {
    std::string out;
    out.reserve(name.size());
    for (char c : name) {
        if (c == '_' || c == '-') continue;
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return out;
}

Result<const FieldDescriptor*> resolve_msg_id_field(const google::protobuf::Descriptor& desc) {
    for (int i = 0; i < desc.field_count(); ++i) {
        const FieldDescriptor* f = desc.field(i);
        if (normalize_field_name(f->name()) != "msgid") continue;

        if (f->is_repeated()) {
            return make_error(ErrorKind::Decode, "msg id field '" + f->name() + "' is repeated");
        }
        switch (f->cpp_type()) {
            case FieldDescriptor::CPPTYPE_INT32:
            case FieldDescriptor::CPPTYPE_INT64:
            case FieldDescriptor::CPPTYPE_UINT32:
            case FieldDescriptor::CPPTYPE_UINT64:
                return f;
            default:
                return make_error(ErrorKind::Decode,
                                  "unsupported msg id field kind " + std::string(f->cpp_type_name()) +
                                  " in " + desc.full_name());
        }
    }
    return make_error(ErrorKind::Schema, "no field named 'msgid' found in " + desc.full_name());
}

Result<std::int32_t> read_msg_id(const google::protobuf::Message& msg, const FieldDescriptor& field) {
    const auto* refl = msg.GetReflection();
    switch (field.cpp_type()) {
        case FieldDescriptor::CPPTYPE_INT32:
            return refl->GetInt32(msg, &field);
        case FieldDescriptor::CPPTYPE_INT64:
            return narrow_msg_id(static_cast<std::int64_t>(refl->GetInt64(msg, &field)));
        case FieldDescriptor::CPPTYPE_UINT32:
            return narrow_msg_id(static_cast<std::uint64_t>(refl->GetUInt32(msg, &field)));
        case FieldDescriptor::CPPTYPE_UINT64:
            return narrow_msg_id(static_cast<std::uint64_t>(refl->GetUInt64(msg, &field)));
        default:
            return make_error(ErrorKind::Decode,
                              "unsupported msg id field kind " + std::string(field.cpp_type_name()));
    }
}

Result<std::int32_t> decode_message(std::span<const std::byte> raw, google::protobuf::Message& dest) {
    if (!dest.ParseFromArray(raw.data(), static_cast<int>(raw.size()))) {
        return make_error(ErrorKind::Decode, "failed to unmarshal protobuf header " + dest.GetTypeName());
    }
    auto field = resolve_msg_id_field(*dest.GetDescriptor());
    if (!field) return bmux_detail::unexpected(field.error());
    return read_msg_id(dest, **field);
}

} // namespace bmux::header
