#include <pipeline/session_id.hpp>
#include <hashing/blake3_pipeline.hpp>

namespace Sessionizer {

std::string escape_id_component(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        if (c == '\\' || c == '#') out.push_back('\\');
        out.push_back(c);
    }
    return out;
}

std::string derive_session_id(SessionIdFormat format,
                              const std::string& user_id,
                              const std::string& product_code,
                              Timestamp session_start) {
    const std::string start = TimeUtil::format_timestamp(session_start);

    if (format == SessionIdFormat::Digest) {
        return BLAKE3Pipeline::to_hex(BLAKE3Pipeline::hash_fields({user_id, product_code, start}));
    }

    std::string id = escape_id_component(user_id);
    id.push_back('#');
    id += escape_id_component(product_code);
    id.push_back('#');
    id += start;
    return id;
}

} // namespace Sessionizer
