#pragma once
/// @file json.hpp
/// @brief JSON library alias and value converters for sqorm
///
/// Wraps nlohmann/json. Values render as their natural JSON counterpart;
/// blobs render as lowercase hex strings.

#include "types.hpp"
#include <nlohmann/json.hpp>

namespace sqorm {

/// JSON type alias
using json = nlohmann::json;

/// Ordered JSON (preserves insertion order, used for rows and records)
using ordered_json = nlohmann::ordered_json;

inline void to_json(ordered_json& j, const Value& v) {
    switch (v.kind()) {
        case ValueKind::Null:    j = nullptr; break;
        case ValueKind::Integer: j = v.as_int(); break;
        case ValueKind::Real:    j = v.as_double(); break;
        case ValueKind::Text:    j = v.as_text(); break;
        case ValueKind::Blob:    j = v.to_string(); break;
    }
}

} // namespace sqorm
