// Copyright 2025 Stream Writer Contributors
// SPDX-License-Identifier: Apache-2.0

#include "payload.hpp"

namespace streamwriter::batching {

const char* to_string(PayloadKind kind) {
    switch (kind) {
        case PayloadKind::Bytes: return "bytes";
        case PayloadKind::Text: return "text";
        case PayloadKind::Structured: return "structured";
    }
    return "unknown";
}

Payload::Payload(Value value)
    : value_(std::move(value)) {
}

Payload Payload::bytes(std::vector<uint8_t> data) {
    return Payload(Value(std::in_place_index<0>, std::move(data)));
}

Payload Payload::text(std::string utf8) {
    return Payload(Value(std::in_place_index<1>, std::move(utf8)));
}

Payload Payload::structured(nlohmann::json value) {
    return Payload(Value(std::in_place_index<2>, std::move(value)));
}

PayloadKind Payload::kind() const {
    switch (value_.index()) {
        case 0: return PayloadKind::Bytes;
        case 1: return PayloadKind::Text;
        default: return PayloadKind::Structured;
    }
}

std::vector<uint8_t> Payload::encode() const {
    switch (kind()) {
        case PayloadKind::Bytes:
            return std::get<0>(value_);
        case PayloadKind::Text: {
            const auto& text = std::get<1>(value_);
            return std::vector<uint8_t>(text.begin(), text.end());
        }
        case PayloadKind::Structured: {
            // Throws nlohmann::json::type_error on invalid UTF-8 in strings
            std::string serialized = std::get<2>(value_).dump();
            return std::vector<uint8_t>(serialized.begin(), serialized.end());
        }
    }
    return {};
}

}  // namespace streamwriter::batching
