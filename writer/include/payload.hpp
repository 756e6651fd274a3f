// Copyright 2025 Stream Writer Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file payload.hpp
/// @brief Caller-supplied message, resolved to bytes at enqueue time
///
/// Three variants, one serialization rule each:
/// - Bytes: passed through unchanged
/// - Text: UTF-8 bytes of the string
/// - Structured: compact JSON (nlohmann::json::dump)
///
/// Example:
/// @code
///   accumulator.enqueue(Payload::text("hello"), "key-1");
///   accumulator.enqueue(Payload::structured({{"level", "INFO"}, {"count", 3}}));
/// @endcode

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace streamwriter::batching {

/// Payload variant kind
enum class PayloadKind {
    Bytes,
    Text,
    Structured
};

/// Convert PayloadKind to string
const char* to_string(PayloadKind kind);

class Payload {
public:
    static Payload bytes(std::vector<uint8_t> data);
    static Payload text(std::string utf8);
    static Payload structured(nlohmann::json value);

    PayloadKind kind() const;

    /// Serialize to the byte sequence that is sent to the stream
    std::vector<uint8_t> encode() const;

private:
    using Value = std::variant<std::vector<uint8_t>, std::string, nlohmann::json>;

    explicit Payload(Value value);

    Value value_;
};

}  // namespace streamwriter::batching
