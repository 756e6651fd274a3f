// Copyright 2025 Stream Writer Contributors
// SPDX-License-Identifier: Apache-2.0

#include "streamwriter/stream_transport.hpp"

namespace streamwriter {

bool is_stream_arn(const std::string& stream) {
    return stream.rfind("arn:", 0) == 0;
}

std::string stream_display_name(const std::string& stream) {
    if (!is_stream_arn(stream)) {
        return stream;
    }

    // arn:partition:kinesis:region:account:stream/name
    std::string resource = stream.substr(stream.rfind(':') + 1);
    const std::string prefix = "stream/";
    if (resource.rfind(prefix, 0) == 0) {
        resource = resource.substr(prefix.length());
    }
    return resource;
}

}  // namespace streamwriter
