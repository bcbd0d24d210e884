#pragma once

#include <cctype>
#include <cstdio>
#include <string>

namespace relay::providers {

// Percent-encodes everything outside the RFC 3986 unreserved set.
inline std::string url_encode(const std::string& value) {
    std::string encoded;
    encoded.reserve(value.size() * 3);
    for (const char c : value) {
        const auto byte = static_cast<unsigned char>(c);
        if (std::isalnum(byte) != 0 || c == '-' || c == '_' || c == '.' || c == '~') {
            encoded.push_back(c);
            continue;
        }
        char hex[4];
        std::snprintf(hex, sizeof(hex), "%%%02X", static_cast<unsigned int>(byte));
        encoded += hex;
    }
    return encoded;
}

// httplib::Client rejects any other scheme by throwing.
inline bool has_http_scheme(const std::string& url) {
    return url.rfind("http://", 0) == 0 || url.rfind("https://", 0) == 0;
}

}  // namespace relay::providers
