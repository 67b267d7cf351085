#include "http/UrlCodec.hpp"

#include <cctype>
#include <charconv>

namespace igp::http {
namespace {

std::optional<unsigned char> hex_byte(std::string_view value, std::size_t pos) {
    if (pos + 2 > value.size()) {
        return std::nullopt;
    }
    const char* begin = value.data() + pos;
    const char* end = begin + 2;
    unsigned int code{};
    auto [ptr, ec] = std::from_chars(begin, end, code, 16);
    if (ec != std::errc() || ptr != end) {
        return std::nullopt;
    }
    return static_cast<unsigned char>(code);
}

bool is_unreserved(unsigned char ch) {
    return std::isalnum(ch) != 0 || ch == '-' || ch == '_' || ch == '.' || ch == '~';
}

}  // namespace

std::string decode_form_component(std::string_view value) {
    std::string decoded;
    decoded.reserve(value.size());
    for (std::size_t i = 0; i < value.size(); ++i) {
        const char ch = value[i];
        if (ch == '+') {
            decoded.push_back(' ');
        }
        else if (ch == '%') {
            if (const auto byte = hex_byte(value, i + 1)) {
                decoded.push_back(static_cast<char>(*byte));
                i += 2;
            }
            else {
                decoded.push_back(ch);
            }
        }
        else {
            decoded.push_back(ch);
        }
    }
    return decoded;
}

std::optional<std::string> decode_uri_component(std::string_view value) {
    std::string decoded;
    decoded.reserve(value.size());
    for (std::size_t i = 0; i < value.size(); ++i) {
        const char ch = value[i];
        if (ch != '%') {
            decoded.push_back(ch);
            continue;
        }
        const auto byte = hex_byte(value, i + 1);
        if (!byte) {
            return std::nullopt;
        }
        decoded.push_back(static_cast<char>(*byte));
        i += 2;
    }
    return decoded;
}

std::string encode_component(std::string_view value) {
    static constexpr char kHex[] = "0123456789ABCDEF";
    std::string encoded;
    encoded.reserve(value.size());
    for (const unsigned char ch : value) {
        if (is_unreserved(ch)) {
            encoded.push_back(static_cast<char>(ch));
        }
        else {
            encoded.push_back('%');
            encoded.push_back(kHex[ch >> 4U]);
            encoded.push_back(kHex[ch & 0x0FU]);
        }
    }
    return encoded;
}

QueryParams parse_query(std::string_view query) {
    QueryParams params;
    while (!query.empty()) {
        const auto amp = query.find('&');
        const auto part = query.substr(0, amp);
        query = amp == std::string_view::npos ? std::string_view{} : query.substr(amp + 1);
        if (part.empty()) {
            continue;
        }
        const auto eq = part.find('=');
        if (eq == std::string_view::npos) {
            params.emplace_back(decode_form_component(part), std::string{});
        }
        else {
            params.emplace_back(decode_form_component(part.substr(0, eq)), decode_form_component(part.substr(eq + 1)));
        }
    }
    return params;
}

std::string encode_query(const QueryParams& params) {
    std::string query;
    for (const auto& [key, value] : params) {
        query.push_back(query.empty() ? '?' : '&');
        query.append(encode_component(key)).append("=").append(encode_component(value));
    }
    return query;
}

}  // namespace igp::http
