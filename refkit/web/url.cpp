/*
 * url.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-21

Description: URL recognition and percent encoding helpers

**************************************************/

#include "url.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <optional>
#include <regex>
#include <vector>

#include <spdlog/spdlog.h>

#include "refkit/error/exception.hpp"

namespace refkit::web {

namespace {
constexpr int HTTP_DEFAULT_PORT = 80;
constexpr int HTTPS_DEFAULT_PORT = 443;
constexpr int MAX_PORT = 65535;
constexpr std::array<char, 16> HEX_DIGITS = {'0', '1', '2', '3', '4', '5',
                                             '6', '7', '8', '9', 'A', 'B',
                                             'C', 'D', 'E', 'F'};

auto isUnreserved(unsigned char ch) -> bool {
    if (ch < 0x80 && std::isalnum(ch) != 0) {
        return true;
    }
    switch (ch) {
        case '-':
        case '_':
        case '.':
        case '!':
        case '~':
        case '*':
        case '\'':
        case '(':
        case ')':
            return true;
        default:
            return false;
    }
}

auto toLower(std::string_view str) -> std::string {
    std::string result(str);
    std::ranges::transform(result, result.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return result;
}

// Reads the byte of the escape starting at str[pos] ('%').
auto readEscape(std::string_view str, size_t pos) -> unsigned char {
    if (pos + 2 >= str.size()) {
        THROW_INVALID_ESCAPE("Incomplete escape sequence at offset {}", pos);
    }
    int value = 0;
    const auto* first = str.data() + pos + 1;
    const auto* last = first + 2;
    const bool hex = std::isxdigit(static_cast<unsigned char>(first[0])) != 0 &&
                     std::isxdigit(static_cast<unsigned char>(first[1])) != 0;
    auto [ptr, ec] = std::from_chars(first, last, value, 16);
    if (!hex || ec != std::errc() || ptr != last) {
        THROW_INVALID_ESCAPE("Invalid escape sequence '{}'",
                             str.substr(pos, 3));
    }
    return static_cast<unsigned char>(value);
}

// Expected length of a UTF-8 sequence from its lead byte, 0 if invalid.
auto utf8SequenceLength(unsigned char lead) -> size_t {
    if (lead < 0x80) {
        return 1;
    }
    if (lead >= 0xC2 && lead <= 0xDF) {
        return 2;
    }
    if (lead >= 0xE0 && lead <= 0xEF) {
        return 3;
    }
    if (lead >= 0xF0 && lead <= 0xF4) {
        return 4;
    }
    return 0;
}

auto isValidSecondByte(unsigned char lead, unsigned char second) -> bool {
    switch (lead) {
        case 0xE0:
            return second >= 0xA0 && second <= 0xBF;
        case 0xED:
            return second >= 0x80 && second <= 0x9F;
        case 0xF0:
            return second >= 0x90 && second <= 0xBF;
        case 0xF4:
            return second >= 0x80 && second <= 0x8F;
        default:
            return (second & 0xC0) == 0x80;
    }
}

// Longest `scheme://host:port` accepted: a 253 character host name plus
// scheme and port.
constexpr size_t MAX_PREFIX_LENGTH = 272;

struct UrlParts {
    std::string_view scheme;
    std::string_view host;
    std::string_view port;
    std::string_view path;
    // Both keep their leading `?` / `#`.
    std::string_view query;
    std::string_view fragment;
    size_t authority_end{0};
};

// Splits on the first `://`, then on `/?#`; no validation.
auto splitUrl(std::string_view str) -> std::optional<UrlParts> {
    const size_t schemeEnd = str.find("://");
    if (schemeEnd == std::string_view::npos) {
        return std::nullopt;
    }

    UrlParts parts;
    parts.scheme = str.substr(0, schemeEnd);
    const size_t authorityStart = schemeEnd + 3;
    parts.authority_end = std::min(str.find_first_of("/?#", authorityStart),
                                   str.size());
    const auto authority =
        str.substr(authorityStart, parts.authority_end - authorityStart);
    const size_t colon = authority.find(':');
    parts.host = authority.substr(0, colon);
    if (colon != std::string_view::npos) {
        parts.port = authority.substr(colon + 1);
    }

    auto rest = str.substr(parts.authority_end);
    const size_t fragmentStart = rest.find('#');
    if (fragmentStart != std::string_view::npos) {
        parts.fragment = rest.substr(fragmentStart);
        rest = rest.substr(0, fragmentStart);
    }
    const size_t queryStart = rest.find('?');
    if (queryStart != std::string_view::npos) {
        parts.query = rest.substr(queryStart);
        rest = rest.substr(0, queryStart);
    }
    parts.path = rest;
    return parts;
}

auto isAsciiAlnum(char ch) -> bool {
    const auto byte = static_cast<unsigned char>(ch);
    return byte < 0x80 && std::isalnum(byte) != 0;
}

auto isPathChar(char ch) -> bool {
    return isAsciiAlnum(ch) ||
           std::string_view("-%_.~+/").find(ch) != std::string_view::npos;
}

auto isQueryChar(char ch) -> bool {
    return isAsciiAlnum(ch) ||
           std::string_view(";&%_.~+=-").find(ch) != std::string_view::npos;
}

auto isFragmentChar(char ch) -> bool {
    return isAsciiAlnum(ch) || ch == '-' || ch == '_';
}

// Strips the `?` or `#` kept by splitUrl().
auto dropLeading(std::string_view part) -> std::string_view {
    return part.empty() ? part : part.substr(1);
}

// RFC 3986 section 5.2.4, empty segments are kept.
auto removeDotSegments(std::string_view path) -> std::string {
    if (path.empty()) {
        return "/";
    }
    std::vector<std::string_view> output;
    size_t start = path.front() == '/' ? 1 : 0;
    while (true) {
        const size_t slash = path.find('/', start);
        const bool last = slash == std::string_view::npos;
        const auto segment = path.substr(
            start, last ? std::string_view::npos : slash - start);
        if (segment == ".") {
            if (last) {
                output.emplace_back();
            }
        } else if (segment == "..") {
            if (!output.empty()) {
                output.pop_back();
            }
            if (last) {
                output.emplace_back();
            }
        } else {
            output.push_back(segment);
        }
        if (last) {
            break;
        }
        start = slash + 1;
    }

    std::string result;
    for (const auto& segment : output) {
        result.push_back('/');
        result.append(segment);
    }
    return result.empty() ? "/" : result;
}
}  // namespace

auto isValidUrl(std::string_view str) -> bool {
    static const std::regex prefixRegex(
        "^(https?://)"
        "((([a-z\\d]([a-z\\d-]*[a-z\\d])?)\\.)+[a-z]{2,}|"
        "((\\d{1,3}\\.){3}\\d{1,3}))"
        "(:\\d+)?$",
        std::regex::ECMAScript | std::regex::icase | std::regex::optimize);

    const auto parts = splitUrl(str);
    if (!parts || parts->authority_end > MAX_PREFIX_LENGTH) {
        return false;
    }
    const auto prefix = str.substr(0, parts->authority_end);
    if (!std::regex_match(prefix.begin(), prefix.end(), prefixRegex)) {
        return false;
    }

    return std::ranges::all_of(parts->path, isPathChar) &&
           std::ranges::all_of(dropLeading(parts->query), isQueryChar) &&
           std::ranges::all_of(dropLeading(parts->fragment), isFragmentChar);
}

auto canonicalizeUrl(std::string_view url) -> std::string {
    if (!isValidUrl(url)) {
        THROW_INVALID_URL("Not an absolute HTTP(S) URL: '{}'", url);
    }
    const auto parts = splitUrl(url);
    if (!parts) {
        THROW_INVALID_URL("Cannot split URL '{}'", url);
    }

    const std::string scheme = toLower(parts->scheme);
    std::string result = scheme + "://" + toLower(parts->host);

    if (!parts->port.empty()) {
        int port = 0;
        auto [ptr, ec] = std::from_chars(
            parts->port.data(), parts->port.data() + parts->port.size(), port);
        if (ec != std::errc() || port > MAX_PORT) {
            THROW_INVALID_URL("Invalid port '{}' in URL '{}'", parts->port,
                              url);
        }
        const int defaultPort =
            scheme == "https" ? HTTPS_DEFAULT_PORT : HTTP_DEFAULT_PORT;
        if (port != defaultPort) {
            result += ":" + std::to_string(port);
        }
    }

    result += removeDotSegments(parts->path);
    result.append(parts->query);
    result.append(parts->fragment);
    spdlog::trace("canonicalizeUrl: {} -> {}", url, result);
    return result;
}

auto joinUrl(std::string_view base, std::string_view ref) -> std::string {
    if (ref.empty()) {
        return isValidUrl(base) ? canonicalizeUrl(base) : std::string(base);
    }

    const size_t schemeEnd = base.find("://");
    const size_t authorityStart =
        schemeEnd == std::string_view::npos ? 0 : schemeEnd + 3;
    const size_t pathStart = base.find_first_of("/?#", authorityStart);
    const auto origin = base.substr(0, pathStart);

    std::string joined;
    if (ref.front() == '/') {
        joined = std::string(origin) + std::string(ref);
    } else {
        std::string_view path;
        if (pathStart != std::string_view::npos && base[pathStart] == '/') {
            const size_t pathEnd = base.find_first_of("?#", pathStart);
            path = base.substr(pathStart, pathEnd == std::string_view::npos
                                              ? std::string_view::npos
                                              : pathEnd - pathStart);
        }
        const size_t lastSlash = path.rfind('/');
        const auto directory = lastSlash == std::string_view::npos
                                   ? std::string_view("/")
                                   : path.substr(0, lastSlash + 1);
        joined = std::string(origin) + std::string(directory) +
                 std::string(ref);
    }

    if (isValidUrl(joined)) {
        return canonicalizeUrl(joined);
    }
    spdlog::debug("joinUrl: '{}' is not a valid URL, keeping it as joined",
                  joined);
    return joined;
}

auto encodeUriComponent(std::string_view str) -> std::string {
    std::string result;
    result.reserve(str.size());
    for (char ch : str) {
        const auto byte = static_cast<unsigned char>(ch);
        if (isUnreserved(byte)) {
            result.push_back(ch);
        } else {
            result.push_back('%');
            result.push_back(HEX_DIGITS[byte >> 4]);
            result.push_back(HEX_DIGITS[byte & 0x0F]);
        }
    }
    return result;
}

auto decodeUriComponent(std::string_view str) -> std::string {
    std::string result;
    result.reserve(str.size());

    for (size_t i = 0; i < str.size(); ++i) {
        if (str[i] != '%') {
            result.push_back(str[i]);
            continue;
        }

        const unsigned char lead = readEscape(str, i);
        i += 2;
        const size_t length = utf8SequenceLength(lead);
        if (length == 0) {
            THROW_INVALID_ESCAPE("Invalid UTF-8 lead byte 0x{:02X}", lead);
        }
        result.push_back(static_cast<char>(lead));

        for (size_t k = 1; k < length; ++k) {
            if (i + 1 >= str.size() || str[i + 1] != '%') {
                THROW_INVALID_ESCAPE(
                    "Truncated UTF-8 sequence after byte 0x{:02X}", lead);
            }
            const unsigned char next = readEscape(str, i + 1);
            const bool valid = k == 1 ? isValidSecondByte(lead, next)
                                      : (next & 0xC0) == 0x80;
            if (!valid) {
                THROW_INVALID_ESCAPE("Invalid UTF-8 continuation byte 0x{:02X}",
                                     next);
            }
            result.push_back(static_cast<char>(next));
            i += 3;
        }
    }
    return result;
}

auto decodePercentBytes(std::string_view str) -> std::string {
    std::string result;
    result.reserve(str.size());
    for (size_t i = 0; i < str.size(); ++i) {
        if (str[i] == '%') {
            result.push_back(static_cast<char>(readEscape(str, i)));
            i += 2;
        } else {
            result.push_back(str[i]);
        }
    }
    return result;
}

}  // namespace refkit::web
