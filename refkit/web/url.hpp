/*
 * url.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-21

Description: URL recognition and percent encoding helpers

**************************************************/

#ifndef REFKIT_WEB_URL_HPP
#define REFKIT_WEB_URL_HPP

#include <string>
#include <string_view>

namespace refkit::web {

/**
 * @brief Checks whether a string is an absolute HTTP(S) URL.
 *
 * Accepts `scheme://host[:port][/path][?query][#fragment]` where the scheme
 * is `http` or `https` and the host is a dotted domain name with a TLD of at
 * least two letters or a dotted-quad IPv4 literal. The match is case
 * insensitive.
 *
 * This is only meant to separate URLs from filesystem paths. IPv6 hosts and
 * other schemes are rejected on purpose.
 *
 * @param str The string to classify.
 * @return true if the string looks like an absolute HTTP(S) URL.
 */
[[nodiscard]] auto isValidUrl(std::string_view str) -> bool;

/**
 * @brief Returns the canonical form of an absolute HTTP(S) URL.
 *
 * Scheme and host are lower-cased, a default port is dropped, an empty path
 * becomes `/` and dot segments are removed from the path. Query and fragment
 * are kept as they are.
 *
 * @param url An absolute URL accepted by isValidUrl().
 * @return The canonical URL string.
 * @throws refkit::error::InvalidUrlError if the input is not a valid URL.
 */
[[nodiscard]] auto canonicalizeUrl(std::string_view url) -> std::string;

/**
 * @brief Resolves a relative location against the directory of a base URL.
 *
 * `ref` replaces the last path segment of `base` (or the whole path when it
 * starts with `/`). The result is canonicalized when it forms a valid URL
 * and returned as joined otherwise.
 *
 * @param base An absolute URL.
 * @param ref A relative location.
 */
[[nodiscard]] auto joinUrl(std::string_view base,
                           std::string_view ref) -> std::string;

/**
 * @brief Percent-encodes every byte outside `A-Z a-z 0-9 - _ . ! ~ * ' ( )`.
 */
[[nodiscard]] auto encodeUriComponent(std::string_view str) -> std::string;

/**
 * @brief Decodes `%XX` escapes.
 *
 * `+` is left alone. Escaped bytes above 0x7F must form complete,
 * well-formed UTF-8 sequences.
 *
 * @param str The encoded string.
 * @return The decoded string.
 * @throws refkit::error::InvalidEscapeError on a truncated or non-hex escape
 * or an escaped byte sequence that is not valid UTF-8.
 */
[[nodiscard]] auto decodeUriComponent(std::string_view str) -> std::string;

/**
 * @brief Decodes `%XX` escapes byte for byte.
 *
 * Unlike decodeUriComponent() the decoded bytes are not required to be
 * UTF-8, so any output of encodeUriComponent() decodes back exactly.
 *
 * @throws refkit::error::InvalidEscapeError on a truncated or non-hex escape.
 */
[[nodiscard]] auto decodePercentBytes(std::string_view str) -> std::string;

}  // namespace refkit::web

#endif  // REFKIT_WEB_URL_HPP
