/*
 * path.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-21

Description: POSIX-style path normalization for reference resolution

**************************************************/

#ifndef REFKIT_IO_PATH_HPP
#define REFKIT_IO_PATH_HPP

#include <string>
#include <string_view>

namespace refkit::io {

/**
 * @brief Collapses `.`, `..` and repeated separators in a `/`-separated path.
 *
 * The input is treated as a bare body: a leading or trailing `/` only
 * produces empty segments, which are dropped. A `..` removes the previous
 * real segment; with nothing left to remove it is kept when
 * `allowAboveRoot` is set and dropped otherwise.
 *
 * @param path The path body.
 * @param allowAboveRoot Whether leading `..` segments survive.
 * @return The collapsed path, without leading or trailing separator. May be
 * empty.
 */
[[nodiscard]] auto posixNormalize(std::string_view path,
                                  bool allowAboveRoot) -> std::string;

/**
 * @brief Normalizes a POSIX-style path.
 *
 * Percent escapes are decoded first; a path that cannot be decoded is
 * normalized as it is. Absolute paths never climb above `/`, relative paths
 * keep their leading `..` segments. A trailing separator is preserved and
 * an empty relative result becomes `.`.
 *
 * @param path The path to normalize.
 * @param decodePercent Whether `%XX` escapes are decoded before collapsing.
 * @return The normalized path. Never throws on malformed input.
 */
[[nodiscard]] auto normalize(std::string_view path,
                             bool decodePercent = true) -> std::string;

/**
 * @brief Resolves `path` in the directory of `basePath`.
 *
 * `path` replaces the last segment of `basePath`, so `foo.yaml` inside
 * `dir/bar.yaml` becomes `dir/foo.yaml`. An empty base normalizes `path`
 * alone and an empty `path` normalizes the base.
 */
[[nodiscard]] auto relativePath(std::string_view path,
                                std::string_view basePath = {},
                                bool decodePercent = true) -> std::string;

/**
 * @brief Returns the last `/`-separated segment of a path.
 */
[[nodiscard]] auto filename(std::string_view path) -> std::string;

}  // namespace refkit::io

#endif  // REFKIT_IO_PATH_HPP
