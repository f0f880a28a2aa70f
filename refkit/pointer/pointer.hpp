/*
 * pointer.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-21

Description: JSON Pointer encoding and decoding

**************************************************/

#ifndef REFKIT_POINTER_POINTER_HPP
#define REFKIT_POINTER_POINTER_HPP

#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "refkit/type/tree.hpp"

namespace refkit::pointer {

/**
 * @brief Splits a JSON Pointer into its decoded tokens.
 *
 * The text before the first `/` is discarded. In each token `~1` becomes `/`
 * and then `~0` becomes `~`, after which percent escapes are decoded byte
 * for byte. A token with a truncated or non-hex escape is kept as
 * unescaped so far.
 *
 * @param pointer The pointer, e.g. `/a~1b/c~0d`.
 * @return The tokens, e.g. `{"a/b", "c~d"}`. Empty for an empty pointer.
 */
[[nodiscard]] auto parsePointer(std::string_view pointer)
    -> std::vector<std::string>;

/**
 * @brief Joins tokens into a JSON Pointer.
 *
 * Each token has `~` escaped as `~0` and then `/` as `~1` and is
 * percent-encoded. parsePointer() reverses it exactly.
 *
 * @return The pointer, or an empty string when there are no tokens.
 */
[[nodiscard]] auto buildPointer(std::span<const std::string> tokens)
    -> std::string;

/**
 * @brief Joins the steps of an object path into a JSON Pointer.
 */
[[nodiscard]] auto buildPointer(const type::ObjPath& path) -> std::string;

/**
 * @brief Builds `fileName#pointer` from an object path.
 *
 * An empty path gives `fileName`, or `#` when there is no file name either.
 */
[[nodiscard]] auto buildRef(const type::ObjPath& path,
                            std::string_view fileName = {}) -> std::string;

/**
 * @brief Decodes a pointer into an object path of mapping keys.
 *
 * Numeric keys still address sequences, see type::getValueByPath().
 */
[[nodiscard]] auto toObjPath(std::string_view pointer) -> type::ObjPath;

}  // namespace refkit::pointer

#endif  // REFKIT_POINTER_POINTER_HPP
