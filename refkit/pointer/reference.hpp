/*
 * reference.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-21

Description: JSON Reference parsing and canonical forms

**************************************************/

#ifndef REFKIT_POINTER_REFERENCE_HPP
#define REFKIT_POINTER_REFERENCE_HPP

#include <string>
#include <string_view>

#include "refkit/type/tree.hpp"

namespace refkit::pointer {

/**
 * @brief Options for parseRef()
 */
struct RefOptions {
    // Decode %XX escapes while normalizing file paths
    bool decode_percent{true};
    // Resolve a relative file part against a URL base instead of treating
    // the base as a filesystem path. With false the base goes through
    // io::relativePath() like any path, so `https://` collapses to `https:/`.
    bool join_url_base{true};
};

/**
 * @brief A reference split into document location and in-document pointer.
 */
struct RefInfo {
    std::string file_path;
    std::string pointer;
    std::string normalized;

    [[nodiscard]] auto hasPointer() const noexcept -> bool {
        return !pointer.empty();
    }

    /**
     * @brief True when the reference does not name a document.
     */
    [[nodiscard]] auto isLocal() const noexcept -> bool {
        return file_path.empty();
    }

    /**
     * @brief The pointer decoded into object path steps.
     */
    [[nodiscard]] auto objPath() const -> type::ObjPath;

    auto operator==(const RefInfo&) const -> bool = default;
};

/**
 * @brief Parses a `filePath#pointer` reference found in the document at
 * `basePath`.
 *
 * The part before the first `#` names the document; when it is empty the
 * reference points into `basePath` itself. Absolute HTTP(S) URLs are
 * canonicalized, anything else is resolved in the directory of `basePath`
 * and normalized. A missing, empty or lone `/` fragment means no pointer.
 * Never throws on malformed input.
 *
 * @param ref The reference as written in the source document.
 * @param basePath Location of the document containing the reference.
 * @param options Resolution options.
 * @return The resolved file path, the raw pointer and the canonical
 * reference built by createRef().
 */
[[nodiscard]] auto parseRef(std::string_view ref,
                            std::string_view basePath = {},
                            const RefOptions& options = {}) -> RefInfo;

/**
 * @brief Builds a reference string from its parts.
 *
 * | base  | pointer | result           |
 * |-------|---------|------------------|
 * | empty | empty   | `#`              |
 * | empty | set     | `#pointer`       |
 * | set   | empty   | `base`           |
 * | set   | set     | `base#pointer`   |
 */
[[nodiscard]] auto createRef(std::string_view basePath = {},
                             std::string_view pointer = {}) -> std::string;

}  // namespace refkit::pointer

#endif  // REFKIT_POINTER_REFERENCE_HPP
