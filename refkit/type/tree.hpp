/*
 * tree.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-21

Description: Path-addressed access and deep merge over JSON trees

**************************************************/

#ifndef REFKIT_TYPE_TREE_HPP
#define REFKIT_TYPE_TREE_HPP

#include <concepts>
#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace refkit::type {

using json = nlohmann::json;

/**
 * @brief One step of an ObjPath: a mapping key or a sequence index.
 */
class PathItem {
public:
    PathItem(std::string key) : value_(std::move(key)) {}
    PathItem(std::string_view key) : value_(std::string(key)) {}
    PathItem(const char* key) : value_(std::string(key)) {}

    // Negative integers cannot address a sequence and are kept as keys.
    template <std::integral T>
    PathItem(T index) {
        if constexpr (std::is_signed_v<T>) {
            if (index < 0) {
                value_ = std::to_string(index);
                return;
            }
        }
        value_ = static_cast<std::size_t>(index);
    }

    [[nodiscard]] auto isIndex() const noexcept -> bool {
        return std::holds_alternative<std::size_t>(value_);
    }

    /**
     * @brief The step as a sequence index.
     *
     * String steps qualify when they are a non-empty run of decimal digits.
     */
    [[nodiscard]] auto asIndex() const -> std::optional<std::size_t>;

    /**
     * @brief The step as a mapping key; indices print in decimal.
     */
    [[nodiscard]] auto asKey() const -> std::string;

    auto operator==(const PathItem&) const -> bool = default;

private:
    std::variant<std::string, std::size_t> value_;
};

using ObjPath = std::vector<PathItem>;

/**
 * @brief Looks up the value at `path` inside `root`.
 *
 * Sequences are indexed numerically, mappings by key. Any step that misses
 * (absent key, index out of range, non-numeric key on a sequence, scalar in
 * the way) ends the walk.
 *
 * @param root The tree to search.
 * @param path The steps to follow. An empty path yields `root`.
 * @return The value, or nullptr when the path does not exist.
 */
[[nodiscard]] auto getValueByPath(const json& root,
                                  const ObjPath& path) -> const json*;

[[nodiscard]] auto getValueByPath(json& root, const ObjPath& path) -> json*;

/**
 * @brief Returns `parent[key]`, replacing it by `{}` unless it already is a
 * mapping or a sequence.
 *
 * `parent` itself becomes `{}` when it is not a container, or when it is a
 * sequence addressed by a non-index key or by an index past its end. An
 * index equal to the size appends. Whatever is replaced is lost.
 */
auto forceContainerAt(json& parent, const PathItem& key) -> json&;

/**
 * @brief Writes `value` at `path` inside `root`, creating the way.
 *
 * Every intermediate step goes through forceContainerAt(); the final step is
 * overwritten whatever it held. An empty path writes nothing. `root` is
 * modified in place.
 */
void setValueByPath(json& root, const ObjPath& path, json value);

/**
 * @brief Merges `patch` into `value`.
 *
 * - two sequences: `value` elements followed by `patch` elements
 * - two mappings: every key of `patch` is merged into the matching key of
 *   `value`, keys only in `value` are kept
 * - anything else: `patch`
 *
 * `value` is taken by value so callers keep their argument intact or move it
 * in; `patch` is only read.
 */
[[nodiscard]] auto mergeValues(json value, const json& patch) -> json;

/**
 * @brief Folds mergeValues() over `values` from left to right.
 *
 * @return The merged value, null for an empty range.
 */
[[nodiscard]] auto mergeAllValues(std::span<const json> values) -> json;

}  // namespace refkit::type

#endif  // REFKIT_TYPE_TREE_HPP
