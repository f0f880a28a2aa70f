/*
 * tree.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-21

Description: Path-addressed access and deep merge over JSON trees

**************************************************/

#include "tree.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <utility>

#include <spdlog/spdlog.h>

namespace refkit::type {

auto PathItem::asIndex() const -> std::optional<std::size_t> {
    if (const auto* index = std::get_if<std::size_t>(&value_)) {
        return *index;
    }
    const auto& key = std::get<std::string>(value_);
    if (key.empty() || !std::ranges::all_of(key, [](unsigned char ch) {
            return std::isdigit(ch) != 0;
        })) {
        return std::nullopt;
    }
    std::size_t index = 0;
    auto [ptr, ec] =
        std::from_chars(key.data(), key.data() + key.size(), index);
    if (ec != std::errc()) {
        return std::nullopt;
    }
    return index;
}

auto PathItem::asKey() const -> std::string {
    if (const auto* index = std::get_if<std::size_t>(&value_)) {
        return std::to_string(*index);
    }
    return std::get<std::string>(value_);
}

namespace {

template <typename Json>
auto lookup(Json& root, const ObjPath& path) -> Json* {
    Json* current = &root;
    for (const auto& key : path) {
        switch (current->type()) {
            case json::value_t::array: {
                const auto index = key.asIndex();
                if (!index || *index >= current->size()) {
                    return nullptr;
                }
                current = &(*current)[*index];
                break;
            }
            case json::value_t::object: {
                auto it = current->find(key.asKey());
                if (it == current->end()) {
                    return nullptr;
                }
                current = &*it;
                break;
            }
            default:
                return nullptr;
        }
    }
    return current;
}

// The slot `parent[key]`, coercing `parent` to a mapping when it cannot hold
// `key`.
auto slotAt(json& parent, const PathItem& key) -> json& {
    switch (parent.type()) {
        case json::value_t::array:
            if (const auto index = key.asIndex();
                index && *index <= parent.size()) {
                return parent[*index];
            }
            spdlog::debug("slotAt: key '{}' replaces a sequence of {} by a "
                          "mapping",
                          key.asKey(), parent.size());
            parent = json::object();
            return parent[key.asKey()];
        case json::value_t::object:
            return parent[key.asKey()];
        default:
            if (!parent.is_null()) {
                spdlog::debug("slotAt: replacing {} by a mapping for key '{}'",
                              parent.type_name(), key.asKey());
            }
            parent = json::object();
            return parent[key.asKey()];
    }
}

}  // namespace

auto getValueByPath(const json& root, const ObjPath& path) -> const json* {
    return lookup(root, path);
}

auto getValueByPath(json& root, const ObjPath& path) -> json* {
    return lookup(root, path);
}

auto forceContainerAt(json& parent, const PathItem& key) -> json& {
    json& slot = slotAt(parent, key);
    if (!slot.is_structured()) {
        if (!slot.is_null()) {
            spdlog::debug("forceContainerAt: replacing {} at '{}' by a mapping",
                          slot.type_name(), key.asKey());
        }
        slot = json::object();
    }
    return slot;
}

void setValueByPath(json& root, const ObjPath& path, json value) {
    if (path.empty()) {
        return;
    }
    json* current = &root;
    for (std::size_t i = 0; i + 1 < path.size(); ++i) {
        current = &forceContainerAt(*current, path[i]);
    }
    slotAt(*current, path.back()) = std::move(value);
}

auto mergeValues(json value, const json& patch) -> json {
    switch (value.type()) {
        case json::value_t::array:
            if (!patch.is_array()) {
                return patch;
            }
            value.insert(value.end(), patch.begin(), patch.end());
            return value;
        case json::value_t::object:
            if (!patch.is_object()) {
                return patch;
            }
            for (auto it = patch.begin(); it != patch.end(); ++it) {
                auto existing = value.find(it.key());
                if (existing == value.end()) {
                    value[it.key()] = it.value();
                } else {
                    *existing = mergeValues(std::move(*existing), it.value());
                }
            }
            return value;
        default:
            return patch;
    }
}

auto mergeAllValues(std::span<const json> values) -> json {
    json result;
    bool first = true;
    for (const auto& value : values) {
        result = first ? value : mergeValues(std::move(result), value);
        first = false;
    }
    return result;
}

}  // namespace refkit::type
