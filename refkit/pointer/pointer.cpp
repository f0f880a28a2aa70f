/*
 * pointer.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-21

Description: JSON Pointer encoding and decoding

**************************************************/

#include "pointer.hpp"

#include <utility>

#include <spdlog/spdlog.h>

#include "refkit/error/exception.hpp"
#include "refkit/web/url.hpp"

namespace refkit::pointer {

namespace {
constexpr char SEPARATOR = '/';

auto replaceAll(std::string text, std::string_view from,
                std::string_view to) -> std::string {
    size_t pos = 0;
    while ((pos = text.find(from, pos)) != std::string::npos) {
        text.replace(pos, from.size(), to);
        pos += to.size();
    }
    return text;
}

auto unescapeToken(std::string_view token) -> std::string {
    std::string result = replaceAll(std::string(token), "~1", "/");
    result = replaceAll(std::move(result), "~0", "~");
    try {
        return web::decodePercentBytes(result);
    } catch (const error::InvalidEscapeError& e) {
        spdlog::debug("parsePointer: keeping token '{}' undecoded: {}", result,
                      e.getMessage());
        return result;
    }
}

auto escapeToken(std::string_view token) -> std::string {
    std::string result = replaceAll(std::string(token), "~", "~0");
    result = replaceAll(std::move(result), "/", "~1");
    return web::encodeUriComponent(result);
}
}  // namespace

auto parsePointer(std::string_view pointer) -> std::vector<std::string> {
    std::vector<std::string> tokens;
    size_t start = pointer.find(SEPARATOR);
    while (start != std::string_view::npos) {
        const size_t end = pointer.find(SEPARATOR, start + 1);
        tokens.push_back(unescapeToken(pointer.substr(
            start + 1,
            end == std::string_view::npos ? std::string_view::npos
                                          : end - start - 1)));
        start = end;
    }
    return tokens;
}

auto buildPointer(std::span<const std::string> tokens) -> std::string {
    std::string result;
    for (const auto& token : tokens) {
        result.push_back(SEPARATOR);
        result += escapeToken(token);
    }
    return result;
}

auto buildPointer(const type::ObjPath& path) -> std::string {
    std::string result;
    for (const auto& item : path) {
        result.push_back(SEPARATOR);
        result += escapeToken(item.asKey());
    }
    return result;
}

auto buildRef(const type::ObjPath& path,
              std::string_view fileName) -> std::string {
    if (path.empty()) {
        return fileName.empty() ? std::string("#") : std::string(fileName);
    }
    return std::string(fileName) + "#" + buildPointer(path);
}

auto toObjPath(std::string_view pointer) -> type::ObjPath {
    auto tokens = parsePointer(pointer);
    type::ObjPath path;
    path.reserve(tokens.size());
    for (auto& token : tokens) {
        path.emplace_back(std::move(token));
    }
    return path;
}

}  // namespace refkit::pointer
