/*
 * path.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-21

Description: POSIX-style path normalization for reference resolution

**************************************************/

#include "path.hpp"

#include <vector>

#include <spdlog/spdlog.h>

#include "refkit/error/exception.hpp"
#include "refkit/web/url.hpp"

namespace refkit::io {

namespace {
constexpr char SEPARATOR = '/';
constexpr std::string_view CURRENT_DIR = ".";
constexpr std::string_view PARENT_DIR = "..";
}  // namespace

auto posixNormalize(std::string_view path,
                    bool allowAboveRoot) -> std::string {
    std::vector<std::string_view> segments;
    size_t start = 0;

    while (start <= path.size()) {
        size_t end = path.find(SEPARATOR, start);
        if (end == std::string_view::npos) {
            end = path.size();
        }
        const auto segment = path.substr(start, end - start);
        start = end + 1;

        if (segment.empty() || segment == CURRENT_DIR) {
            continue;
        }
        if (segment == PARENT_DIR) {
            if (!segments.empty() && segments.back() != PARENT_DIR) {
                segments.pop_back();
            } else if (allowAboveRoot) {
                segments.push_back(PARENT_DIR);
            }
            continue;
        }
        segments.push_back(segment);
    }

    std::string result;
    result.reserve(path.size());
    for (const auto& segment : segments) {
        if (!result.empty()) {
            result.push_back(SEPARATOR);
        }
        result.append(segment);
    }
    return result;
}

auto normalize(std::string_view path, bool decodePercent) -> std::string {
    if (path.empty()) {
        return std::string(CURRENT_DIR);
    }

    const bool isAbsolute = path.front() == SEPARATOR;
    const bool trailingSeparator = path.back() == SEPARATOR;

    std::string body(path);
    if (decodePercent) {
        try {
            body = web::decodeUriComponent(path);
        } catch (const error::InvalidEscapeError& e) {
            spdlog::debug("normalize: keeping '{}' undecoded: {}", path,
                          e.getMessage());
        }
    }

    std::string result = posixNormalize(body, !isAbsolute);

    if (result.empty() && !isAbsolute) {
        result = CURRENT_DIR;
    }
    if (!result.empty() && trailingSeparator) {
        result.push_back(SEPARATOR);
    }
    if (isAbsolute) {
        result.insert(result.begin(), SEPARATOR);
    }

    spdlog::trace("normalize: {} -> {}", path, result);
    return result;
}

auto relativePath(std::string_view path, std::string_view basePath,
                  bool decodePercent) -> std::string {
    if (basePath.empty()) {
        return normalize(path, decodePercent);
    }
    if (path.empty()) {
        return normalize(basePath, decodePercent);
    }

    const size_t lastSeparator = basePath.rfind(SEPARATOR);
    std::string combined;
    if (lastSeparator != std::string_view::npos) {
        combined.assign(basePath.substr(0, lastSeparator + 1));
    }
    combined.append(path);
    return normalize(combined, decodePercent);
}

auto filename(std::string_view path) -> std::string {
    const size_t lastSeparator = path.rfind(SEPARATOR);
    if (lastSeparator == std::string_view::npos) {
        return std::string(path);
    }
    return std::string(path.substr(lastSeparator + 1));
}

}  // namespace refkit::io
