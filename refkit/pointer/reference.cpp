/*
 * reference.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-21

Description: JSON Reference parsing and canonical forms

**************************************************/

#include "reference.hpp"

#include <optional>

#include <spdlog/spdlog.h>

#include "refkit/error/exception.hpp"
#include "refkit/io/path.hpp"
#include "refkit/pointer/pointer.hpp"
#include "refkit/web/url.hpp"

namespace refkit::pointer {

namespace {
auto resolveFilePath(std::string_view refPath, std::string_view basePath,
                     const RefOptions& options) -> std::string {
    const auto sourcePath = refPath.empty() ? basePath : refPath;
    if (sourcePath.empty()) {
        return {};
    }

    try {
        if (web::isValidUrl(sourcePath)) {
            return web::canonicalizeUrl(sourcePath);
        }
        if (options.join_url_base && web::isValidUrl(basePath)) {
            return web::joinUrl(basePath, refPath);
        }
    } catch (const error::InvalidUrlError& e) {
        spdlog::debug("parseRef: keeping '{}' as written: {}", sourcePath,
                      e.getMessage());
        return std::string(sourcePath);
    }

    return io::relativePath(refPath, basePath, options.decode_percent);
}
}  // namespace

auto RefInfo::objPath() const -> type::ObjPath { return toObjPath(pointer); }

auto parseRef(std::string_view ref, std::string_view basePath,
              const RefOptions& options) -> RefInfo {
    const size_t hash = ref.find('#');
    const auto refPath = ref.substr(0, hash);
    std::optional<std::string_view> fragment;
    if (hash != std::string_view::npos) {
        fragment = ref.substr(hash + 1);
    }

    RefInfo info;
    info.file_path = resolveFilePath(refPath, basePath, options);
    if (fragment && !fragment->empty() && *fragment != "/") {
        info.pointer = std::string(*fragment);
    }
    info.normalized = createRef(info.file_path, info.pointer);

    spdlog::trace("parseRef: '{}' in '{}' -> '{}'", ref, basePath,
                  info.normalized);
    return info;
}

auto createRef(std::string_view basePath,
               std::string_view pointer) -> std::string {
    if (basePath.empty()) {
        return pointer.empty() ? std::string("#")
                               : "#" + std::string(pointer);
    }
    if (pointer.empty()) {
        return std::string(basePath);
    }
    return std::string(basePath) + "#" + std::string(pointer);
}

}  // namespace refkit::pointer
