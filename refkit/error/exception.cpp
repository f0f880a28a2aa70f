/*
 * exception.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2023-11-10

Description: Better Exception Library

**************************************************/

#include "exception.hpp"

#include <sstream>

namespace refkit::error {
auto Exception::what() const noexcept -> const char* {
    if (full_message_.empty()) {
        try {
            std::ostringstream oss;
            oss << "Exception occurred:\n";
            oss << "  File: " << file_ << "\n";
            oss << "  Line: " << line_ << "\n";
            oss << "  Function: " << func_ << "()\n";
            oss << "  Thread ID: " << thread_id_ << "\n";
            oss << "  Message: " << message_ << "\n";
            full_message_ = oss.str();
        } catch (const std::exception&) {
            return message_.c_str();
        }
    }
    return full_message_.c_str();
}

auto Exception::getFile() const -> std::string { return file_; }
auto Exception::getLine() const -> int { return line_; }
auto Exception::getFunction() const -> std::string { return func_; }
auto Exception::getMessage() const -> std::string { return message_; }
auto Exception::getThreadId() const -> std::thread::id { return thread_id_; }
}  // namespace refkit::error
