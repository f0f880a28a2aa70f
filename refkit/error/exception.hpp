/*
 * exception.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2023-11-10

Description: Better Exception Library

**************************************************/

#ifndef REFKIT_ERROR_EXCEPTION_HPP
#define REFKIT_ERROR_EXCEPTION_HPP

#include <exception>
#include <format>
#include <string>
#include <thread>
#include <utility>

#define REFKIT_FILE_NAME __FILE__
#define REFKIT_FILE_LINE __LINE__
#define REFKIT_FUNC_NAME __func__

namespace refkit::error {

/**
 * @brief Base exception carrying the throw site and the throwing thread.
 *
 * Subclasses only need `using Exception::Exception;` and a matching
 * `THROW_*` macro that fills in the location.
 */
class Exception : public std::exception {
public:
    /**
     * @brief Constructs an exception with a formatted message.
     *
     * @param file Source file of the throw site.
     * @param line Line of the throw site.
     * @param func Function of the throw site.
     * @param format Message format string.
     * @param args Format arguments.
     */
    template <typename... Args>
    Exception(const char* file, int line, const char* func,
              std::format_string<Args...> format, Args&&... args)
        : file_(file),
          line_(line),
          func_(func),
          message_(std::format(format, std::forward<Args>(args)...)),
          thread_id_(std::this_thread::get_id()) {}

    /**
     * @brief Full description including the throw site.
     */
    auto what() const noexcept -> const char* override;

    auto getFile() const -> std::string;
    auto getLine() const -> int;
    auto getFunction() const -> std::string;
    auto getMessage() const -> std::string;
    auto getThreadId() const -> std::thread::id;

private:
    std::string file_;
    int line_;
    std::string func_;
    std::string message_;
    mutable std::string full_message_;
    std::thread::id thread_id_;
};

/**
 * @brief Raised when a percent-encoded string cannot be decoded.
 */
class InvalidEscapeError : public Exception {
public:
    using Exception::Exception;
};

#define THROW_INVALID_ESCAPE(...)                                          \
    throw refkit::error::InvalidEscapeError(REFKIT_FILE_NAME,              \
                                           REFKIT_FILE_LINE,              \
                                           REFKIT_FUNC_NAME, __VA_ARGS__)

/**
 * @brief Raised when a string is not an absolute HTTP(S) URL.
 */
class InvalidUrlError : public Exception {
public:
    using Exception::Exception;
};

#define THROW_INVALID_URL(...)                                          \
    throw refkit::error::InvalidUrlError(REFKIT_FILE_NAME,              \
                                         REFKIT_FILE_LINE,              \
                                         REFKIT_FUNC_NAME, __VA_ARGS__)

}  // namespace refkit::error

#endif  // REFKIT_ERROR_EXCEPTION_HPP
