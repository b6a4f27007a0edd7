/*
 * SPDX-FileCopyrightText: 2026 Espressif Systems (Shanghai) CO LTD
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdlib>
#include <string>
#include "esp_err.h"
#include "esp_log.h"

#ifndef __FILENAME__
#define __FILENAME__    __FILE__
#endif
#define AT_SOCKET_THROW_IF_FALSE(...) at_socket::throw_if_false(__FILENAME__, __LINE__, __VA_ARGS__)

namespace at_socket {

#ifdef CONFIG_COMPILER_CXX_EXCEPTIONS
#define AT_SOCKET_THROW(exception) throw(exception)

class at_socket_exception: virtual public std::exception {
public:
    explicit at_socket_exception(std::string msg): esp_err(ESP_FAIL), message(std::move(msg)) {}
    explicit at_socket_exception(std::string msg, esp_err_t err): esp_err(err), message(std::move(msg)) {}
    [[nodiscard]] esp_err_t get_err_t() const
    {
        return esp_err;
    }
    ~at_socket_exception() noexcept override = default;
    [[nodiscard]] const char *what() const noexcept override
    {
        return message.c_str();
    }
private:
    esp_err_t esp_err;
    std::string message;
};

#else
#define AT_SOCKET_THROW(exception) do { exception; abort(); } while(0)

class at_socket_exception {
    void print(const std::string &msg)
    {
        ESP_LOGE("AT_SOCKET_THROW", "%s", msg.c_str());
    }
public:
    explicit at_socket_exception(std::string msg)
    {
        print(msg);
    }
    explicit at_socket_exception(std::string msg, esp_err_t err)
    {
        print(msg + " (" + std::to_string(err) + ")");
    }
};

#endif

static inline std::string make_message(const std::string &filename, int line, const std::string &message = "ERROR")
{
    return filename + ":" + std::to_string(line) + " " + message;
}

/**
 * @brief Reports a violated precondition of a command field
 *
 * Such violations are caller bugs, so they are never encoded and never retried.
 */
static inline void throw_if_false(const std::string &filename, int line, bool condition, const std::string &message)
{
    if (!condition) {
        AT_SOCKET_THROW(at_socket_exception(make_message(filename, line, message), ESP_ERR_INVALID_ARG));
    }
}

} // namespace at_socket
