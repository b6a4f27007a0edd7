/*
 * SPDX-FileCopyrightText: 2026 Espressif Systems (Shanghai) CO LTD
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <string_view>
#include "at_socket_types.hpp"

namespace at_socket {

/**
 * @brief Assembles an AT set command (AT+NAME=p1,p2,...) in a caller owned buffer
 *
 * The builder never allocates. Bytes which don't fit into the buffer are only counted,
 * so that finish() can report exactly how much space was missing.
 */
class CommandBuilder {
public:
    /**
     * @brief Starts a set command
     * @param buffer Scratch buffer, owned by the caller
     * @param size Size of the scratch buffer
     * @param at_prefix Emit "AT" in front of the command name
     */
    static CommandBuilder create_set(uint8_t *buffer, size_t size, bool at_prefix = true);

    CommandBuilder &named(std::string_view name);

    /**
     * @brief Appends an integer as decimal ASCII
     */
    CommandBuilder &with_int_parameter(int32_t value);

    /**
     * @brief Appends an integer only if present, nothing at all otherwise
     */
    CommandBuilder &with_optional_int_parameter(std::optional<int32_t> value);

    /**
     * @brief Appends a string parameter enclosed in double quotes
     */
    CommandBuilder &with_string_parameter(std::string_view value);

    /**
     * @brief Appends binary data unquoted and untouched
     */
    CommandBuilder &with_raw_parameter(const uint8_t *data, size_t len);

    /**
     * @brief Appends the terminator and reports the result
     * @return OK with a view of the written bytes, or FAIL with the number of missing bytes
     */
    encode_result finish(std::string_view terminator = "\r\n");

private:
    CommandBuilder(uint8_t *buffer, size_t size);
    void append(const char *data, size_t len);
    void append(std::string_view data)
    {
        append(data.data(), data.size());
    }
    void separator();

    uint8_t *buffer;
    size_t size;
    size_t index{0};
    size_t params{0};
};

} // namespace at_socket
