/*
 * SPDX-FileCopyrightText: 2026 Espressif Systems (Shanghai) CO LTD
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string_view>
#include "at_socket_types.hpp"

namespace at_socket {

/**
 * @brief Matches a complete modem reply against a sequence of expectations
 *
 * Every expect_*() call consumes input from the current position. The first mismatch
 * latches the parser into failure, subsequent calls are no-ops and finish() returns FAIL.
 * Output parameters are only written on a successful match.
 */
class CommandParser {
public:
    static CommandParser parse(std::string_view data);

    /**
     * @brief Consumes a literal token (e.g. "+CSOC: " or "\r\n\r\nOK\r\n")
     */
    CommandParser &expect_identifier(std::string_view identifier);

    /**
     * @brief Consumes a decimal integer and an optional trailing comma
     */
    CommandParser &expect_int_parameter(int32_t &value);

    /**
     * @brief Consumes a double quoted string and an optional trailing comma
     * @param[out] value Content between the quotes, borrows the parsed data
     */
    CommandParser &expect_string_parameter(std::string_view &value);

    /**
     * @brief Reports the outcome
     * @return OK if every expectation matched and the whole input was consumed
     */
    [[nodiscard]] command_result finish() const;

private:
    explicit CommandParser(std::string_view data): data(data) {}
    void fail(const char *what);
    void skip_separator();

    std::string_view data;
    size_t pos{0};
    bool failed{false};
};

} // namespace at_socket
