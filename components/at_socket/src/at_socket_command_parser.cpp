/*
 * SPDX-FileCopyrightText: 2026 Espressif Systems (Shanghai) CO LTD
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <charconv>
#include "esp_log.h"
#include "cxx_include/at_socket_command_parser.hpp"

static const char *TAG = "at_socket_parser";

namespace at_socket {

CommandParser CommandParser::parse(std::string_view data)
{
    return CommandParser(data);
}

void CommandParser::fail(const char *what)
{
    ESP_LOGD(TAG, "Expected %s at offset %d", what, static_cast<int>(pos));
    failed = true;
}

void CommandParser::skip_separator()
{
    if (pos < data.size() && data[pos] == ',') {
        ++pos;
    }
}

CommandParser &CommandParser::expect_identifier(std::string_view identifier)
{
    if (failed) {
        return *this;
    }
    if (data.substr(pos, identifier.size()) != identifier) {
        fail("identifier");
        return *this;
    }
    pos += identifier.size();
    return *this;
}

CommandParser &CommandParser::expect_int_parameter(int32_t &value)
{
    if (failed) {
        return *this;
    }
    auto begin = data.data() + pos;
    auto end = data.data() + data.size();
    int32_t parsed;
    auto [ptr, ec] = std::from_chars(begin, end, parsed);
    if (ec != std::errc()) {
        fail("integer");
        return *this;
    }
    value = parsed;
    pos += ptr - begin;
    skip_separator();
    return *this;
}

CommandParser &CommandParser::expect_string_parameter(std::string_view &value)
{
    if (failed) {
        return *this;
    }
    if (pos >= data.size() || data[pos] != '"') {
        fail("opening quote");
        return *this;
    }
    auto closing = data.find('"', pos + 1);
    if (closing == std::string_view::npos) {
        fail("closing quote");
        return *this;
    }
    value = data.substr(pos + 1, closing - pos - 1);
    pos = closing + 1;
    skip_separator();
    return *this;
}

command_result CommandParser::finish() const
{
    if (failed) {
        return command_result::FAIL;
    }
    if (pos != data.size()) {
        ESP_LOGD(TAG, "%d unexpected trailing bytes", static_cast<int>(data.size() - pos));
        return command_result::FAIL;
    }
    return command_result::OK;
}

} // namespace at_socket
