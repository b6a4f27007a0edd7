/*
 * SPDX-FileCopyrightText: 2026 Espressif Systems (Shanghai) CO LTD
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <algorithm>
#include <charconv>
#include <cstring>
#include "esp_log.h"
#include "cxx_include/at_socket_command_builder.hpp"

static const char *TAG = "at_socket_builder";

namespace at_socket {

CommandBuilder::CommandBuilder(uint8_t *buffer, size_t size): buffer(buffer), size(buffer ? size : 0) {}

CommandBuilder CommandBuilder::create_set(uint8_t *buffer, size_t size, bool at_prefix)
{
    CommandBuilder builder(buffer, size);
    if (at_prefix) {
        builder.append("AT");
    }
    return builder;
}

void CommandBuilder::append(const char *data, size_t len)
{
    if (index < size) {
        memcpy(buffer + index, data, std::min(len, size - index));
    }
    index += len;
}

void CommandBuilder::separator()
{
    append(params++ == 0 ? "=" : ",");
}

CommandBuilder &CommandBuilder::named(std::string_view name)
{
    append(name);
    return *this;
}

CommandBuilder &CommandBuilder::with_int_parameter(int32_t value)
{
    char digits[12];    // "-2147483648"
    auto converted = std::to_chars(digits, digits + sizeof(digits), value);
    separator();
    append(digits, converted.ptr - digits);
    return *this;
}

CommandBuilder &CommandBuilder::with_optional_int_parameter(std::optional<int32_t> value)
{
    if (value) {
        with_int_parameter(*value);
    }
    return *this;
}

CommandBuilder &CommandBuilder::with_string_parameter(std::string_view value)
{
    separator();
    append("\"");
    append(value);
    append("\"");
    return *this;
}

CommandBuilder &CommandBuilder::with_raw_parameter(const uint8_t *data, size_t len)
{
    separator();
    append(reinterpret_cast<const char *>(data), len);
    return *this;
}

encode_result CommandBuilder::finish(std::string_view terminator)
{
    append(terminator);
    if (index > size) {
        ESP_LOGD(TAG, "Command needs %d bytes, buffer has %d", static_cast<int>(index), static_cast<int>(size));
        return { command_result::FAIL, {}, index - size };
    }
    return { command_result::OK, std::string_view(reinterpret_cast<const char *>(buffer), index), 0 };
}

} // namespace at_socket
