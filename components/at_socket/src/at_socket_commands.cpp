/*
 * SPDX-FileCopyrightText: 2026 Espressif Systems (Shanghai) CO LTD
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <cstdint>
#include "esp_log.h"
#include "cxx_include/at_socket_commands.hpp"
#include "cxx_include/at_socket_command_builder.hpp"
#include "cxx_include/at_socket_command_parser.hpp"
#include "cxx_include/at_socket_exception.hpp"

static const char *TAG = "at_socket_commands";

namespace at_socket {

static encode_result log_command(const char *name, encode_result ret)
{
    if (ret) {
        // skip the trailing "\r\n"
        ESP_LOGD(TAG, "%s: %.*s", name, static_cast<int>(ret.command.size()) - 2, ret.command.data());
    } else {
        ESP_LOGD(TAG, "%s: buffer too small, %d bytes missing", name, static_cast<int>(ret.missing));
    }
    return ret;
}

encode_result CreateSocket::get_command(uint8_t *buffer, size_t size) const
{
    AT_SOCKET_THROW_IF_FALSE(is_valid(domain), "Invalid socket domain");
    AT_SOCKET_THROW_IF_FALSE(is_valid(connection_type), "Invalid connection type");
    AT_SOCKET_THROW_IF_FALSE(is_valid(protocol), "Invalid socket protocol");
    return log_command("+CSOC", CommandBuilder::create_set(buffer, size)
                       .named("+CSOC")
                       .with_int_parameter(static_cast<int32_t>(domain))
                       .with_int_parameter(static_cast<int32_t>(connection_type))
                       .with_int_parameter(static_cast<int32_t>(protocol))
                       .with_optional_int_parameter(cid)
                       .finish());
}

command_result CreateSocket::parse_response(std::string_view data, AtResponse &response) const
{
    int32_t socket_id = -1;
    auto ret = CommandParser::parse(data)
               .expect_identifier("+CSOC: ")
               .expect_int_parameter(socket_id)
               .expect_identifier("\r\n\r\nOK\r\n")
               .finish();
    if (ret != command_result::OK) {
        ESP_LOGE(TAG, "Unexpected reply to +CSOC: %.*s", static_cast<int>(data.size()), data.data());
        return ret;
    }
    if (socket_id < 0 || socket_id > UINT8_MAX) {
        ESP_LOGE(TAG, "Socket id %d out of range", static_cast<int>(socket_id));
        return command_result::FAIL;
    }
    response = response::SocketCreated{ static_cast<uint8_t>(socket_id) };
    return command_result::OK;
}

encode_result ConnectSocketToRemote::get_command(uint8_t *buffer, size_t size) const
{
    AT_SOCKET_THROW_IF_FALSE(port > 0, "Remote port must not be zero");
    AT_SOCKET_THROW_IF_FALSE(is_valid(connection_type), "Invalid connection type");
    return log_command("+CSOCON", CommandBuilder::create_set(buffer, size)
                       .named("+CSOCON")
                       .with_int_parameter(socket_id)
                       .with_int_parameter(port)
                       .with_string_parameter(remote_address)
                       .with_int_parameter(static_cast<int32_t>(connection_type))
                       .finish());
}

SendSocketMessage::SendSocketMessage(uint8_t socket_id, const uint8_t *data, size_t len):
    socket_id(socket_id), data_len(0), data(data)
{
    AT_SOCKET_THROW_IF_FALSE(len <= UINT16_MAX, "Payload too long");
    AT_SOCKET_THROW_IF_FALSE(data != nullptr || len == 0, "Payload missing");
    data_len = static_cast<uint16_t>(len);
}

SendSocketMessage::SendSocketMessage(uint8_t socket_id, std::string_view data):
    SendSocketMessage(socket_id, reinterpret_cast<const uint8_t *>(data.data()), data.size()) {}

encode_result SendSocketMessage::get_command(uint8_t *buffer, size_t size) const
{
    if (data_len > 0) {
        ESP_LOG_BUFFER_HEXDUMP(TAG, data, data_len, ESP_LOG_VERBOSE);
    }
    return log_command("+CSOSEND", CommandBuilder::create_set(buffer, size)
                       .named("+CSOSEND")
                       .with_int_parameter(socket_id)
                       .with_int_parameter(data_len)
                       .with_raw_parameter(data, data_len)
                       .finish());
}

encode_result CloseSocket::get_command(uint8_t *buffer, size_t size) const
{
    return log_command("+CSOCL", CommandBuilder::create_set(buffer, size)
                       .named("+CSOCL")
                       .with_int_parameter(socket_id)
                       .finish());
}

} // namespace at_socket
