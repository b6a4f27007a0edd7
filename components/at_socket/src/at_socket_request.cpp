/*
 * SPDX-FileCopyrightText: 2026 Espressif Systems (Shanghai) CO LTD
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "esp_log.h"
#include "cxx_include/at_socket_request.hpp"
#include "cxx_include/at_socket_command_parser.hpp"

static const char *TAG = "at_socket_request";

namespace at_socket {

command_result AtRequest::parse_response(std::string_view data, AtResponse &response) const
{
    auto ret = CommandParser::parse(data)
               .expect_identifier("OK\r\n")
               .finish();
    if (ret != command_result::OK) {
        ESP_LOGE(TAG, "Unexpected reply: %.*s", static_cast<int>(data.size()), data.data());
        return ret;
    }
    response = response::Ok{};
    return command_result::OK;
}

} // namespace at_socket
