/*
 * SPDX-FileCopyrightText: 2026 Espressif Systems (Shanghai) CO LTD
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <algorithm>
#include "esp_log.h"
#include "cxx_include/at_socket_buffer.hpp"

static const char *TAG = "at_socket_buffer";

using namespace at_socket;

command_buffer::command_buffer(size_t size, size_t max_size):
    data(std::make_unique<uint8_t[]>(size)), size(size), max_size(std::max(size, max_size)) {}

command_buffer::command_buffer(const at_socket_config_t *config):
    command_buffer(config->command_buffer_size, config->max_command_buffer_size) {}

encode_result command_buffer::encode(const AtRequest &request)
{
    auto ret = request.get_command(data.get(), size);
    if (ret || size + ret.missing > max_size) {
        return ret;
    }
    ESP_LOGD(TAG, "Growing command buffer %d -> %d", static_cast<int>(size), static_cast<int>(size + ret.missing));
    size += ret.missing;
    data = std::make_unique<uint8_t[]>(size);
    return request.get_command(data.get(), size);
}
