/*
 * SPDX-FileCopyrightText: 2026 Espressif Systems (Shanghai) CO LTD
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include "at_socket_config.h"
#include "at_socket_request.hpp"

namespace at_socket {

/**
 * Owned scratch buffer for encoding commands, grows on demand up to a configured limit
 *
 */
struct command_buffer {
    command_buffer(size_t size, size_t max_size);
    explicit command_buffer(const at_socket_config_t *config);
    command_buffer(command_buffer const &) = delete;
    command_buffer &operator=(command_buffer const &) = delete;
    command_buffer(command_buffer &&other) noexcept
    {
        data = std::move(other.data);
        size = other.size;
        max_size = other.max_size;
        other.size = 0;
    }
    command_buffer &operator=(command_buffer &&other) noexcept
    {
        if (&other == this) {
            return *this;
        }
        data = std::move(other.data);
        size = other.size;
        max_size = other.max_size;
        other.size = 0;
        return *this;
    }
    [[nodiscard]] uint8_t *get() const
    {
        return data.get();
    }

    /**
     * @brief Encodes the request into this buffer
     *
     * If the request doesn't fit, the buffer is reallocated to the exact size needed
     * (unless it would exceed max_size) and the request is encoded once more.
     * The returned view is valid until the next call to encode() or the buffer's destruction.
     */
    [[nodiscard]] encode_result encode(const AtRequest &request);

    std::unique_ptr<uint8_t[]> data;
    size_t size{};
    size_t max_size{};
};

}
