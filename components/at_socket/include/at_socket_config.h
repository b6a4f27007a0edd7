/*
 * SPDX-FileCopyrightText: 2026 Espressif Systems (Shanghai) CO LTD
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <stddef.h>

#ifndef CONFIG_AT_SOCKET_COMMAND_BUFFER_SIZE
#define CONFIG_AT_SOCKET_COMMAND_BUFFER_SIZE 128
#endif

#ifndef CONFIG_AT_SOCKET_MAX_COMMAND_BUFFER_SIZE
#define CONFIG_AT_SOCKET_MAX_COMMAND_BUFFER_SIZE 2048
#endif

/**
 * @brief AT socket command layer configuration
 */
struct at_socket_config {
    size_t command_buffer_size;         /*!< Initial size of the scratch buffer used to encode commands */
    size_t max_command_buffer_size;     /*!< Upper limit the scratch buffer may grow to */
};

typedef struct at_socket_config at_socket_config_t;

/**
 * @brief Default configuration of the AT socket command layer
 */
#define AT_SOCKET_DEFAULT_CONFIG()                                                  \
    {                                                                               \
        .command_buffer_size = CONFIG_AT_SOCKET_COMMAND_BUFFER_SIZE,                \
        .max_command_buffer_size = CONFIG_AT_SOCKET_MAX_COMMAND_BUFFER_SIZE         \
    }
