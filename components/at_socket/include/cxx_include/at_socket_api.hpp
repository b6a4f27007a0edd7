/*
 * SPDX-FileCopyrightText: 2026 Espressif Systems (Shanghai) CO LTD
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "at_socket_config.h"
#include "cxx_include/at_socket_types.hpp"
#include "cxx_include/at_socket_exception.hpp"
#include "cxx_include/at_socket_request.hpp"
#include "cxx_include/at_socket_commands.hpp"
#include "cxx_include/at_socket_buffer.hpp"
