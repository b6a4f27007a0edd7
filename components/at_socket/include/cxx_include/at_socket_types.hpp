/*
 * SPDX-FileCopyrightText: 2026 Espressif Systems (Shanghai) CO LTD
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <variant>

namespace at_socket {

/**
 * @defgroup AT_SOCKET_TYPES
 * @brief Basic type definitions used in at-socket
 */

/** @addtogroup AT_SOCKET_TYPES
* @{
*/

/**
 * @brief Result of encoding or decoding a command
 */
enum class command_result {
    OK,             /*!< The command was encoded or the reply matched */
    FAIL            /*!< Not enough buffer space, or the reply didn't match */
};

/**
 * @brief Address family of the socket
 */
enum class Domain : uint8_t {
    IPv4 = 1,
    IPv6 = 2,
};

/**
 * @brief Connection type of the socket
 */
enum class Type : uint8_t {
    TCP = 1,
    UDP = 2,
    RAW = 3,
};

/**
 * @brief Underlying protocol of the socket
 */
enum class Protocol : uint8_t {
    IP = 1,
    ICMP = 2,
    UDPLITE = 3,
};

[[nodiscard]] bool is_valid(Domain domain);
[[nodiscard]] bool is_valid(Type type);
[[nodiscard]] bool is_valid(Protocol protocol);

namespace response {

/**
 * @brief Plain acknowledgement
 */
struct Ok {
};

/**
 * @brief Acknowledgement of a socket creation, carries the identifier assigned by the modem
 */
struct SocketCreated {
    uint8_t socket_id;
};

} // namespace response

/**
 * @brief Successful outcome of any socket command
 */
using AtResponse = std::variant<response::Ok, response::SocketCreated>;

/**
 * @brief Result of encoding a command into a caller supplied buffer
 */
struct encode_result {
    command_result result;      /*!< OK if the whole command fits into the buffer */
    std::string_view command;   /*!< Encoded bytes including the terminator, borrows the buffer (valid on OK) */
    size_t missing;             /*!< Number of additional bytes the buffer would need (valid on FAIL) */

    explicit operator bool() const
    {
        return result == command_result::OK;
    }
};

/**
 * @}
 */

} // namespace at_socket
