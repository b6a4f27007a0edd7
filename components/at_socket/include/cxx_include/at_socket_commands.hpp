/*
 * SPDX-FileCopyrightText: 2026 Espressif Systems (Shanghai) CO LTD
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <string_view>
#include "at_socket_request.hpp"

namespace at_socket {

/**
 * @defgroup AT_SOCKET_COMMANDS
 * @brief Socket commands of the modem (AT+CSOC family)
 */
/** @addtogroup AT_SOCKET_COMMANDS
 * @{
 */

/**
 * @brief Creates a socket: AT+CSOC=<domain>,<type>,<protocol>[,<cid>]
 *
 * Reply: +CSOC: <socket_id> followed by OK
 */
class CreateSocket: public AtRequest {
public:
    CreateSocket(Domain domain, Type connection_type, Protocol protocol, std::optional<int32_t> cid = std::nullopt):
        domain(domain), connection_type(connection_type), protocol(protocol), cid(cid) {}

    using AtRequest::get_command;
    [[nodiscard]] encode_result get_command(uint8_t *buffer, size_t size) const override;
    [[nodiscard]] command_result parse_response(std::string_view data, AtResponse &response) const override;

    Domain domain;
    Type connection_type;
    Protocol protocol;
    std::optional<int32_t> cid;     /*!< PDP context, omitted from the command if not set */
};

/**
 * @brief Connects a socket to a remote host: AT+CSOCON=<socket_id>,<port>,"<address>",<type>
 */
class ConnectSocketToRemote: public AtRequest {
public:
    /**
     * @param socket_id Socket obtained by CreateSocket
     * @param port Remote port, must not be zero
     * @param remote_address IP address or host name, must outlive the command
     * @param connection_type Same type the socket was created with
     */
    ConnectSocketToRemote(uint8_t socket_id, uint16_t port, std::string_view remote_address, Type connection_type):
        socket_id(socket_id), port(port), remote_address(remote_address), connection_type(connection_type) {}

    using AtRequest::get_command;
    [[nodiscard]] encode_result get_command(uint8_t *buffer, size_t size) const override;

    uint8_t socket_id;
    uint16_t port;
    std::string_view remote_address;
    Type connection_type;
};

/**
 * @brief Sends data through a socket: AT+CSOSEND=<socket_id>,<length>,<data>
 *
 * The data is emitted verbatim, the length always matches the payload.
 */
class SendSocketMessage: public AtRequest {
public:
    /**
     * @param socket_id Socket obtained by CreateSocket
     * @param data Payload, must outlive the command
     * @param len Payload size, at most UINT16_MAX
     * @throws at_socket_exception if the payload is too long
     */
    SendSocketMessage(uint8_t socket_id, const uint8_t *data, size_t len);
    SendSocketMessage(uint8_t socket_id, std::string_view data);

    using AtRequest::get_command;
    [[nodiscard]] encode_result get_command(uint8_t *buffer, size_t size) const override;

    [[nodiscard]] uint8_t get_socket_id() const
    {
        return socket_id;
    }
    [[nodiscard]] uint16_t get_data_len() const
    {
        return data_len;
    }

private:
    uint8_t socket_id;
    uint16_t data_len;
    const uint8_t *data;
};

/**
 * @brief Closes a socket: AT+CSOCL=<socket_id>
 *
 * Uses the default reply handling, i.e. expects the bare OK.
 */
class CloseSocket: public AtRequest {
public:
    explicit CloseSocket(uint8_t socket_id): socket_id(socket_id) {}

    using AtRequest::get_command;
    [[nodiscard]] encode_result get_command(uint8_t *buffer, size_t size) const override;

    uint8_t socket_id;
};

/**
 * @}
 */

} // namespace at_socket
