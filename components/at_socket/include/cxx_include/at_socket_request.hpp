/*
 * SPDX-FileCopyrightText: 2026 Espressif Systems (Shanghai) CO LTD
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <array>
#include <string_view>
#include "at_socket_types.hpp"

namespace at_socket {

/**
 * @brief Interface implemented by every socket command
 *
 * A request knows how to encode itself into the modem's AT grammar and how to decode
 * the modem's reply to it. Both operations are pure: no I/O and no state between calls.
 */
class AtRequest {
public:
    AtRequest() = default;
    AtRequest(const AtRequest &) = default;
    AtRequest &operator=(const AtRequest &) = default;
    virtual ~AtRequest() = default;

    /**
     * @brief Encodes the command into the supplied buffer
     * @param buffer Scratch buffer, the returned view borrows it
     * @param size Size of the scratch buffer
     * @return OK and the encoded command, or FAIL and the number of missing bytes
     * @throws at_socket_exception if the command fields are invalid
     */
    [[nodiscard]] virtual encode_result get_command(uint8_t *buffer, size_t size) const = 0;

    template <size_t N>
    [[nodiscard]] encode_result get_command(std::array<uint8_t, N> &buffer) const
    {
        return get_command(buffer.data(), buffer.size());
    }

    /**
     * @brief Decodes one complete reply of the modem
     *
     * The default implementation accepts the bare acknowledgement "OK\r\n" only.
     *
     * @param data Raw reply bytes
     * @param[out] response Outcome, written only on success
     * @return OK if the reply matched, FAIL otherwise
     */
    [[nodiscard]] virtual command_result parse_response(std::string_view data, AtResponse &response) const;
};

} // namespace at_socket
