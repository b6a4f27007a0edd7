/*
 * SPDX-FileCopyrightText: 2026 Espressif Systems (Shanghai) CO LTD
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "cxx_include/at_socket_types.hpp"

namespace at_socket {

bool is_valid(Domain domain)
{
    switch (domain) {
    case Domain::IPv4:
    case Domain::IPv6:
        return true;
    }
    return false;
}

bool is_valid(Type type)
{
    switch (type) {
    case Type::TCP:
    case Type::UDP:
    case Type::RAW:
        return true;
    }
    return false;
}

bool is_valid(Protocol protocol)
{
    switch (protocol) {
    case Protocol::IP:
    case Protocol::ICMP:
    case Protocol::UDPLITE:
        return true;
    }
    return false;
}

} // namespace at_socket
