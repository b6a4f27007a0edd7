/*
 * SPDX-FileCopyrightText: 2026 Espressif Systems (Shanghai) CO LTD
 *
 * SPDX-License-Identifier: Unlicense OR CC0-1.0
 */
#define CATCH_CONFIG_MAIN // This tells the catch header to generate a main
#include <algorithm>
#include <array>
#include <string>
#include "catch.hpp"
#include "cxx_include/at_socket_api.hpp"

using namespace at_socket;

static std::string to_string(const encode_result &ret)
{
    return std::string(ret.command);
}

TEST_CASE("Create socket command", "[at_socket]")
{
    std::array<uint8_t, 512> buffer{};

    CreateSocket with_cid(Domain::IPv4, Type::TCP, Protocol::IP, 3);
    auto ret = with_cid.get_command(buffer);
    REQUIRE(ret.result == command_result::OK);
    CHECK(to_string(ret) == "AT+CSOC=1,1,1,3\r\n");
    CHECK(reinterpret_cast<const uint8_t *>(ret.command.data()) == buffer.data());

    // no context id means no trailing parameter at all
    CreateSocket without_cid(Domain::IPv6, Type::RAW, Protocol::ICMP);
    ret = without_cid.get_command(buffer);
    REQUIRE(ret.result == command_result::OK);
    CHECK(to_string(ret) == "AT+CSOC=2,3,2\r\n");

    CreateSocket udp(Domain::IPv4, Type::UDP, Protocol::UDPLITE, -1);
    ret = udp.get_command(buffer);
    REQUIRE(ret);
    CHECK(to_string(ret) == "AT+CSOC=1,2,3,-1\r\n");
}

TEST_CASE("Create socket response", "[at_socket]")
{
    CreateSocket create_socket(Domain::IPv4, Type::TCP, Protocol::IP);
    AtResponse response;

    CHECK(create_socket.parse_response("+CSOC: 5\r\n\r\nOK\r\n", response) == command_result::OK);
    auto created = std::get_if<response::SocketCreated>(&response);
    REQUIRE(created != nullptr);
    CHECK(created->socket_id == 5);

    CHECK(create_socket.parse_response("+CSOC: 255\r\n\r\nOK\r\n", response) == command_result::OK);
    CHECK(std::get<response::SocketCreated>(response).socket_id == 255);

    response = response::SocketCreated{ 42 };
    const char *malformed[] = {
        "",
        "OK\r\n",
        "ERROR\r\n",
        "+CSOC: 5\r\n",                     // truncated
        "+CSOC: 5\r\n\r\nOK",               // missing final line end
        "+CSOC: \r\n\r\nOK\r\n",            // no socket id
        "+CSOC:5\r\n\r\nOK\r\n",
        "+CSOC: x\r\n\r\nOK\r\n",
        "\r\n\r\nOK\r\n+CSOC: 5",           // reordered
        "+CSOC: 5\r\n\r\nOK\r\nOK\r\n",     // trailing bytes
        "+CSOC: 256\r\n\r\nOK\r\n",         // socket id out of range
        "+CSOC: -1\r\n\r\nOK\r\n",
        "+CSOC: 99999999999\r\n\r\nOK\r\n",
    };
    for (auto reply : malformed) {
        INFO("reply: " << reply);
        CHECK(create_socket.parse_response(reply, response) == command_result::FAIL);
    }
    // failed decoding leaves the previous outcome untouched
    CHECK(std::get<response::SocketCreated>(response).socket_id == 42);
}

TEST_CASE("Connect socket command", "[at_socket]")
{
    std::array<uint8_t, 512> buffer{};

    ConnectSocketToRemote connect(1, 1111, "127.0.0.1", Type::TCP);
    auto ret = connect.get_command(buffer);
    REQUIRE(ret.result == command_result::OK);
    CHECK(to_string(ret) == "AT+CSOCON=1,1111,\"127.0.0.1\",1\r\n");

    ConnectSocketToRemote connect_host(255, 65535, "example.com", Type::UDP);
    ret = connect_host.get_command(buffer);
    REQUIRE(ret);
    CHECK(to_string(ret) == "AT+CSOCON=255,65535,\"example.com\",2\r\n");
}

#ifdef CONFIG_COMPILER_CXX_EXCEPTIONS
TEST_CASE("Invalid fields are rejected before encoding", "[at_socket]")
{
    std::array<uint8_t, 64> buffer{};

    ConnectSocketToRemote zero_port(1, 0, "127.0.0.1", Type::TCP);
    CHECK_THROWS_AS((void)zero_port.get_command(buffer), at_socket_exception);
    CHECK(std::all_of(buffer.begin(), buffer.end(), [](uint8_t b) {
        return b == 0;
    }));

    try {
        (void)zero_port.get_command(buffer);
        FAIL("zero port was encoded");
    } catch (const at_socket_exception &e) {
        CHECK(e.get_err_t() == ESP_ERR_INVALID_ARG);
    }

    CreateSocket bad_domain(static_cast<Domain>(7), Type::TCP, Protocol::IP);
    CHECK_THROWS_AS((void)bad_domain.get_command(buffer), at_socket_exception);
    CreateSocket bad_type(Domain::IPv4, static_cast<Type>(0), Protocol::IP);
    CHECK_THROWS_AS((void)bad_type.get_command(buffer), at_socket_exception);
    CreateSocket bad_protocol(Domain::IPv4, Type::TCP, static_cast<Protocol>(4));
    CHECK_THROWS_AS((void)bad_protocol.get_command(buffer), at_socket_exception);
    CHECK(std::all_of(buffer.begin(), buffer.end(), [](uint8_t b) {
        return b == 0;
    }));

    std::string too_long(UINT16_MAX + 1, 'x');
    CHECK_THROWS_AS(SendSocketMessage(0, too_long), at_socket_exception);
    CHECK_THROWS_AS(SendSocketMessage(0, nullptr, 4), at_socket_exception);
}
#endif

TEST_CASE("Send socket message command", "[at_socket]")
{
    std::array<uint8_t, 512> buffer{};

    SendSocketMessage send(1, "hello");
    CHECK(send.get_data_len() == 5);
    auto ret = send.get_command(buffer);
    REQUIRE(ret.result == command_result::OK);
    CHECK(to_string(ret) == "AT+CSOSEND=1,5,hello\r\n");

    // binary payload goes out verbatim: no quoting, no escaping
    const std::string payload("a\"b,\0c", 6);
    SendSocketMessage send_binary(2, payload);
    CHECK(send_binary.get_data_len() == 6);
    ret = send_binary.get_command(buffer);
    REQUIRE(ret);
    CHECK(to_string(ret) == std::string("AT+CSOSEND=2,6,") + payload + "\r\n");

    const uint8_t bytes[] = { 0x00, 0xff, '\r', '\n' };
    SendSocketMessage send_bytes(3, bytes, sizeof(bytes));
    ret = send_bytes.get_command(buffer);
    REQUIRE(ret);
    CHECK(to_string(ret) == std::string("AT+CSOSEND=3,4,\x00\xff\r\n\r\n", 21));
}

TEST_CASE("Close socket command", "[at_socket]")
{
    std::array<uint8_t, 512> buffer{};

    CloseSocket close(0);
    auto ret = close.get_command(buffer);
    REQUIRE(ret.result == command_result::OK);
    CHECK(to_string(ret) == "AT+CSOCL=0\r\n");
}

TEST_CASE("Acknowledged commands", "[at_socket]")
{
    ConnectSocketToRemote connect(1, 1111, "127.0.0.1", Type::TCP);
    SendSocketMessage send(1, "hello");
    CloseSocket close(1);
    const AtRequest *requests[] = { &connect, &send, &close };

    for (auto request : requests) {
        AtResponse response = response::SocketCreated{ 1 };
        CHECK(request->parse_response("OK\r\n", response) == command_result::OK);
        CHECK(std::holds_alternative<response::Ok>(response));

        response = response::SocketCreated{ 1 };
        CHECK(request->parse_response("ERROR\r\n", response) == command_result::FAIL);
        CHECK(request->parse_response("OK", response) == command_result::FAIL);
        CHECK(request->parse_response("OK\r\nOK\r\n", response) == command_result::FAIL);
        CHECK(request->parse_response("\r\nOK", response) == command_result::FAIL);
        CHECK(request->parse_response("", response) == command_result::FAIL);
        CHECK(std::holds_alternative<response::SocketCreated>(response));
    }
}

TEST_CASE("Insufficient buffer space", "[at_socket]")
{
    ConnectSocketToRemote connect(1, 1111, "127.0.0.1", Type::TCP);
    const std::string expected = "AT+CSOCON=1,1111,\"127.0.0.1\",1\r\n";

    std::array<uint8_t, 10> small{};
    auto ret = connect.get_command(small);
    CHECK(ret.result == command_result::FAIL);
    CHECK(ret.missing == expected.size() - small.size());
    CHECK(ret.command.empty());

    ret = connect.get_command(nullptr, 0);
    CHECK(ret.result == command_result::FAIL);
    CHECK(ret.missing == expected.size());

    // exactly the required size is enough
    std::array<uint8_t, 32> exact{};
    REQUIRE(expected.size() == exact.size());
    ret = connect.get_command(exact);
    REQUIRE(ret);
    CHECK(to_string(ret) == expected);
}

TEST_CASE("Encoding is repeatable", "[at_socket]")
{
    CreateSocket create_socket(Domain::IPv4, Type::TCP, Protocol::IP, 3);
    ConnectSocketToRemote connect(1, 1111, "127.0.0.1", Type::TCP);
    SendSocketMessage send(1, "payload");
    CloseSocket close(1);
    const AtRequest *requests[] = { &create_socket, &connect, &send, &close };

    for (auto request : requests) {
        std::array<uint8_t, 128> first{};
        std::array<uint8_t, 128> second{};
        auto ret1 = request->get_command(first.data(), first.size());
        auto ret2 = request->get_command(second.data(), second.size());
        REQUIRE(ret1);
        REQUIRE(ret2);
        CHECK(to_string(ret1) == to_string(ret2));
        CHECK(first == second);
    }
}

TEST_CASE("Command buffer grows on demand", "[at_socket]")
{
    ConnectSocketToRemote connect(1, 1111, "127.0.0.1", Type::TCP);
    const std::string expected = "AT+CSOCON=1,1111,\"127.0.0.1\",1\r\n";

    command_buffer growing(8, 64);
    auto ret = growing.encode(connect);
    REQUIRE(ret.result == command_result::OK);
    CHECK(to_string(ret) == expected);
    CHECK(growing.size == expected.size());
    CHECK(reinterpret_cast<const uint8_t *>(ret.command.data()) == growing.get());

    command_buffer limited(8, 16);
    ret = limited.encode(connect);
    CHECK(ret.result == command_result::FAIL);
    CHECK(ret.missing == expected.size() - 8);
    CHECK(limited.size == 8);

    at_socket_config_t config = AT_SOCKET_DEFAULT_CONFIG();
    command_buffer configured(&config);
    CHECK(configured.size == CONFIG_AT_SOCKET_COMMAND_BUFFER_SIZE);
    ret = configured.encode(CloseSocket(3));
    REQUIRE(ret);
    CHECK(to_string(ret) == "AT+CSOCL=3\r\n");

    command_buffer moved(std::move(configured));
    CHECK(configured.size == 0);
    CHECK(moved.size == CONFIG_AT_SOCKET_COMMAND_BUFFER_SIZE);
}
