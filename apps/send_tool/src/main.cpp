// apps/send_tool/src/main.cpp
// bmux: send_tool
// Purpose: client-side helper for poking a running bmux_echo_server.
// This is NOT part of the server; it is a demo/testing utility.
//
// Usage:
//   ./bmux_send [host] [port] [msg_id] [count] [body]
//
// Sends `count` envelopes with the echo server's 7-byte header
// (u8 version | u16 msg_id | u32 seq), then prints each reply.

#include <chrono>
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

#include "bmux/net/socket.hpp"
#include "bmux/wire/envelope.hpp"

static std::vector<std::byte> make_header(std::uint16_t msg_id, std::uint32_t seq) {
    return {std::byte{1},
            std::byte(msg_id >> 8), std::byte(msg_id & 0xFF),
            std::byte(seq >> 24), std::byte((seq >> 16) & 0xFF),
            std::byte((seq >> 8) & 0xFF), std::byte(seq & 0xFF)};
}

int main(int argc, char** argv) {
    const std::string host   = (argc > 1) ? argv[1] : "127.0.0.1";
    const auto        port   = static_cast<std::uint16_t>((argc > 2) ? std::stoul(argv[2]) : 30000);
    const auto        msg_id = static_cast<std::uint16_t>((argc > 3) ? std::stoul(argv[3]) : 1);
    const int         count  = (argc > 4) ? std::stoi(argv[4]) : 3;
    const std::string text   = (argc > 5) ? argv[5] : "hello";

    std::cout << "bmux_send: " << host << ":" << port << " msg_id=" << msg_id << " count=" << count << std::endl;

    auto fd = bmux::net::connect_to(host, port);
    if (!fd) {
        std::cerr << "connect failed: " << fd.error().message << std::endl;
        return 1;
    }

    std::vector<std::byte> body(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) body[i] = static_cast<std::byte>(text[i]);

    const bmux::wire::ReadDeadlines deadlines{std::chrono::seconds(5), std::chrono::seconds(5)};
    for (int i = 0; i < count; ++i) {
        const auto seq  = static_cast<std::uint32_t>(i);
        const auto sent = std::chrono::steady_clock::now();
        if (auto w = bmux::wire::write_envelope(fd->get(), make_header(msg_id, seq), body,
                                                std::chrono::seconds(5));
            !w) {
            std::cerr << "send failed: " << w.error().message << std::endl;
            return 1;
        }

        auto reply = bmux::wire::read_envelope(fd->get(), deadlines);
        if (!reply) {
            // Unrouted ids get no reply; the server keeps the connection open.
            std::cout << "seq=" << seq << " no reply (" << reply.error().message << ")" << std::endl;
            return 1;
        }
        const auto rtt = std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now() - sent);
        std::string text_reply(reply->body.size(), '\0');
        for (std::size_t k = 0; k < reply->body.size(); ++k) {
            text_reply[k] = static_cast<char>(reply->body[k]);
        }
        std::cout << "seq=" << seq << " head=" << static_cast<int>(reply->head_len)
                  << "B body=\"" << text_reply << "\" rtt=" << rtt.count() << " us" << std::endl;
    }

    std::cout << "bmux_send finished" << std::endl;
    return 0;
}
