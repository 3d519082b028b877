// SPDX-License-Identifier: Apache-2.0
// fake_engine_main.cpp
// Minimal engine process speaking the control protocol on 127.0.0.1:<port>.
// Used by end-to-end tests in place of the real game engine.
//
//   arena_fake_engine --port N [--crash-at K] [--end-at K] [--outcome tie|p1|p2]
//
// Each accepted connection must open with attach{slot}. Each slot keeps its own
// game loop, advanced by the step request's count; --crash-at exits with code 3
// when a slot's loop reaches it, --end-at attaches the game-over report once
// the loop reaches it.
#include "arena.pb.h"
#include "common/framing.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

namespace {

struct Options
{
    uint16_t port{0};
    uint32_t crash_at{0};
    uint32_t end_at{0};
    std::string outcome{"tie"};
    std::string map;
};

struct Conn
{
    int fd{-1};
    int slot{-1};
    uint32_t steps{0};
    arena::netutil::FrameParseState parse;
};

bool write_all(int fd, const std::string &data)
{
    size_t off = 0;
    while (off < data.size()) {
        ssize_t n = ::send(fd, data.data() + off, data.size() - off, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR)
            continue;
        if (n <= 0)
            return false;
        off += static_cast<size_t>(n);
    }
    return true;
}

void add_results(arena::ResponseStep *step, const std::string &outcome)
{
    auto p1 = arena::PLAYER_OUTCOME_TIE;
    auto p2 = arena::PLAYER_OUTCOME_TIE;
    if (outcome == "p1") {
        p1 = arena::PLAYER_OUTCOME_VICTORY;
        p2 = arena::PLAYER_OUTCOME_DEFEAT;
    } else if (outcome == "p2") {
        p1 = arena::PLAYER_OUTCOME_DEFEAT;
        p2 = arena::PLAYER_OUTCOME_VICTORY;
    }
    auto *a = step->add_player_result();
    a->set_player_id(1);
    a->set_result(p1);
    auto *b = step->add_player_result();
    b->set_player_id(2);
    b->set_result(p2);
}

// Builds the reply for one request; false closes the connection.
bool handle(Conn &c, const arena::Request &req, Options &opts, arena::Response &resp)
{
    resp.set_id(req.id());
    resp.set_status(arena::STATUS_IN_GAME);
    if (c.slot < 0 && !req.has_attach())
        return false;
    switch (req.request_case()) {
        case arena::Request::kAttach:
            c.slot = static_cast<int>(req.attach().slot());
            resp.set_status(arena::STATUS_LAUNCHED);
            resp.mutable_attach()->set_slot(req.attach().slot());
            break;
        case arena::Request::kCreateGame:
            opts.map = req.create_game().map();
            resp.set_status(arena::STATUS_INIT_GAME);
            resp.mutable_create_game();
            break;
        case arena::Request::kJoinGame:
            resp.mutable_join_game()->set_player_id(static_cast<uint32_t>(c.slot) + 1);
            break;
        case arena::Request::kStep: {
            c.steps += std::max<uint32_t>(req.step().count(), 1);
            if (opts.crash_at != 0 && c.steps >= opts.crash_at) {
                std::cerr << "fake engine: crashing at step " << c.steps << std::endl;
                std::_Exit(3);
            }
            resp.mutable_step()->set_game_loop(c.steps);
            if (opts.end_at != 0 && c.steps >= opts.end_at) {
                resp.set_status(arena::STATUS_ENDED);
                add_results(resp.mutable_step(), opts.outcome);
            }
            break;
        }
        case arena::Request::kObservation:
            resp.mutable_observation()->set_game_loop(c.steps);
            resp.mutable_observation()->set_payload("observation");
            break;
        case arena::Request::kDebug:
            resp.mutable_debug();
            break;
        case arena::Request::kPing:
            resp.mutable_ping()->set_game_version("fake-1");
            break;
        case arena::Request::kSaveReplay:
            resp.mutable_save_replay()->set_data("FAKE-REPLAY:" + opts.map + ":" + std::to_string(c.steps));
            break;
        case arena::Request::kLeaveGame:
            resp.set_status(arena::STATUS_ENDED);
            resp.mutable_leave_game();
            break;
        case arena::Request::kQuit:
            resp.set_status(arena::STATUS_QUIT);
            resp.mutable_quit();
            break;
        default:
            resp.mutable_action();
            break;
    }
    return true;
}

} // namespace

int main(int argc, char **argv)
{
    Options opts;
    if (const char *p = std::getenv("ARENA_ENGINE_PORT"))
        opts.port = static_cast<uint16_t>(std::atoi(p));
    for (int i = 1; i + 1 < argc; ++i) {
        std::string a = argv[i];
        if (a == "--port")
            opts.port = static_cast<uint16_t>(std::atoi(argv[++i]));
        else if (a == "--crash-at")
            opts.crash_at = static_cast<uint32_t>(std::atoi(argv[++i]));
        else if (a == "--end-at")
            opts.end_at = static_cast<uint32_t>(std::atoi(argv[++i]));
        else if (a == "--outcome")
            opts.outcome = argv[++i];
    }
    if (opts.port == 0) {
        std::cerr << "fake engine: no port given" << std::endl;
        return 2;
    }

    int lfd = ::socket(AF_INET, SOCK_STREAM, 0);
    int one = 1;
    ::setsockopt(lfd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(opts.port);
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    if (::bind(lfd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) != 0 || ::listen(lfd, 4) != 0) {
        std::cerr << "fake engine: cannot listen on " << opts.port << std::endl;
        return 2;
    }
    std::cout << "fake engine listening on " << opts.port << std::endl;

    std::vector<Conn> conns;
    while (true) {
        std::vector<pollfd> fds;
        fds.push_back({lfd, POLLIN, 0});
        for (auto &c : conns)
            fds.push_back({c.fd, POLLIN, 0});
        int n = ::poll(fds.data(), fds.size(), 1000);
        if (n < 0 && errno == EINTR)
            continue;
        if (n < 0)
            return 1;
        if (fds[0].revents & POLLIN) {
            int cfd = ::accept(lfd, nullptr, nullptr);
            if (cfd >= 0)
                conns.push_back(Conn{cfd});
        }
        bool any_closed = false;
        for (size_t i = 1; i < fds.size(); ++i) {
            if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR)))
                continue;
            Conn &c = conns[i - 1];
            char buf[4096];
            ssize_t r = ::recv(c.fd, buf, sizeof(buf), 0);
            if (r <= 0) {
                ::close(c.fd);
                c.fd = -1;
                any_closed = true;
                continue;
            }
            c.parse.buffer.insert(c.parse.buffer.end(), buf, buf + r);
            std::string payload;
            arena::netutil::extract_status st;
            while ((st = arena::netutil::try_extract(c.parse, payload)) == arena::netutil::extract_status::frame) {
                arena::Request req;
                arena::Response resp;
                if (!req.ParseFromString(payload) || !handle(c, req, opts, resp)) {
                    st = arena::netutil::extract_status::invalid;
                    break;
                }
                std::string out;
                resp.SerializeToString(&out);
                if (!write_all(c.fd, arena::netutil::build_frame(out))) {
                    st = arena::netutil::extract_status::invalid;
                    break;
                }
                if (req.has_quit())
                    return 0;
            }
            if (st == arena::netutil::extract_status::invalid) {
                ::close(c.fd);
                c.fd = -1;
                any_closed = true;
            }
        }
        if (any_closed) {
            std::erase_if(conns, [](const Conn &c) { return c.fd < 0; });
            // Both control streams gone after the game started: nothing left to serve
            if (conns.empty() && !opts.map.empty())
                return 0;
        }
    }
}
