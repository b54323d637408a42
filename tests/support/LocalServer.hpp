/**
 * LocalServer.hpp - cpp-httplib server on a loopback port for client tests
 */

#pragma once

#include <chrono>
#include <string>
#include <thread>

#include <httplib.h>

namespace llt::test {

class LocalServer {
public:
    LocalServer() = default;
    ~LocalServer() { stop(); }

    httplib::Server& server() { return server_; }

    /// Bind to a free port and serve on a background thread.
    bool start() {
        port_ = server_.bind_to_any_port("127.0.0.1");
        if (port_ <= 0) {
            return false;
        }
        thread_ = std::thread([this]() { server_.listen_after_bind(); });
        for (int i = 0; i < 200 && !server_.is_running(); ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        return server_.is_running();
    }

    void stop() {
        server_.stop();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    std::string url() const { return "http://127.0.0.1:" + std::to_string(port_); }

private:
    httplib::Server server_;
    std::thread thread_;
    int port_ = -1;
};

} // namespace llt::test
