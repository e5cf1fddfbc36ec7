#pragma once

#include <httplib.h>
#include <atomic>
#include <functional>
#include <string>
#include <thread>
#include <utility>

namespace chitty {

class MetricsEndpoints;

using Logger = std::function<void(const httplib::Request&, const httplib::Response&)>;

class HttpServer {
public:
    HttpServer(int port, MetricsEndpoints& endpoints, std::string bind_address = "0.0.0.0");
    ~HttpServer();

    /// Binds synchronously, then serves on a background thread.
    /// Throws std::runtime_error when the address cannot be bound.
    void start();
    void stop();

    void enableCompression(bool enable) { enable_compression_ = enable; }
    void setLogger(Logger logger) { logger_ = std::move(logger); }

    int port() const { return port_; }
    const std::string& bindAddress() const { return bind_address_; }
    bool running() const { return running_; }

    // Allow additional endpoint registration before start()
    httplib::Server& getServer() { return server_; }

private:
    int port_;
    std::string bind_address_;
    MetricsEndpoints& endpoints_;
    httplib::Server server_;
    std::thread thread_;
    std::atomic<bool> running_{false};
    bool enable_compression_{true};
    Logger logger_{};
};

}  // namespace chitty
