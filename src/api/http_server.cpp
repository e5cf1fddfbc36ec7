#include "api/http_server.h"

#include "api/metrics_endpoints.h"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <zlib.h>

namespace chitty {

namespace {
bool accepts_gzip(const httplib::Request& req) {
    if (!req.has_header("Accept-Encoding")) return false;
    auto enc = req.get_header_value("Accept-Encoding");
    std::transform(enc.begin(), enc.end(), enc.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return enc.find("gzip") != std::string::npos;
}

std::string gzip_compress(const std::string& input) {
    if (input.empty()) return {};

    z_stream zs{};
    if (deflateInit2(&zs, Z_DEFAULT_COMPRESSION, Z_DEFLATED, 15 + 16, 8,
                     Z_DEFAULT_STRATEGY) != Z_OK) {
        return {};
    }

    zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(input.data()));
    zs.avail_in = static_cast<uInt>(input.size());

    std::string output;
    output.reserve(input.size() / 2);
    char buffer[16384];

    int ret = Z_OK;
    while (ret == Z_OK) {
        zs.next_out = reinterpret_cast<Bytef*>(buffer);
        zs.avail_out = static_cast<uInt>(sizeof(buffer));
        ret = deflate(&zs, zs.avail_in ? Z_NO_FLUSH : Z_FINISH);
        if (ret != Z_OK && ret != Z_STREAM_END) {
            deflateEnd(&zs);
            return {};
        }
        const size_t written = sizeof(buffer) - zs.avail_out;
        if (written > 0) {
            output.append(buffer, written);
        }
    }

    deflateEnd(&zs);
    return output;
}

void access_log(const httplib::Request& req, const httplib::Response& res) {
    spdlog::debug("{} {} -> {} ({} bytes)", req.method, req.path, res.status, res.body.size());
}
}  // namespace

HttpServer::HttpServer(int port, MetricsEndpoints& endpoints, std::string bind_address)
    : port_(port), bind_address_(std::move(bind_address)), endpoints_(endpoints) {}

HttpServer::~HttpServer() { stop(); }

void HttpServer::start() {
    if (running_) return;

    // Compress after routing so every handler benefits
    server_.set_post_routing_handler([this](const httplib::Request& req, httplib::Response& res) {
        if (!enable_compression_) return;
        if (!accepts_gzip(req)) return;
        if (res.body.empty()) return;
        if (res.has_header("Content-Encoding")) return;

        auto compressed = gzip_compress(res.body);
        if (compressed.empty()) return;

        const auto content_type = res.get_header_value("Content-Type");
        res.set_content(compressed,
                        content_type.empty() ? "application/octet-stream" : content_type);
        auto range = res.headers.equal_range("Content-Length");
        res.headers.erase(range.first, range.second);
        res.set_header("Content-Length", std::to_string(compressed.size()));
        res.set_header("Content-Encoding", "gzip");
        res.set_header("Vary", "Accept-Encoding");
    });

    // Access log
    server_.set_logger([this](const httplib::Request& req, const httplib::Response& res) {
        if (logger_) {
            logger_(req, res);
        } else {
            access_log(req, res);
        }
    });

    // Unknown paths answer 404 with an empty body; other errors get a short text body
    server_.set_error_handler([](const httplib::Request&, httplib::Response& res) {
        if (res.status == 404) {
            res.body.clear();
            return;
        }
        if (res.body.empty()) {
            res.set_content(httplib::status_message(res.status), "text/plain");
        } else if (!res.has_header("Content-Type")) {
            res.set_header("Content-Type", "text/plain");
        }
    });

    server_.set_exception_handler([](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
        std::string what = "unknown error";
        if (ep) {
            try {
                std::rethrow_exception(ep);
            } catch (const std::exception& e) {
                what = e.what();
            }
        }
        spdlog::error("Handler for {} failed: {}", req.path, what);
        res.status = 500;
        res.set_content("Internal Server Error: " + what, "text/plain");
    });

    endpoints_.registerRoutes(server_);

    if (!server_.bind_to_port(bind_address_, port_)) {
        throw std::runtime_error("Failed to bind " + bind_address_ + ":" + std::to_string(port_));
    }

    running_ = true;
    thread_ = std::thread([this]() { server_.listen_after_bind(); });
    while (!server_.is_running()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    spdlog::info("HTTP server listening on {}:{}", bind_address_, port_);
}

void HttpServer::stop() {
    if (!running_) return;
    server_.stop();
    if (thread_.joinable()) thread_.join();
    running_ = false;
}

}  // namespace chitty
