// control_server.cpp

#include "control_server.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>
#include <sstream>
#include <thread>

#include <sys/socket.h>

#include <boost/asio/connect.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/core.hpp>

#include "config.hpp"
#include "logger.hpp"
#include "utils.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace {

ControlServer::Response make_response(const ControlServer::Request& req, http::status status,
                                      const std::string& body,
                                      const std::string& content_type = "application/json") {
    ControlServer::Response res{status, req.version()};
    res.set(http::field::server, "chronocam");
    res.set(http::field::content_type, content_type);
    res.set(http::field::cache_control, "no-cache, no-store, must-revalidate");
    res.keep_alive(req.keep_alive());
    res.body() = body;
    res.prepare_payload();
    return res;
}

std::string error_json(const std::string& code, const std::string& message) {
    return "{\"ok\":false,\"code\":\"" + json_escape(code) + "\",\"message\":\"" + json_escape(message) + "\"}";
}

std::string logs_json() {
    std::stringstream ss;
    ss << "[";
    bool first = true;
    for (const auto& line : recent_logs()) {
        ss << (first ? "" : ",") << "\"" << json_escape(line) << "\"";
        first = false;
    }
    ss << "]";
    return ss.str();
}

} // namespace

ControlServer::ControlServer(CaptureScheduler& scheduler, EventBus& bus, const std::string& config_path)
    : scheduler(scheduler), bus(bus), config_path(config_path),
      keepalive_interval(std::chrono::seconds(EVENT_KEEPALIVE_SECONDS)), stopping(false) {}

ControlServer::Response ControlServer::handle_request(const Request& req) {
    std::string target(req.target());
    size_t query = target.find('?');
    if (query != std::string::npos) {
        target.erase(query);
    }

    if (req.method() == http::verb::get) {
        if (target == "/status") {
            return make_response(req, http::status::ok, status_to_json(scheduler.status()));
        }
        if (target == "/logs") {
            return make_response(req, http::status::ok, logs_json());
        }
        if (target == "/last.jpg") {
            std::ifstream file(scheduler.latest_image_path(), std::ios::binary);
            if (!file.is_open()) {
                return make_response(req, http::status::not_found, error_json("not_found", "No image captured yet"));
            }
            std::string bytes((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
            return make_response(req, http::status::ok, bytes, "image/jpeg");
        }
    }

    if (req.method() == http::verb::post) {
        if (target == "/action/pause") {
            scheduler.pause();
            return make_response(req, http::status::ok, "{\"ok\":true,\"paused\":true}");
        }
        if (target == "/action/resume") {
            scheduler.resume();
            return make_response(req, http::status::ok, "{\"ok\":true,\"paused\":false}");
        }
        if (target == "/action/snapshot") {
            CaptureOutcome outcome = scheduler.force_snapshot();
            if (!outcome.ok()) {
                return make_response(req, http::status::bad_gateway,
                                     error_json(outcome.error->code(), outcome.error->message));
            }
            return make_response(req, http::status::ok,
                                 "{\"ok\":true,\"filename\":\"" + json_escape(outcome.snapshot->filename) + "\"}");
        }
        if (target == "/action/reload") {
            try {
                scheduler.reload_config(load_config(config_path));
            } catch (const ConfigError& e) {
                log_status("ERROR: Reload rejected: " + std::string(e.what()));
                return make_response(req, http::status::bad_request, error_json("config_invalid", e.what()));
            }
            return make_response(req, http::status::ok,
                                 "{\"ok\":true,\"generation\":" + std::to_string(scheduler.current_generation()) + "}");
        }
    }

    return make_response(req, http::status::not_found, error_json("not_found", "No route for " + target));
}

void ControlServer::stream_events(tcp::socket& socket) {
    const std::string header =
        "HTTP/1.1 200 OK\r\n"
        "Connection: close\r\n"
        "Cache-Control: no-cache\r\n"
        "Content-Type: text/event-stream\r\n\r\n";

    beast::error_code ec;
    net::write(socket, net::buffer(header), ec);
    if (ec) {
        return;
    }

    ScopedSubscription subscription(bus);
    log_status("Event subscriber attached (" + std::to_string(bus.subscriber_count()) + " connected)");

    // Runs on the publishing thread; shutting the descriptor down fails any
    // write blocked on this socket
    int fd = socket.native_handle();
    subscription->on_dropped([fd] {
        if (::shutdown(fd, SHUT_RDWR) != 0) {
            log_status("Warning: could not close dropped event stream: " + std::string(strerror(errno)));
        }
    });

    while (true) {
        auto event = subscription->wait_next(keepalive_interval);
        if (subscription->is_dropped()) {
            break;
        }

        std::string message;
        if (event) {
            message = "data: " + event_to_json(*event) + "\n\n";
        } else {
            // Comment line; a failed write tells us the peer is gone
            message = ": keepalive\n\n";
        }

        net::write(socket, net::buffer(message), ec);
        if (ec) {
            break;
        }
    }

    log_status("Event subscriber detached");
}

void ControlServer::handle_session(tcp::socket socket) {
    beast::flat_buffer buffer;
    beast::error_code ec;

    while (true) {
        Request req;
        http::read(socket, buffer, req, ec);
        if (ec == http::error::end_of_stream) {
            break;
        }
        if (ec) {
            log_status("Warning: HTTP read failed: " + ec.message());
            break;
        }

        std::string target(req.target());
        if (req.method() == http::verb::get && target.substr(0, target.find('?')) == "/events") {
            stream_events(socket);
            break;
        }

        Response res = handle_request(req);
        bool close = res.need_eof();
        http::write(socket, res, ec);
        if (ec || close) {
            break;
        }
    }

    // Peer may have closed already; nothing left to report
    socket.shutdown(tcp::socket::shutdown_send, ec);
}

unsigned short ControlServer::listen(const std::string& address, unsigned short port) {
    acceptor = std::make_unique<tcp::acceptor>(ioc, tcp::endpoint{net::ip::make_address(address), port});
    bound_endpoint = acceptor->local_endpoint();
    log_status("Control server listening on " + address + ":" + std::to_string(bound_endpoint.port()));
    return bound_endpoint.port();
}

void ControlServer::serve() {
    while (!stopping.load()) {
        tcp::socket socket{ioc};
        beast::error_code ec;
        acceptor->accept(socket, ec);
        if (stopping.load()) {
            break;
        }
        if (ec) {
            log_status("Warning: accept failed: " + ec.message());
            continue;
        }
        std::thread(&ControlServer::handle_session, this, std::move(socket)).detach();
    }
    log_status("Control server stopped");
}

void ControlServer::run(const std::string& address, unsigned short port) {
    listen(address, port);
    serve();
}

void ControlServer::stop() {
    if (!acceptor || stopping.exchange(true)) {
        return;
    }
    // Wake the blocking accept() with a throwaway connection
    tcp::endpoint endpoint = bound_endpoint;
    if (endpoint.address().is_unspecified()) {
        endpoint.address(endpoint.address().is_v6() ? net::ip::address(net::ip::address_v6::loopback())
                                                    : net::ip::address(net::ip::address_v4::loopback()));
    }
    tcp::socket poke{ioc};
    beast::error_code ec;
    poke.connect(endpoint, ec);
    if (ec) {
        log_status("Warning: could not wake control server: " + ec.message());
    }
}
