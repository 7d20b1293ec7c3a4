// control_server.hpp

#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/http.hpp>

#include "capture_scheduler.hpp"
#include "event_bus.hpp"

#define EVENT_KEEPALIVE_SECONDS 15

// HTTP front of the scheduler for the dashboard:
//   GET  /status            status JSON
//   GET  /events            text/event-stream of JSON events
//   GET  /last.jpg          newest image
//   GET  /logs              recent log lines
//   POST /action/pause | /action/resume | /action/snapshot | /action/reload
// One thread per connection; event streams hold their subscription for as
// long as the connection lives. A stream whose subscription is dropped for
// falling behind has its socket shut down, which also unblocks a write stuck
// on a stalled peer.
class ControlServer {
public:
    using Request = boost::beast::http::request<boost::beast::http::string_body>;
    using Response = boost::beast::http::response<boost::beast::http::string_body>;

private:
    CaptureScheduler& scheduler;
    EventBus& bus;
    std::string config_path;
    std::chrono::milliseconds keepalive_interval;

    boost::asio::io_context ioc;
    std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor;
    boost::asio::ip::tcp::endpoint bound_endpoint;
    std::atomic<bool> stopping;

    void handle_session(boost::asio::ip::tcp::socket socket);
    void stream_events(boost::asio::ip::tcp::socket& socket);

public:
    // `config_path` is re-read by /action/reload.
    ControlServer(CaptureScheduler& scheduler, EventBus& bus, const std::string& config_path);

    // Binds and returns the bound port (useful with port 0). Throws
    // boost::system::system_error if the address cannot be bound.
    unsigned short listen(const std::string& address, unsigned short port);

    // Accepts connections until stop(); each gets its own thread.
    void serve();

    // listen() then serve().
    void run(const std::string& address, unsigned short port);

    // Makes serve() return. Open connections finish on their own.
    void stop();

    void set_keepalive_interval(std::chrono::milliseconds interval) { keepalive_interval = interval; }

    // Routes every request except the /events stream.
    Response handle_request(const Request& req);
};
