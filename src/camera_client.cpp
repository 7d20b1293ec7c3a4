// camera_client.cpp

#include "camera_client.hpp"

#include <cctype>
#include <stdexcept>

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/http/vector_body.hpp>
#include <opencv2/imgcodecs.hpp>

#include "http_auth.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

std::optional<HttpUrl> parse_http_url(const std::string& url) {
    const std::string scheme = "http://";
    if (url.compare(0, scheme.size(), scheme) != 0) {
        return std::nullopt;
    }

    std::string rest = url.substr(scheme.size());
    size_t authority_end = rest.find_first_of("/?#");
    std::string authority = rest.substr(0, authority_end);

    HttpUrl parsed;
    parsed.port = "80";
    if (authority_end == std::string::npos) {
        parsed.target = "/";
    } else {
        parsed.target = rest.substr(authority_end);
        size_t fragment = parsed.target.find('#');
        if (fragment != std::string::npos) {
            parsed.target.erase(fragment);
        }
        if (parsed.target.empty() || parsed.target[0] != '/') {
            parsed.target.insert(0, "/");
        }
    }

    if (authority.find('@') != std::string::npos) {
        // Credentials belong in username/password, not the URL
        return std::nullopt;
    }

    size_t port_sep = std::string::npos;
    if (!authority.empty() && authority[0] == '[') {
        size_t close = authority.find(']');
        if (close == std::string::npos) {
            return std::nullopt;
        }
        parsed.host = authority.substr(1, close - 1);
        if (close + 1 < authority.size()) {
            if (authority[close + 1] != ':') {
                return std::nullopt;
            }
            port_sep = close + 1;
        }
    } else {
        port_sep = authority.rfind(':');
        parsed.host = authority.substr(0, port_sep);
    }

    if (port_sep != std::string::npos) {
        parsed.port = authority.substr(port_sep + 1);
        if (parsed.port.empty() || parsed.port.size() > 5) {
            return std::nullopt;
        }
        for (char c : parsed.port) {
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                return std::nullopt;
            }
        }
    }

    if (parsed.host.empty()) {
        return std::nullopt;
    }
    return parsed;
}

bool HttpCameraClient::is_decodable_image(const std::vector<unsigned char>& bytes) {
    if (bytes.empty()) {
        return false;
    }
    try {
        cv::Mat raw(1, static_cast<int>(bytes.size()), CV_8UC1, const_cast<unsigned char*>(bytes.data()));
        cv::Mat decoded = cv::imdecode(raw, cv::IMREAD_REDUCED_GRAYSCALE_8);
        return !decoded.empty();
    } catch (const cv::Exception&) {
        return false;
    }
}

std::optional<CaptureError> HttpCameraClient::perform_request(http::verb method, const HttpUrl& url,
                                                              const std::string& authorization,
                                                              std::chrono::steady_clock::time_point deadline,
                                                              Reply& reply) const {
    net::io_context ioc;
    tcp::resolver resolver(ioc);
    beast::tcp_stream stream(ioc);
    net::steady_timer timer(ioc);
    beast::flat_buffer buffer;

    http::request<http::empty_body> req{method, url.target, 11};
    req.set(http::field::host, url.port == "80" ? url.host : url.host + ":" + url.port);
    req.set(http::field::user_agent, "chronocam");
    req.set(http::field::accept, "image/*");
    if (!authorization.empty()) {
        req.set(http::field::authorization, authorization);
    }

    http::response_parser<http::vector_body<unsigned char>> parser;
    parser.body_limit(MAX_IMAGE_BYTES);
    if (method == http::verb::head) {
        // Content-Length describes the GET body; a HEAD reply has none
        parser.skip(true);
    }

    beast::error_code result;
    bool finished = false;
    bool timed_out = false;

    auto finish = [&](beast::error_code ec) {
        result = ec;
        finished = true;
        timer.cancel();
    };

    // One deadline covers resolve, connect, write and read
    timer.expires_at(deadline);
    timer.async_wait([&](beast::error_code ec) {
        if (ec || finished) {
            return;
        }
        timed_out = true;
        resolver.cancel();
        stream.cancel();
    });

    resolver.async_resolve(url.host, url.port, [&](beast::error_code ec, tcp::resolver::results_type results) {
        if (ec) {
            return finish(ec);
        }
        stream.async_connect(results, [&](beast::error_code ec, tcp::endpoint) {
            if (ec) {
                return finish(ec);
            }
            http::async_write(stream, req, [&](beast::error_code ec, std::size_t) {
                if (ec) {
                    return finish(ec);
                }
                http::async_read(stream, buffer, parser, [&](beast::error_code ec, std::size_t) {
                    finish(ec);
                });
            });
        });
    });

    ioc.run();

    if (timed_out) {
        return CaptureError{CaptureErrorKind::Timeout, "No response from camera within timeout"};
    }
    if (result == net::error::connection_refused) {
        return CaptureError{CaptureErrorKind::ConnectionRefused, "Connection refused by " + url.host + ":" + url.port};
    }
    if (result == http::error::body_limit) {
        return CaptureError{CaptureErrorKind::InvalidContent, "Response body exceeds image size limit"};
    }
    if (result) {
        return CaptureError{CaptureErrorKind::Unreachable, "Camera unreachable: " + result.message()};
    }

    auto& response = parser.get();
    reply.status = response.result_int();
    for (const auto& field : response) {
        if (field.name() == http::field::www_authenticate) {
            reply.authenticate.push_back(std::string(field.value()));
        }
    }
    reply.body = std::move(response.body());

    // The peer may already be gone; the socket is closed on destruction either way
    beast::error_code shutdown_ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, shutdown_ec);

    return std::nullopt;
}

std::optional<CaptureError> HttpCameraClient::authenticated_request(http::verb method, const HttpUrl& url,
                                                                    const ScheduleConfig& config,
                                                                    std::chrono::steady_clock::time_point deadline,
                                                                    Reply& reply) const {
    std::string authorization;
    switch (config.auth_type) {
    case AuthType::None:
        break;
    case AuthType::Basic:
        authorization = basic_authorization(config.username, config.password);
        break;
    case AuthType::Digest:
        // Answered after the camera's 401 challenge
        break;
    }

    if (auto failure = perform_request(method, url, authorization, deadline, reply)) {
        return failure;
    }

    if (reply.status == 401 && config.auth_type == AuthType::Digest) {
        auto challenge = parse_digest_challenge(reply.authenticate);
        if (!challenge) {
            return CaptureError{CaptureErrorKind::AuthFailed, "Camera did not offer Digest authentication", 401};
        }
        try {
            authorization = digest_authorization(*challenge, config.username, config.password,
                                                 std::string(http::to_string(method)), url.target, make_cnonce(), 1);
        } catch (const std::runtime_error& e) {
            return CaptureError{CaptureErrorKind::AuthFailed, e.what(), 401};
        }

        reply = Reply();
        return perform_request(method, url, authorization, deadline, reply);
    }
    return std::nullopt;
}

FetchResult HttpCameraClient::fetch_snapshot(const ScheduleConfig& config) {
    FetchResult result;

    auto url = parse_http_url(config.cam_url);
    if (!url) {
        result.error = CaptureError{CaptureErrorKind::Unreachable, "Invalid camera URL: " + config.cam_url};
        return result;
    }

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(config.fetch_timeout_seconds);

    Reply reply;
    if (auto failure = authenticated_request(http::verb::get, *url, config, deadline, reply)) {
        result.error = *failure;
        return result;
    }

    if (reply.status == 401 || reply.status == 403) {
        result.error = CaptureError{CaptureErrorKind::AuthFailed,
                                    "Camera rejected credentials (HTTP " + std::to_string(reply.status) + ")",
                                    static_cast<int>(reply.status)};
        return result;
    }
    if (reply.status < 200 || reply.status >= 300) {
        result.error = CaptureError{CaptureErrorKind::HttpError,
                                    "Camera responded with HTTP " + std::to_string(reply.status),
                                    static_cast<int>(reply.status)};
        return result;
    }
    if (!is_decodable_image(reply.body)) {
        result.error = CaptureError{CaptureErrorKind::InvalidContent,
                                    "Camera returned " + std::to_string(reply.body.size()) + " bytes that are not an image"};
        return result;
    }

    result.image = std::move(reply.body);
    return result;
}

std::optional<CaptureError> HttpCameraClient::check_reachable(const ScheduleConfig& config) {
    auto url = parse_http_url(config.cam_url);
    if (!url) {
        return CaptureError{CaptureErrorKind::Unreachable, "Invalid camera URL: " + config.cam_url};
    }

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(config.fetch_timeout_seconds);

    Reply reply;
    if (auto failure = authenticated_request(http::verb::head, *url, config, deadline, reply)) {
        return failure;
    }
    if (reply.status == 405 || reply.status == 501) {
        reply = Reply();
        if (auto failure = authenticated_request(http::verb::get, *url, config, deadline, reply)) {
            return failure;
        }
    }

    if (reply.status == 401 || reply.status == 403) {
        return CaptureError{CaptureErrorKind::AuthFailed,
                            "Camera rejected credentials (HTTP " + std::to_string(reply.status) + ")",
                            static_cast<int>(reply.status)};
    }
    if (reply.status >= 400) {
        return CaptureError{CaptureErrorKind::HttpError,
                            "Camera responded with HTTP " + std::to_string(reply.status),
                            static_cast<int>(reply.status)};
    }
    return std::nullopt;
}
