// camera_client.hpp

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include <boost/beast/http/verb.hpp>

#include "capture_error.hpp"
#include "config.hpp"

#define MAX_IMAGE_BYTES (32u * 1024u * 1024u)

struct FetchResult {
    std::vector<unsigned char> image;
    std::optional<CaptureError> error;

    bool ok() const { return !error; }
};

// Anything that can produce one still image per call. The scheduler only
// sees this interface.
class SnapshotSource {
public:
    virtual ~SnapshotSource() = default;
    virtual FetchResult fetch_snapshot(const ScheduleConfig& config) = 0;

    // Lightweight reachability check without taking a snapshot; nothing on success.
    virtual std::optional<CaptureError> check_reachable(const ScheduleConfig& config) = 0;
};

struct HttpUrl {
    std::string host;
    std::string port;
    std::string target; // path and query, at least "/"
};

std::optional<HttpUrl> parse_http_url(const std::string& url);

// Fetches the snapshot URL with one HTTP GET (plus the challenge round trip
// for Digest auth), bounded by fetch_timeout_seconds. Never retries; every
// failure is classified and returned.
class HttpCameraClient : public SnapshotSource {
private:
    struct Reply {
        unsigned status = 0;
        std::vector<unsigned char> body;
        std::vector<std::string> authenticate;
    };

    std::optional<CaptureError> perform_request(boost::beast::http::verb method, const HttpUrl& url,
                                                const std::string& authorization,
                                                std::chrono::steady_clock::time_point deadline,
                                                Reply& reply) const;

    // One authenticated request (Basic up front, Digest answered after a 401).
    std::optional<CaptureError> authenticated_request(boost::beast::http::verb method, const HttpUrl& url,
                                                      const ScheduleConfig& config,
                                                      std::chrono::steady_clock::time_point deadline,
                                                      Reply& reply) const;

public:
    FetchResult fetch_snapshot(const ScheduleConfig& config) override;

    // HEAD, or GET when the camera answers 405/501. Any status below 400 counts as reachable.
    std::optional<CaptureError> check_reachable(const ScheduleConfig& config) override;

    // True when OpenCV can decode the bytes as an image.
    static bool is_decodable_image(const std::vector<unsigned char>& bytes);
};
