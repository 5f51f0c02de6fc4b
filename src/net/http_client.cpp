#include "net/http_client.hpp"
#include "net/url_validator.hpp"
#include <spdlog/spdlog.h>

#ifndef CPPHTTPLIB_OPENSSL_SUPPORT
#define CPPHTTPLIB_OPENSSL_SUPPORT
#endif
#include <httplib.h>

#include <chrono>

namespace mahilo::net {

HttpResponse HttplibClient::post(const std::string& url,
                                 const std::string& body,
                                 const HeaderList& headers,
                                 int timeout_ms) {
    HttpResponse response;

    auto parsed = parse_url(url);
    if (!parsed || (parsed->scheme != "http" && parsed->scheme != "https")) {
        response.error = "Invalid URL format";
        return response;
    }

    try {
        std::string host = parsed->host.find(':') != std::string::npos
            ? "[" + parsed->host + "]" : parsed->host;
        httplib::Client cli(parsed->scheme + "://" + host + ":" + std::to_string(parsed->port));

        auto timeout = std::chrono::milliseconds(timeout_ms);
        cli.set_connection_timeout(timeout);
        cli.set_read_timeout(timeout);
        cli.set_write_timeout(timeout);
        cli.set_follow_location(false);

        httplib::Headers request_headers;
        std::string content_type = "application/json";
        for (const auto& [name, value] : headers) {
            if (name == "Content-Type") {
                content_type = value;
            } else {
                request_headers.emplace(name, value);
            }
        }

        auto result = cli.Post(parsed->path, request_headers, body, content_type);
        if (!result) {
            response.error = "HTTP request failed: " + httplib::to_string(result.error());
            return response;
        }

        response.status = result->status;
        response.body = result->body;

    } catch (const std::exception& e) {
        response.error = std::string("Exception: ") + e.what();
        spdlog::error("Webhook POST to {} threw: {}", parsed->host, e.what());
    }

    return response;
}

} // namespace mahilo::net
