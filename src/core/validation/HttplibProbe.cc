// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

#include "HttplibProbe.h"
#include "../../utils/Log.h"
#include <cstdint>
#include <format>
#include <stop_token>
#include <httplib.h>

namespace KeyWarden {

bool HttplibProbe::split_url(const std::string& url, std::string& scheme_host, std::string& path) {
    const auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos) {
        return false;
    }
    const auto path_start = url.find('/', scheme_end + 3);
    if (path_start == std::string::npos) {
        scheme_host = url;
        path = "/";
    } else {
        scheme_host = url.substr(0, path_start);
        path = url.substr(path_start);
    }
    return true;
}

ProbeResponse HttplibProbe::get(const std::string& url,
                                const HttpHeaders& headers,
                                std::chrono::milliseconds timeout,
                                std::stop_token stop) {
    ProbeResponse response;

    if (stop.stop_requested()) {
        response.failure = ProbeFailure::ABORTED;
        return response;
    }

    std::string scheme_host;
    std::string path;
    if (!split_url(url, scheme_host, path)) {
        response.failure = ProbeFailure::NETWORK;
        response.error = std::format("Invalid URL: {}", url);
        return response;
    }

    httplib::Client cli(scheme_host);
    cli.set_connection_timeout(timeout);
    cli.set_read_timeout(timeout);
    cli.set_write_timeout(timeout);

    httplib::Headers request_headers;
    for (const auto& [name, value] : headers) {
        request_headers.emplace(name, value);
    }

    // Shuts the socket down from the requesting thread; the progress callback
    // covers the body phase, where the client checks for cancellation itself
    std::stop_callback on_stop(stop, [&cli] { cli.stop(); });

    const auto res = cli.Get(path, request_headers,
                             [&stop](uint64_t, uint64_t) { return !stop.stop_requested(); });

    if (stop.stop_requested()) {
        response.failure = ProbeFailure::ABORTED;
        response.error = "Request aborted";
        return response;
    }

    if (!res) {
        const auto error = res.error();
        if (error == httplib::Error::Canceled) {
            response.failure = ProbeFailure::ABORTED;
            response.error = "Request aborted";
        } else if (error == httplib::Error::ConnectionTimeout || error == httplib::Error::Read) {
            response.failure = ProbeFailure::TIMEOUT;
            response.error = "Request timeout";
        } else {
            response.failure = ProbeFailure::NETWORK;
            response.error = httplib::to_string(error);
        }
        Log::debug("HttplibProbe: {} failed: {}", scheme_host, response.error);
        return response;
    }

    response.status = res->status;
    response.status_text = httplib::status_message(res->status);
    response.ok = res->status >= 200 && res->status < 300;
    return response;
}

} // namespace KeyWarden
