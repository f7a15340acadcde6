// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

/**
 * @file HttplibProbe.h
 * @brief IHttpProbe backed by cpp-httplib
 *
 * Only built when CMake finds httplib.h. HTTPS needs
 * CPPHTTPLIB_OPENSSL_SUPPORT, which the keywarden_http target exports to
 * every translation unit that links it. A stop request shuts the client's socket down, so an
 * in-flight request returns ProbeFailure::ABORTED without waiting for the
 * timeout.
 */

#pragma once

#include "IHttpProbe.h"
#include <string>

namespace KeyWarden {

class HttplibProbe final : public IHttpProbe {
public:
    HttplibProbe() = default;

    HttplibProbe(const HttplibProbe&) = delete;
    HttplibProbe& operator=(const HttplibProbe&) = delete;

    [[nodiscard]] ProbeResponse get(const std::string& url,
                                    const HttpHeaders& headers,
                                    std::chrono::milliseconds timeout,
                                    std::stop_token stop) override;

    /**
     * @brief Split "https://host[:port]/path" into scheme+host and path
     * @return false if the URL has no scheme
     */
    [[nodiscard]] static bool split_url(const std::string& url,
                                        std::string& scheme_host,
                                        std::string& path);
};

} // namespace KeyWarden
