// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

/**
 * @file IHttpProbe.h
 * @brief Transport used by live validation
 *
 * A probe performs one bounded-time GET and reports the outcome without
 * throwing. Implementations must return ProbeFailure::ABORTED promptly
 * once the stop token is signalled.
 */

#pragma once

#include <chrono>
#include <map>
#include <stop_token>
#include <string>

namespace KeyWarden {

/**
 * @brief Transport-level reason a probe produced no HTTP status
 */
enum class ProbeFailure {
    NONE,       ///< A status line was received
    TIMEOUT,    ///< Connect or read exceeded the deadline
    NETWORK,    ///< DNS, TLS, connection refused, ...
    ABORTED     ///< Stop requested by the caller
};

struct ProbeResponse {
    bool ok = false;            ///< True for 2xx
    int status = 0;             ///< 0 when failure != NONE
    std::string status_text;
    ProbeFailure failure = ProbeFailure::NONE;
    std::string error;          ///< Transport error description
};

using HttpHeaders = std::map<std::string, std::string>;

class IHttpProbe {
public:
    virtual ~IHttpProbe() = default;

    /**
     * @brief Issue a GET request
     * @param url Absolute https URL
     * @param headers Request headers (may include credentials; never log them)
     * @param timeout Deadline for the whole exchange
     * @param stop Cancellation signal
     */
    [[nodiscard]] virtual ProbeResponse get(const std::string& url,
                                            const HttpHeaders& headers,
                                            std::chrono::milliseconds timeout,
                                            std::stop_token stop) = 0;
};

} // namespace KeyWarden
