#pragma once

#include "domain/Types.h"

#include <string>

namespace infra::net {

struct Endpoint {
    bool tls{false};
    std::string host;
    std::string port;
    std::string target{"/"};

    // Value for the HTTP Host header during the upgrade.
    std::string hostHeader() const;
    std::string url() const;
};

// Accepts ws:// and wss:// URLs; the port defaults to 80/443 and the target to "/".
domain::Result<Endpoint> parseEndpoint(const std::string& url);

}  // namespace infra::net
