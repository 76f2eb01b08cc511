#include "infra/net/Endpoint.h"

#include <algorithm>
#include <cctype>
#include <utility>

namespace infra::net {
namespace {

domain::Result<Endpoint> invalid(const std::string& url, const char* why) {
    domain::Result<Endpoint> result;
    result.ok = false;
    result.error = "invalid backend url '" + url + "': " + why;
    return result;
}

bool allDigits(const std::string& value) {
    return !value.empty() && std::all_of(value.begin(), value.end(), [](unsigned char ch) {
        return std::isdigit(ch) != 0;
    });
}

}  // namespace

std::string Endpoint::hostHeader() const {
    const bool defaultPort = (tls && port == "443") || (!tls && port == "80");
    const std::string bracketed = host.find(':') != std::string::npos ? "[" + host + "]" : host;
    return defaultPort ? bracketed : bracketed + ":" + port;
}

std::string Endpoint::url() const {
    return std::string(tls ? "wss://" : "ws://") + hostHeader() + target;
}

domain::Result<Endpoint> parseEndpoint(const std::string& url) {
    Endpoint endpoint;

    std::string lower = url;
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });

    std::string rest;
    if (lower.rfind("wss://", 0) == 0) {
        endpoint.tls = true;
        rest = url.substr(6);
    }
    else if (lower.rfind("ws://", 0) == 0) {
        rest = url.substr(5);
    }
    else {
        return invalid(url, "scheme must be ws:// or wss://");
    }

    const auto slash = rest.find_first_of("/?");
    std::string authority = rest.substr(0, slash);
    if (slash != std::string::npos) {
        endpoint.target = rest.substr(slash);
        if (endpoint.target.front() == '?') {
            endpoint.target.insert(endpoint.target.begin(), '/');
        }
    }

    if (authority.find('@') != std::string::npos) {
        return invalid(url, "credentials in the authority are not supported");
    }

    std::string portText;
    if (!authority.empty() && authority.front() == '[') {
        const auto close = authority.find(']');
        if (close == std::string::npos) {
            return invalid(url, "unterminated IPv6 literal");
        }
        endpoint.host = authority.substr(1, close - 1);
        const std::string tail = authority.substr(close + 1);
        if (!tail.empty()) {
            if (tail.front() != ':') {
                return invalid(url, "unexpected text after IPv6 literal");
            }
            portText = tail.substr(1);
        }
    }
    else {
        const auto colon = authority.rfind(':');
        if (colon != std::string::npos) {
            endpoint.host = authority.substr(0, colon);
            portText = authority.substr(colon + 1);
        }
        else {
            endpoint.host = authority;
        }
    }

    if (endpoint.host.empty()) {
        return invalid(url, "missing host");
    }

    if (portText.empty()) {
        endpoint.port = endpoint.tls ? "443" : "80";
    }
    else {
        if (!allDigits(portText) || portText.size() > 5 || std::stoi(portText) == 0 || std::stoi(portText) > 65535) {
            return invalid(url, "port out of range");
        }
        endpoint.port = portText;
    }

    domain::Result<Endpoint> result;
    result.value = std::move(endpoint);
    return result;
}

}  // namespace infra::net
