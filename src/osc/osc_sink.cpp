#include "osc/osc_sink.hpp"

#include <algorithm>
#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>
#include <utility>
#include "core/logging/logger.hpp"

namespace vrc::osc {

using core::errors::AgentError;
using core::errors::ErrorCategory;

UdpOscSink::UdpOscSink(std::string host, const std::uint16_t port)
    : host_(std::move(host)), port_(port) {}

UdpOscSink::~UdpOscSink() {
    if (fd_ >= 0) {
        static_cast<void>(close(fd_));
    }
}

core::errors::Result<std::string> UdpOscSink::open() {
    if (fd_ >= 0) {
        return resolved_;
    }

    addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_DGRAM;
    addrinfo* results = nullptr;
    const std::string service = std::to_string(port_);
    const int rc = getaddrinfo(host_.c_str(), service.c_str(), &hints, &results);
    if (rc != 0 || results == nullptr) {
        return AgentError{ErrorCategory::Dispatch,
                          "Unable to resolve OSC host " + host_ + ": " + gai_strerror(rc),
                          "osc_resolve_failed", "Check osc.host / osc.port."};
    }

    const int fd = ::socket(results->ai_family, results->ai_socktype, results->ai_protocol);
    if (fd < 0) {
        freeaddrinfo(results);
        return AgentError{ErrorCategory::Dispatch,
                          std::string("Unable to create UDP socket: ") + std::strerror(errno),
                          "osc_socket_failed", "", true};
    }

    address_length_ = static_cast<socklen_t>(
        std::min<std::size_t>(results->ai_addrlen, sizeof(address_)));
    std::memcpy(&address_, results->ai_addr, address_length_);

    char text[INET_ADDRSTRLEN] = {};
    const auto* in = reinterpret_cast<const sockaddr_in*>(results->ai_addr);
    static_cast<void>(inet_ntop(AF_INET, &in->sin_addr, text, sizeof(text)));
    resolved_ = std::string(text) + ":" + service;
    freeaddrinfo(results);

    fd_ = fd;
    LOG_DEBUG("OscSink: UDP socket ready for " + resolved_);
    return resolved_;
}

core::errors::Result<std::size_t> UdpOscSink::send(const OscMessage& message) {
    auto opened = open();
    if (core::errors::is_error(opened)) {
        return core::errors::get_error(opened);
    }

    auto encoded = encode(message);
    if (core::errors::is_error(encoded)) {
        return core::errors::get_error(encoded);
    }
    const auto& bytes = core::errors::get_value(encoded);

    const ssize_t sent =
        ::sendto(fd_, bytes.data(), bytes.size(), 0,
                 reinterpret_cast<const sockaddr*>(&address_), address_length_);
    if (sent < 0) {
        return AgentError{ErrorCategory::Dispatch,
                          "sendto " + resolved_ + " failed: " + std::strerror(errno),
                          "osc_send_failed", "Enable OSC in VRChat or check osc.port.",
                          errno == EAGAIN || errno == ENOBUFS || errno == ECONNREFUSED};
    }
    return static_cast<std::size_t>(sent);
}

core::errors::Result<std::size_t> DryRunOscSink::send(const OscMessage& message) {
    auto encoded = encode(message);
    if (core::errors::is_error(encoded)) {
        return core::errors::get_error(encoded);
    }
    LOG_INFO("[dry-run] osc " + describe(message));
    return core::errors::get_value(encoded).size();
}

}  // namespace vrc::osc
