#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <sys/socket.h>
#include "core/errors/agent_errors.hpp"
#include "osc/osc_message.hpp"

namespace vrc::osc {

// Destination of encoded OSC messages.
class OscSink {
public:
    virtual ~OscSink() = default;
    // Returns the number of bytes handed to the transport.
    virtual core::errors::Result<std::size_t> send(const OscMessage& message) = 0;
};

class UdpOscSink final : public OscSink {
public:
    UdpOscSink(std::string host, std::uint16_t port);
    ~UdpOscSink() override;

    UdpOscSink(const UdpOscSink&) = delete;
    UdpOscSink& operator=(const UdpOscSink&) = delete;

    // Resolves the host and creates the socket. send() opens lazily too.
    core::errors::Result<std::string> open();

    core::errors::Result<std::size_t> send(const OscMessage& message) override;

private:
    std::string host_;
    std::uint16_t port_;
    int fd_ = -1;
    std::string resolved_;
    sockaddr_storage address_{};
    socklen_t address_length_ = 0;
};

// Logs every message instead of sending it.
class DryRunOscSink final : public OscSink {
public:
    core::errors::Result<std::size_t> send(const OscMessage& message) override;
};

}  // namespace vrc::osc
