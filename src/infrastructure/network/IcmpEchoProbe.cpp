#include "infrastructure/network/IcmpEchoProbe.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <chrono>
#include <cstring>
#include <optional>
#include <random>

#ifdef __linux__
#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/ip_icmp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>
#endif

namespace pingsweep::infra {

namespace {

constexpr uint8_t ICMP_ECHO_REQUEST = 8;
constexpr uint8_t ICMP_ECHO_REPLY = 0;
constexpr uint8_t ICMP_DEST_UNREACHABLE = 3;

#ifdef __linux__

std::optional<in_addr> resolveIpv4(const std::string& hostname) {
    struct addrinfo hints {};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_RAW;

    struct addrinfo* result = nullptr;
    if (getaddrinfo(hostname.c_str(), nullptr, &hints, &result) != 0 || !result) {
        return std::nullopt;
    }

    auto* addr = reinterpret_cast<struct sockaddr_in*>(result->ai_addr);
    in_addr resolved = addr->sin_addr;
    freeaddrinfo(result);
    return resolved;
}

// Closes the raw socket on every exit path.
class SocketGuard {
public:
    explicit SocketGuard(int fd) : fd_(fd) {}
    ~SocketGuard() {
        if (fd_ >= 0) {
            close(fd_);
        }
    }
    SocketGuard(const SocketGuard&) = delete;
    SocketGuard& operator=(const SocketGuard&) = delete;

    int get() const { return fd_; }

private:
    int fd_;
};

#endif

} // namespace

IcmpEchoProbe::IcmpEchoProbe() {
    std::random_device rd;
    identifier_ = static_cast<uint16_t>(rd() & 0xFFFF);
    spdlog::debug("IcmpEchoProbe initialized with identifier: {}", identifier_);
}

uint16_t IcmpEchoProbe::calculateChecksum(const uint8_t* data, size_t length) {
    uint32_t sum = 0;

    while (length > 1) {
        sum += (static_cast<uint16_t>(data[0]) << 8) | data[1];
        data += 2;
        length -= 2;
    }

    if (length == 1) {
        sum += static_cast<uint16_t>(data[0]) << 8;
    }

    while (sum >> 16) {
        sum = (sum & 0xFFFF) + (sum >> 16);
    }

    return static_cast<uint16_t>(~sum);
}

std::vector<uint8_t> IcmpEchoProbe::buildIcmpEchoRequest(uint16_t identifier, uint16_t sequence) {
    std::vector<uint8_t> packet(64, 0);

    packet[0] = ICMP_ECHO_REQUEST;
    packet[1] = 0;
    packet[4] = static_cast<uint8_t>(identifier >> 8);
    packet[5] = static_cast<uint8_t>(identifier & 0xFF);
    packet[6] = static_cast<uint8_t>(sequence >> 8);
    packet[7] = static_cast<uint8_t>(sequence & 0xFF);

    auto now = std::chrono::steady_clock::now().time_since_epoch().count();
    std::memcpy(&packet[8], &now, sizeof(now));

    uint16_t checksum = calculateChecksum(packet.data(), packet.size());
    packet[2] = static_cast<uint8_t>(checksum >> 8);
    packet[3] = static_cast<uint8_t>(checksum & 0xFF);

    return packet;
}

core::ProbeResult IcmpEchoProbe::probe(const std::string& identifier,
                                       const core::ProbeOptions& options,
                                       std::stop_token stopToken) {
    if (stopToken.stop_requested()) {
        return core::ProbeResult::unreachable(identifier, core::FailureReason::ToolError,
                                              "cancelled before start");
    }

#ifdef __linux__
    auto destination = resolveIpv4(identifier);
    if (!destination) {
        return core::ProbeResult::unreachable(identifier, core::FailureReason::ResolutionFailure,
                                              "cannot resolve " + identifier);
    }

    SocketGuard sock(socket(AF_INET, SOCK_RAW, IPPROTO_ICMP));
    if (sock.get() < 0) {
        spdlog::warn("ICMP probe to {} failed: cannot create raw socket", identifier);
        return core::ProbeResult::unreachable(identifier, core::FailureReason::ToolError,
                                              "Failed to create raw socket (need CAP_NET_RAW)");
    }

    struct sockaddr_in dest {};
    dest.sin_family = AF_INET;
    dest.sin_addr = *destination;

    bool destinationUnreachable = false;

    for (int attempt = 0; attempt < options.count; ++attempt) {
        uint16_t seq = sequenceNumber_++;
        auto packet = buildIcmpEchoRequest(identifier_, seq);
        auto sendTime = std::chrono::steady_clock::now();

        ssize_t sent = sendto(sock.get(), packet.data(), packet.size(), 0,
                              reinterpret_cast<struct sockaddr*>(&dest), sizeof(dest));
        if (sent < 0) {
            return core::ProbeResult::unreachable(identifier, core::FailureReason::ToolError,
                                                  "Failed to send ICMP packet");
        }

        auto expiry = sendTime + options.timeout;
        std::array<uint8_t, 1024> recvBuffer{};

        // Raw sockets see every ICMP packet on the host; skip the ones that are not ours.
        while (true) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                expiry - std::chrono::steady_clock::now());
            if (remaining.count() <= 0) {
                break;
            }

            pollfd pfd{sock.get(), POLLIN, 0};
            int ready = poll(&pfd, 1, static_cast<int>(remaining.count()));
            if (ready <= 0) {
                continue;
            }

            struct sockaddr_in from {};
            socklen_t fromLen = sizeof(from);
            ssize_t received = recvfrom(sock.get(), recvBuffer.data(), recvBuffer.size(), 0,
                                        reinterpret_cast<struct sockaddr*>(&from), &fromLen);
            auto recvTime = std::chrono::steady_clock::now();

            if (received < 28) { // Minimum IP header (20) + ICMP header (8)
                continue;
            }

            auto* ipHeader = recvBuffer.data();
            size_t ipHeaderLen = static_cast<size_t>((ipHeader[0] & 0x0F) * 4);
            if (static_cast<size_t>(received) < ipHeaderLen + 8) {
                continue;
            }
            auto* icmpHeader = recvBuffer.data() + ipHeaderLen;

            if (icmpHeader[0] == ICMP_ECHO_REPLY &&
                from.sin_addr.s_addr == destination->s_addr) {
                uint16_t recvId = (static_cast<uint16_t>(icmpHeader[4]) << 8) | icmpHeader[5];
                uint16_t recvSeq = (static_cast<uint16_t>(icmpHeader[6]) << 8) | icmpHeader[7];

                if (recvId == identifier_ && recvSeq == seq) {
                    auto latency = std::chrono::duration_cast<std::chrono::microseconds>(
                        recvTime - sendTime);
                    spdlog::debug("ICMP echo to {} answered in {}us TTL={}", identifier,
                                  latency.count(), static_cast<int>(ipHeader[8]));
                    return core::ProbeResult::reachable(identifier, latency);
                }
            } else if (icmpHeader[0] == ICMP_DEST_UNREACHABLE &&
                       static_cast<size_t>(received) >= ipHeaderLen + 8 + 20 + 8) {
                // The unreachable message quotes our original IP header and echo request.
                auto* quotedIp = icmpHeader + 8;
                size_t quotedLen = static_cast<size_t>((quotedIp[0] & 0x0F) * 4);
                if (static_cast<size_t>(received) < ipHeaderLen + 8 + quotedLen + 8) {
                    continue;
                }
                auto* quotedIcmp = quotedIp + quotedLen;
                uint16_t quotedId = (static_cast<uint16_t>(quotedIcmp[4]) << 8) | quotedIcmp[5];
                if (quotedId == identifier_) {
                    destinationUnreachable = true;
                    break;
                }
            }
        }

        if (destinationUnreachable) {
            break;
        }
    }

    if (destinationUnreachable) {
        return core::ProbeResult::unreachable(identifier, core::FailureReason::Unreachable,
                                              "destination unreachable");
    }
    return core::ProbeResult::unreachable(identifier, core::FailureReason::Timeout);
#else
    return core::ProbeResult::unreachable(identifier, core::FailureReason::ToolError,
                                          "ICMP ping not implemented for this platform");
#endif
}

} // namespace pingsweep::infra
