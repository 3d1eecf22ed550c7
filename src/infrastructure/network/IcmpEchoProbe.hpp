#pragma once

#include "core/services/IReachabilityProbe.hpp"

#include <atomic>
#include <cstdint>
#include <vector>

namespace pingsweep::infra {

/**
 * @brief ICMP echo reachability probe using raw sockets.
 *
 * Sends up to `count` echo requests and succeeds on the first matching reply.
 * IPv4 only. Implements the core::IReachabilityProbe interface.
 *
 * @note On Linux, requires CAP_NET_RAW capability or root privileges.
 */
class IcmpEchoProbe : public core::IReachabilityProbe {
public:
    IcmpEchoProbe();

    core::ProbeResult probe(const std::string& identifier, const core::ProbeOptions& options,
                            std::stop_token stopToken) override;

    std::string name() const override { return "icmp-echo"; }

    // ICMP helpers
    static uint16_t calculateChecksum(const uint8_t* data, size_t length);
    static std::vector<uint8_t> buildIcmpEchoRequest(uint16_t identifier, uint16_t sequence);

private:
    std::atomic<uint16_t> sequenceNumber_{0};
    uint16_t identifier_;
};

} // namespace pingsweep::infra
