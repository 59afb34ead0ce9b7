#include "logmine/address_space.hpp"

namespace logmine {

const std::vector<ReservedBlock>& reserved_blocks() {
    static const std::vector<ReservedBlock> blocks = [] {
        std::vector<ReservedBlock> out;
        for (const char* cidr : {"10.0.0.0/8", "192.168.0.0/16", "172.16.0.0/12"}) {
            auto [network, count] = utils::parse_subnet(cidr);
            out.push_back({cidr, network, count});
        }
        return out;
    }();
    return blocks;
}

bool is_reserved(uint32_t ip) {
    uint32_t a = (ip >> 24) & 0xFF;
    uint32_t b = (ip >> 16) & 0xFF;
    return a == 10 || (a == 192 && b == 168) || (a == 172 && b >= 16 && b <= 31);
}

uint32_t random_private_ipv4(utils::Random& rng) {
    const auto& block = utils::choice(rng, reserved_blocks());

    // Skip network and broadcast addresses
    uint32_t offset = static_cast<uint32_t>(
        rng.randint(1, static_cast<int>(block.host_count - 2)));
    return block.network + offset;
}

uint32_t random_public_ipv4(utils::Random& rng) {
    while (true) {
        uint32_t a = rng.randint(1, 254);
        uint32_t b = rng.randint(0, 254);
        uint32_t c = rng.randint(0, 254);
        uint32_t d = rng.randint(1, 254);
        uint32_t ip = (a << 24) | (b << 16) | (c << 8) | d;
        if (!is_reserved(ip)) {
            return ip;
        }
    }
}

uint32_t random_ipv4(utils::Random& rng, double private_bias) {
    if (rng.uniform() < private_bias) {
        return random_private_ipv4(rng);
    }
    return random_public_ipv4(rng);
}

std::string random_ipv4_str(utils::Random& rng, double private_bias) {
    return utils::uint32_to_ip_str(random_ipv4(rng, private_bias));
}

} // namespace logmine
