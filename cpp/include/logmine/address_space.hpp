#ifndef LOGMINE_ADDRESS_SPACE_HPP
#define LOGMINE_ADDRESS_SPACE_HPP

#include "utils.hpp"
#include <string>
#include <vector>
#include <cstdint>

namespace logmine {

/**
 * Reserved (private) IPv4 block
 */
struct ReservedBlock {
    std::string cidr;
    uint32_t network;     // network address, host byte order
    uint32_t host_count;  // addresses in the block, network and broadcast included
};

/**
 * The three RFC 1918 blocks: 10/8, 192.168/16, 172.16/12 (in draw order)
 */
const std::vector<ReservedBlock>& reserved_blocks();

/**
 * True if the address lies inside any reserved block
 */
bool is_reserved(uint32_t ip);

/**
 * Uniform block, then a host offset strictly between network and broadcast
 */
uint32_t random_private_ipv4(utils::Random& rng);

/**
 * Rejection-sampled address outside every reserved block
 *
 * First and last octets are drawn from [1,254], the middle two from [0,254].
 */
uint32_t random_public_ipv4(utils::Random& rng);

/**
 * Private address with probability private_bias, public otherwise
 */
uint32_t random_ipv4(utils::Random& rng, double private_bias);

std::string random_ipv4_str(utils::Random& rng, double private_bias);

} // namespace logmine

#endif // LOGMINE_ADDRESS_SPACE_HPP
