#include "logmine/address_space.hpp"
#include "logmine/utils.hpp"

#include <cstdlib>
#include <iostream>
#include <set>
#include <string>

namespace {

using namespace logmine;

void check(bool cond, const std::string &msg) {
  if (!cond) {
    std::cerr << "FAIL: " << msg << '\n';
    std::exit(1);
  }
}

uint32_t ip(const char *text) { return utils::ip_str_to_uint32(text); }

void test_reserved_block_table() {
  const auto &blocks = reserved_blocks();
  check(blocks.size() == 3U, "three reserved blocks");
  check(blocks[0].cidr == "10.0.0.0/8" && blocks[0].host_count == (1U << 24), "10/8 block");
  check(blocks[1].network == ip("192.168.0.0") && blocks[1].host_count == (1U << 16),
        "192.168/16 block");
  check(blocks[2].network == ip("172.16.0.0") && blocks[2].host_count == (1U << 20),
        "172.16/12 block");
}

void test_is_reserved_boundaries() {
  check(is_reserved(ip("10.0.0.1")), "10/8 member");
  check(is_reserved(ip("10.255.255.255")), "10/8 top");
  check(!is_reserved(ip("11.0.0.1")), "11/8 is public");
  check(!is_reserved(ip("172.15.255.255")), "just below 172.16/12");
  check(is_reserved(ip("172.16.0.0")), "172.16/12 bottom");
  check(is_reserved(ip("172.31.255.255")), "172.16/12 top");
  check(!is_reserved(ip("172.32.0.0")), "just above 172.16/12");
  check(is_reserved(ip("192.168.0.1")), "192.168/16 member");
  check(!is_reserved(ip("192.169.0.1")), "192.169 is public");
  check(!is_reserved(ip("193.168.0.1")), "193.168 is public");
}

void test_private_bias_one_stays_inside_blocks() {
  utils::Random rng(2024);
  std::set<std::string> blocks_hit;

  for (int i = 0; i < 20000; ++i) {
    uint32_t addr = random_ipv4(rng, 1.0);
    check(is_reserved(addr), "private draw escaped reserved space: " + utils::uint32_to_ip_str(addr));

    for (const auto &block : reserved_blocks()) {
      if (addr >= block.network && addr - block.network < block.host_count) {
        blocks_hit.insert(block.cidr);
        check(addr != block.network, "network address must not be drawn");
        check(addr != block.network + block.host_count - 1, "broadcast address must not be drawn");
      }
    }
  }

  check(blocks_hit.size() == 3U, "every reserved block should be drawn");
}

void test_private_bias_zero_stays_outside_blocks() {
  utils::Random rng(77);

  for (int i = 0; i < 20000; ++i) {
    uint32_t addr = random_ipv4(rng, 0.0);
    check(!is_reserved(addr), "public draw landed in reserved space: " + utils::uint32_to_ip_str(addr));

    uint32_t a = (addr >> 24) & 0xFF;
    uint32_t b = (addr >> 16) & 0xFF;
    uint32_t c = (addr >> 8) & 0xFF;
    uint32_t d = addr & 0xFF;
    check(a >= 1 && a <= 254, "first octet in [1,254]");
    check(b <= 254 && c <= 254, "middle octets in [0,254]");
    check(d >= 1 && d <= 254, "last octet in [1,254]");
  }
}

void test_string_draw_is_dotted_quad() {
  utils::Random rng(5);
  for (int i = 0; i < 100; ++i) {
    std::string text = random_ipv4_str(rng, 0.5);
    check(utils::uint32_to_ip_str(utils::ip_str_to_uint32(text)) == text,
          "address string must be canonical dotted quad");
  }
}

} // namespace

int main() {
  test_reserved_block_table();
  test_is_reserved_boundaries();
  test_private_bias_one_stays_inside_blocks();
  test_private_bias_zero_stays_outside_blocks();
  test_string_draw_is_dotted_quad();
  std::cout << "logmine address space tests passed\n";
  return 0;
}
