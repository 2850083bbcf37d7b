#ifndef DTCHAT_ENDPOINT_HPP
#define DTCHAT_ENDPOINT_HPP
/**
 * @file endpoint.hpp
 * @brief Transport address: kind tag + address string, with canonical text form.
 *
 * Canonical form is "<kind> <address>", kind lowercase:
 *   "tcp 127.0.0.1:7001"   "udp 10.0.0.2:7002"   "bp ipn:12.0"
 * This is the exact string carried in the wire envelope's source_endpoint.
 */

#include <cstdint>
#include <string>
#include <utility>

namespace dtchat {

enum class EndpointKind : uint8_t {
  Tcp = 0,
  Udp = 1,
  Bp  = 2,   ///< Bundle Protocol (DTN); address is a node EID such as "ipn:1.0"
};

/// "tcp", "udp" or "bp".
const char* kind_name(EndpointKind k);

struct Endpoint {
  EndpointKind kind{EndpointKind::Tcp};
  std::string  address;

  Endpoint() = default;
  Endpoint(EndpointKind k, std::string addr) : kind(k), address(std::move(addr)) {}

  /**
   * @brief Parse "<kind> <address>".
   *
   * Kind keyword is case-insensitive, separated from the address by one or
   * more blanks. Leading/trailing blanks are ignored. The address must be a
   * single non-empty token.
   *
   * @retval true  @p out holds the parsed endpoint.
   * @retval false malformed text; @p out is left untouched.
   */
  static bool parse(const std::string& text, Endpoint& out);

  /// Canonical "<kind> <address>".
  std::string to_string() const;

  bool operator==(const Endpoint& o) const { return kind == o.kind && address == o.address; }
  bool operator!=(const Endpoint& o) const { return !(*this == o); }
};

/// Host part of "host:port" (text before the last ':'), or the whole address.
std::string ip_of(const std::string& address);

} // namespace dtchat

#endif // DTCHAT_ENDPOINT_HPP
