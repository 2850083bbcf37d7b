#include "dtchat/endpoint.hpp"

#include <cctype>

namespace dtchat {

const char* kind_name(EndpointKind k) {
  switch (k) {
    case EndpointKind::Tcp: return "tcp";
    case EndpointKind::Udp: return "udp";
    case EndpointKind::Bp:  return "bp";
  }
  return "unknown";
}

static bool is_blank(char c) { return c == ' ' || c == '\t'; }

static std::string lower_ascii(std::string s) {
  for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

// -----------------------------------------------------------------------------
// parse() - "<kind><blanks><address>"
// POLICY:
//   - Reject on unknown kind, missing address, or blanks inside the address.
//   - Only write `out` once everything validated.
// -----------------------------------------------------------------------------
bool Endpoint::parse(const std::string& text, Endpoint& out) {
  size_t b = 0, e = text.size();
  while (b < e && is_blank(text[b])) ++b;
  while (e > b && is_blank(text[e - 1])) --e;
  if (b == e) return false;

  size_t k = b;
  while (k < e && !is_blank(text[k])) ++k;
  if (k == e) return false;                 // kind only, no address

  const std::string kw = lower_ascii(text.substr(b, k - b));
  EndpointKind kind;
  if      (kw == "tcp") kind = EndpointKind::Tcp;
  else if (kw == "udp") kind = EndpointKind::Udp;
  else if (kw == "bp")  kind = EndpointKind::Bp;
  else return false;

  size_t a = k;
  while (a < e && is_blank(text[a])) ++a;
  for (size_t i = a; i < e; ++i) {
    if (is_blank(text[i])) return false;    // address is a single token
  }

  out.kind = kind;
  out.address = text.substr(a, e - a);
  return true;
}

std::string Endpoint::to_string() const {
  return std::string(kind_name(kind)) + " " + address;
}

std::string ip_of(const std::string& address) {
  const size_t colon = address.rfind(':');
  if (colon == std::string::npos) return address;
  return address.substr(0, colon);
}

} // namespace dtchat
