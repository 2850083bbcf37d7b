// -----------------------------------------------------------------------------
// contact_plan.cpp - ContactPlanRouter: ION contact plan parsing + earliest
// arrival search.
//
// API: see include/dtchat/prediction.hpp
// -----------------------------------------------------------------------------
#include "dtchat/prediction.hpp"

#include <cstdlib>        // strtod for predictable number parsing
#include <functional>
#include <limits>
#include <memory>
#include <queue>
#include <sstream>
#include <utility>

namespace dtchat {

namespace {

struct Range {
  std::string from;
  std::string to;
  double start_s{0};
  double end_s{0};
  double owlt_s{0};
};

// strtod accepts the leading '+' ION uses for relative times.
bool parse_number(const std::string& s, double& out) {
  if (s.empty()) return false;
  char* e = nullptr;
  const double v = std::strtod(s.c_str(), &e);
  if (!e || *e) return false;
  out = v;
  return true;
}

} // namespace

NodeIndex ContactPlanRouter::intern(const std::string& name) {
  auto it = index_.find(name);
  if (it != index_.end()) return it->second;
  const NodeIndex idx = static_cast<NodeIndex>(names_.size());
  names_.push_back(name);
  index_[name] = idx;
  return idx;
}

// -----------------------------------------------------------------------------
// parse() - read "a contact" / "a range" lines.
// POLICY:
//   - Blank lines, '#' comments and other ionadmin commands are skipped.
//   - A contact or range line with missing/non-numeric fields fails the whole
//     plan; a half-loaded topology would give wrong predictions.
//   - Ranges are symmetric: a range A->B also covers contacts B->A.
// -----------------------------------------------------------------------------
bool ContactPlanRouter::parse(std::istream& in, std::unique_ptr<ContactPlanRouter>& out,
                              std::string& err) {
  auto r = std::make_unique<ContactPlanRouter>(ParsedOnly{});
  std::vector<Range> ranges;
  std::vector<std::pair<std::string, std::string>> contact_names;

  std::string line;
  size_t lineno = 0;
  while (std::getline(in, line)) {
    ++lineno;
    const size_t hash = line.find('#');
    if (hash != std::string::npos) line.erase(hash);

    std::istringstream ls(line);
    std::vector<std::string> tok;
    std::string t;
    while (ls >> t) tok.push_back(t);
    if (tok.empty()) continue;
    if (tok[0] != "a" || tok.size() < 2) continue;
    if (tok[1] != "contact" && tok[1] != "range") continue;

    if (tok.size() < 7) {
      err = "line " + std::to_string(lineno) + ": expected 7 fields";
      return false;
    }

    double start = 0, end = 0, value = 0;
    if (!parse_number(tok[2], start) || !parse_number(tok[3], end) || !parse_number(tok[6], value)) {
      err = "line " + std::to_string(lineno) + ": bad number";
      return false;
    }
    if (end < start) {
      err = "line " + std::to_string(lineno) + ": end before start";
      return false;
    }

    if (tok[1] == "contact") {
      Contact c;
      c.from = r->intern(tok[4]);
      c.to = r->intern(tok[5]);
      c.start_s = start;
      c.end_s = end;
      c.rate_bps = value;
      r->contacts_.push_back(c);
      contact_names.emplace_back(tok[4], tok[5]);
    } else {
      r->intern(tok[4]);
      r->intern(tok[5]);
      ranges.push_back(Range{tok[4], tok[5], start, end, value});
    }
  }

  // Attach one-way light time from the range covering each contact's start.
  for (size_t i = 0; i < r->contacts_.size(); ++i) {
    Contact& c = r->contacts_[i];
    const auto& names = contact_names[i];
    for (const auto& rg : ranges) {
      const bool same_pair = (rg.from == names.first && rg.to == names.second) ||
                             (rg.from == names.second && rg.to == names.first);
      if (same_pair && rg.start_s <= c.start_s && c.start_s < rg.end_s) {
        c.owlt_s = rg.owlt_s;
        break;
      }
    }
  }

  out = std::move(r);
  return true;
}

std::optional<NodeIndex> ContactPlanRouter::node_index(const std::string& name) const {
  auto it = index_.find(name);
  if (it == index_.end()) return std::nullopt;
  return it->second;
}

// -----------------------------------------------------------------------------
// earliest_arrival() - Dijkstra over arrival times.
// A contact u->v is usable from time t when transmission can start at
// max(t, start), needs size/rate seconds, and finishes before the contact
// closes. Arrival at v = finish + owlt. Arrival times only grow along a path,
// so the first time dst is settled is the earliest.
// -----------------------------------------------------------------------------
std::optional<double> ContactPlanRouter::earliest_arrival(NodeIndex src, NodeIndex dst,
                                                          double size_bytes, double at_s) const {
  const size_t n = names_.size();
  if (src >= n || dst >= n) return std::nullopt;
  if (src == dst) return at_s;

  const double INF = std::numeric_limits<double>::infinity();
  std::vector<double> best(n, INF);
  std::vector<bool> done(n, false);

  using Item = std::pair<double, NodeIndex>;
  std::priority_queue<Item, std::vector<Item>, std::greater<Item>> pq;
  best[src] = at_s;
  pq.push(Item(at_s, src));

  while (!pq.empty()) {
    const Item top = pq.top();
    pq.pop();
    const double t = top.first;
    const NodeIndex u = top.second;
    if (done[u]) continue;
    done[u] = true;
    if (u == dst) return t;

    for (const auto& c : contacts_) {
      if (c.from != u || done[c.to]) continue;
      if (c.rate_bps <= 0 || c.end_s <= t) continue;
      const double begin = t > c.start_s ? t : c.start_s;
      const double finish = begin + size_bytes / c.rate_bps;
      if (finish > c.end_s) continue;          // does not fit in the window
      const double arrive = finish + c.owlt_s;
      if (arrive < best[c.to]) {
        best[c.to] = arrive;
        pq.push(Item(arrive, c.to));
      }
    }
  }
  return std::nullopt;
}

} // namespace dtchat
