#include "dtchat/prediction.hpp"

#include <fstream>

namespace dtchat {

const char* predict_status_name(PredictStatus s) {
  switch (s) {
    case PredictStatus::Ok:              return "ok";
    case PredictStatus::NoRouteFound:    return "no_route";
    case PredictStatus::InvalidEndpoint: return "invalid_endpoint";
  }
  return "unknown";
}

std::string node_name_from_bp_address(const std::string& bp_address) {
  static const std::string PREFIX = "ipn:";
  if (bp_address.compare(0, PREFIX.size(), PREFIX) != 0) return bp_address;
  const std::string rest = bp_address.substr(PREFIX.size());
  const size_t dot = rest.find('.');
  if (dot == std::string::npos) return bp_address;
  return rest.substr(0, dot);
}

DeliveryOracle::DeliveryOracle(std::unique_ptr<Router> router, Time plan_start)
: router_(std::move(router)), plan_start_(plan_start) {}

bool DeliveryOracle::load(const std::string& path, std::shared_ptr<DeliveryOracle>& out,
                          std::string& err) {
  std::ifstream in(path);
  if (!in) {
    err = "cannot open contact plan '" + path + "'";
    return false;
  }
  std::unique_ptr<ContactPlanRouter> router;
  std::string perr;
  if (!ContactPlanRouter::parse(in, router, perr)) {
    err = path + ": " + perr;
    return false;
  }
  out = std::make_shared<DeliveryOracle>(std::move(router), Time::now());
  return true;
}

PredictStatus DeliveryOracle::predict(const std::string& src_address, const std::string& dst_address,
                                      double size_bytes, Time& out, std::string& err) const {
  return predict_at(src_address, dst_address, size_bytes, Time::now(), out, err);
}

// -----------------------------------------------------------------------------
// predict_at()
// PRE:  addresses are BP endpoint addresses ("ipn:<node>.<service>").
// OUT:  Ok + arrival instant, InvalidEndpoint if a node is not in the plan,
//       NoRouteFound if the plan has no path in time.
// -----------------------------------------------------------------------------
PredictStatus DeliveryOracle::predict_at(const std::string& src_address,
                                         const std::string& dst_address,
                                         double size_bytes, const Time& send_time,
                                         Time& out, std::string& err) const {
  const std::string src_name = node_name_from_bp_address(src_address);
  const std::string dst_name = node_name_from_bp_address(dst_address);

  std::optional<NodeIndex> src;
  if (router_) src = router_->node_index(src_name);
  if (!src) {
    err = "Source ION ID '" + src_name + "' not found in contact plan";
    return PredictStatus::InvalidEndpoint;
  }
  const auto dst = router_->node_index(dst_name);
  if (!dst) {
    err = "Destination ION ID '" + dst_name + "' not found in contact plan";
    return PredictStatus::InvalidEndpoint;
  }

  const double at_s = send_time.seconds() - plan_start_.seconds();
  const auto arrival = router_->earliest_arrival(*src, *dst, size_bytes, at_s);
  if (!arrival) {
    err = "No route found from ION " + src_name + " to ION " + dst_name;
    return PredictStatus::NoRouteFound;
  }

  out = Time::from_seconds(plan_start_.seconds() + *arrival);
  return PredictStatus::Ok;
}

PredictionState PredictionState::from_contact_plan(const std::string& cp_path) {
  if (cp_path.empty()) return disabled();
  std::shared_ptr<DeliveryOracle> oracle;
  std::string err;
  if (!DeliveryOracle::load(cp_path, oracle, err)) return error(err);
  return enabled(oracle);
}

std::string PredictionState::describe() const {
  switch (mode) {
    case PredictionMode::Enabled:  return "prediction enabled";
    case PredictionMode::Disabled: return "prediction disabled";
    case PredictionMode::Error:    return "prediction error: " + reason;
  }
  return "prediction unknown";
}

} // namespace dtchat
