/**
 * @file prediction.hpp
 * @brief Delivery-time oracle: "if I send N bytes over BP now, when does it land?"
 *
 * @details
 * ## Pieces
 * - `Router` - the routing-engine contract: node lookup by name and an
 *   earliest-arrival query over a contact plan. Implementations are immutable
 *   after construction and every query is `const`, so one instance is shared
 *   across threads without locking.
 * - `ContactPlanRouter` - built-in Router over an ION-style contact plan.
 * - `DeliveryOracle` - adapter the engine talks to. Converts BP endpoint
 *   addresses ("ipn:12.0") into router node names ("12"), converts wall-clock
 *   time to plan-relative seconds and back.
 * - `PredictionState` - Enabled(oracle) / Error(reason) / Disabled, decided
 *   once at startup.
 *
 * ## Contact plan grammar (subset of ION ionadmin)
 * ```
 *   # comment
 *   a contact +<start_s> +<end_s> <from> <to> <rate_bytes_per_s>
 *   a range   +<start_s> +<end_s> <from> <to> <owlt_s>
 * ```
 * Times are seconds relative to plan start (the leading '+' is optional).
 * Unknown commands are ignored. Node names are taken as they appear.
 *
 * ## Policy
 * Prediction is advisory. Any failure leaves `predicted_arrival_time` unset;
 * the send itself is never affected.
 */
#ifndef DTCHAT_PREDICTION_HPP
#define DTCHAT_PREDICTION_HPP

#include <cstddef>
#include <cstdint>
#include <istream>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "time.hpp"

namespace dtchat {

using NodeIndex = uint32_t;

/**
 * @brief Routing-engine contract.
 */
class Router {
public:
  virtual ~Router() = default;

  /// Index of the node named @p name, or none if not in the topology.
  virtual std::optional<NodeIndex> node_index(const std::string& name) const = 0;

  /**
   * @brief Earliest arrival of a bundle.
   * @param src,dst    node indices
   * @param size_bytes bundle size
   * @param at_s       send time, seconds relative to plan start
   * @return arrival time in plan-relative seconds, or none if no route exists.
   */
  virtual std::optional<double> earliest_arrival(NodeIndex src, NodeIndex dst,
                                                 double size_bytes, double at_s) const = 0;
};

/// One scheduled transmission window.
struct Contact {
  NodeIndex from{0};
  NodeIndex to{0};
  double start_s{0};
  double end_s{0};
  double rate_bps{0};   ///< bytes per second
  double owlt_s{0};     ///< one-way light time from the matching range line
};

/**
 * @brief Router over a parsed contact plan (label-setting earliest-arrival search).
 */
class ContactPlanRouter : public Router {
  struct ParsedOnly { explicit ParsedOnly() = default; };

public:
  /// Built only through parse(); the tag keeps it out of reach elsewhere.
  explicit ContactPlanRouter(ParsedOnly) {}

  /**
   * @brief Parse a contact plan.
   * @retval false a contact/range line is malformed; @p err names the line.
   */
  static bool parse(std::istream& in, std::unique_ptr<ContactPlanRouter>& out, std::string& err);

  std::optional<NodeIndex> node_index(const std::string& name) const override;
  std::optional<double> earliest_arrival(NodeIndex src, NodeIndex dst,
                                         double size_bytes, double at_s) const override;

  size_t node_count() const { return names_.size(); }
  const std::vector<Contact>& contacts() const { return contacts_; }

private:
  NodeIndex intern(const std::string& name);

  std::vector<std::string> names_;
  std::map<std::string, NodeIndex> index_;
  std::vector<Contact> contacts_;
};

enum class PredictStatus : uint8_t {
  Ok = 0,
  NoRouteFound,
  InvalidEndpoint,
};

const char* predict_status_name(PredictStatus s);

/// "ipn:12.0" -> "12". Anything else is returned unchanged.
std::string node_name_from_bp_address(const std::string& bp_address);

/**
 * @brief Oracle adapter consumed by the engine.
 *
 * `plan_start` anchors plan-relative seconds to wall-clock time. The oracle
 * built by `load()` uses the load instant.
 */
class DeliveryOracle {
public:
  DeliveryOracle(std::unique_ptr<Router> router, Time plan_start);

  /// Read and parse a contact plan file. Plan start is now.
  static bool load(const std::string& path, std::shared_ptr<DeliveryOracle>& out, std::string& err);

  /**
   * @brief Predict arrival of @p size_bytes sent now from @p src_address to @p dst_address.
   * @param out  predicted arrival on Ok
   * @param err  reason otherwise
   */
  PredictStatus predict(const std::string& src_address, const std::string& dst_address,
                        double size_bytes, Time& out, std::string& err) const;

  /// Same query at an explicit send instant.
  PredictStatus predict_at(const std::string& src_address, const std::string& dst_address,
                           double size_bytes, const Time& send_time,
                           Time& out, std::string& err) const;

  const Time& plan_start() const { return plan_start_; }

private:
  std::unique_ptr<Router> router_;
  Time plan_start_;
};

enum class PredictionMode : uint8_t { Disabled = 0, Enabled = 1, Error = 2 };

/**
 * @brief Process-wide prediction setting, fixed at startup.
 */
struct PredictionState {
  PredictionMode mode{PredictionMode::Disabled};
  std::shared_ptr<const DeliveryOracle> oracle;  ///< Enabled only
  std::string reason;                            ///< Error only

  static PredictionState enabled(std::shared_ptr<const DeliveryOracle> o) {
    PredictionState s;
    s.mode = PredictionMode::Enabled;
    s.oracle = std::move(o);
    return s;
  }
  static PredictionState error(std::string why) {
    PredictionState s;
    s.mode = PredictionMode::Error;
    s.reason = std::move(why);
    return s;
  }
  static PredictionState disabled() { return PredictionState{}; }

  /// Disabled when @p cp_path is empty, Error when loading fails, else Enabled.
  static PredictionState from_contact_plan(const std::string& cp_path);

  /// "prediction enabled", "prediction disabled", "prediction error: <reason>".
  std::string describe() const;
};

} // namespace dtchat

#endif // DTCHAT_PREDICTION_HPP
