#include "foa_codec/metrics.hpp"
#include "foa_codec/json_bridge.hpp"
#include <cmath> // std::isfinite
#include <sstream>

namespace foa {

static inline double safe_num(double v){ return std::isfinite(v) ? v : 0.0; }

std::string RunStats::to_json() const {
  static constexpr EntityKind kinds[] = {EntityKind::StartObject, EntityKind::StartArray,
                                         EntityKind::EndObject, EntityKind::EndArray,
                                         EntityKind::Data};
  std::ostringstream o;
  o << "{";
  o << "\"entities\":" << entities << ",";
  o << "\"bytes\":" << bytes << ",";
  o << "\"wall_ms\":" << safe_num(wall_ms) << ",";
  o << "\"throughput_mb_s\":" << safe_num(throughput_mb_s) << ",";
  o << "\"entities_per_sec\":" << safe_num(entities_per_sec) << ",";

  o << "\"by_kind\":{";
  for (std::size_t i = 0; i < by_kind.size(); ++i) {
    if (i) o << ",";
    o << json_quote(to_string(kinds[i])) << ":" << by_kind[i];
  }
  o << "},";

  o << "\"buffer\":{"
    << "\"grows\":" << buffer_grows << ","
    << "\"compactions\":" << buffer_compactions << ","
    << "\"high_water\":" << buffer_high_water
    << "},";

  o << "\"stages\":[";
  for (std::size_t i = 0; i < stages.size(); ++i) {
    if (i) o << ",";
    o << "{\"stage\":" << json_quote(stages[i].name)
      << ",\"duration_us\":" << stages[i].duration_us << "}";
  }
  o << "]";

  o << "}";
  return o.str();
}

}
