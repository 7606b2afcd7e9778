#include <fzd/config_io.hpp>
#include <fzd/errors.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstddef>
#include <fstream>
#include <vector>
#include <spdlog/spdlog.h>

namespace fzd {

static std::string trim(std::string s) {
  auto not_space = [](unsigned char c){ return !std::isspace(c); };
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
  s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
  return s;
}

static std::vector<std::string> split_csv_line(const std::string& line) {
  std::vector<std::string> cols;
  std::string cur;
  for (char c : line) {
    if (c == ',') { cols.push_back(trim(cur)); cur.clear(); }
    else { cur.push_back(c); }
  }
  cols.push_back(trim(cur));
  return cols;
}

static std::string strip_comment(const std::string& line) {
  const auto pos = line.find('#');
  return pos == std::string::npos ? line : line.substr(0, pos);
}

namespace {

class Parser {
public:
  explicit Parser(LoadedConfig& cfg) : cfg_(cfg) {}

  void row(std::size_t line_no, const std::vector<std::string>& cols) {
    line_ = line_no;
    const std::string& kw = cols[0];
    if (kw == "range")           parse_range_(cols);
    else if (kw == "set")        parse_set_(cols);
    else if (kw == "rule")       parse_rule_(cols);
    else if (kw == "resolution") parse_resolution_(cols);
    else if (kw == "vehicle")    parse_vehicle_(cols);
    else if (kw == "sim")        parse_sim_(cols);
    else fail_("unknown keyword '" + kw + "'");
  }

private:
  [[noreturn]] void fail_(const std::string& msg) const {
    throw InvalidParameter("config line " + std::to_string(line_) + ": " + msg);
  }

  void arity_(const std::vector<std::string>& cols, std::size_t lo, std::size_t hi) const {
    if (cols.size() < lo || cols.size() > hi) {
      fail_("'" + cols[0] + "' expects " + std::to_string(lo - 1) +
            (lo == hi ? "" : ".." + std::to_string(hi - 1)) + " fields, got " +
            std::to_string(cols.size() - 1));
    }
  }

  double number_(const std::string& s) const {
    double v = 0.0;
    std::size_t idx = 0;
    try {
      v = std::stod(s, &idx);
    } catch (const std::exception&) {
      fail_("not a number: '" + s + "'");
    }
    if (idx != s.size()) fail_("not a number: '" + s + "'");
    return v;
  }

  LinguisticVariable& variable_(const std::string& name) const {
    if (name == "speed_error")  return cfg_.controller.speed_error;
    if (name == "acceleration") return cfg_.controller.acceleration;
    if (name == "throttle")     return cfg_.controller.throttle;
    fail_("unknown variable '" + name + "'");
  }

  void parse_range_(const std::vector<std::string>& cols) {
    arity_(cols, 4, 4);
    auto& var = variable_(cols[1]);
    var.lo = number_(cols[2]);
    var.hi = number_(cols[3]);
  }

  void parse_set_(const std::vector<std::string>& cols) {
    arity_(cols, 6, 7);
    auto& var = variable_(cols[1]);
    if (cols[2].empty()) fail_("set without a label");
    if (std::find(replaced_.begin(), replaced_.end(), var.name) == replaced_.end()) {
      var.sets.clear();
      replaced_.push_back(var.name);
    }
    std::vector<double> pts;
    for (std::size_t i = 3; i < cols.size(); ++i) pts.push_back(number_(cols[i]));
    MembershipFn fn{};
    try {
      fn = (pts.size() == 3) ? make_triangle(pts[0], pts[1], pts[2])
                             : make_trapezoid(pts[0], pts[1], pts[2], pts[3]);
    } catch (const InvalidParameter& e) {
      fail_("set '" + cols[2] + "': " + e.what());
    }
    var.sets.push_back(FuzzySet{cols[2], fn});
  }

  void parse_rule_(const std::vector<std::string>& cols) {
    arity_(cols, 4, 4);
    if (!rules_replaced_) {
      cfg_.controller.rules.clear();
      rules_replaced_ = true;
    }
    cfg_.controller.rules.push_back(Rule{cols[1], cols[2], cols[3]});
  }

  void parse_resolution_(const std::vector<std::string>& cols) {
    arity_(cols, 2, 2);
    const double v = number_(cols[1]);
    if (!std::isfinite(v) || v < 2.0 || v != std::floor(v)) fail_("resolution must be an integer >= 2");
    if (v > double(kMaxResolution)) {
      fail_("resolution must not exceed " + std::to_string(kMaxResolution));
    }
    cfg_.controller.resolution = static_cast<std::size_t>(v);
  }

  void parse_vehicle_(const std::vector<std::string>& cols) {
    arity_(cols, 3, 3);
    const double v = number_(cols[2]);
    if (cols[1] == "mass")                  cfg_.vehicle.mass = v;
    else if (cols[1] == "max_drive_force")  cfg_.vehicle.max_drive_force = v;
    else if (cols[1] == "drag_coefficient") cfg_.vehicle.drag_coefficient = v;
    else fail_("unknown vehicle key '" + cols[1] + "'");
  }

  void parse_sim_(const std::vector<std::string>& cols) {
    arity_(cols, 3, 3);
    if (cols[1] == "track") {
      if (cols[2] == "oval")         cfg_.sim.track = TrackShape::Oval;
      else if (cols[2] == "stadium") cfg_.sim.track = TrackShape::Stadium;
      else fail_("unknown track '" + cols[2] + "'");
      return;
    }
    const double v = number_(cols[2]);
    if (cols[1] == "dt") {
      if (!(v > 0.0)) fail_("sim dt must be positive");
      cfg_.sim.dt = v;
    } else if (cols[1] == "target_speed") {
      cfg_.sim.target_speed = v;
    } else {
      fail_("unknown sim key '" + cols[1] + "'");
    }
  }

  LoadedConfig& cfg_;
  std::size_t line_{0};
  std::vector<std::string> replaced_;
  bool rules_replaced_{false};
};

} // namespace

LoadedConfig load_config_from_stream(std::istream& in) {
  LoadedConfig cfg;
  Parser parser(cfg);
  std::string line;
  std::size_t line_no = 0;

  while (std::getline(in, line)) {
    ++line_no;
    const std::string raw = trim(strip_comment(line));
    if (raw.empty()) continue;
    parser.row(line_no, split_csv_line(raw));
  }

  validate_vehicle_params(cfg.vehicle);
  return cfg;
}

std::optional<LoadedConfig> load_config_file(const std::string& path) {
  std::ifstream f(path);
  if (!f) return std::nullopt;
  LoadedConfig cfg = load_config_from_stream(f);
  spdlog::info("loaded config '{}': {} rules, vehicle mass={} drive={} drag={}",
               path, cfg.controller.rules.size(), cfg.vehicle.mass,
               cfg.vehicle.max_drive_force, cfg.vehicle.drag_coefficient);
  return cfg;
}

} // namespace fzd
