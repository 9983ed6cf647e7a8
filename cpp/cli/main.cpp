/*
================================================================================
CLI: Main Entry Point (rowshade_cli)
FILE: cpp/cli/main.cpp

Purpose:
  - Command-line access to the row-to-row shading geometry:
    * ground angle / masking angle at a point on a row
    * Passias average masking angle and sky-diffuse loss
    * projected solar zenith angle for a tracker axis
    * shaded fraction between adjacent rows

Usage:
  rowshade_cli <command> [--option value ...]

  A comma-separated option value (e.g. --solar-zenith 60,79,90) is evaluated
  elementwise; all list options of one call must have the same length.

Output:
  CSV on stdout (label,value). Logs go through engine/core/logging.

Exit codes:
  0 success, 1 invalid arguments, 2 validation failed, 3 computation failed
  A command line that cannot be read (UsageError) or lists that cannot be
  aligned (ShapeError) is 1; readable values out of range are 2.
================================================================================
*/

#include "engine/core/errors.hpp"
#include "engine/core/logging.hpp"
#include "engine/exports/values_csv.hpp"
#include "engine/shading/shading_all.hpp"

#include <cerrno>
#include <climits>
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <map>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

using namespace rowshade;

enum ExitCode {
  SUCCESS = 0,
  INVALID_ARGS = 1,
  VALIDATION_FAILED = 2,
  COMPUTATION_FAILED = 3
};

namespace {

// Malformed command line: unknown token, missing option or unreadable value.
class UsageError : public RowShadeError {
 public:
  explicit UsageError(std::string msg) : RowShadeError(std::move(msg)) {}
};

void print_help() {
  std::cout << R"(
rowshade_cli - row-to-row shading geometry for collector arrays

Usage:
  rowshade_cli <command> [--option value ...]

Commands:
  ground-angle     --surface-tilt --gcr --slant-height
  masking-angle    --surface-tilt --gcr [--slant-height 0]
  passias          --surface-tilt --gcr
                   (average masking angle and sky-diffuse loss)
  sky-diffuse      --masking-angle
  psza             --solar-zenith --solar-azimuth --axis-tilt --axis-azimuth
  shaded-fraction  --shaded-row-rotation [--shading-row-rotation]
                   --collector-width --pitch --solar-zenith
                   [--surface-to-axis-offset 0] [--cross-axis-slope 0]
                   [--solar-azimuth 180] [--axis-azimuth 90] [--axis-tilt 0]
  help             Show this help message

Global options:
  --precision N    digits after the decimal point (default 6)
  --verbose        log at DEBUG level
  --quiet          log errors only

Angles are in degrees. A comma list (e.g. --solar-zenith 60,79,90) is
evaluated elementwise.

Examples:
  rowshade_cli passias --surface-tilt 20 --gcr 0.5
  rowshade_cli shaded-fraction --shaded-row-rotation 30 --collector-width 5.7735 \
      --pitch 5 --solar-zenith 60,79,90 --solar-azimuth 90 --axis-azimuth 180

Exit Codes:
  0 - Success
  1 - Invalid arguments (unknown command or option syntax, missing option,
      unreadable number, list options of different lengths)
  2 - Validation failed (values out of range)
  3 - Computation failed
)";
}

class Options {
 public:
  // Throws UsageError on a malformed command line.
  Options(int argc, char** argv, int first) {
    for (int i = first; i < argc; ++i) {
      const std::string key = argv[i];
      if (key.rfind("--", 0) != 0) {
        throw UsageError("unexpected argument '" + key + "'");
      }
      const std::string name = key.substr(2);
      if (name == "verbose" || name == "quiet") {
        flags_[name] = true;
        continue;
      }
      if (i + 1 >= argc) {
        throw UsageError("option '" + key + "' needs a value");
      }
      values_[name] = argv[++i];
    }
  }

  bool flag(const std::string& name) const { return flags_.count(name) != 0; }

  bool has(const std::string& name) const { return values_.count(name) != 0; }

  const std::string& raw(const std::string& name) const {
    const auto it = values_.find(name);
    if (it == values_.end()) throw UsageError("missing required option --" + name);
    consumed_[name] = true;
    return it->second;
  }

  Values get(const std::string& name) const { return parse_values(name, raw(name)); }

  Values get_or(const std::string& name, double fallback) const {
    return has(name) ? get(name) : Values(fallback);
  }

  int get_int(const std::string& name) const {
    const double v = parse_double(name, raw(name));
    if (v != std::floor(v) || v < INT_MIN || v > INT_MAX) {
      throw UsageError("--" + name + ": '" + raw(name) + "' is not an integer");
    }
    return static_cast<int>(v);
  }

  std::vector<std::string> unused() const {
    std::vector<std::string> out;
    for (const auto& kv : values_) {
      if (!consumed_.count(kv.first)) out.push_back(kv.first);
    }
    return out;
  }

 private:
  static double parse_double(const std::string& name, const std::string& tok) {
    if (tok.empty()) throw UsageError("--" + name + ": empty number");
    errno = 0;
    char* end = nullptr;
    const double v = std::strtod(tok.c_str(), &end);
    if (errno != 0 || end == tok.c_str() || *end != '\0') {
      throw UsageError("--" + name + ": '" + tok + "' is not a number");
    }
    return v;
  }

  static Values parse_values(const std::string& name, const std::string& text) {
    if (text.find(',') == std::string::npos) return Values(parse_double(name, text));

    std::vector<double> out;
    std::stringstream ss(text);
    std::string tok;
    while (std::getline(ss, tok, ',')) out.push_back(parse_double(name, tok));
    return Values(std::move(out));
  }

  std::map<std::string, std::string> values_;
  std::map<std::string, bool> flags_;
  mutable std::map<std::string, bool> consumed_;
};

void require_gcr(const Values& gcr) {
  for (std::size_t i = 0; i < gcr.size(); ++i) {
    if (!(gcr.at(i) >= 0.0)) throw ValidationError("--gcr must be >= 0");
  }
}

void emit(const Values& v, const std::string& column, const EvalSettings& settings) {
  write_values_csv(std::cout, v, column, settings.output);
}

int cmd_ground_angle(const Options& opt, const EvalSettings& settings) {
  const Values gcr = opt.get("gcr");
  require_gcr(gcr);
  const Values out = ground_angle(opt.get("surface-tilt"), gcr, opt.get("slant-height"));
  emit(out, "ground_angle_deg", settings);
  return ExitCode::SUCCESS;
}

int cmd_masking_angle(const Options& opt, const EvalSettings& settings) {
  const Values gcr = opt.get("gcr");
  require_gcr(gcr);
  const Values out = masking_angle(opt.get("surface-tilt"), gcr, opt.get_or("slant-height", 0.0));
  emit(out, "masking_angle_deg", settings);
  return ExitCode::SUCCESS;
}

int cmd_passias(const Options& opt, const EvalSettings& settings) {
  const Values gcr = opt.get("gcr");
  require_gcr(gcr);
  const Values avg = masking_angle_passias(opt.get("surface-tilt"), gcr);
  const Values loss = sky_diffuse_passias(avg);
  write_columns_csv(std::cout,
                    {{"average_masking_angle_deg", &avg}, {"sky_diffuse_loss", &loss}},
                    settings.output);
  return ExitCode::SUCCESS;
}

int cmd_sky_diffuse(const Options& opt, const EvalSettings& settings) {
  emit(sky_diffuse_passias(opt.get("masking-angle")), "sky_diffuse_loss", settings);
  return ExitCode::SUCCESS;
}

int cmd_psza(const Options& opt, const EvalSettings& settings) {
  const Values out = projected_solar_zenith_angle(
      opt.get("solar-zenith"),
      opt.get_or("solar-azimuth", settings.tracker.solar_azimuth_deg),
      opt.get_or("axis-tilt", settings.tracker.axis_tilt_deg),
      opt.get_or("axis-azimuth", settings.tracker.axis_azimuth_deg));
  emit(out, "projected_solar_zenith_deg", settings);
  return ExitCode::SUCCESS;
}

int cmd_shaded_fraction(const Options& opt, const EvalSettings& settings) {
  ShadedFraction1dInputs in;
  in.apply_defaults(settings.tracker);
  in.shaded_row_rotation = opt.get("shaded-row-rotation");
  if (opt.has("shading-row-rotation")) {
    in.shading_row_rotation = opt.get("shading-row-rotation");
  } else {
    log_debug("shading-row-rotation not given; rows rotate in unison");
  }
  in.surface_to_axis_offset = opt.get_or("surface-to-axis-offset", 0.0);
  const Values width = opt.get("collector-width");
  const Values pitch = opt.get("pitch");
  for (std::size_t i = 0; i < width.size(); ++i) {
    if (!(width.at(i) > 0.0)) throw ValidationError("--collector-width must be > 0");
  }
  for (std::size_t i = 0; i < pitch.size(); ++i) {
    if (!(pitch.at(i) > 0.0)) throw ValidationError("--pitch must be > 0");
  }
  in.collector_width = width;
  in.solar_zenith = opt.get("solar-zenith");
  in.cross_axis_slope = opt.get_or("cross-axis-slope", 0.0);
  in.pitch = pitch;
  if (opt.has("solar-azimuth")) in.solar_azimuth = opt.get("solar-azimuth");
  if (opt.has("axis-azimuth")) in.axis_azimuth = opt.get("axis-azimuth");
  if (opt.has("axis-tilt")) in.axis_tilt = opt.get("axis-tilt");

  emit(shaded_fraction1d(in), "shaded_fraction", settings);
  return ExitCode::SUCCESS;
}

using Command = int (*)(const Options&, const EvalSettings&);

const std::map<std::string, Command>& commands() {
  static const std::map<std::string, Command> table = {
      {"ground-angle", &cmd_ground_angle},
      {"masking-angle", &cmd_masking_angle},
      {"passias", &cmd_passias},
      {"sky-diffuse", &cmd_sky_diffuse},
      {"psza", &cmd_psza},
      {"shaded-fraction", &cmd_shaded_fraction},
  };
  return table;
}

} // namespace

int main(int argc, char** argv) {
  const std::string cmd = (argc >= 2) ? std::string(argv[1]) : "help";

  if (cmd == "help" || cmd == "-h" || cmd == "--help") {
    print_help();
    return ExitCode::SUCCESS;
  }

  const auto it = commands().find(cmd);
  if (it == commands().end()) {
    std::cerr << "Unknown command: " << cmd << "\n";
    std::cerr << "Run 'rowshade_cli help' for usage information.\n";
    return ExitCode::INVALID_ARGS;
  }

  EvalSettings settings = EvalSettings::defaults();
  try {
    const Options opt(argc, argv, 2);

    if (opt.flag("verbose")) settings.log_level = LogLevel::DEBUG;
    if (opt.flag("quiet")) settings.log_level = LogLevel::ERROR;
    if (opt.has("precision")) settings.output.precision = opt.get_int("precision");
    settings.validate_or_throw();
    set_log_level(settings.log_level);

    log_debug("rowshade_cli " + cmd);
    const int rc = it->second(opt, settings);

    for (const auto& name : opt.unused()) log_warn("ignored option --" + name);
    return rc;

  } catch (const UsageError& e) {
    log_error(std::string("invalid arguments: ") + e.what());
    std::cerr << "Run 'rowshade_cli help' for usage information.\n";
    return ExitCode::INVALID_ARGS;
  } catch (const ShapeError& e) {
    log_error(std::string("shape mismatch: ") + e.what());
    return ExitCode::INVALID_ARGS;
  } catch (const ValidationError& e) {
    log_error(std::string("validation failed: ") + e.what());
    return ExitCode::VALIDATION_FAILED;
  } catch (const std::exception& e) {
    log_error(std::string("error: ") + e.what());
    return ExitCode::COMPUTATION_FAILED;
  }
}
