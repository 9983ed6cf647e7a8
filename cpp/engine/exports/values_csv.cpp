#include "engine/exports/values_csv.hpp"

#include "engine/core/angles.hpp"
#include "engine/core/errors.hpp"
#include "engine/series/elementwise.hpp"

#include <iomanip>
#include <sstream>

namespace rowshade {

std::string csv_escape(const std::string& s, char delim) {
  bool needs_quote = false;
  for (char c : s) {
    if (c == delim || c == '"' || c == '\n' || c == '\r') {
      needs_quote = true;
      break;
    }
  }
  if (!needs_quote) return s;

  std::string out = "\"";
  for (char c : s) {
    if (c == '"') out += "\"\"";
    else out += c;
  }
  out += "\"";
  return out;
}

std::string csv_double(double x, int precision) {
  if (!is_finite(x)) return "";
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(precision) << x;
  return oss.str();
}

void write_columns_csv(std::ostream& out,
                       const std::vector<CsvColumn>& columns,
                       const OutputSettings& opt,
                       const std::string& label_column) {
  opt.validate_or_throw();
  std::vector<const Values*> args;
  args.reserve(columns.size());
  for (const CsvColumn& c : columns) {
    if (c.values == nullptr) throw ValidationError("CSV: column '" + c.name + "' has no values");
    args.push_back(c.values);
  }
  const BroadcastShape shape = resolve_shape("write_columns_csv", args);
  const char d = opt.delimiter;

  if (opt.include_header) {
    out << csv_escape(label_column, d);
    for (const CsvColumn& c : columns) out << d << csv_escape(c.name, d);
    out << "\n";
  }

  const Index* labels = shape.labels ? &shape.labels->index() : nullptr;
  for (std::size_t i = 0; i < shape.size; ++i) {
    out << csv_escape(labels ? (*labels)[i] : std::to_string(i), d);
    for (const Values* v : args) out << d << csv_double(v->at(i), opt.precision);
    out << "\n";
  }
}

void write_values_csv(std::ostream& out,
                      const Values& v,
                      const std::string& value_column,
                      const OutputSettings& opt,
                      const std::string& label_column) {
  write_columns_csv(out, {CsvColumn{value_column, &v}}, opt, label_column);
}

std::string values_to_csv(const Values& v,
                          const std::string& value_column,
                          const OutputSettings& opt,
                          const std::string& label_column) {
  std::ostringstream oss;
  write_values_csv(oss, v, value_column, opt, label_column);
  return oss.str();
}

} // namespace rowshade
