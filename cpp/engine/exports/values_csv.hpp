#pragma once
/*
================================================================================
Engine: CSV Rendering of Shading Results
FILE: cpp/engine/exports/values_csv.hpp

Output format:
  <label_column><delim><column_1>[<delim><column_2>...]
  one row per element; a scalar renders as a single row labelled "0",
  an array with positional labels, a Series with its own index.
  Columns of one table align like elementwise arguments: scalars repeat,
  sequences must agree in length and labels (ShapeError otherwise).

Hardening:
  - Labels containing the delimiter, quotes or newlines are quoted.
  - NaN/Inf values export as an empty field (never "nan").
  - Stable ordering: rows follow the input alignment.
================================================================================
*/

#include "engine/core/settings.hpp"
#include "engine/series/series.hpp"

#include <ostream>
#include <string>
#include <vector>

namespace rowshade {

std::string csv_escape(const std::string& s, char delim);

std::string csv_double(double x, int precision);

struct CsvColumn {
  std::string name;
  const Values* values = nullptr;  // not owned
};

// One label column followed by `columns` in order.
// Throws ValidationError on invalid settings, ShapeError on misaligned columns.
void write_columns_csv(std::ostream& out,
                       const std::vector<CsvColumn>& columns,
                       const OutputSettings& opt = OutputSettings(),
                       const std::string& label_column = "label");

// Render `v` as CSV. Throws ValidationError on invalid settings.
std::string values_to_csv(const Values& v,
                          const std::string& value_column,
                          const OutputSettings& opt = OutputSettings(),
                          const std::string& label_column = "label");

void write_values_csv(std::ostream& out,
                      const Values& v,
                      const std::string& value_column,
                      const OutputSettings& opt = OutputSettings(),
                      const std::string& label_column = "label");

} // namespace rowshade
