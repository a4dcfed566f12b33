#include "progress_parser.h"

#include <cstdlib>

#include "string_utils.h"

namespace {
bool ParseNumber(const std::string& text, size_t pos, double* value) {
  if (pos >= text.size()) {
    return false;
  }
  const char* begin = text.c_str() + pos;
  char* end = nullptr;
  const double parsed = std::strtod(begin, &end);
  if (end == begin) {
    return false;
  }
  *value = parsed;
  return true;
}

// Number following "<key> =" somewhere in text.
bool ValueAfter(const std::string& text, const std::string& key, double* value) {
  const size_t at = text.find(key);
  if (at == std::string::npos) {
    return false;
  }
  size_t pos = text.find('=', at + key.size());
  if (pos == std::string::npos) {
    return false;
  }
  return ParseNumber(text, pos + 1, value);
}
}  // namespace

void ParseProgressLine(ProgressEvent* event) {
  if (!event) {
    return;
  }
  const std::string line = caseflow::Trim(event->text);
  double value = 0.0;

  if (caseflow::StartsWith(line, "Time =") && ParseNumber(line, 6, &value)) {
    event->sim_time = value;
    return;
  }
  if (caseflow::StartsWith(line, "ExecutionTime =")) {
    if (ValueAfter(line, "ExecutionTime", &value)) {
      event->execution_time = value;
    }
    return;
  }
  const size_t solving = line.find("Solving for ");
  if (solving != std::string::npos) {
    const size_t name_start = solving + 12;
    const size_t comma = line.find(',', name_start);
    if (comma == std::string::npos) {
      return;
    }
    if (ValueAfter(line, "Initial residual", &value)) {
      event->residual_field = caseflow::Trim(line.substr(name_start, comma - name_start));
      event->residual = value;
    }
  }
}
