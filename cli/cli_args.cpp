#include "cli_args.h"

#include <stdexcept>
#include <string>

namespace sqlc::cli {

namespace {

bool parse_delimiter(const std::string& value, char& out) {
  if (value == "\\t" || value == "tab") {
    out = '\t';
    return true;
  }
  if (value.size() != 1) return false;
  out = value[0];
  return true;
}

bool parse_max_rows(const std::string& value, size_t& out) {
  try {
    size_t pos = 0;
    unsigned long long parsed = std::stoull(value, &pos);
    if (pos != value.size()) return false;
    out = static_cast<size_t>(parsed);
    return true;
  } catch (const std::logic_error&) {
    return false;
  }
}

void add_phase(std::vector<sqlc::Phase>& phases, sqlc::Phase phase) {
  for (const auto& existing : phases) {
    if (existing == phase) return;
  }
  phases.push_back(phase);
}

/// Accepts a comma-separated list of tokens, ast, ir, plan or all.
bool parse_phases(const std::string& value, std::vector<sqlc::Phase>& out) {
  const sqlc::Phase all[] = {sqlc::Phase::Tokens, sqlc::Phase::Ast, sqlc::Phase::IR,
                             sqlc::Phase::Plan};
  size_t start = 0;
  while (true) {
    size_t comma = value.find(',', start);
    std::string name = value.substr(start, comma == std::string::npos ? std::string::npos
                                                                       : comma - start);
    if (name == "all") {
      for (auto phase : all) add_phase(out, phase);
    } else {
      bool matched = false;
      for (auto phase : all) {
        if (name == sqlc::to_string(phase)) {
          add_phase(out, phase);
          matched = true;
        }
      }
      if (!matched) return false;
    }
    if (comma == std::string::npos) return true;
    start = comma + 1;
  }
}

}  // namespace

void print_startup_help(std::ostream& os) {
  os << "sqlc - query delimited tables with a small SQL dialect\n\n";
  os << "Usage:\n";
  os << "  sqlc --query <query> --input <path.csv>\n";
  os << "  sqlc --query-file <file> --input <path.csv> [--input <path.csv> ...]\n";
  os << "  sqlc --mode duckbox|json|plain|csv\n";
  os << "  sqlc --explain\n";
  os << "  sqlc --show tokens|ast|ir|plan|all\n";
  os << "  sqlc --export <path.csv|path.parquet>\n\n";
  os << "Notes:\n";
  os << "  - The FROM table is matched against each input's file name without extension.\n";
  os << "  - Column types are inferred: Number when every value is numeric, else String.\n\n";
  os << "Examples:\n";
  os << "  sqlc --query \"SELECT name, age FROM students WHERE age > 20\" --input ./students.csv\n";
  os << "  sqlc --query \"SELECT * FROM students ORDER BY age DESC LIMIT 3\" --input ./students.csv --mode json\n";
}

void print_help(std::ostream& os) {
  os << "Usage: sqlc --query <query> --input <path>\n";
  os << "       sqlc --query-file <file> --input <path>\n";
  os << "Options:\n";
  os << "  --input <path>          Delimited file to load; repeat for several tables\n";
  os << "  --delimiter <char>      Field delimiter for inputs (default ',', use \\t for tab)\n";
  os << "  --mode <mode>           Output mode: duckbox, json, plain or csv\n";
  os << "  --max-rows <n>          Rows shown in duckbox mode (0 shows all)\n";
  os << "  --highlight on|off      Bold header row on terminals\n";
  os << "  --color=disabled        Disable ANSI colors in diagnostics and JSON\n";
  os << "  --explain               Print the execution plan before running it\n";
  os << "  --show <phases>         Print compiler phases (tokens, ast, ir, plan or all;\n";
  os << "                          comma-separated or repeated) before running\n";
  os << "  --export <path>         Write the result to .csv or .parquet\n";
  os << "  --help                  Show this help\n";
  os << "Settings are also read from $SQLC_CONFIG or ~/.config/sqlc/config.toml.\n";
}

/// Parses argv into typed options so main can dispatch consistently.
/// MUST reject flags missing their value and MUST leave unset flags as nullopt.
/// Inputs are argc/argv; outputs are options/error and no external side effects.
bool parse_cli_args(int argc, char** argv, CliOptions& options, std::string& error) {
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    bool has_value = i + 1 < argc;
    if (arg == "--help" || arg == "-h") {
      options.show_help = true;
    } else if (arg == "--explain") {
      add_phase(options.show, sqlc::Phase::Plan);
    } else if (arg == "--color=disabled") {
      options.color = false;
    } else if (arg == "--query" || arg == "--query-file" || arg == "--input" ||
               arg == "--mode" || arg == "--delimiter" || arg == "--max-rows" ||
               arg == "--highlight" || arg == "--export" || arg == "--show") {
      if (!has_value) {
        error = "Missing value for " + arg;
        return false;
      }
      std::string value = argv[++i];
      if (arg == "--query") {
        options.query = value;
      } else if (arg == "--query-file") {
        options.query_file = value;
      } else if (arg == "--input") {
        options.inputs.push_back(value);
      } else if (arg == "--mode") {
        options.output_mode = value;
      } else if (arg == "--export") {
        options.export_path = value;
      } else if (arg == "--show") {
        if (!parse_phases(value, options.show)) {
          error = "Invalid --show value: " + value + " (use tokens|ast|ir|plan|all)";
          return false;
        }
      } else if (arg == "--delimiter") {
        char delimiter = ',';
        if (!parse_delimiter(value, delimiter)) {
          error = "Invalid --delimiter value (expected a single character)";
          return false;
        }
        options.delimiter = delimiter;
      } else if (arg == "--max-rows") {
        size_t max_rows = 0;
        if (!parse_max_rows(value, max_rows)) {
          error = "Invalid --max-rows value: " + value;
          return false;
        }
        options.max_rows = max_rows;
      } else if (value == "on") {
        options.highlight = true;
      } else if (value == "off") {
        options.highlight = false;
      } else {
        // WHY: invalid highlight values must fail fast to avoid ambiguous UI state.
        error = "Invalid --highlight value (use on|off)";
        return false;
      }
    } else {
      error = "Unknown argument: " + arg;
      return false;
    }
  }
  return true;
}

}  // namespace sqlc::cli
