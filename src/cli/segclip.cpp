// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#include "LineClipper.hpp"
#include "Logging.hpp"

#include <array>
#include <charconv>
#include <format>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

#include <getopt.h>

namespace sc {
struct CommandLineError : public std::runtime_error {
  using std::runtime_error::runtime_error;
};

struct ProgramOptions {
  Rectangle window{100.0, 100.0, 200.0, 200.0};
  std::optional<Line> line;
  int precision{1};
  bool trace{false};
  bool demo{false};
  bool help{false};
};

auto parse_command_line_args(int argc, char** argv) -> ProgramOptions;

auto parse_coordinates(std::string_view text, std::string_view what) -> std::array<double, 4>;

void print_usage(std::ostream& out, const char* program);

void print_clip(std::ostream& out, const Line& line, const Rectangle& window,
                const ProgramOptions& options);

void run_demo(std::ostream& out, const ProgramOptions& options);

} // namespace sc

int main(int argc, char** argv) {
  try {
    const sc::ProgramOptions options = sc::parse_command_line_args(argc, argv);
    if (options.help) {
      sc::print_usage(std::cout, argv[0]);
      return 0;
    }
    if (options.demo) {
      sc::run_demo(std::cout, options);
      return 0;
    }
    if (!options.line) {
      throw sc::CommandLineError("missing --line");
    }
    sc::print_clip(std::cout, *options.line, options.window, options);
  } catch (const sc::CommandLineError& e) {
    sc::Log::e("{}", e.what());
    sc::print_usage(std::cerr, argv[0]);
    return 2;
  } catch (const sc::ClipPreconditionError& e) {
    sc::Log::e("{}", e.what());
    return 2;
  } catch (const sc::ClipError& e) {
    sc::Log::e("internal clipping error: {}", e.what());
    return 3;
  }
  return 0;
}

namespace sc {

auto parse_command_line_args(int argc, char** argv) -> ProgramOptions {
  ProgramOptions result{};
  static ::option long_options[] = {::option{"window", required_argument, nullptr, 'w'},
                                    ::option{"line", required_argument, nullptr, 'l'},
                                    ::option{"precision", required_argument, nullptr, 'p'},
                                    ::option{"log-level", required_argument, nullptr, 'v'},
                                    ::option{"trace", no_argument, nullptr, 't'},
                                    ::option{"demo", no_argument, nullptr, 'd'},
                                    ::option{"help", no_argument, nullptr, 'h'},
                                    ::option{}};
  const char* short_options = "w:l:p:v:tdh";
  int option_index = 0;
  int parsedShortOpt = ::getopt_long(argc, argv, short_options, long_options, &option_index);
  while (parsedShortOpt != -1) {
    switch (parsedShortOpt) {
    case 'w': {
      const auto bounds = parse_coordinates(optarg, "window");
      result.window = Rectangle{bounds[0], bounds[1], bounds[2], bounds[3]};
      break;
    }
    case 'l': {
      const auto coords = parse_coordinates(optarg, "line");
      result.line = Line{{coords[0], coords[1]}, {coords[2], coords[3]}};
      break;
    }
    case 'p': {
      std::string_view text = optarg;
      auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), result.precision);
      if (ec != std::errc{} || end != text.data() + text.size() || result.precision < 0 ||
          result.precision > 17) {
        throw CommandLineError(std::format("invalid precision '{}'", text));
      }
      break;
    }
    case 'v': {
      const auto level = Log::parse_level(optarg);
      if (!level) {
        throw CommandLineError(std::format("unknown log level '{}'", optarg));
      }
      Log::set_level(*level);
      break;
    }
    case 't':
      result.trace = true;
      break;
    case 'd':
      result.demo = true;
      break;
    case 'h':
      result.help = true;
      break;
    default:
      throw CommandLineError("unknown option");
    }
    parsedShortOpt = ::getopt_long(argc, argv, short_options, long_options, &option_index);
  }
  if (optind < argc) {
    throw CommandLineError(std::format("unexpected argument '{}'", argv[optind]));
  }
  return result;
}

// Parses four comma separated numbers such as "100,100,200,200".
auto parse_coordinates(std::string_view text, std::string_view what) -> std::array<double, 4> {
  std::array<double, 4> values{};
  const char* current = text.data();
  const char* const last = text.data() + text.size();
  for (std::size_t i = 0; i < values.size(); ++i) {
    auto [end, ec] = std::from_chars(current, last, values[i]);
    if (ec != std::errc{}) {
      throw CommandLineError(std::format("cannot parse {} '{}'", what, text));
    }
    current = end;
    if (i + 1 < values.size()) {
      if (current == last || *current != ',') {
        throw CommandLineError(std::format("{} needs four comma separated values", what));
      }
      ++current;
    }
  }
  if (current != last) {
    throw CommandLineError(std::format("trailing characters in {} '{}'", what, text));
  }
  return values;
}

void print_usage(std::ostream& out, const char* program) {
  out << "Usage: " << program
      << " --window XMIN,YMIN,XMAX,YMAX --line X1,Y1,X2,Y2 [--trace] [--precision N]\n"
      << "       [--log-level LEVEL]\n"
      << "       " << program << " --demo [--window XMIN,YMIN,XMAX,YMAX] [--log-level LEVEL]\n"
      << "Options:\n"
      << "  -w, --window      clip window, default 100,100,200,200\n"
      << "  -l, --line        segment to clip\n"
      << "  -t, --trace       print every refinement step\n"
      << "  -p, --precision   decimals printed per coordinate, default 1\n"
      << "  -v, --log-level   debug, info, warning or error\n"
      << "  -d, --demo        clip the reference segments\n"
      << "  -h, --help        show this message\n"
      << "Exit status: 0 visible or rejected, 2 invalid arguments or window,\n"
      << "             3 internal clipping error\n";
}

void print_clip(std::ostream& out, const Line& line, const Rectangle& window,
                const ProgramOptions& options) {
  const int precision = options.precision;
  if (options.trace) {
    const ClipTrace trace = trace_clip_line(line, window);
    for (const ClipStep& step : trace.steps) {
      out << std::format("step: {} endpoint at {} -> {:.{}f} ({})\n", to_string(step.endpoint),
                         step.boundary, step.intersection, precision, step.outcode);
    }
    if (trace.result) {
      out << std::format("visible: {:.{}f}\n", *trace.result, precision);
    } else {
      out << "rejected\n";
    }
    return;
  }
  if (const auto clipped = clip_line(line, window)) {
    out << std::format("visible: {:.{}f}\n", *clipped, precision);
  } else {
    out << "rejected\n";
  }
}

void run_demo(std::ostream& out, const ProgramOptions& options) {
  struct Scenario {
    std::string_view name;
    Line line;
  };
  static constexpr std::array scenarios = {
      Scenario{"accept", {{110.0, 110.0}, {190.0, 190.0}}},
      Scenario{"reject right", {{210.0, 110.0}, {250.0, 190.0}}},
      Scenario{"reject top", {{50.0, 250.0}, {250.0, 250.0}}},
      Scenario{"clip two corners", {{50.0, 50.0}, {250.0, 250.0}}},
      Scenario{"clip left and right", {{50.0, 150.0}, {250.0, 150.0}}},
      Scenario{"clip top and bottom", {{150.0, 50.0}, {150.0, 250.0}}},
      Scenario{"clip one end", {{150.0, 150.0}, {250.0, 250.0}}},
  };
  Log::i("Clipping {} reference segments against {}", scenarios.size(), options.window);
  out << std::format("window: {:.{}f}\n", options.window, options.precision);
  for (const Scenario& scenario : scenarios) {
    out << std::format("\n{}: {:.{}f}\n", scenario.name, scenario.line, options.precision);
    print_clip(out, scenario.line, options.window, options);
  }
}

} // namespace sc
