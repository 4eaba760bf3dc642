#include <CLI/CLI.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <effect_expr/effect_expr.hpp>
#include <effect_expr/utility.hpp>

#include <internal_use_only/config.hpp>

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <vector>

namespace {

std::optional<std::string> read_file(const std::string &path)
{
  std::ifstream input(path, std::ios::binary);
  if (!input) { return std::nullopt; }
  return std::string{ std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>() };
}

int report_failure(const effect_expr::RuntimeError &error)
{
  std::cerr << effect_expr::describe(error) << '\n';
  return EXIT_FAILURE;
}

}// namespace

int main(int argc, const char **argv)
{
  try {
    CLI::App app{ fmt::format("{} version {}", effect_expr::cmake::project_name, effect_expr::cmake::project_version) };

    std::optional<std::string> script;
    std::optional<std::string> file;
    std::optional<std::uint64_t> fuel;
    std::optional<std::int64_t> poll_ms;
    std::vector<std::string> tests;
    std::string log_level{ "warn" };
    bool show_version = false;
    bool trace_effects = false;
    bool annotate = false;

    app.add_flag("--version", show_version, "Show version information");
    auto *exec_option = app.add_option("--exec", script, "Program text to run");
    app.add_option("--file", file, "Program file to run")->check(CLI::ExistingFile)->excludes(exec_option);
    app.add_option("--fuel", fuel, "Evaluation step budget for main");
    app.add_option("--test", tests, "Run the named test definitions instead of main");
    app.add_option("--poll-ms", poll_ms, "Upper bound in milliseconds for blocking waits")->check(CLI::PositiveNumber);
    app.add_flag("--trace-effects", trace_effects, "Log every effect step");
    app.add_flag("--annotate", annotate, "Prefix printed values with their kind");
    app.add_option("--log-level", log_level, "trace, debug, info, warn, error, critical or off")
      ->check(CLI::IsMember({ "trace", "debug", "info", "warn", "error", "critical", "off" }));

    CLI11_PARSE(app, argc, argv);

    if (show_version) {
      std::puts(fmt::format("{}", effect_expr::cmake::project_version).c_str());
      return EXIT_SUCCESS;
    }

    spdlog::set_level(spdlog::level::from_str(log_level));

    auto config = effect_expr::RuntimeConfig::from_environment();
    if (trace_effects) {
      config.trace_effects = true;
      spdlog::set_level(spdlog::level::trace);
    }
    if (poll_ms) { config.poll_interval = std::chrono::milliseconds{ *poll_ms }; }

    std::string text;
    if (script) {
      text = *script;
    } else if (file) {
      auto contents = read_file(*file);
      if (!contents) {
        spdlog::error("unable to read {}", *file);
        return EXIT_FAILURE;
      }
      text = std::move(*contents);
    } else {
      std::cerr << app.help() << '\n';
      return EXIT_FAILURE;
    }

    auto program = effect_expr::read_program(text);
    if (!program) {
      std::cerr << effect_expr::describe(program.error()) << '\n';
      return EXIT_FAILURE;
    }

    if (!tests.empty()) {
      auto report = effect_expr::run_test_suite(*program, tests, config);
      if (!report) { return report_failure(report.error()); }
      for (const auto &failure : report->failures) {
        std::cout << fmt::format("FAIL {}: {}\n", failure.name, failure.message);
      }
      std::cout << fmt::format("{} passed, {} failed\n", report->passed, report->failed);
      return report->failed == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
    }

    if (fuel) {
      auto result = effect_expr::run_with_fuel(*program, *fuel, config);
      if (!result) { return report_failure(result.error()); }
      if (!*result) {
        std::cout << fmt::format("fuel exhausted after {} steps\n", *fuel);
        return EXIT_SUCCESS;
      }
      std::cout << effect_expr::to_string(**result, annotate) << '\n';
      return EXIT_SUCCESS;
    }

    auto result = effect_expr::run(*program, config);
    if (!result) { return report_failure(result.error()); }
    std::cout << effect_expr::to_string(*result, annotate) << '\n';
  } catch (const std::exception &e) {
    spdlog::error("Unhandled exception in main: {}", e.what());
    return EXIT_FAILURE;
  }
}
