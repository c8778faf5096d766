#include "termcoord/application/demo_app.hpp"
#include "termcoord/logger.hpp"
#include "termcoord/output_coordinator.hpp"
#include "termcoord/prompt_controller.hpp"
#include <atomic>
#include <charconv>
#include <optional>
#include <thread>

namespace termcoord {

namespace {

auto parse_count(const std::string& text) -> std::optional<std::uint64_t> {
    std::uint64_t value = 0;
    auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || end != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

// -v, -vv, -q, -qq
auto count_short_flag(const std::string& arg, char flag) -> int {
    if (arg.size() < 2 || arg[0] != '-' || arg[1] == '-') {
        return 0;
    }
    for (std::size_t i = 1; i < arg.size(); ++i) {
        if (arg[i] != flag) {
            return 0;
        }
    }
    return static_cast<int>(arg.size() - 1);
}

} // namespace

auto parse_args(const std::vector<std::string>& args) -> CliOptions {
    CliOptions options;
    int verbose = 0;
    int quiet = 0;

    for (std::size_t i = 0; i < args.size(); ++i) {
        const auto& arg = args[i];
        auto has_value = i + 1 < args.size();

        if (auto v = count_short_flag(arg, 'v')) {
            verbose += v;
        } else if (auto q = count_short_flag(arg, 'q')) {
            quiet += q;
        } else if (arg == "--color") {
            if (!has_value) {
                options.error = "missing value for --color";
                return options;
            }
            auto level = color_level_from_string(args[++i]);
            if (!level) {
                options.error = "invalid --color value: " + args[i];
                return options;
            }
            options.output.color = *level;
        } else if (arg == "--yes") {
            options.output.prompt = PromptLevel::YES;
        } else if (arg == "--non-interactive") {
            options.output.prompt = PromptLevel::NO;
        } else if (arg == "--interactive") {
            options.output.prompt = PromptLevel::INTERACTIVE;
        } else if (arg == "--bars" || arg == "--steps" || arg == "--delay") {
            if (!has_value) {
                options.error = "missing value for " + arg;
                return options;
            }
            auto value = parse_count(args[++i]);
            if (!value) {
                options.error = "invalid " + arg + " value: " + args[i];
                return options;
            }
            if (arg == "--bars") {
                options.bars = static_cast<std::size_t>(*value);
            } else if (arg == "--steps") {
                options.steps = *value;
            } else {
                options.step_delay = std::chrono::milliseconds(*value);
            }
        } else if (arg == "--no-ask") {
            options.ask = false;
        } else if (arg == "--no-animate") {
            options.output.animate = false;
        } else if (arg == "-h" || arg == "--help") {
            options.show_help = true;
        } else {
            options.error = "unknown option: " + arg;
            return options;
        }
    }

    options.output.print_level = print_level_from_flags(verbose, quiet);
    return options;
}

auto usage() -> std::string {
    return "Usage: termcoord-demo [options]\n"
           "  -v, -vv                 More output (debug, trace)\n"
           "  -q, -qq                 Less output (warnings only, errors only)\n"
           "      --color <mode>      always, never or auto\n"
           "      --yes               Answer yes/no questions with yes\n"
           "      --non-interactive   Refuse every prompt\n"
           "      --interactive       Always prompt, even under CI\n"
           "      --bars <n>          Number of concurrent progress bars (default 3)\n"
           "      --steps <n>         Steps per bar (default 40)\n"
           "      --delay <ms>        Delay between steps (default 50)\n"
           "      --no-ask            Skip the final question\n"
           "      --no-animate        No background spinner ticker\n"
           "  -h, --help              Show this help\n"
           "\nEnvironment:\n"
           "  CI=true                 Same as --non-interactive unless a prompt flag is given\n"
           "  TERMCOORD_LOG=<level>   trace, debug, info, warn or error\n";
}

DemoApp::DemoApp(std::unique_ptr<ITerminalDevice> terminal) : terminal_(std::move(terminal)) {}

auto DemoApp::run(const CliOptions& options) -> int {
    OutputCoordinator coordinator(std::move(terminal_), apply_environment(options.output));
    Logger log(coordinator);
    PromptController prompts(coordinator);

    const auto& caps = coordinator.capabilities();
    log.debug("interactive={} ansi={} color={} width={}", caps.is_interactive, caps.supports_ansi,
              coordinator.colors_enabled(), caps.width.value_or(0));
    log.trace("{} workers, {} steps each", options.bars, options.steps);

    auto waiting = coordinator.create_progress(
        ProgressOptions{.label = "waiting for workers", .total = std::nullopt, .keep = false});

    std::atomic<std::uint64_t> steps_done{0};
    std::vector<std::thread> workers;
    workers.reserve(options.bars);
    for (std::size_t i = 0; i < options.bars; ++i) {
        workers.emplace_back([&, i] {
            set_thread_print_name(fmt::format("worker-{}", i + 1));
            auto bar = coordinator.create_progress(
                ProgressOptions{.label = fmt::format("task {}", i + 1), .total = options.steps});
            for (std::uint64_t step = 0; step < options.steps; ++step) {
                std::this_thread::sleep_for(options.step_delay);
                bar.set_message(fmt::format("item {}", step + 1));
                bar.advance();
                ++steps_done;
                if (step + 1 == options.steps / 2) {
                    log.info("halfway through task {}", i + 1);
                }
            }
            log.debug("task {} finished", i + 1);
            clear_thread_print_name();
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }
    waiting.finish();

    if (options.ask) {
        auto answer = prompts.yesno("Show a summary?");
        if (!answer) {
            log.warn("no answer, skipping the summary");
        } else if (*answer) {
            log.print("{} tasks completed, {} steps", options.bars, steps_done.load());
        }
    }

    coordinator.shutdown();
    return coordinator.degraded() ? 1 : 0;
}

} // namespace termcoord
