// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/cli/commands.hpp>
#include <reel/cli/progress_bar.hpp>
#include <reel/core/cleanup_service.hpp>
#include <reel/core/dispatcher.hpp>
#include <reel/core/error.hpp>
#include <reel/core/logging.hpp>
#include <reel/core/session_controller.hpp>
#include <reel/core/settings.hpp>
#include <reel/core/storage.hpp>
#include <reel/engine/ytdlp_engine.hpp>
#include <reel/version.hpp>
#include <spdlog/spdlog.h>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>

using namespace reel::core;

namespace chrono = std::chrono;

namespace reel::cli {

namespace {

volatile std::sig_atomic_t g_cancel_requested = 0;
volatile std::sig_atomic_t g_pause_toggle = 0;

extern "C" void on_interrupt(int) {
    g_cancel_requested = 1;
}

extern "C" void on_pause_toggle(int) {
    g_pause_toggle = 1;
}

void install_signal_handlers() {
    struct sigaction sa{};
    sigemptyset(&sa.sa_mask);

    sa.sa_handler = on_interrupt;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    sa.sa_handler = on_pause_toggle;
    sigaction(SIGUSR1, &sa, nullptr);
}

constexpr chrono::milliseconds LOOP_SLICE{200};

} // namespace

//=============================================================================
// Argument parsing
//=============================================================================

CliArgs parse_args(int argc, char* argv[]) {
    CliArgs args;

    auto value_of = [&](int& i, std::string_view name) -> std::string {
        if (i + 1 < argc) {
            return argv[++i];
        }
        args.errors.push_back("Missing value for " + std::string(name));
        return {};
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            args.help = true;
            return args;
        }
        if (arg == "-v" || arg == "--version") {
            args.version = true;
            return args;
        }

        if (arg == "-V" || arg == "--verbose") {
            args.verbose = true;
        } else if (arg == "--quiet") {
            args.quiet = true;
        } else if (arg == "-a" || arg == "--audio") {
            args.audio_only = true;
        } else if (arg == "-q" || arg == "--quality") {
            auto text = value_of(i, arg);
            if (auto tier = parse_quality(text)) {
                args.quality = *tier;
            } else if (!text.empty()) {
                args.errors.push_back("Unknown quality '" + text + "' (max, 1080, 720, 480, 360)");
            }
        } else if (arg == "-d" || arg == "--directory") {
            args.output_dir = value_of(i, arg);
        } else if (arg == "-c" || arg == "--config") {
            args.config_file = value_of(i, arg);
        } else if (arg.starts_with("-")) {
            args.errors.push_back("Unknown option " + arg);
        } else if (args.url.empty()) {
            args.url = arg;
        } else {
            args.errors.push_back("Only one URL can be downloaded at a time");
        }
    }

    return args;
}

//=============================================================================
// Commands
//=============================================================================

int download(const CliArgs& args) {
    auto& settings = Settings::instance();
    auto config_file = args.config_file.empty() ? Settings::default_file() : std::filesystem::path(args.config_file);
    if (auto ec = settings.load(config_file)) {
        std::cerr << "Error: " << user_message(ec, "cannot use " + config_file.string()) << std::endl;
        return EXIT_FAILED;
    }
    const auto& data = settings.data();

    std::string level = args.verbose ? "debug" : (args.quiet ? "error" : data.log_level);
    if (auto ec = init_logging(level)) {
        std::cerr << "Warning: logging setup failed: " << ec.message() << std::endl;
    }

    std::unique_ptr<DirectoryStorage> storage = args.output_dir.empty()
        ? std::make_unique<DirectoryStorage>(data.audio_dir, data.video_dir)
        : std::make_unique<DirectoryStorage>(args.output_dir, args.output_dir);

    engine::YtDlpOptions engine_options;
    engine_options.audio_format = data.audio_format;
    engine_options.audio_quality = data.audio_quality;
    engine::YtDlpEngine engine([] { return Settings::instance().ytdlp_executable(); }, engine_options);

    auto options = settings.session_options();
    options.auto_acknowledge = false;

    RunLoopDispatcher loop;
    CleanupService cleanup;
    SessionController controller(engine, loop, *storage, cleanup, options);

    ProgressBar bar(args.audio_only ? "Audio" : "Video");
    bool finished = false;
    std::string final_message;

    SessionCallbacks callbacks;
    callbacks.on_snapshot = [&](const ProgressSnapshot& snapshot) {
        if (!args.quiet && controller.state() != SessionState::idle && !is_terminal(controller.state())) {
            bar.update(snapshot);
        }
    };
    callbacks.on_state = [&](SessionHandle, SessionState state) {
        if (args.verbose) {
            spdlog::debug("State: {}", to_string(state));
        }
        if (state == SessionState::paused && !args.quiet) {
            bar.finish();
            std::cout << "Paused (send SIGUSR1 to resume)" << std::endl;
        } else if (state == SessionState::cancelling && !args.quiet) {
            bar.finish();
            std::cout << "Cancelling..." << std::endl;
        }
        if (is_terminal(state)) {
            finished = true;
        }
    };
    callbacks.on_message = [&](std::string_view message, bool) {
        if (!message.empty()) {
            final_message = message;
        }
    };
    controller.callbacks(std::move(callbacks));

    auto handle = controller.start(args.url, args.audio_only ? MediaMode::audio : MediaMode::video, args.quality);
    if (!handle) {
        std::cerr << "Error: " << user_message(handle.error()) << std::endl;
        return EXIT_FAILED;
    }

    if (auto info = controller.current(); info && !args.quiet) {
        std::cout << "Saving to " << info->output_dir.string() << std::endl;
    }

    install_signal_handlers();

    while (!finished) {
        loop.run_until([&] {
            return finished || g_cancel_requested != 0 || g_pause_toggle != 0;
        }, LOOP_SLICE);

        if (g_cancel_requested != 0) {
            g_cancel_requested = 0;
            controller.cancel();
        }
        if (g_pause_toggle != 0) {
            g_pause_toggle = 0;
            if (controller.state() == SessionState::paused) {
                controller.resume();
            } else {
                controller.pause();
            }
        }
    }

    if (!args.quiet) {
        bar.finish();
    }

    switch (controller.state()) {
        case SessionState::completed:
            std::cout << final_message << std::endl;
            return EXIT_OK;
        case SessionState::cancelled:
            std::cout << "Download cancelled" << std::endl;
            return EXIT_CANCELLED;
        default:
            std::cerr << "Error: " << final_message << std::endl;
            return EXIT_FAILED;
    }
}

void print_help(std::string_view program_name) noexcept {
    std::cout << "Reel " << program_name << " - YouTube video and audio downloader\n";
    std::cout << "\n";
    std::cout << "USAGE:\n";
    std::cout << "  " << program_name << " [OPTIONS] <URL>\n";
    std::cout << "\n";
    std::cout << "OPTIONS:\n";
    std::cout << "  -h, --help              Show this help message\n";
    std::cout << "  -v, --version           Show version information\n";
    std::cout << "  -V, --verbose           Enable verbose output\n";
    std::cout << "      --quiet             Quiet mode (no progress bar)\n";
    std::cout << "  -a, --audio             Audio only (converted to the configured format)\n";
    std::cout << "  -q, --quality <TIER>    max, 1080, 720, 480 or 360 (default: max)\n";
    std::cout << "  -d, --directory <DIR>   Save to specified directory\n";
    std::cout << "  -c, --config <FILE>     Settings file (default: " << Settings::default_file().string() << ")\n";
    std::cout << "\n";
    std::cout << "CONTROLS:\n";
    std::cout << "  Ctrl-C                  Cancel and remove partial files\n";
    std::cout << "  kill -USR1 <pid>        Pause / resume\n";
    std::cout << "\n";
    std::cout << "EXAMPLES:\n";
    std::cout << "  " << program_name << " https://www.youtube.com/watch?v=dQw4w9WgXcQ\n";
    std::cout << "  " << program_name << " -q 720 -d ~/Downloads https://youtu.be/dQw4w9WgXcQ\n";
    std::cout << "  " << program_name << " -a https://www.youtube.com/playlist?list=PL123\n";
}

void print_version() noexcept {
    std::cout << reel::APP_NAME << " " << reel::version.to_string() << std::endl;
    std::cout << "Built " << reel::BUILD_DATE << " with C++23, spdlog, nlohmann/json\n";
}

} // namespace reel::cli
