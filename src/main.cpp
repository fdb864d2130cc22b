#include "config/ConfigError.hpp"
#include "config/LayoutConfig.hpp"
#include "events/Scheduler.hpp"
#include "layout/LayoutEngine.hpp"
#include "layout/Truncation.hpp"
#include "ui/Terminal.hpp"
#include "util/Logger.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <format>
#include <fstream>
#include <iostream>
#include <thread>

using namespace std::chrono_literals;
using namespace sextant;

static std::atomic<bool> g_shutdown{false};

static void signal_handler(int) {
    g_shutdown.store(true);
}

static std::string env_or(const char* name, const std::string& fallback) {
    const char* value = std::getenv(name);
    return (value && *value) ? std::string(value) : fallback;
}

// Branch name from .git/HEAD in the working directory, empty if detached or absent
static std::string current_git_branch() {
    std::ifstream head(".git/HEAD");
    std::string line;
    if (!head || !std::getline(head, line)) return "";

    const std::string prefix = "ref: refs/heads/";
    if (line.rfind(prefix, 0) != 0) return "";
    return line.substr(prefix.size());
}

static std::vector<layout::Segment> build_segments(std::chrono::steady_clock::time_point started) {
    using layout::PriorityTier;
    using layout::Side;

    std::vector<layout::Segment> segments;

    bool connected = env_or("SEXTANT_CONNECTED", "1") != "0";
    segments.push_back({"conn", Side::Left, PriorityTier::Critical, 1, connected ? "●" : "○", std::nullopt});

    auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - started).count();
    segments.push_back({"timer", Side::Left, PriorityTier::Critical, 5,
                        std::format("{:02}:{:02}", elapsed / 60, elapsed % 60), std::nullopt});

    std::string branch = env_or("SEXTANT_BRANCH", current_git_branch());
    if (!branch.empty()) {
        segments.push_back({"git", Side::Left, PriorityTier::High, 8, "⎇ " + branch, std::nullopt});
    }

    std::string agent = env_or("SEXTANT_AGENT", "");
    if (!agent.empty()) {
        segments.push_back({"agent", Side::Left, PriorityTier::High, 6, "⚡ " + agent, std::nullopt});
    }

    std::string model = env_or("SEXTANT_MODEL", "");
    if (!model.empty()) {
        segments.push_back({"model", Side::Right, PriorityTier::High, 10,
                            "model: " + model, "m: " + model});
    }

    std::string cost = env_or("SEXTANT_COST", "");
    if (!cost.empty()) {
        segments.push_back({"cost", Side::Right, PriorityTier::Medium, 7, "cost: $" + cost, "$" + cost});
    }

    std::string tokens = env_or("SEXTANT_TOKENS", "");
    if (!tokens.empty()) {
        segments.push_back({"tokens", Side::Right, PriorityTier::Medium, 9,
                            "tokens: " + tokens, "tok: " + tokens});
    }

    std::string api = env_or("SEXTANT_API_URL", "");
    if (!api.empty()) {
        segments.push_back({"api", Side::Right, PriorityTier::Low, 12, "api: " + api, std::nullopt});
    }

    return segments;
}

static void render(const layout::LayoutEngine& engine, layout::DisplayMode requested,
                   std::chrono::steady_clock::time_point started, bool redraw) {
    auto frame = engine.compute(build_segments(started), requested);

    std::string description = env_or("SEXTANT_DESCRIPTION", "");
    // Icon, status word and progress counter share the line with the description
    std::string task_line = engine.fit(frame, description, {2, 10, 8});

    if (redraw) std::cout << "\033[2J\033[H";
    std::cout << frame.status_line << "\n";
    if (!task_line.empty()) std::cout << task_line << "\n";
    std::cout << std::format("[{}x{} {} mode={} subtasks={} dropped={}]",
                             frame.dimensions->width, frame.dimensions->height,
                             layout::to_string(frame.dimensions->breakpoint),
                             layout::to_string(frame.mode), frame.subtask_limit,
                             frame.allocation.dropped.size())
              << std::endl;
}

int main() {
    try {
        util::Logger::init();
        util::Logger::info("sextant-status starting...");

        auto config = config::ConfigLoader::load_config();
        util::Logger::info("Configuration loaded");

        ui::TtySizeSource tty;
        layout::DimensionObserver observer(tty, config.thresholds, config.terminal);
        layout::LayoutEngine engine(config, observer);

        layout::DisplayModeState mode(config.display.mode);
        if (const char* requested = std::getenv("SEXTANT_MODE")) {
            mode.set(layout::parse_display_mode(requested));
        }

        auto started = std::chrono::steady_clock::now();
        bool watch = env_or("SEXTANT_WATCH", "0") == "1";

        if (!watch) {
            render(engine, mode.mode(), started, false);
            return 0;
        }

        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);
        ui::ResizeSignal::install();

        bool dirty = true;
        events::Scheduler scheduler;
        scheduler.schedule("resample", config.terminal.poll_interval, [&] {
            if (observer.refresh()) dirty = true;
        });
        scheduler.schedule("clock", 1000ms, [&] { dirty = true; });

        while (!g_shutdown.load()) {
            if (ui::ResizeSignal::consume() && observer.refresh()) {
                dirty = true;
            }
            scheduler.process();

            if (dirty) {
                render(engine, mode.mode(), started, true);
                dirty = false;
            }
            std::this_thread::sleep_for(20ms);
        }

        util::Logger::info("sextant-status exiting");
        return 0;
    } catch (const config::ConfigError& e) {
        util::Logger::error(std::string("Configuration error: ") + e.what());
        std::cerr << "sextant: configuration error: " << e.what() << std::endl;
        return 2;
    } catch (const std::exception& e) {
        util::Logger::error(std::string("Fatal: ") + e.what());
        std::cerr << "sextant: " << e.what() << std::endl;
        return 1;
    }
}
