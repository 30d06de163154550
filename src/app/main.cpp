#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <nlohmann/json.hpp>
#include "app/cli_parser.hpp"
#include "app/preflight.hpp"
#include "core/clock/clock.hpp"
#include "core/config/agent_config.hpp"
#include "core/config/session_id.hpp"
#include "core/errors/agent_errors.hpp"
#include "core/logging/logger.hpp"
#include "dispatch/action_dispatcher.hpp"
#include "dispatch/actuation_scheduler.hpp"
#include "dispatch/override_channel.hpp"
#include "osc/osc_sink.hpp"
#include "perception/observation_feed.hpp"
#include "perception/observation_source.hpp"
#include "planner/openai_backend.hpp"
#include "planner/planner_client.hpp"
#include "policy/action_guard.hpp"
#include "runtime/control_loop.hpp"
#include "runtime/instinct_generator.hpp"
#include "runtime/intent_cell.hpp"
#include "runtime/intent_gate.hpp"
#include "runtime/plan_shaper.hpp"
#include "session/memory_store.hpp"
#include "session/session_journal.hpp"

namespace {

std::atomic_bool g_signalled{false};

void on_signal(int) { g_signalled.store(true); }

void report_error(const std::string& what, const vrc::core::errors::AgentError& err) {
    LOG_ERROR(what + " " + vrc::core::errors::describe(err));
    if (!err.hint.empty()) {
        LOG_INFO("Hint: " + err.hint);
    }
}

// Reads "say [text]" / "stop" lines from stdin. Detached: getline cannot be
// interrupted, so the thread shares ownership of the channel.
void start_hotkey_listener(std::shared_ptr<vrc::dispatch::OverrideChannel> channel) {
    std::thread([channel]() {
        vrc::core::logging::Logger::set_thread_name("stdin");
        std::string line;
        while (std::getline(std::cin, line)) {
            auto event = vrc::dispatch::parse_override_command(line);
            if (!event.has_value()) {
                if (!line.empty()) {
                    LOG_WARN("Unknown command: " + line + " (use 'say [text]' or 'stop')");
                }
                continue;
            }
            if (!channel->push(event.value())) {
                LOG_WARN("Override dropped, channel full");
            }
            if (event->kind == vrc::dispatch::OverrideKind::Stop) {
                return;
            }
        }
    }).detach();
}

nlohmann::json session_settings(const vrc::core::config::AgentConfig& cfg,
                                const vrc::app::cli::CliOptions& options) {
    nlohmann::json settings;
    settings["preset"] =
        options.preset.has_value() ? vrc::core::config::to_string(options.preset.value()) : "";
    settings["dry_run"] = cfg.runtime.dry_run;
    settings["observe_only"] = cfg.runtime.observe_only;
    settings["once"] = options.once;
    settings["tick_interval_ms"] = cfg.runtime.tick_interval_ms;
    settings["intent_ttl_ms"] = cfg.runtime.intent_ttl_ms;
    settings["osc"] = cfg.osc.host + ":" + std::to_string(cfg.osc.port);
    settings["planner"] = cfg.planner.enabled ? cfg.api.model : "disabled";
    settings["observation_file"] = cfg.perception.observation_file.string();
    return settings;
}

}  // namespace

int main(int argc, char* argv[]) {
    namespace errors = vrc::core::errors;

    // 1. Session id goes on every log line
    const std::string session_id = vrc::core::config::generate_session_id();
    vrc::core::logging::Logger::get().set_session_id(session_id);
    vrc::core::logging::Logger::set_thread_name("loop");

    // 2. Parse CLI input and return normalized input errors
    auto parsed = vrc::app::cli::parse_and_validate(argc, argv);
    if (errors::is_error(parsed)) {
        report_error("Input error", errors::get_error(parsed));
        return 2;
    }
    const auto& options = errors::get_value(parsed);
    if (options.verbose) {
        vrc::core::logging::Logger::get().set_min_level(vrc::core::logging::LogLevel::DEBUG);
    }

    // 3. Config file, then preset and flag overrides
    auto loaded = vrc::core::config::load_config(options.config_path);
    if (errors::is_error(loaded)) {
        report_error("Config error", errors::get_error(loaded));
        return 3;
    }
    auto cfg = errors::get_value(loaded);
    vrc::app::cli::apply_overrides(options, cfg);
    auto validated = vrc::core::config::validate_config(cfg);
    if (errors::is_error(validated)) {
        report_error("Config error", errors::get_error(validated));
        return 3;
    }
    cfg = errors::get_value(validated);

    // 4. Readiness report; never aborts a run
    const auto report = vrc::app::run_preflight(cfg);
    vrc::app::log_report(report);
    if (options.command == vrc::app::cli::Command::Preflight) {
        return report.overall() == vrc::app::CheckLevel::Red ? 4 : 0;
    }

    // 5. Session journal
    vrc::session::SessionJournal journal(cfg.session.journal_dir, session_id);
    auto started = journal.write_session_start(session_settings(cfg, options));
    if (errors::is_error(started)) {
        report_error("Failed to start session journal", errors::get_error(started));
        return 4;
    }
    LOG_INFO("Session started, journal " + errors::get_value(started).string());

    // 6. OSC sink and the actuation thread
    std::unique_ptr<vrc::osc::OscSink> sink;
    if (cfg.runtime.dry_run) {
        sink = std::make_unique<vrc::osc::DryRunOscSink>();
        LOG_INFO("OSC: dry-run");
    } else {
        auto udp = std::make_unique<vrc::osc::UdpOscSink>(cfg.osc.host, cfg.osc.port);
        auto opened = udp->open();
        if (errors::is_error(opened)) {
            // Sends retry the open; dispatch failures are non-fatal.
            const auto& err = errors::get_error(opened);
            LOG_WARN("OSC not ready [" + err.code + "]: " + err.message);
        } else {
            LOG_INFO("OSC: udp " + errors::get_value(opened));
        }
        sink = std::move(udp);
    }
    vrc::dispatch::ActuationScheduler scheduler(*sink);
    scheduler.start();

    // 7. Loop collaborators
    vrc::core::clock::SteadyClock clock;
    vrc::runtime::IntentCell intents;
    vrc::runtime::GateSettings gate_settings;
    gate_settings.scene_change_threshold = cfg.gate.scene_change_threshold;
    vrc::runtime::IntentGate gate(gate_settings);
    vrc::runtime::InstinctGenerator instinct(cfg.instinct, cfg.runtime.seed);
    vrc::perception::ObservationFeed feed(
        std::make_unique<vrc::perception::FileObservationSource>(cfg.perception.observation_file),
        vrc::core::clock::Duration(cfg.gate.heard_latch_ms));
    vrc::dispatch::ActionDispatcher dispatcher(vrc::policy::ActionGuard{}, scheduler);
    auto overrides = std::make_shared<vrc::dispatch::OverrideChannel>();

    std::unique_ptr<vrc::session::MemoryStore> memory;
    if (cfg.memory.enabled) {
        memory = std::make_unique<vrc::session::MemoryStore>(cfg.memory.file_path,
                                                             cfg.memory.max_records);
    }

    std::unique_ptr<vrc::planner::PlannerClient> planner;
    if (cfg.planner.enabled) {
        auto backend = std::make_unique<vrc::planner::OpenAiPlannerBackend>(cfg.api);
        LOG_INFO("Planner: " + backend->name());
        planner = std::make_unique<vrc::planner::PlannerClient>(
            std::move(backend), intents, clock,
            vrc::planner::PlannerSettings::from_config(cfg));
    } else {
        LOG_WARN("Planner disabled, instinct only");
    }

    vrc::runtime::PlanShaper shaper(clock, vrc::runtime::ShaperSettings::from_config(cfg),
                                    cfg.runtime.seed);
    vrc::runtime::ControlLoop loop(vrc::runtime::LoopSettings::from_config(cfg), clock, feed,
                                   gate, intents, instinct, dispatcher, *overrides,
                                   planner.get(), memory.get(), &journal, &shaper);

    // 8. Run
    std::string end_reason = "completed";
    if (options.once) {
        static_cast<void>(loop.tick());
        if (planner && planner->in_flight()) {
            const auto budget = std::chrono::milliseconds(
                static_cast<long long>(cfg.api.timeout_ms) * cfg.planner.max_attempts +
                static_cast<long long>(cfg.planner.retry_base_ms) * 4);
            if (!planner->wait_idle(budget)) {
                LOG_WARN("Planner still running after " + std::to_string(budget.count()) +
                         " ms, giving up");
            }
        }
        end_reason = "once";
    } else {
        std::signal(SIGINT, on_signal);
        std::signal(SIGTERM, on_signal);
        start_hotkey_listener(overrides);
        LOG_INFO("Running. Type 'say [text]' or 'stop', Ctrl+C to quit.");

        std::atomic_bool loop_done{false};
        std::thread signal_watch([&loop, &loop_done]() {
            while (!loop_done.load()) {
                if (g_signalled.load()) {
                    LOG_INFO("Signal received, stopping");
                    loop.request_stop();
                    return;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
            }
        });

        loop.run();
        loop_done.store(true);
        signal_watch.join();
        end_reason = g_signalled.load() ? "signal" : "stop";
    }

    // 9. Shutdown: planner first so no Intent lands mid-release
    if (planner) {
        planner->shutdown();
    }
    static_cast<void>(scheduler.wait_idle(std::chrono::milliseconds(1000)));
    scheduler.shutdown();

    const auto loop_stats = loop.stats();
    const auto dispatch_stats = dispatcher.stats();
    const auto sched_stats = scheduler.stats();
    nlohmann::json stats;
    stats["ticks"] = loop_stats.ticks;
    stats["overruns"] = loop_stats.overruns;
    stats["triggers"] = loop_stats.triggers;
    stats["triggers_dropped"] = loop_stats.triggers_dropped;
    stats["capture_failures"] = loop_stats.capture_failures;
    stats["dispatch_failures"] = loop_stats.dispatch_failures;
    stats["overrides"] = loop_stats.overrides;
    stats["instinct_dropped"] = dispatch_stats.instinct_dropped;
    stats["intent_deferred"] = dispatch_stats.intent_deferred;
    stats["rejected"] = dispatch_stats.rejected;
    stats["osc_sent"] = sched_stats.sent;
    stats["osc_failed"] = sched_stats.failed;
    if (planner) {
        const auto planner_stats = planner->stats();
        stats["plans_started"] = planner_stats.started;
        stats["plans_succeeded"] = planner_stats.succeeded;
        stats["plans_failed"] = planner_stats.failed;
    }

    auto ended = journal.write_session_end(end_reason, stats);
    if (errors::is_error(ended)) {
        report_error("Failed to write session end", errors::get_error(ended));
        return 4;
    }
    LOG_INFO("Session ended (" + end_reason + "): " + stats.dump());
    return 0;
}
