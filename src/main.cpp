#include "audio/PipeWireContext.hpp"
#include "audio/PipeWireOutput.hpp"
#include "backend/Config.hpp"
#include "backend/Player.hpp"
#include "backend/Queue.hpp"
#include "backend/QueueError.hpp"
#include "backend/StateStore.hpp"
#include "config/KeyMap.hpp"
#include "events/Scheduler.hpp"
#include "ui/Terminal.hpp"
#include "ui/widgets/StatusBar.hpp"
#include "util/Logger.hpp"
#include <atomic>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <optional>
#include <poll.h>
#include <unistd.h>

using namespace std::chrono_literals;

namespace {

std::atomic<bool> g_shutdown{false};

void signal_handler(int) {
    g_shutdown.store(true);
}

constexpr int TICK_MS = 100;
constexpr auto STATE_SAVE_INTERVAL = 5000ms;
// Ticks an alert stays on the status line
constexpr int ALERT_TICKS = 30;

lyre::backend::SessionState capture_state(const lyre::backend::Player& player,
                                          const lyre::backend::Queue& queue) {
    lyre::backend::SessionState state;
    state.volume = player.volume();
    state.muted = player.muted();
    state.shuffle = queue.is_shuffle();
    state.queue = queue.path();
    if (const auto* track = queue.track()) {
        state.track = track->path();
        state.elapsed = static_cast<int>(player.elapsed().value_or(lyre::backend::Duration::zero()).count());
    }
    return state;
}

}  // namespace

int main(int argc, char** argv) {
    using namespace lyre;

    try {
        util::Logger::init();
        util::Logger::info("lyre starting...");

        auto cfg = backend::ConfigLoader::load_config();
        auto session = backend::StateStore::load();

        audio::PipeWireContext context;
        if (!context.init()) {
            std::cerr << "lyre: could not connect to PipeWire" << std::endl;
            return 1;
        }

        backend::Player player(std::make_unique<audio::PipeWireOutput>(context, cfg.output_rate));
        if (!player.start()) {
            std::cerr << "lyre: could not open the audio device" << std::endl;
            return 1;
        }

        player.set_volume(session.volume);
        if (session.muted) {
            player.mute();
        }

        // Queue source: command line, then last session, then first configured list
        backend::Queue queue = backend::Queue::with_state(session);
        std::string requested;
        if (argc > 1) {
            requested = argv[1];
        } else if (!queue.path() && !cfg.lists.empty()) {
            requested = cfg.lists.front().string();
        }
        if (!requested.empty()) {
            try {
                queue.queue(requested);
            } catch (const backend::QueueError& e) {
                std::cerr << "lyre: " << e.what() << std::endl;
                return 1;
            }
        } else if (const auto* track = queue.track()) {
            player.revive(*track, backend::Duration(session.elapsed));
        }

        auto& terminal = ui::Terminal::instance();
        terminal.init();

        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        config::KeyMap keymap;
        ui::widgets::StatusBar status_bar(cfg.accent);

        events::Scheduler scheduler;
        scheduler.schedule("save_state", STATE_SAVE_INTERVAL, [&player, &queue] {
            backend::StateStore::save(capture_state(player, queue));
        });

        std::optional<std::string> alert;
        int alert_ticks = 0;
        auto show_alert = [&](std::string message) {
            alert = std::move(message);
            alert_ticks = ALERT_TICKS;
        };

        const backend::Duration seek_step(cfg.seek_seconds);
        bool quit = false;

        terminal.clear_screen();

        while (!quit && !g_shutdown.load()) {
            player.update();
            queue.on_track_finished(player);
            scheduler.process();

            if (auto player_alert = player.take_alert()) {
                show_alert(*player_alert);
            }
            if (alert_ticks > 0 && --alert_ticks == 0) {
                alert.reset();
            }

            ui::widgets::StatusView view;
            view.paused = player.paused();
            view.muted = player.muted();
            view.shuffle = queue.is_shuffle();
            view.resampling = player.resampling();
            view.volume = player.volume();
            if (auto elapsed = player.elapsed()) view.elapsed = elapsed->count();
            if (auto duration = player.duration()) view.duration = duration->count();
            if (const auto* track = queue.track()) view.title = track->display();
            view.alert = alert;
            terminal.print_line(0, status_bar.render(view, terminal.get_terminal_width()));

            struct pollfd pfd = {STDIN_FILENO, POLLIN, 0};
            int ret = poll(&pfd, 1, TICK_MS);
            if (ret < 0) {
                if (errno == EINTR) continue;
                util::Logger::error("Main: poll failed: errno=" + std::to_string(errno));
                break;
            }
            if (ret == 0 || !(pfd.revents & POLLIN)) {
                continue;
            }

            ui::InputEvent event;
            while ((event = terminal.read_input()).type != ui::InputEvent::Type::None) {
                if (event.type == ui::InputEvent::Type::Resize) {
                    terminal.clear_screen();
                    continue;
                }
                auto action = keymap.lookup_action(event.key_name);
                if (!action) continue;

                util::Logger::debug(std::string("Main: Action ") + config::action_name(*action));
                try {
                    switch (*action) {
                        case config::Action::TogglePause: player.toggle(); break;
                        case config::Action::Next: queue.next(player); break;
                        case config::Action::Last: queue.last(player); break;
                        case config::Action::ToggleMute: player.toggle_mute(); break;
                        case config::Action::VolumeUp: player.volume_up(cfg.volume_step); break;
                        case config::Action::VolumeDown: player.volume_down(cfg.volume_step); break;
                        case config::Action::SeekForward: queue.seek_forward(player, seek_step); break;
                        case config::Action::SeekBackward: queue.seek_backward(player, seek_step); break;
                        case config::Action::Restart: queue.restart(player); break;
                        case config::Action::ToggleShuffle: queue.toggle_shuffle(); break;
                        case config::Action::Quit: quit = true; break;
                    }
                } catch (const backend::QueueError& e) {
                    show_alert(e.what());
                }
            }
        }

        // Give the user their terminal back before the slower teardown
        terminal.shutdown();

        player.update();
        scheduler.run_now("save_state");
        util::Logger::info("lyre shutdown");
        return 0;
    } catch (const std::exception& e) {
        // CRITICAL: Restore terminal even on exception!
        ui::Terminal::instance().shutdown();
        util::Logger::error("Fatal error: " + std::string(e.what()));
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
