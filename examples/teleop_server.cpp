#include <puppet.hpp>

#include <argu/argu.hpp>
#include <echo/echo.hpp>

#include <atomic>
#include <csignal>
#include <string>

namespace {
    std::atomic<puppet::TeleopServer *> g_server{nullptr};

    void on_signal(int) {
        if (auto *s = g_server.load()) {
            s->request_stop();
        }
    }

    /// Viewer stand-in: logs every toggle the operator triggers.
    struct LogScene : puppet::Scene {
        int camera = 0;

        void next_camera() override {
            camera = 1 - camera;
            echo::info("camera -> ", camera);
        }
        void toggle_visibility() override { echo::info("toggled task object visibility"); }
        void toggle_light(puppet::Side side) override {
            echo::info("toggled ", side == puppet::Side::Left ? "left" : "right", " light");
        }
        void set_ghost_visible(const std::string &arm, bool visible) override {
            echo::debug("ghost ", arm.c_str(), visible ? " shown" : " hidden");
        }
        void show_reachability(bool visible) override { echo::debug("reachability ", visible ? "shown" : "hidden"); }
    };
} // namespace

int main(int argc, char *argv[]) {
    puppet::Config cfg;

    std::string rate = "30";
    std::string cooldown = "1.5";
    std::string checkpoint_every = "1000";
    bool no_checkpoint = false;
    bool record = false;
    bool no_ghost = false;

    auto cmd = argu::Command("puppet_server")
                   .version("1.0.0")
                   .about("Teleoperation control server driving a simulated follower robot")
                   .auto_exit()
                   .arg(argu::Arg("endpoint")
                            .long_name("endpoint")
                            .help("RPC endpoint (tcp://host:port, ipc:///path, shm://name:size)")
                            .value_of(cfg.endpoint)
                            .value_name("URI")
                            .default_value("tcp://127.0.0.1:5556"))
                   .arg(argu::Arg("robot")
                            .long_name("robot")
                            .help("Robot topology: r1 or arms")
                            .value_of(cfg.robot)
                            .value_name("NAME")
                            .default_value("r1"))
                   .arg(argu::Arg("rate")
                            .long_name("rate")
                            .help("Control loop rate in Hz")
                            .value_of(rate)
                            .value_name("HZ")
                            .default_value("30"))
                   .arg(argu::Arg("cooldown")
                            .long_name("cooldown")
                            .help("Seconds of clipped motion after resuming")
                            .value_of(cooldown)
                            .value_name("SECONDS")
                            .default_value("1.5"))
                   .arg(argu::Arg("checkpoint-every")
                            .long_name("checkpoint-every")
                            .help("Ticks between periodic checkpoints")
                            .value_of(checkpoint_every)
                            .value_name("TICKS")
                            .default_value("1000"))
                   .arg(argu::Arg("no-checkpoint")
                            .long_name("no-checkpoint")
                            .help("Disable periodic checkpoints")
                            .flag()
                            .value_of(no_checkpoint))
                   .arg(argu::Arg("record").long_name("record").help("Attach an episode recorder").flag().value_of(record))
                   .arg(argu::Arg("no-ghost")
                            .long_name("no-ghost")
                            .help("Disable ghost arm mirroring")
                            .flag()
                            .value_of(no_ghost));

    auto result = cmd.parse(argc, argv);
    if (!result) {
        return result.exit();
    }

    auto tick_hz = puppet::parse_real("--rate", rate);
    if (tick_hz.is_err()) {
        echo::error(tick_hz.error().message.c_str());
        return 2;
    }
    auto cooldown_s = puppet::parse_real("--cooldown", cooldown);
    if (cooldown_s.is_err()) {
        echo::error(cooldown_s.error().message.c_str());
        return 2;
    }
    auto every = puppet::parse_ticks("--checkpoint-every", checkpoint_every);
    if (every.is_err()) {
        echo::error(every.error().message.c_str());
        return 2;
    }
    cfg.tick_hz = tick_hz.value();
    cfg.cooldown_s = cooldown_s.value();
    cfg.checkpoint_every_ticks = every.value();
    cfg.auto_checkpoint = !no_checkpoint;
    cfg.ghosting = !no_ghost;

    auto valid = cfg.validate();
    if (valid.is_err()) {
        echo::error(valid.error().message.c_str());
        return 2;
    }

    auto topo = puppet::topology::make(cfg);
    if (topo.is_err()) {
        echo::error(topo.error().message.c_str());
        return 2;
    }

    puppet::sim::SimOptions sim_opts;
    sim_opts.dt = cfg.tick_period_s();
    sim_opts.reset_trunk_translate = cfg.default_trunk_translate;
    sim_opts.torso = cfg.torso;
    puppet::sim::SimRobot robot(topo.value(), sim_opts);
    puppet::sim::SimRecorder recorder(robot);
    LogScene scene;

    puppet::Collaborators collab;
    collab.actuator = &robot;
    collab.recorder = record ? &recorder : nullptr;
    collab.scene = &scene;

    auto created = puppet::TeleopServer::create(cfg, collab);
    if (created.is_err()) {
        echo::error(created.error().message.c_str());
        return 1;
    }
    auto server = std::move(created.value());

    auto started = server->start();
    if (started.is_err()) {
        return 1;
    }

    g_server.store(server.get());
    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    echo("Press X on the leader (or post a resume event) to start driving the robot");
    auto served = server->serve();

    g_server.store(nullptr);
    auto down = server->shutdown();
    if (down.is_err()) {
        echo::error(down.error().message.c_str());
        return 1;
    }
    return served.is_ok() ? 0 : 1;
}
