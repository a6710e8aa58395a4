#include <puppet.hpp>

#include <argu/argu.hpp>
#include <echo/echo.hpp>

#include <termios.h>
#include <unistd.h>

#include <chrono>
#include <string>
#include <thread>

// Minimal leader for the r1 layout, driven from the terminal instead of a
// hand-held device. Arms hold the pose the server reports at startup.

namespace {
    /// Puts stdin in non-canonical, non-echoing, non-blocking mode for its lifetime.
    class RawTerminal {
      public:
        RawTerminal() {
            if (!isatty(STDIN_FILENO) || tcgetattr(STDIN_FILENO, &saved_) != 0) {
                return;
            }
            termios raw = saved_;
            raw.c_lflag &= static_cast<tcflag_t>(~(ECHO | ICANON));
            raw.c_cc[VMIN] = 0;
            raw.c_cc[VTIME] = 0;
            enabled_ = tcsetattr(STDIN_FILENO, TCSANOW, &raw) == 0;
        }

        ~RawTerminal() {
            if (enabled_) {
                tcsetattr(STDIN_FILENO, TCSANOW, &saved_);
            }
        }

        RawTerminal(const RawTerminal &) = delete;
        RawTerminal &operator=(const RawTerminal &) = delete;

        bool enabled() const { return enabled_; }

        /// Next pending key, or -1.
        int poll() const {
            if (!enabled_) {
                return -1;
            }
            unsigned char ch = 0;
            return ::read(STDIN_FILENO, &ch, 1) == 1 ? static_cast<int>(ch) : -1;
        }

      private:
        termios saved_{};
        bool enabled_ = false;
    };

    dp::Vector<dp::f64> arm_from(const puppet::ObservationMap &obs, const char *name) {
        if (const auto *entry = puppet::find(obs, name)) {
            return entry->values;
        }
        dp::Vector<dp::f64> zeros;
        zeros.assign(puppet::topology::DualArmMobile::kArmJoints, 0.0);
        return zeros;
    }
} // namespace

int main(int argc, char *argv[]) {
    std::string endpoint;
    auto cmd = argu::Command("keyboard_leader")
                   .version("1.0.0")
                   .about("Keyboard leader: w/s drive, a/d turn, space stop, x resume/checkpoint, y rollback, "
                          "b camera, r reset, q quit")
                   .auto_exit()
                   .arg(argu::Arg("endpoint")
                            .positional()
                            .help("Server endpoint")
                            .value_of(endpoint)
                            .value_name("URI")
                            .default_value("tcp://127.0.0.1:5556"));

    auto result = cmd.parse(argc, argv);
    if (!result) {
        return result.exit();
    }

    puppet::rpc::LeaderClient leader;
    auto connected = leader.connect(endpoint);
    if (connected.is_err()) {
        echo::error(connected.error().message.c_str());
        return 1;
    }

    auto dofs = leader.num_dofs();
    if (dofs.is_ok()) {
        echo("Connected to ", endpoint.c_str(), " (", dofs.value(), " dofs)");
    }

    auto obs = leader.get_observations();
    if (obs.is_err()) {
        echo::error(obs.error().message.c_str());
        return 1;
    }
    const auto left = arm_from(obs.value(), "arm_left_joint_positions");
    const auto right = arm_from(obs.value(), "arm_right_joint_positions");

    RawTerminal term;
    if (!term.enabled()) {
        echo("stdin is not a TTY; keyboard disabled");
    }

    dp::f64 vx = 0.0;
    dp::f64 wz = 0.0;

    while (true) {
        constexpr dp::f64 PUBLISH_DT_S = 1.0 / 30.0;
        constexpr dp::f64 STEP_LIN = 0.1;
        constexpr dp::f64 STEP_ANG = 0.2;

        // Buttons are level-triggered on the server side, so a key press is sent
        // as one pressed frame followed by released frames.
        std::array<dp::f64, puppet::kButtonCount> buttons{};

        const int key = term.poll();
        if (key == 'q' || key == 'Q') {
            break;
        }
        switch (key) {
        case 'w':
            vx += STEP_LIN;
            break;
        case 's':
            vx -= STEP_LIN;
            break;
        case 'a':
            wz += STEP_ANG;
            break;
        case 'd':
            wz -= STEP_ANG;
            break;
        case ' ':
            vx = 0.0;
            wz = 0.0;
            break;
        case 'x':
            buttons[static_cast<dp::usize>(puppet::Button::X)] = 1.0;
            break;
        case 'y':
            buttons[static_cast<dp::usize>(puppet::Button::Y)] = 1.0;
            break;
        case 'b':
            buttons[static_cast<dp::usize>(puppet::Button::B)] = 1.0;
            break;
        case 'r': {
            auto posted = leader.post_event(puppet::Event::Reset);
            if (posted.is_err()) {
                echo::warn(posted.error().message.c_str());
            }
            break;
        }
        default:
            break;
        }

        dp::Vector<dp::f64> frame;
        for (auto q : left) {
            frame.push_back(q);
        }
        for (auto q : right) {
            frame.push_back(q);
        }
        frame.push_back(vx);
        frame.push_back(0.0);
        frame.push_back(wz);
        frame.push_back(0.0); // trunk rate
        frame.push_back(0.0); // trunk tilt
        frame.push_back(1.0); // left gripper open
        frame.push_back(1.0); // right gripper open
        for (auto b : buttons) {
            frame.push_back(b);
        }

        auto sent = leader.command_joint_state(frame);
        if (sent.is_err()) {
            echo::error(sent.error().message.c_str());
            return 1;
        }
        if (key >= 0) {
            echo("key=", static_cast<char>(key), " vx=", vx, " wz=", wz);
        }

        std::this_thread::sleep_for(std::chrono::duration<double>(PUBLISH_DT_S));
    }
    return 0;
}
