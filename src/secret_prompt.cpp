#include "symcli/secret_prompt.hpp"

#include <string>

#include <termios.h>
#include <unistd.h>

namespace symcli {

namespace {

// Restores the saved terminal attributes on scope exit.
class EchoGuard {
public:
    explicit EchoGuard(const int fd) : fd_(fd) {
        if (isatty(fd_) != 1 || tcgetattr(fd_, &saved_) != 0) {
            return;
        }
        termios quiet = saved_;
        quiet.c_lflag &= ~static_cast<tcflag_t>(ECHO);
        active_ = tcsetattr(fd_, TCSANOW, &quiet) == 0;
    }

    ~EchoGuard() {
        if (active_) {
            tcsetattr(fd_, TCSANOW, &saved_);
        }
    }

    EchoGuard(const EchoGuard&) = delete;
    EchoGuard& operator=(const EchoGuard&) = delete;

    bool active() const { return active_; }

private:
    int fd_;
    termios saved_{};
    bool active_ = false;
};

}  // namespace

SymStatus TerminalPrompt::PromptSecret(const std::string& label, std::string& out_secret) {
    err_ << label;
    err_.flush();

    bool got_line = false;
    {
        EchoGuard guard(input_fd_);
        got_line = static_cast<bool>(std::getline(in_, out_secret));
        if (guard.active()) {
            err_ << "\n";
        }
    }
    if (!got_line) {
        out_secret.clear();
        return SymStatus::InteractiveAborted;
    }
    if (!out_secret.empty() && out_secret.back() == '\r') {
        out_secret.pop_back();
    }
    return SymStatus::Ok;
}

}  // namespace symcli
