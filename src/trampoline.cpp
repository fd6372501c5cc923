#include "trampoline.hpp"
#include "util.hpp"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <iostream>
#include <sys/wait.h>
#include <unistd.h>

namespace cronrepo {

namespace fs = std::filesystem;

RunConfig parse_run_config(const std::string& content, const std::string& path,
                           RunConfig defaults) {
    RunConfig cfg = std::move(defaults);
    int line_no = 0;
    for (const auto& raw : split(content, '\n')) {
        ++line_no;
        std::string line = trim(raw);
        if (line.empty() || line[0] == '#') continue;

        auto eq = line.find('=');
        if (eq == std::string::npos) {
            throw TrampolineSetupError(path + ":" + std::to_string(line_no) +
                                       ": expected KEY=VALUE");
        }
        std::string key = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));
        if (key == "LOG") {
            cfg.log = value;
        } else if (key == "NOTIFY") {
            cfg.notify = value;
        } else if (key == "ROTATE") {
            if (!parse_uint(value, cfg.rotate)) {
                throw TrampolineSetupError(path + ":" + std::to_string(line_no) +
                                           ": ROTATE must be a non-negative integer");
            }
        } else {
            std::cerr << "[trampoline] " << path << ":" << line_no
                      << ": ignoring unknown directive " << key << "\n";
        }
    }
    return cfg;
}

RunConfig load_run_config(const std::string& job_file, const RunConfig& defaults) {
    fs::path conf = fs::path(job_file).parent_path() / kRunConfigName;
    RunConfig cfg = defaults;
    std::error_code ec;
    if (fs::exists(conf, ec)) {
        std::string content;
        if (!read_file(conf.string(), content)) {
            throw TrampolineSetupError("cannot read " + conf.string());
        }
        cfg = parse_run_config(content, conf.string(), defaults);
    }
    if (cfg.log.empty()) {
        throw TrampolineSetupError("no LOG directive in " + conf.string() +
                                   " and no run.log default configured");
    }
    return cfg;
}

std::string log_name(const std::string& job_file, const std::string& job_id) {
    std::string name = fs::path(job_file).stem().string();
    return job_id.empty() ? name : name + "%" + job_id;
}

LogLocation resolve_log_dir(const std::string& tmpl, std::time_t now) {
    std::tm day{};
    localtime_r(&now, &day);
    day.tm_hour = 0;
    day.tm_min = 0;
    day.tm_sec = 0;

    char buf[4096];
    size_t n = std::strftime(buf, sizeof(buf), tmpl.c_str(), &day);
    if (n == 0 && !tmpl.empty()) {
        throw TrampolineSetupError("LOG template expands to nothing: " + tmpl);
    }
    char date[16];
    std::strftime(date, sizeof(date), "%Y-%m-%d", &day);

    LogLocation loc;
    loc.dir = expand_home(expand_env(std::string(buf, n)));
    loc.date = date;

    std::error_code ec;
    fs::create_directories(loc.dir, ec);
    if (ec || !fs::is_directory(loc.dir)) {
        throw TrampolineSetupError("cannot create log directory " + loc.dir +
                                   (ec ? ": " + ec.message() : ""));
    }
    return loc;
}

void rotate_log(const std::string& log_path, int keep) {
    auto backup = [&log_path](int i) { return log_path + "." + std::to_string(i); };
    std::error_code ec;

    for (int i = keep > 0 ? keep : 1; fs::exists(backup(i), ec); ++i) {
        fs::remove(backup(i), ec);
    }
    if (!fs::exists(log_path, ec)) return;
    if (keep <= 0) {
        fs::remove(log_path, ec);
        if (ec) throw TrampolineSetupError("cannot remove " + log_path + ": " + ec.message());
        return;
    }
    for (int i = keep - 1; i >= 1; --i) {
        if (!fs::exists(backup(i), ec)) continue;
        fs::rename(backup(i), backup(i + 1), ec);
        if (ec) throw TrampolineSetupError("cannot rotate " + backup(i) + ": " + ec.message());
    }
    fs::rename(log_path, backup(1), ec);
    if (ec) throw TrampolineSetupError("cannot rotate " + log_path + ": " + ec.message());
}

std::string JobOutcome::status_text() const {
    return exited ? std::to_string(code) : std::to_string(-signal);
}

int JobOutcome::exit_code() const {
    return exited ? code : 128 + signal;
}

JobOutcome outcome_from_wait_status(int status) {
    JobOutcome out;
    if (WIFSIGNALED(status)) {
        out.exited = false;
        out.signal = WTERMSIG(status);
    } else {
        out.code = WIFEXITED(status) ? WEXITSTATUS(status) : 1;
    }
    return out;
}

const std::vector<int>& PosixSignalShield::signals() {
    static const std::vector<int> sigs = {SIGINT, SIGQUIT, SIGTERM, SIGPIPE};
    return sigs;
}

void PosixSignalShield::shield() {
    saved_.assign(signals().size(), {});
    struct sigaction ignore{};
    ignore.sa_handler = SIG_IGN;
    sigemptyset(&ignore.sa_mask);
    for (size_t i = 0; i < signals().size(); ++i) {
        sigaction(signals()[i], &ignore, &saved_[i]);
    }
}

void PosixSignalShield::release() {
    for (size_t i = 0; i < saved_.size(); ++i) {
        sigaction(signals()[i], &saved_[i], nullptr);
    }
    saved_.clear();
}

namespace {

class ShieldScope {
public:
    explicit ShieldScope(SignalShield& s) : s_(s) { s_.shield(); }
    ~ShieldScope() { s_.release(); }
    ShieldScope(const ShieldScope&) = delete;
    ShieldScope& operator=(const ShieldScope&) = delete;

private:
    SignalShield& s_;
};

void touch(const std::string& path) {
    if (!atomic_write_file(path, "")) {
        throw TrampolineSetupError("cannot create " + path);
    }
}

} // namespace

Trampoline::Trampoline(RunConfig config, SignalShield& signals)
    : config_(std::move(config)), signals_(signals) {}

std::string Trampoline::state_path(const std::string& suffix) const {
    return (fs::path(location_.dir) / (name_ + suffix)).string();
}

int Trampoline::run(const TrampolineRequest& request, std::time_t now) {
    state_ = RunState::Starting;
    prepare(request, now);

    // Rotation and state files must not be cut short by an interrupt
    ShieldScope scope(signals_);
    start(request);
    state_ = RunState::Running;
    JobOutcome outcome = launch(request);
    finish(outcome);
    if (!outcome.ok() && request.notify) notify_failure(outcome);
    return outcome.exit_code();
}

void Trampoline::prepare(const TrampolineRequest& request, std::time_t now) {
    location_ = resolve_log_dir(config_.log, now);
    name_ = log_name(request.job_file, request.job_id);
}

void Trampoline::start(const TrampolineRequest& request) {
    rotate_log(state_path(".log"), config_.rotate);
    touch(state_path(".running"));

    setenv("CRONREPO_LOG", location_.dir.c_str(), 1);
    setenv("CRONREPO_NAME", name_.c_str(), 1);
    setenv("CRONREPO_DATE", location_.date.c_str(), 1);
    if (request.job_id.empty()) {
        unsetenv("CRONREPO_JID");
    } else {
        setenv("CRONREPO_JID", request.job_id.c_str(), 1);
    }
}

JobOutcome Trampoline::launch(const TrampolineRequest& request) {
    std::string log_path = state_path(".log");
    int fd = open(log_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        std::cerr << "[trampoline] cannot open " << log_path << ": "
                  << std::strerror(errno) << "\n";
        return JobOutcome{true, 127, 0};
    }

    std::vector<std::string> argv_store;
    argv_store.push_back(request.job_file);
    argv_store.insert(argv_store.end(), request.args.begin(), request.args.end());
    std::vector<char*> argv;
    for (auto& a : argv_store) argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        close(fd);
        std::cerr << "[trampoline] fork failed: " << std::strerror(errno) << "\n";
        return JobOutcome{true, 127, 0};
    }

    if (pid == 0) {
        // The job gets the default dispositions back
        for (int sig : PosixSignalShield::signals()) std::signal(sig, SIG_DFL);
        dup2(fd, STDOUT_FILENO);
        dup2(fd, STDERR_FILENO);
        execv(argv[0], argv.data());
        std::fprintf(stderr, "cronrepo-run: cannot execute %s: %s\n", argv[0],
                     std::strerror(errno));
        _exit(127);
    }

    close(fd);
    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            std::cerr << "[trampoline] waitpid failed: " << std::strerror(errno) << "\n";
            return JobOutcome{true, 127, 0};
        }
    }
    return outcome_from_wait_status(status);
}

void Trampoline::finish(const JobOutcome& outcome) {
    std::error_code ec;
    fs::remove(state_path(".running"), ec);
    fs::remove(state_path(".completed"), ec);
    fs::remove(state_path(".failed"), ec);

    state_ = outcome.ok() ? RunState::Completed : RunState::Failed;
    std::string path = state_path(outcome.ok() ? ".completed" : ".failed");
    std::string content = outcome.ok() ? "" : outcome.status_text() + "\n";
    if (!atomic_write_file(path, content)) {
        std::cerr << "[trampoline] cannot write " << path << "\n";
    }
}

void Trampoline::notify_failure(const JobOutcome& outcome) {
    if (config_.notify.empty()) return;
    setenv("CRONREPO_STATUS", outcome.status_text().c_str(), 1);

    pid_t pid = fork();
    if (pid < 0) {
        std::cerr << "[trampoline] cannot start notify command: "
                  << std::strerror(errno) << "\n";
        return;
    }
    if (pid == 0) {
        for (int sig : PosixSignalShield::signals()) std::signal(sig, SIG_DFL);
        execl("/bin/sh", "sh", "-c", config_.notify.c_str(), nullptr);
        _exit(127);
    }
    int status = 0;
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
    JobOutcome notified = outcome_from_wait_status(status);
    if (!notified.ok()) {
        std::cerr << "[trampoline] notify command failed with status "
                  << notified.status_text() << "\n";
    }
}

} // namespace cronrepo
