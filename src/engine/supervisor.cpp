#include "engine/supervisor.hpp"
#include <fcntl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <poll.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <boost/algorithm/string/join.hpp>
#include <cstring>
#include <system_error>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/utils.hpp"

namespace quest::engine {
using namespace std;

const int BUF_SIZE = 4096;

// 每次 poll 返回后每个管道最多读取的次数，避免持续输出的程序占住循环
const int MAX_READS_PER_ROUND = 16;

const int PIPE_IN = 1;
const int PIPE_OUT = 0;

const chrono::milliseconds POLL_INTERVAL(20);

/**
 * @brief 子进程在 exec 之前失败的阶段，通过状态管道传给父进程
 */
enum child_stage {
    STAGE_SETSID = 1,
    STAGE_RLIMIT = 2,
    STAGE_REDIRECT = 3,
    STAGE_CHDIR = 4,
    STAGE_EXEC = 5
};

static const char *get_stage_name(int stage) {
    switch (stage) {
        case STAGE_SETSID: return "setsid";
        case STAGE_RLIMIT: return "setrlimit";
        case STAGE_REDIRECT: return "redirecting standard streams";
        case STAGE_CHDIR: return "changing working directory";
        case STAGE_EXEC: return "exec";
        default: return "unknown stage";
    }
}

struct rlimit_setting {
    int resource;
    rlim_t cur, max;
};

struct output_stream {
    int fd = -1;
    string data;
    bool truncated = false;
};

void cancellation_token::cancel() noexcept {
    cancelled = true;
}

bool cancellation_token::is_cancelled() const noexcept {
    return cancelled;
}

supervision_limits make_supervision_limits(const engine_config &config, chrono::milliseconds wall_time, size_t max_output_bytes) {
    supervision_limits limits;
    limits.wall_time = wall_time;
    limits.max_output_bytes = max_output_bytes;
    limits.rlimits = config.limits;
    limits.kill_grace = chrono::milliseconds(config.kill_grace_millis);
    limits.runaway_bytes_per_window = config.runaway_bytes_per_window;
    limits.runaway_window = chrono::milliseconds(config.runaway_window_millis);
    limits.runaway_windows = config.runaway_windows;
    return limits;
}

static void close_fd(int &fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

/**
 * @brief 向整个进程组发送信号，进程组已经不存在时不视为错误
 */
static void kill_group(pid_t pgid, int sig) {
    if (kill(-pgid, sig) != 0 && errno != ESRCH)
        LOG(WARNING) << "unable to send signal " << sig << " to process group " << pgid << ": " << strerror(errno);
}

/**
 * @brief 生成子进程需要设置的 rlimit
 * 非特权进程不能提高硬限制，因此所有值都不会超过当前的硬限制。
 */
static vector<rlimit_setting> collect_rlimits(const resource_limits &limits) {
    vector<rlimit_setting> settings;
    auto add = [&](int resource, rlim_t cur, rlim_t max) {
        struct rlimit current;
        if (getrlimit(resource, &current) != 0)
            throw system_error(errno, system_category(), "getrlimit");
        if (current.rlim_max != RLIM_INFINITY) {
            max = min(max, current.rlim_max);
            cur = min(cur, max);
        }
        settings.push_back({resource, cur, max});
    };

    if (limits.cpu_seconds) {
        // 硬限制比软限制多一秒：到达软限制时内核发送 SIGXCPU，可以可靠地判断 CPU 时间超限
        rlim_t cputime = *limits.cpu_seconds;
        add(RLIMIT_CPU, cputime, cputime + 1);
    }
    if (limits.memory_bytes) add(RLIMIT_AS, *limits.memory_bytes, *limits.memory_bytes);
    if (limits.processes) add(RLIMIT_NPROC, *limits.processes, *limits.processes);
    if (limits.file_bytes) add(RLIMIT_FSIZE, *limits.file_bytes, *limits.file_bytes);
    if (limits.no_core_dumps) add(RLIMIT_CORE, 0, 0);
    return settings;
}

/**
 * @brief 子进程在 exec 之前出错时，把出错阶段和 errno 写入状态管道并退出
 * fork 之后的子进程只能调用 async-signal-safe 的函数。
 */
[[noreturn]] static void child_fail(int status_fd, int stage) {
    int payload[2] = {stage, errno};
    ssize_t written = write(status_fd, payload, sizeof(payload));
    (void)written;
    _exit(127);
}

/**
 * @brief 从管道中读取数据，超出上限的部分直接丢弃但仍然计数
 * @return 本次丢弃的字节数
 */
static size_t pump_pipe(output_stream &stream, size_t limit) {
    char buf[BUF_SIZE];
    size_t discarded = 0;
    for (int round = 0; round < MAX_READS_PER_ROUND && stream.fd >= 0; ++round) {
        ssize_t nread = read(stream.fd, buf, BUF_SIZE);
        if (nread > 0) {
            size_t room = stream.data.size() < limit ? limit - stream.data.size() : 0;
            size_t keep = min(room, (size_t)nread);
            stream.data.append(buf, keep);
            if (keep < (size_t)nread) {
                if (!stream.truncated) LOG(INFO) << "child fd " << stream.fd << " limit reached";
                stream.truncated = true;
                discarded += nread - keep;
            }
        } else if (nread == 0) {
            // EOF
            close_fd(stream.fd);
        } else {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) break;
            throw system_error(errno, system_category(), "reading child output");
        }
    }
    return discarded;
}

static void set_nonblock(int fd) {
    int flags = fcntl(fd, F_GETFL);
    if (flags == -1 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) == -1)
        throw system_error(errno, system_category(), "fcntl, setting flags");
}

static void run_command(const command &cmd, const supervision_limits &limits, const cancellation_token *cancel, raw_outcome &outcome) {
    if (cmd.argv.empty())
        throw internal_error("empty command");

    string search_path = cmd.env.count("PATH") ? cmd.env.at("PATH") : get_env("PATH", "/usr/local/bin:/usr/bin:/bin");
    auto program = find_executable(cmd.argv[0], search_path);
    if (!program)
        throw internal_error(fmt::format("toolchain {} is not installed or not executable", cmd.argv[0]));

    VLOG(1) << "spawning " << get_step_name(cmd.role) << " step: " << boost::algorithm::join(cmd.argv, " ");

    // 在 fork 之前准备好子进程需要的全部数据，子进程中不再分配内存
    vector<rlimit_setting> rlimits = collect_rlimits(limits.rlimits);
    vector<string> environment = build_environment(cmd.env);
    vector<char *> args, envp;
    for (auto &arg : cmd.argv) args.push_back(const_cast<char *>(arg.c_str()));
    args.push_back(nullptr);
    for (auto &entry : environment) envp.push_back(const_cast<char *>(entry.c_str()));
    envp.push_back(nullptr);
    string program_path = program->string();
    string working_dir = cmd.working_dir.string();

    int out_pipe[2] = {-1, -1}, err_pipe[2] = {-1, -1}, status_pipe[2] = {-1, -1};
    int devnull = -1;
    defer {
        for (int *p : {out_pipe, err_pipe, status_pipe}) {
            close_fd(p[PIPE_IN]);
            close_fd(p[PIPE_OUT]);
        }
        close_fd(devnull);
    };

    // 所有的文件描述符都带有 O_CLOEXEC，避免其他 worker 线程同时启动的子进程继承这些管道
    for (int *p : {out_pipe, err_pipe, status_pipe})
        if (pipe2(p, O_CLOEXEC) != 0)
            throw system_error(errno, system_category(), "creating pipe");
    if ((devnull = open("/dev/null", O_RDONLY | O_CLOEXEC)) < 0)
        throw system_error(errno, system_category(), "opening /dev/null");

    auto start = chrono::steady_clock::now();
    pid_t pid = fork();
    if (pid == -1)
        throw system_error(errno, system_category(), "unable to fork");

    if (pid == 0) {  // 子进程
        int status_fd = status_pipe[PIPE_IN];

        sigset_t emptymask;
        sigemptyset(&emptymask);
        sigprocmask(SIG_SETMASK, &emptymask, nullptr);
        signal(SIGPIPE, SIG_DFL);
        signal(SIGINT, SIG_DFL);
        signal(SIGTERM, SIG_DFL);

        // 在新的进程组中运行命令，这样可以用一个信号杀死命令及其所有后代进程
        if (setsid() == -1) child_fail(status_fd, STAGE_SETSID);

        for (auto &setting : rlimits) {
            struct rlimit lim;
            lim.rlim_cur = setting.cur;
            lim.rlim_max = setting.max;
            if (setrlimit(setting.resource, &lim) != 0) child_fail(status_fd, STAGE_RLIMIT);
        }

        if (dup2(devnull, STDIN_FILENO) < 0 ||
            dup2(out_pipe[PIPE_IN], STDOUT_FILENO) < 0 ||
            dup2(err_pipe[PIPE_IN], STDERR_FILENO) < 0)
            child_fail(status_fd, STAGE_REDIRECT);

        if (!working_dir.empty() && chdir(working_dir.c_str()) != 0)
            child_fail(status_fd, STAGE_CHDIR);

        execve(program_path.c_str(), args.data(), envp.data());
        child_fail(status_fd, STAGE_EXEC);
    }

    // 监控进程
    bool reaped = false;
    int wstatus = 0;
    scoped_guard reaper([&] {
        if (reaped) return;
        kill_group(pid, SIGKILL);
        kill(pid, SIGKILL);
        while (waitpid(pid, &wstatus, 0) == -1 && errno == EINTR) {}
    });

    for (int *p : {out_pipe, err_pipe, status_pipe})
        close_fd(p[PIPE_IN]);
    close_fd(devnull);

    {
        // exec 成功时状态管道因为 O_CLOEXEC 被关闭，读到 EOF
        int payload[2];
        ssize_t nread;
        do {
            nread = read(status_pipe[PIPE_OUT], payload, sizeof(payload));
        } while (nread == -1 && errno == EINTR);
        close_fd(status_pipe[PIPE_OUT]);
        if (nread == (ssize_t)sizeof(payload)) {
            while (waitpid(pid, &wstatus, 0) == -1 && errno == EINTR) {}
            reaped = true;
            throw internal_error(fmt::format("unable to start {}: {} failed: {}", cmd.argv[0], get_stage_name(payload[0]), strerror(payload[1])));
        }
    }

    output_stream out, err;
    out.fd = out_pipe[PIPE_OUT];
    err.fd = err_pipe[PIPE_OUT];
    out_pipe[PIPE_OUT] = err_pipe[PIPE_OUT] = -1;
    defer {
        close_fd(out.fd);
        close_fd(err.fd);
    };
    set_nonblock(out.fd);
    set_nonblock(err.fd);

    auto deadline = start + limits.wall_time;
    auto end = start;
    optional<termination> forced;
    chrono::steady_clock::time_point kill_at, drain_deadline;
    bool sent_kill = false;

    auto window_start = start;
    size_t window_discarded = 0;
    unsigned hot_windows = 0;

    while (true) {
        auto now = chrono::steady_clock::now();

        if (!reaped) {
            pid_t r = waitpid(pid, &wstatus, WNOHANG);
            if (r == -1 && errno != EINTR)
                throw system_error(errno, system_category(), "waiting on child");
            if (r == pid) {
                reaped = true;
                end = now;
                // 主进程已经退出，杀死进程组内残留的后代进程，确保它们不会比命令活得更久
                kill_group(pid, SIGKILL);
                drain_deadline = now + limits.kill_grace;
            }
        }

        if (reaped) {
            if (out.fd < 0 && err.fd < 0) break;
            if (now >= drain_deadline) {
                LOG(WARNING) << "output of " << cmd.argv[0] << " is still open after the process group was killed";
                break;
            }
        } else if (!forced) {
            if (cancel && cancel->is_cancelled()) {
                forced = termination::CANCELLED;
                LOG(WARNING) << "execution cancelled: aborting command " << cmd.argv[0];
            } else if (now >= deadline) {
                forced = termination::TIMEOUT;
                LOG(WARNING) << fmt::format("timelimit exceeded ({} ms wall time): aborting command {}", limits.wall_time.count(), cmd.argv[0]);
            } else if (limits.runaway_windows > 0 && hot_windows >= limits.runaway_windows) {
                forced = termination::RESOURCE_EXCEEDED;
                LOG(WARNING) << "runaway output detected: aborting command " << cmd.argv[0];
            }

            if (forced) {
                // 先尝试让程序正常结束，kill_grace 之后再强制杀死
                kill_group(pid, SIGTERM);
                kill_at = now + limits.kill_grace;
            }
        } else if (!sent_kill && now >= kill_at) {
            LOG(INFO) << "sending SIGKILL to process group " << pid;
            kill_group(pid, SIGKILL);
            sent_kill = true;
        }

        auto timeout = POLL_INTERVAL;
        if (!reaped && !forced && deadline - now < timeout)
            timeout = max(chrono::milliseconds(1), chrono::duration_cast<chrono::milliseconds>(deadline - now));

        pollfd fds[2];
        output_stream *streams[2];
        nfds_t nfds = 0;
        for (output_stream *stream : {&out, &err}) {
            if (stream->fd < 0) continue;
            fds[nfds].fd = stream->fd;
            fds[nfds].events = POLLIN;
            fds[nfds].revents = 0;
            streams[nfds++] = stream;
        }

        int r = poll(fds, nfds, (int)timeout.count());
        if (r == -1 && errno != EINTR)
            throw system_error(errno, system_category(), "waiting for child data");
        if (r > 0) {
            for (nfds_t i = 0; i < nfds; ++i)
                if (fds[i].revents & (POLLIN | POLLHUP | POLLERR))
                    window_discarded += pump_pipe(*streams[i], limits.max_output_bytes);
        }

        now = chrono::steady_clock::now();
        if (now - window_start >= limits.runaway_window) {
            if (window_discarded > limits.runaway_bytes_per_window)
                ++hot_windows;
            else
                hot_windows = 0;
            window_discarded = 0;
            window_start = now;
        }
    }

    outcome.duration_millis = chrono::duration_cast<chrono::milliseconds>(end - start).count();
    outcome.output = move(out.data);
    outcome.error = move(err.data);
    outcome.truncated_stdout = out.truncated;
    outcome.truncated_stderr = err.truncated;

    if (WIFSIGNALED(wstatus)) outcome.signal = WTERMSIG(wstatus);

    if (forced) {
        outcome.term = *forced;
        outcome.exit_code = nullopt;
    } else if (WIFEXITED(wstatus)) {
        outcome.term = termination::EXITED;
        outcome.exit_code = WEXITSTATUS(wstatus);
    } else if (WIFSIGNALED(wstatus)) {
        // In linux, exitcode is no larger than 127.
        outcome.exit_code = outcome.signal + 128;
        switch (outcome.signal) {
            case SIGXCPU:
                outcome.term = termination::RESOURCE_EXCEEDED;
                outcome.message = "cpu time limit exceeded";
                LOG(WARNING) << "Time Limit Exceeded (hard limit)";
                break;
            case SIGXFSZ:
                outcome.term = termination::RESOURCE_EXCEEDED;
                outcome.message = "file size limit exceeded";
                LOG(WARNING) << "File Size Limit Exceeded";
                break;
            default:
                outcome.term = termination::SIGNALED;
                LOG(WARNING) << "Command terminated with signal (" << outcome.signal << ", " << strsignal(outcome.signal) << ")";
                break;
        }
    } else {
        throw internal_error(fmt::format("unknown status: {:x}", wstatus));
    }
}

raw_outcome supervise(const command &cmd, const supervision_limits &limits, const cancellation_token *cancel) {
    raw_outcome outcome;
    outcome.role = cmd.role;
    try {
        run_command(cmd, limits, cancel, outcome);
    } catch (std::exception &ex) {
        LOG(ERROR) << "unable to run " << get_step_name(cmd.role) << " step: " << ex.what();
        outcome.term = termination::INTERNAL_ERROR;
        outcome.exit_code = nullopt;
        outcome.message = ex.what();
    }
    return outcome;
}

}  // namespace quest::engine
