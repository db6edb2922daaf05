#include "ProcessRunner.h"
#include "Cancellation.h"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace hostwatch {

namespace {

constexpr size_t MAX_CAPTURE = 1 * 1024 * 1024;

void close_fd(int& fd){ if(fd >= 0){ ::close(fd); fd = -1; } }

// Returns false on EOF or hard error (fd is closed in both cases).
bool drain(int& fd, std::string& sink){
    char buf[4096];
    while(true){
        ssize_t n = ::read(fd, buf, sizeof(buf));
        if(n > 0){
            if(sink.size() < MAX_CAPTURE) sink.append(buf, std::min(static_cast<size_t>(n), MAX_CAPTURE - sink.size()));
            continue;
        }
        if(n < 0 && errno == EINTR) continue;
        if(n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return true;
        close_fd(fd);
        return false;
    }
}

void record_status(int status, ProcessResult& r){
    if(WIFEXITED(status)) r.exit_code = WEXITSTATUS(status);
    else if(WIFSIGNALED(status)) r.term_signal = WTERMSIG(status);
}

}

ProcessResult run_process(const std::vector<std::string>& argv,
                          std::chrono::milliseconds timeout,
                          const CancellationToken* cancel) {
    ProcessResult r;
    if(argv.empty() || argv[0].empty()){
        r.spawn_failed = true; r.error = "empty command";
        return r;
    }
    if(cancel && cancel->cancelled()){
        r.cancelled = true; r.error = "cancelled";
        return r;
    }

    // Everything the child touches is prepared before fork.
    std::vector<char*> cargv;
    cargv.reserve(argv.size()+1);
    for(const auto& a : argv) cargv.push_back(const_cast<char*>(a.c_str()));
    cargv.push_back(nullptr);

    int out_pipe[2] = {-1,-1}, err_pipe[2] = {-1,-1}, exec_pipe[2] = {-1,-1};
    if(pipe2(out_pipe, O_CLOEXEC)!=0 || pipe2(err_pipe, O_CLOEXEC)!=0 || pipe2(exec_pipe, O_CLOEXEC)!=0){
        r.spawn_failed = true; r.error = std::string("pipe failed: ") + std::strerror(errno);
        for(int* p : {out_pipe, err_pipe, exec_pipe}){ close_fd(p[0]); close_fd(p[1]); }
        return r;
    }

    pid_t pid = fork();
    if(pid < 0){
        r.spawn_failed = true; r.error = std::string("fork failed: ") + std::strerror(errno);
        for(int* p : {out_pipe, err_pipe, exec_pipe}){ close_fd(p[0]); close_fd(p[1]); }
        return r;
    }
    if(pid == 0){
        int devnull = ::open("/dev/null", O_RDONLY);
        if(devnull >= 0) ::dup2(devnull, STDIN_FILENO);
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);
        execvp(cargv[0], cargv.data());
        int e = errno;
        ssize_t ignored = ::write(exec_pipe[1], &e, sizeof(e));
        (void)ignored;
        _exit(127);
    }

    close_fd(out_pipe[1]); close_fd(err_pipe[1]); close_fd(exec_pipe[1]);

    // exec_pipe is close-on-exec: EOF means exec succeeded, an int means errno.
    int exec_errno = 0;
    ssize_t got;
    do { got = ::read(exec_pipe[0], &exec_errno, sizeof(exec_errno)); } while(got < 0 && errno == EINTR);
    close_fd(exec_pipe[0]);
    if(got == static_cast<ssize_t>(sizeof(exec_errno))){
        r.spawn_failed = true;
        r.error = "exec " + argv[0] + ": " + std::strerror(exec_errno);
        close_fd(out_pipe[0]); close_fd(err_pipe[0]);
        int status = 0;
        while(waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
        return r;
    }

    fcntl(out_pipe[0], F_SETFL, fcntl(out_pipe[0], F_GETFL) | O_NONBLOCK);
    fcntl(err_pipe[0], F_SETFL, fcntl(err_pipe[0], F_GETFL) | O_NONBLOCK);

    const bool has_deadline = timeout.count() > 0;
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    bool reaped = false;
    int status = 0;

    auto must_stop = [&]() -> bool {
        if(cancel && cancel->cancelled()){ r.cancelled = true; return true; }
        if(has_deadline && std::chrono::steady_clock::now() >= deadline){ r.timed_out = true; return true; }
        return false;
    };
    auto slice_ms = [&]() -> int {
        if(!has_deadline) return 50;
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now()).count();
        if(left < 1) return 1;
        return static_cast<int>(std::min<long long>(left, 50));
    };

    while(!reaped){
        if(must_stop()){
            kill(pid, SIGKILL);
            break;
        }
        if(out_pipe[0] >= 0 || err_pipe[0] >= 0){
            pollfd fds[2]; nfds_t n = 0;
            if(out_pipe[0] >= 0) fds[n++] = {out_pipe[0], POLLIN, 0};
            if(err_pipe[0] >= 0) fds[n++] = {err_pipe[0], POLLIN, 0};
            int pr = ::poll(fds, n, slice_ms());
            if(pr < 0 && errno != EINTR){
                r.error = std::string("poll failed: ") + std::strerror(errno);
                kill(pid, SIGKILL);
                break;
            }
            if(pr > 0){
                if(out_pipe[0] >= 0) drain(out_pipe[0], r.out);
                if(err_pipe[0] >= 0) drain(err_pipe[0], r.err);
            }
        } else {
            // Both streams closed; the child may still be running.
            pid_t w = waitpid(pid, &status, WNOHANG);
            if(w == pid){ reaped = true; break; }
            if(w < 0 && errno != EINTR){ r.error = std::string("waitpid failed: ") + std::strerror(errno); reaped = true; break; }
            std::this_thread::sleep_for(std::chrono::milliseconds(std::min(slice_ms(), 5)));
        }
    }

    close_fd(out_pipe[0]); close_fd(err_pipe[0]);
    if(!reaped){
        while(waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
    }
    record_status(status, r);
    if(r.timed_out && r.error.empty()) r.error = "timed out after " + std::to_string(timeout.count()) + "ms";
    if(r.cancelled && r.error.empty()) r.error = "cancelled";
    return r;
}

}
