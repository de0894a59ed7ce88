#include "util/subprocess.hpp"

#include <atomic>
#include <cstdint>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <sstream>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace asmhom {

static std::atomic<uint64_t> g_output_counter{0};

static bool read_file(const std::string& path, std::string& out) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) return false;
    std::ostringstream ss;
    ss << in.rdbuf();
    out = ss.str();
    return true;
}

std::string format_command(const std::vector<std::string>& argv) {
    std::string s;
    for (size_t i = 0; i < argv.size(); i++) {
        if (i > 0) s += ' ';
        s += argv[i];
    }
    return s;
}

bool run_process(const std::vector<std::string>& argv,
                 const std::string& work_dir,
                 ProcessResult& result,
                 std::string& error_msg) {
    if (argv.empty()) {
        error_msg = "run_process: empty command";
        return false;
    }

    uint64_t n = g_output_counter.fetch_add(1);
    std::string base = work_dir + "/proc_" + std::to_string(::getpid()) +
                       "_" + std::to_string(n);
    std::string out_path = base + ".out";
    std::string err_path = base + ".err";

    int out_fd = ::open(out_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0600);
    if (out_fd < 0) {
        error_msg = "cannot create " + out_path + ": " + std::strerror(errno);
        return false;
    }
    int err_fd = ::open(err_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0600);
    if (err_fd < 0) {
        error_msg = "cannot create " + err_path + ": " + std::strerror(errno);
        ::close(out_fd);
        ::unlink(out_path.c_str());
        return false;
    }

    // The child reports an exec failure's errno through this pipe.
    // A successful exec closes the write end (O_CLOEXEC).
    int status_pipe[2];
    if (::pipe2(status_pipe, O_CLOEXEC) < 0) {
        error_msg = std::string("pipe failed: ") + std::strerror(errno);
        ::close(out_fd);
        ::close(err_fd);
        ::unlink(out_path.c_str());
        ::unlink(err_path.c_str());
        return false;
    }

    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& a : argv) cargv.push_back(const_cast<char*>(a.c_str()));
    cargv.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        error_msg = std::string("fork failed: ") + std::strerror(errno);
        ::close(out_fd);
        ::close(err_fd);
        ::close(status_pipe[0]);
        ::close(status_pipe[1]);
        ::unlink(out_path.c_str());
        ::unlink(err_path.c_str());
        return false;
    }

    if (pid == 0) {
        ::close(status_pipe[0]);
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);
        ::dup2(out_fd, STDOUT_FILENO);
        ::dup2(err_fd, STDERR_FILENO);
        ::execvp(cargv[0], cargv.data());
        int e = errno;
        ssize_t w = ::write(status_pipe[1], &e, sizeof(e));
        (void)w;
        ::_exit(127);
    }

    ::close(out_fd);
    ::close(err_fd);
    ::close(status_pipe[1]);

    int exec_errno = 0;
    ssize_t r;
    do {
        r = ::read(status_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (r < 0 && errno == EINTR);
    ::close(status_pipe[0]);

    int status = 0;
    pid_t w;
    do {
        w = ::waitpid(pid, &status, 0);
    } while (w < 0 && errno == EINTR);

    bool ok = true;
    if (r == static_cast<ssize_t>(sizeof(exec_errno))) {
        error_msg = "cannot execute " + argv[0] + ": " + std::strerror(exec_errno);
        ok = false;
    } else if (w < 0) {
        error_msg = std::string("waitpid failed: ") + std::strerror(errno);
        ok = false;
    } else {
        if (WIFEXITED(status)) {
            result.exit_code = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            result.exit_code = 128 + WTERMSIG(status);
        }
        if (!read_file(out_path, result.stdout_text) ||
            !read_file(err_path, result.stderr_text)) {
            error_msg = "cannot read output of " + argv[0];
            ok = false;
        }
    }

    ::unlink(out_path.c_str());
    ::unlink(err_path.c_str());
    return ok;
}

} // namespace asmhom
