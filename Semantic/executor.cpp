#include "Semantic.h"

namespace {

[[noreturn]] void exec_failed(const ExecutionPlan& plan, int err){
    throw SemanticError(ErrorKind::ExecutionFailed,
                        "`" + plan.command_line() + "`: " + std::strerror(err));
}

void close_fd(int fd){
    if(fd >= 0) ::close(fd);
}

} // namespace

int run_plan(const ExecutionPlan& plan){
    TRACE_FN("cmd=", plan.command_line());

    // The child writes errno here if execvp fails; a successful exec closes
    // the write end (FD_CLOEXEC) and the parent reads EOF.
    int status_pipe[2];
    if(pipe(status_pipe) < 0){
        exec_failed(plan, errno);
    }
    if(fcntl(status_pipe[1], F_SETFD, FD_CLOEXEC) < 0){
        int err = errno;
        close_fd(status_pipe[0]);
        close_fd(status_pipe[1]);
        exec_failed(plan, err);
    }

    std::vector<const char*> argv;
    argv.reserve(plan.args.size() + 2);
    argv.push_back(plan.program.c_str());
    for(const auto& a : plan.args) argv.push_back(a.c_str());
    argv.push_back(nullptr);

    std::cout.flush();
    std::cerr.flush();

    pid_t pid = fork();
    if(pid < 0){
        int err = errno;
        close_fd(status_pipe[0]);
        close_fd(status_pipe[1]);
        exec_failed(plan, err);
    }

    if(pid == 0){
        // Child process
        close_fd(status_pipe[0]);
        execvp(plan.program.c_str(), const_cast<char* const*>(argv.data()));
        int err = errno;
        ssize_t ignored = write(status_pipe[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    // Parent process
    close_fd(status_pipe[1]);
    int child_errno = 0;
    ssize_t n;
    do {
        n = read(status_pipe[0], &child_errno, sizeof(child_errno));
    } while(n < 0 && errno == EINTR);
    close_fd(status_pipe[0]);

    int status = 0;
    pid_t waited;
    do {
        waited = waitpid(pid, &status, 0);
    } while(waited < 0 && errno == EINTR);

    if(n == static_cast<ssize_t>(sizeof(child_errno))){
        exec_failed(plan, child_errno);
    }
    if(waited < 0){
        exec_failed(plan, errno);
    }

    if(WIFEXITED(status)) return WEXITSTATUS(status);
    if(WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return 1;
}
