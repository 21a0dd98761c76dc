#include <mergeimport/process.hpp>

#include <fmt/format.h>

#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <fcntl.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <cstdlib>

namespace fs = std::filesystem;

namespace mergeimport {

static int make_cloexec_pipe(int pfd[2]) {
#ifdef __linux__
  if (::pipe2(pfd, O_CLOEXEC) == 0) return 0;
#endif
  if (::pipe(pfd) != 0) return -1;
  ::fcntl(pfd[0], F_SETFD, ::fcntl(pfd[0], F_GETFD) | FD_CLOEXEC);
  ::fcntl(pfd[1], F_SETFD, ::fcntl(pfd[1], F_GETFD) | FD_CLOEXEC);
  return 0;
}

static void close_pair(int pfd[2]) {
  ::close(pfd[0]);
  ::close(pfd[1]);
}

static std::string read_all(int fd) {
  std::string s;
  std::array<char, 4096> buf{};
  for (;;) {
    ssize_t n = ::read(fd, buf.data(), buf.size());
    if (n > 0) { s.append(buf.data(), static_cast<size_t>(n)); continue; }
    if (n < 0 && errno == EINTR) continue;
    break;
  }
  return s;
}

ProcResult run_process(const std::vector<std::string> &args,
                       const fs::path &cwd,
                       const std::unordered_map<std::string, std::string> &env,
                       const fs::path &stderr_path) {
  ProcResult res{};
  if (args.empty()) {
    res.error = "empty argv";
    return res;
  }

  int errfd = -1;
  if (!stderr_path.empty()) {
    errfd = ::open(stderr_path.c_str(), O_CREAT | O_WRONLY | O_TRUNC | O_CLOEXEC, 0644);
    if (errfd < 0) {
      res.error = fmt::format("open {}: {}", stderr_path.string(), std::strerror(errno));
      return res;
    }
  }

  int out_pipe[2];
  if (make_cloexec_pipe(out_pipe) != 0) {
    res.error = fmt::format("pipe failed: {}", std::strerror(errno));
    if (errfd >= 0) ::close(errfd);
    return res;
  }
  // child writes its errno here when exec fails; closed by a successful exec
  int exec_pipe[2];
  if (make_cloexec_pipe(exec_pipe) != 0) {
    res.error = fmt::format("pipe failed: {}", std::strerror(errno));
    close_pair(out_pipe);
    if (errfd >= 0) ::close(errfd);
    return res;
  }

  // argv is built before fork
  std::vector<char*> argv_c;
  argv_c.reserve(args.size() + 1);
  for (auto &s : args) argv_c.push_back(const_cast<char*>(s.c_str()));
  argv_c.push_back(nullptr);

  pid_t pid = ::fork();
  if (pid < 0) {
    res.error = fmt::format("fork failed: {}", std::strerror(errno));
    close_pair(out_pipe);
    close_pair(exec_pipe);
    if (errfd >= 0) ::close(errfd);
    return res;
  }

  if (pid == 0) {
    ::close(out_pipe[0]);
    ::close(exec_pipe[0]);
    int err = 0;
    if (!cwd.empty() && ::chdir(cwd.c_str()) != 0) {
      err = errno;
      (void)!::write(exec_pipe[1], &err, sizeof(err));
      _exit(127);
    }
    for (auto &[k, v] : env) ::setenv(k.c_str(), v.c_str(), 1);

    ::dup2(out_pipe[1], STDOUT_FILENO);
    if (errfd >= 0) ::dup2(errfd, STDERR_FILENO);

    ::execvp(argv_c[0], argv_c.data());

    err = errno;
    (void)!::write(exec_pipe[1], &err, sizeof(err));
    _exit(127);
  }

  ::close(out_pipe[1]);
  ::close(exec_pipe[1]);
  if (errfd >= 0) ::close(errfd);

  res.out = read_all(out_pipe[0]);
  ::close(out_pipe[0]);

  int child_errno = 0;
  ssize_t n;
  do {
    n = ::read(exec_pipe[0], &child_errno, sizeof(child_errno));
  } while (n < 0 && errno == EINTR);
  ::close(exec_pipe[0]);

  int status = 0;
  pid_t r;
  do {
    r = ::waitpid(pid, &status, 0);
  } while (r < 0 && errno == EINTR);

  if (n > 0) {
    res.error = fmt::format("exec {} failed: {}", args[0], std::strerror(child_errno));
    return res;
  }
  if (r < 0) {
    res.error = fmt::format("waitpid failed: {}", std::strerror(errno));
    return res;
  }

  res.started = true;
  if (WIFEXITED(status)) res.exit_code = WEXITSTATUS(status);
  else if (WIFSIGNALED(status)) res.exit_code = 128 + WTERMSIG(status);
  return res;
}

} // namespace mergeimport
