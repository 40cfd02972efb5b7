#include "judgebox/sandbox.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>

namespace judgebox {

namespace {

void append_limited(std::string &dst, const char *src, ssize_t n,
                    std::size_t limit, bool &truncated) {
  if (n <= 0)
    return;
  const std::size_t avail = dst.size() < limit ? limit - dst.size() : 0;
  const std::size_t take =
      std::min<std::size_t>(static_cast<std::size_t>(n), avail);
  dst.append(src, take);
  if (take < static_cast<std::size_t>(n))
    truncated = true;
}

void close_fd(int &fd) {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

// Reads everything currently available on a non-blocking fd. Bytes beyond
// the limit are read and discarded so the writer never stalls on a full pipe.
// Returns false once the write end has been closed (EOF) or the fd failed.
bool drain(int fd, std::string &dst, std::size_t limit, bool &truncated) {
  char buf[4096];
  while (true) {
    const ssize_t n = ::read(fd, buf, sizeof(buf));
    if (n > 0) {
      append_limited(dst, buf, n, limit, truncated);
      continue;
    }
    if (n == 0)
      return false;
    if (errno == EINTR)
      continue;
    return errno == EAGAIN || errno == EWOULDBLOCK;
  }
}

int decode_status(int status) {
  if (WIFEXITED(status))
    return WEXITSTATUS(status);
  if (WIFSIGNALED(status))
    return 128 + WTERMSIG(status);
  return 1;
}

} // namespace

std::string resolve_executable(const std::string &name,
                               const std::string &path_env) {
  if (name.empty())
    return {};
  if (name.find('/') != std::string::npos)
    return name;
  std::size_t pos = 0;
  while (pos <= path_env.size()) {
    const std::size_t next = path_env.find(':', pos);
    const std::string dir = path_env.substr(
        pos, next == std::string::npos ? std::string::npos : next - pos);
    const std::string candidate = (dir.empty() ? std::string(".") : dir) + "/" + name;
    struct stat st {};
    if (::stat(candidate.c_str(), &st) == 0 && S_ISREG(st.st_mode) &&
        ::access(candidate.c_str(), X_OK) == 0)
      return candidate;
    if (next == std::string::npos)
      break;
    pos = next + 1;
  }
  return {};
}

ProcessResult run_process(const ProcessSpec &spec) {
  ProcessResult result;

  // Everything the child needs is built before fork(): the child of a
  // multi-threaded parent may only call async-signal-safe functions.
  std::string path_env;
  if (auto it = spec.env.find("PATH"); it != spec.env.end())
    path_env = it->second;
  else
    path_env = "/usr/local/bin:/usr/bin:/bin";
  const std::string exe = resolve_executable(spec.command, path_env);
  if (exe.empty()) {
    result.error_code = ErrorCode::spawn_failed;
    result.error_message = "executable not found: " + spec.command;
    result.exit_code = 127;
    return result;
  }

  std::vector<std::string> all = {spec.command};
  all.insert(all.end(), spec.argv.begin(), spec.argv.end());
  std::vector<char *> argv;
  argv.reserve(all.size() + 1);
  for (auto &s : all)
    argv.push_back(s.data());
  argv.push_back(nullptr);

  std::vector<std::string> envs;
  envs.reserve(spec.env.size());
  for (const auto &[k, v] : spec.env)
    envs.push_back(k + "=" + v);
  std::vector<char *> envp;
  envp.reserve(envs.size() + 1);
  for (auto &e : envs)
    envp.push_back(e.data());
  envp.push_back(nullptr);

  int out_pipe[2] = {-1, -1};
  int err_pipe[2] = {-1, -1};
  int exec_pipe[2] = {-1, -1};  // carries errno back if exec fails
  if (::pipe2(out_pipe, O_CLOEXEC) != 0 || ::pipe2(err_pipe, O_CLOEXEC) != 0 ||
      ::pipe2(exec_pipe, O_CLOEXEC) != 0) {
    result.error_code = ErrorCode::spawn_failed;
    result.error_message = std::string("pipe: ") + std::strerror(errno);
    for (int *p : {out_pipe, err_pipe, exec_pipe}) {
      close_fd(p[0]);
      close_fd(p[1]);
    }
    return result;
  }

  const pid_t pid = ::fork();
  if (pid < 0) {
    result.error_code = ErrorCode::spawn_failed;
    result.error_message = std::string("fork: ") + std::strerror(errno);
    for (int *p : {out_pipe, err_pipe, exec_pipe}) {
      close_fd(p[0]);
      close_fd(p[1]);
    }
    return result;
  }

  if (pid == 0) {
    // New session: the deadline kill targets the whole group.
    ::setsid();
    const int devnull = ::open("/dev/null", O_RDONLY);
    if (devnull >= 0)
      ::dup2(devnull, STDIN_FILENO);
    ::dup2(out_pipe[1], STDOUT_FILENO);
    ::dup2(err_pipe[1], STDERR_FILENO);

    int err = 0;
    if (!spec.cwd.empty() && ::chdir(spec.cwd.c_str()) != 0) {
      err = errno;
    } else {
      ::execve(exe.c_str(), argv.data(), envp.data());
      err = errno;
    }
    ssize_t ignored = ::write(exec_pipe[1], &err, sizeof(err));
    (void)ignored;
    ::_exit(127);
  }

  close_fd(out_pipe[1]);
  close_fd(err_pipe[1]);
  close_fd(exec_pipe[1]);

  // A successful exec closes the CLOEXEC write end: read() returns 0.
  int child_errno = 0;
  ssize_t got = 0;
  do {
    got = ::read(exec_pipe[0], &child_errno, sizeof(child_errno));
  } while (got < 0 && errno == EINTR);
  close_fd(exec_pipe[0]);
  if (got == static_cast<ssize_t>(sizeof(child_errno))) {
    int status = 0;
    ::waitpid(pid, &status, 0);
    close_fd(out_pipe[0]);
    close_fd(err_pipe[0]);
    result.error_code = ErrorCode::spawn_failed;
    result.error_message = "exec " + exe + ": " + std::strerror(child_errno);
    result.exit_code = 127;
    return result;
  }

  ::fcntl(out_pipe[0], F_SETFL, O_NONBLOCK);
  ::fcntl(err_pipe[0], F_SETFL, O_NONBLOCK);

  const auto deadline = std::chrono::steady_clock::now() +
                        std::chrono::milliseconds(spec.timeout_ms);
  int status = 0;
  bool exited = false;
  while (!exited) {
    pollfd fds[2] = {{out_pipe[0], POLLIN, 0}, {err_pipe[0], POLLIN, 0}};
    ::poll(fds, 2, 10);
    if (out_pipe[0] >= 0 &&
        !drain(out_pipe[0], result.stdout_text, spec.max_output_bytes,
               result.stdout_truncated))
      close_fd(out_pipe[0]);
    if (err_pipe[0] >= 0 &&
        !drain(err_pipe[0], result.stderr_text, spec.max_output_bytes,
               result.stderr_truncated))
      close_fd(err_pipe[0]);

    const pid_t w = ::waitpid(pid, &status, WNOHANG);
    if (w == pid) {
      exited = true;
      break;
    }
    if (spec.timeout_ms > 0 && std::chrono::steady_clock::now() >= deadline) {
      ::kill(-pid, SIGKILL);
      ::kill(pid, SIGKILL);
      ::waitpid(pid, &status, 0);
      result.timed_out = true;
      break;
    }
  }

  if (out_pipe[0] >= 0)
    drain(out_pipe[0], result.stdout_text, spec.max_output_bytes,
          result.stdout_truncated);
  if (err_pipe[0] >= 0)
    drain(err_pipe[0], result.stderr_text, spec.max_output_bytes,
          result.stderr_truncated);
  close_fd(out_pipe[0]);
  close_fd(err_pipe[0]);

  if (result.timed_out) {
    result.exit_code = 124;
    result.error_code = ErrorCode::timeout;
    result.error_message = "deadline of " + std::to_string(spec.timeout_ms) +
                           "ms exceeded";
  } else {
    result.exit_code = decode_status(status);
  }
  return result;
}

} // namespace judgebox
