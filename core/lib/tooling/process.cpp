// chartscan/tooling/process.cpp - Child process execution (POSIX)
//
#include "chartscan/tooling/process.hpp"

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <cstring>

namespace chartscan
{

namespace
{

struct Pipe
{
  int read_fd = -1;
  int write_fd = -1;

  Pipe() = default;
  Pipe(const Pipe &) = delete;
  Pipe & operator=(const Pipe &) = delete;
  ~Pipe()
  {
    close_read();
    close_write();
  }

  bool open()
  {
    int fds[2] = {-1, -1};
    // O_CLOEXEC keeps concurrently spawned children from inheriting the
    // other end, which would delay EOF.
    if (::pipe2(fds, O_CLOEXEC) != 0) {
      return false;
    }
    read_fd = fds[0];
    write_fd = fds[1];
    return true;
  }

  void close_read()
  {
    if (read_fd >= 0) {
      ::close(read_fd);
      read_fd = -1;
    }
  }

  void close_write()
  {
    if (write_fd >= 0) {
      ::close(write_fd);
      write_fd = -1;
    }
  }
};

void write_all_noexcept(int fd, const char * data, size_t size) noexcept
{
  while (size > 0) {
    const ssize_t n = ::write(fd, data, size);
    if (n < 0) {
      if (errno == EINTR) continue;
      return;
    }
    data += n;
    size -= static_cast<size_t>(n);
  }
}

void drain(Pipe & out, Pipe & err, std::string & out_buf, std::string & err_buf)
{
  std::array<char, 4096> chunk{};
  std::array<pollfd, 2> fds{};

  while (out.read_fd >= 0 || err.read_fd >= 0) {
    fds[0] = pollfd{out.read_fd, POLLIN, 0};
    fds[1] = pollfd{err.read_fd, POLLIN, 0};

    const int ready = ::poll(fds.data(), fds.size(), -1);
    if (ready < 0) {
      if (errno == EINTR) continue;
      break;
    }

    for (size_t i = 0; i < fds.size(); ++i) {
      if (fds[i].fd < 0 || fds[i].revents == 0) {
        continue;
      }
      Pipe & p = (i == 0) ? out : err;
      std::string & buf = (i == 0) ? out_buf : err_buf;
      const ssize_t n = ::read(p.read_fd, chunk.data(), chunk.size());
      if (n > 0) {
        buf.append(chunk.data(), static_cast<size_t>(n));
      } else if (n == 0 || errno != EINTR) {
        p.close_read();
      }
    }
  }
}

}  // namespace

ProcessResult run_process(
  const std::vector<std::string> & argv, const std::optional<std::filesystem::path> & working_dir)
{
  ProcessResult result;
  if (argv.empty()) {
    result.error = "empty command line";
    return result;
  }

  // Everything the child touches is prepared before fork().
  std::vector<char *> c_argv;
  c_argv.reserve(argv.size() + 1);
  for (const auto & a : argv) {
    c_argv.push_back(const_cast<char *>(a.c_str()));
  }
  c_argv.push_back(nullptr);

  const std::string cwd = working_dir ? working_dir->string() : std::string();
  const std::string exec_failure = "failed to execute " + argv[0] + "\n";

  Pipe out;
  Pipe err;
  if (!out.open() || !err.open()) {
    result.error = std::string("pipe: ") + std::strerror(errno);
    return result;
  }

  const pid_t pid = ::fork();
  if (pid < 0) {
    result.error = std::string("fork: ") + std::strerror(errno);
    return result;
  }

  if (pid == 0) {
    // child
    const int null_fd = ::open("/dev/null", O_RDONLY);
    if (null_fd >= 0) {
      ::dup2(null_fd, STDIN_FILENO);
      ::close(null_fd);
    }
    ::dup2(out.write_fd, STDOUT_FILENO);
    ::dup2(err.write_fd, STDERR_FILENO);

    if (!cwd.empty() && ::chdir(cwd.c_str()) != 0) {
      write_all_noexcept(STDERR_FILENO, exec_failure.data(), exec_failure.size());
      _exit(k_exit_not_found);
    }

    ::execvp(c_argv[0], c_argv.data());

    // exec failed
    write_all_noexcept(STDERR_FILENO, exec_failure.data(), exec_failure.size());
    _exit(k_exit_not_found);
  }

  // parent
  result.launched = true;
  out.close_write();
  err.close_write();

  drain(out, err, result.std_out, result.std_err);

  int status = 0;
  pid_t waited = -1;
  do {
    waited = ::waitpid(pid, &status, 0);
  } while (waited < 0 && errno == EINTR);

  if (waited < 0) {
    result.error = std::string("waitpid: ") + std::strerror(errno);
    result.exit_code = -1;
  } else if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.exit_code = 128 + WTERMSIG(status);
  }

  return result;
}

}  // namespace chartscan
