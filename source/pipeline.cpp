#include <dircache/pipeline.hpp>

#include <spdlog/spdlog.h>

#include <sys/types.h>
#include <sys/wait.h>
#include <fcntl.h>
#include <signal.h>
#include <unistd.h>

#include <array>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <thread>

namespace dircache {

static int make_cloexec_pipe(int pfd[2]) {
#ifdef __linux__
  if (::pipe2(pfd, O_CLOEXEC) == 0) return 0;
#endif
  if (::pipe(pfd) != 0) return -1;
  ::fcntl(pfd[0], F_SETFD, ::fcntl(pfd[0], F_GETFD) | FD_CLOEXEC);
  ::fcntl(pfd[1], F_SETFD, ::fcntl(pfd[1], F_GETFD) | FD_CLOEXEC);
  return 0;
}

static void close_fd(int &fd) {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

static int exit_code_of(int status) {
  if (WIFEXITED(status)) return WEXITSTATUS(status);
  if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
  return -1;
}

static void write_str(int fd, const char *s) {
  (void)!::write(fd, s, std::strlen(s));
}

static void emit_line(std::string line, const LineHandler &handler) {
  while (!line.empty() && std::isspace(static_cast<unsigned char>(line.back())))
    line.pop_back();
  if (line.empty() || !handler)
    return;
  try {
    handler(line);
  } catch (const std::exception &e) {
    spdlog::error("[pipeline] output handler failed: {}", e.what());
  }
}

static void relay_lines(int fd, const LineHandler &handler) {
  std::string pending;
  std::array<char, 4096> buf{};
  for (;;) {
    ssize_t n = ::read(fd, buf.data(), buf.size());
    if (n < 0 && errno == EINTR)
      continue;
    if (n <= 0)
      break;
    pending.append(buf.data(), static_cast<size_t>(n));
    std::size_t pos;
    while ((pos = pending.find('\n')) != std::string::npos) {
      emit_line(pending.substr(0, pos), handler);
      pending.erase(0, pos + 1);
    }
  }
  if (!pending.empty())
    emit_line(std::move(pending), handler);
}

int run_pipeline(const std::vector<Stage> &stages,
                 const PipelineOptions &opts,
                 const LineHandler &on_stdout,
                 const LineHandler &on_stderr) {
  if (stages.empty())
    throw std::invalid_argument("run_pipeline: no stages");

  // в дочернем процессе только dup2 и exec, всё готовим заранее
  std::vector<std::vector<char *>> argvs;
  argvs.reserve(stages.size());
  for (const auto &st : stages) {
    if (st.argv.empty())
      throw std::invalid_argument("run_pipeline: stage without argv");
    std::vector<char *> a;
    a.reserve(st.argv.size() + 1);
    for (const auto &s : st.argv)
      a.push_back(const_cast<char *>(s.c_str()));
    a.push_back(nullptr);
    argvs.push_back(std::move(a));
  }

  int out_pipe[2] = {-1, -1};
  int err_pipe[2] = {-1, -1};
  int sink_fd = -1; // stdout of the last stage
  int null_fd = -1;
  int prev_read = -1;
  std::vector<pid_t> pids;

  auto fail = [&](int err, const std::string &what) {
    close_fd(out_pipe[0]);
    close_fd(out_pipe[1]);
    close_fd(err_pipe[0]);
    close_fd(err_pipe[1]);
    close_fd(sink_fd);
    close_fd(null_fd);
    close_fd(prev_read);
    for (pid_t p : pids) {
      ::kill(p, SIGKILL);
      int st = 0;
      ::waitpid(p, &st, 0);
    }
    throw std::system_error(err, std::generic_category(), what);
  };

  if (make_cloexec_pipe(err_pipe) != 0)
    fail(errno, "pipe");
  if (!opts.stdout_file.empty()) {
    sink_fd = ::open(opts.stdout_file.c_str(),
                     O_CREAT | O_WRONLY | O_TRUNC | O_CLOEXEC, 0644);
    if (sink_fd < 0)
      fail(errno, "open " + opts.stdout_file.string());
  } else {
    if (make_cloexec_pipe(out_pipe) != 0)
      fail(errno, "pipe");
    sink_fd = out_pipe[1];
    out_pipe[1] = -1;
  }
  null_fd = ::open("/dev/null", O_WRONLY | O_CLOEXEC);
  if (null_fd < 0)
    fail(errno, "open /dev/null");

  for (std::size_t i = 0; i < stages.size(); ++i) {
    const bool last = i + 1 == stages.size();
    int link[2] = {-1, -1};
    if (!last && make_cloexec_pipe(link) != 0)
      fail(errno, "pipe");
    const int stage_out = last ? sink_fd : link[1];
    const int stage_err = stages[i].discard_stderr ? null_fd : err_pipe[1];

    pid_t pid = ::fork();
    if (pid < 0) {
      int err = errno;
      close_fd(link[0]);
      close_fd(link[1]);
      fail(err, "fork");
    }

    if (pid == 0) {
      if (prev_read >= 0)
        ::dup2(prev_read, STDIN_FILENO);
      ::dup2(stage_out, STDOUT_FILENO);
      ::dup2(stage_err, STDERR_FILENO);
      ::execvp(argvs[i][0], argvs[i].data());
      write_str(STDERR_FILENO, argvs[i][0]);
      write_str(STDERR_FILENO, ": ");
      write_str(STDERR_FILENO, std::strerror(errno));
      write_str(STDERR_FILENO, "\n");
      _exit(127);
    }

    pids.push_back(pid);
    close_fd(prev_read);
    close_fd(link[1]);
    prev_read = link[0];
  }

  // пишущие концы теперь только у дочерних процессов
  close_fd(sink_fd);
  close_fd(err_pipe[1]);
  close_fd(null_fd);

  std::thread err_reader;
  std::thread out_reader;
  try {
    err_reader = std::thread([&] { relay_lines(err_pipe[0], on_stderr); });
    if (out_pipe[0] >= 0)
      out_reader = std::thread([&] { relay_lines(out_pipe[0], on_stdout); });
  } catch (const std::system_error &e) {
    // убитые дети закрывают пишущие концы, читатель получит EOF
    for (pid_t p : pids)
      ::kill(p, SIGKILL);
    if (err_reader.joinable())
      err_reader.join();
    fail(e.code().value(), "start output reader");
  }

  int rc = 0;
  for (pid_t p : pids) {
    int status = 0;
    pid_t r;
    do {
      r = ::waitpid(p, &status, 0);
    } while (r < 0 && errno == EINTR);
    int code = r < 0 ? -1 : exit_code_of(status);
    if (code != 0)
      rc = code;
  }

  err_reader.join();
  if (out_reader.joinable())
    out_reader.join();
  close_fd(err_pipe[0]);
  close_fd(out_pipe[0]);
  return rc;
}

static std::string quote(const std::string &arg) {
  if (!arg.empty() && arg.find_first_of(" \t\"'\\$|&;<>()*?") ==
                          std::string::npos)
    return arg;
  std::string out = "'";
  for (char c : arg) {
    if (c == '\'')
      out += "'\\''";
    else
      out += c;
  }
  out += '\'';
  return out;
}

std::string describe(const std::vector<Stage> &stages) {
  std::ostringstream oss;
  for (std::size_t i = 0; i < stages.size(); ++i) {
    if (i)
      oss << " | ";
    for (std::size_t j = 0; j < stages[i].argv.size(); ++j) {
      if (j)
        oss << ' ';
      oss << quote(stages[i].argv[j]);
    }
  }
  return oss.str();
}

} // namespace dircache
