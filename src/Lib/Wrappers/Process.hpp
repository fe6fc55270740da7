#pragma once

#ifdef __linux__

  #include <algorithm>  // std::min
  #include <cerrno>     // errno, EINTR
  #include <chrono>     // std::chrono::{steady_clock, milliseconds, duration_cast}
  #include <csignal>    // SIGKILL
  #include <fcntl.h>    // O_CLOEXEC, O_RDONLY, open
  #include <poll.h>     // poll, pollfd
  #include <sys/wait.h> // waitpid, WIFEXITED, WEXITSTATUS
  #include <unistd.h>   // fork, execvp, pipe2, dup2, _exit, read, close

  #include "GnomeMcp/Utils/Error.hpp"
  #include "GnomeMcp/Utils/Logging.hpp"
  #include "GnomeMcp/Utils/Types.hpp"

namespace Process {
  namespace {
    using gnome_mcp::utils::error::GmcpError;
    using gnome_mcp::utils::error::GmcpErrorCode;
    using gnome_mcp::utils::types::Array;
    using gnome_mcp::utils::types::Err;
    using gnome_mcp::utils::types::i32;
    using gnome_mcp::utils::types::i64;
    using gnome_mcp::utils::types::PCStr;
    using gnome_mcp::utils::types::Result;
    using gnome_mcp::utils::types::String;
    using gnome_mcp::utils::types::usize;
    using gnome_mcp::utils::types::Vec;

    /// Owns a file descriptor and closes it on destruction.
    class FileDescriptor {
      int m_fd = -1;

     public:
      explicit FileDescriptor(const int fd = -1) : m_fd(fd) {}

      ~FileDescriptor() { reset(); }

      FileDescriptor(const FileDescriptor&)                = delete;
      fn operator=(const FileDescriptor&)->FileDescriptor& = delete;
      FileDescriptor(FileDescriptor&&)                     = delete;
      fn operator=(FileDescriptor&&)->FileDescriptor&      = delete;

      [[nodiscard]] fn get() const -> int { return m_fd; }

      fn reset(const int fd = -1) -> void {
        if (m_fd >= 0)
          close(m_fd);

        m_fd = fd;
      }
    };

    constexpr i64 POLL_SLICE_MS = 20;

    /// Reads whatever is available; returns false once the pipe reached EOF.
    inline fn Drain(FileDescriptor& pipeFd, String& out) -> bool {
      Array<char, 4096> buffer {};

      const ssize_t count = read(pipeFd.get(), buffer.data(), buffer.size());

      if (count > 0) {
        out.append(buffer.data(), static_cast<usize>(count));
        return true;
      }

      if (count < 0 && errno == EINTR)
        return true;

      pipeFd.reset();

      return false;
    }
  } // namespace

  struct Output {
    i32    exitCode = -1;
    String stdoutText;
    String stderrText;
  };

  /**
   * @brief Runs a program without a shell and collects its output.
   *
   * The child is killed once the timeout expires.
   *
   * @param argv Program name followed by its arguments. The program is looked up in PATH.
   * @param timeoutMs Maximum run time in milliseconds.
   * @return The exit code and captured output, NotFound when the program does not exist,
   * or Timeout.
   */
  inline fn Run(const Vec<String>& argv, const i32 timeoutMs) -> Result<Output> {
    using std::chrono::steady_clock, std::chrono::milliseconds, std::chrono::duration_cast;

    if (argv.empty())
      return Err(GmcpError(GmcpErrorCode::InvalidArgument, "No program given"));

    Array<int, 2> outPipe {};
    Array<int, 2> errPipe {};

    if (pipe2(outPipe.data(), O_CLOEXEC) != 0)
      return Err(GmcpError::fromErrno("pipe2"));

    FileDescriptor outRead(outPipe[0]);
    FileDescriptor outWrite(outPipe[1]);

    if (pipe2(errPipe.data(), O_CLOEXEC) != 0)
      return Err(GmcpError::fromErrno("pipe2"));

    FileDescriptor errRead(errPipe[0]);
    FileDescriptor errWrite(errPipe[1]);

    Vec<char*> args;
    args.reserve(argv.size() + 1);

    for (const String& arg : argv)
      args.push_back(const_cast<char*>(arg.c_str())); // NOLINT(cppcoreguidelines-pro-type-const-cast)

    args.push_back(nullptr);

    const pid_t pid = fork();

    if (pid < 0)
      return Err(GmcpError::fromErrno("fork"));

    if (pid == 0) {
      // The server's stdin carries the protocol stream.
      if (const int devNull = open("/dev/null", O_RDONLY | O_CLOEXEC); devNull >= 0)
        dup2(devNull, STDIN_FILENO);

      dup2(outWrite.get(), STDOUT_FILENO);
      dup2(errWrite.get(), STDERR_FILENO);

      execvp(args[0], args.data());

      // 127 matches the shell's "command not found".
      _exit(127);
    }

    outWrite.reset();
    errWrite.reset();

    Output                         output;
    const steady_clock::time_point deadline = steady_clock::now() + milliseconds(timeoutMs);

    int status = 0;

    // Launchers such as gtk-launch exit right away while the started program keeps the
    // inherited pipes open, so the loop ends on the direct child's exit rather than on EOF.
    while (true) {
      const pid_t reaped = waitpid(pid, &status, WNOHANG);

      if (reaped == pid)
        break;

      if (reaped < 0 && errno != EINTR)
        return Err(GmcpError::fromErrno("waitpid"));

      const i64 remaining = duration_cast<milliseconds>(deadline - steady_clock::now()).count();

      if (remaining <= 0) {
        kill(pid, SIGKILL);
        waitpid(pid, nullptr, 0);

        return Err(GmcpError(GmcpErrorCode::Timeout, std::format("'{}' did not finish within {}ms", argv[0], timeoutMs)));
      }

      Array<pollfd, 2> fds = { {
        { .fd = outRead.get(), .events = POLLIN, .revents = 0 },
        { .fd = errRead.get(), .events = POLLIN, .revents = 0 },
      } };

      const int ready = poll(fds.data(), fds.size(), static_cast<int>(std::min<i64>(remaining, POLL_SLICE_MS)));

      if (ready < 0 && errno != EINTR) {
        kill(pid, SIGKILL);
        waitpid(pid, nullptr, 0);

        return Err(GmcpError::fromErrno("poll"));
      }

      if (ready <= 0)
        continue;

      if (fds[0].revents != 0)
        Drain(outRead, output.stdoutText);

      if (fds[1].revents != 0)
        Drain(errRead, output.stderrText);
    }

    // Collect what the child left in the pipes without waiting on descendants.
    while (outRead.get() >= 0 || errRead.get() >= 0) {
      Array<pollfd, 2> fds = { {
        { .fd = outRead.get(), .events = POLLIN, .revents = 0 },
        { .fd = errRead.get(), .events = POLLIN, .revents = 0 },
      } };

      if (poll(fds.data(), fds.size(), 0) <= 0 || steady_clock::now() >= deadline)
        break;

      if (fds[0].revents != 0)
        Drain(outRead, output.stdoutText);

      if (fds[1].revents != 0)
        Drain(errRead, output.stderrText);
    }

    output.exitCode = WIFEXITED(status) ? WEXITSTATUS(status) : -1;

    if (output.exitCode == 127)
      return Err(GmcpError(GmcpErrorCode::NotFound, std::format("'{}' is not installed", argv[0])));

    debug_log("{} exited with {}", argv[0], output.exitCode);

    return output;
  }

  /**
   * @brief Runs a program and fails with its stderr when it exits non-zero.
   */
  inline fn RunChecked(const Vec<String>& argv, const i32 timeoutMs) -> Result<Output> {
    Result<Output> output = Run(argv, timeoutMs);

    if (!output)
      return output;

    if (output->exitCode != 0) {
      String message = output->stderrText.empty() ? output->stdoutText : output->stderrText;

      while (!message.empty() && (message.back() == '\n' || message.back() == '\r'))
        message.pop_back();

      return Err(GmcpError(GmcpErrorCode::PlatformSpecific, std::format("'{}' failed with exit code {}: {}", argv[0], output->exitCode, message)));
    }

    return output;
  }
} // namespace Process

#endif // __linux__
