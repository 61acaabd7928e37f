/**
 * @file Unix.cpp
 * @brief POSIX implementations of FileReader and CommandRunner, shared by Linux and the BSDs.
 */

#include <array>        // std::array (Array)
#include <cerrno>       // errno, ENOENT, EACCES, ...
#include <cstring>      // std::strerror
#include <fcntl.h>      // O_CLOEXEC, O_WRONLY
#include <filesystem>   // std::filesystem::{directory_iterator, is_regular_file, status}
#include <format>       // std::format
#include <fstream>      // std::ifstream
#include <iterator>     // std::istreambuf_iterator
#include <matchit.hpp>  // matchit::{match, is, or_, _}
#include <spawn.h>      // posix_spawnp, posix_spawn_file_actions_*
#include <sys/wait.h>   // waitpid, WIFEXITED, WEXITSTATUS, WIFSIGNALED, WTERMSIG
#include <system_error> // std::error_code
#include <unistd.h>     // pipe2, read, close, STDOUT_FILENO, STDERR_FILENO

#include "Distro++/Core/HostAccess.hpp"

#include "Distro++/Utils/Error.hpp"
#include "Distro++/Utils/Logging.hpp"
#include "Distro++/Utils/Types.hpp"

extern "C" char** environ; // NOLINT(readability-identifier-naming) - POSIX global

using distro::utils::error::DistroErrorCode;
using enum distro::utils::error::DistroErrorCode;
using namespace distro::utils::types;
namespace fs = std::filesystem;

namespace {
  using distro::core::CommandOutput;

  auto CodeFromErrno(const i32 err) -> DistroErrorCode {
    using namespace matchit;

    return match(err)(
      is | or_(ENOENT, ENOTDIR) = NotFound,
      is | or_(EACCES, EPERM)   = PermissionDenied,
      is | _                    = IoError
    );
  }

  /**
   * @class FileDescriptor
   * @brief Owns a file descriptor and closes it on destruction.
   */
  class FileDescriptor {
   public:
    explicit FileDescriptor(const i32 descriptor = -1) : m_fd(descriptor) {}

    FileDescriptor(const FileDescriptor&)                    = delete;
    auto operator=(const FileDescriptor&) -> FileDescriptor& = delete;
    FileDescriptor(FileDescriptor&&)                         = delete;
    auto operator=(FileDescriptor&&) -> FileDescriptor&      = delete;

    ~FileDescriptor() {
      reset();
    }

    [[nodiscard]] auto get() const -> i32 {
      return m_fd;
    }

    auto reset() -> Unit {
      if (m_fd >= 0)
        close(m_fd);

      m_fd = -1;
    }

   private:
    i32 m_fd;
  };

  auto DecodeWaitStatus(const i32 status) -> i32 {
    if (WIFEXITED(status))
      return WEXITSTATUS(status);

    if (WIFSIGNALED(status))
      return 128 + WTERMSIG(status);

    return -1;
  }

  class PosixFileReader final : public distro::core::FileReader {
   public:
    [[nodiscard]] auto readFile(const StringView path) const -> Result<String> override {
      std::error_code       errc;
      const fs::file_status status = fs::status(path, errc);

      if (status.type() == fs::file_type::not_found)
        ERR_FMT(NotFound, "File '{}' does not exist", path);

      if (errc)
        ERR_FMT(CodeFromErrno(errc.value()), "Cannot access '{}': {}", path, errc.message());

      if (fs::is_directory(status))
        ERR_FMT(IoError, "'{}' is a directory", path);

      std::ifstream file { fs::path(path), std::ios::binary };

      if (!file.is_open())
        ERR_FMT(PermissionDenied, "Failed to open '{}'", path);

      String content { std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>() };

      if (file.bad())
        ERR_FMT(IoError, "Failed to read '{}'", path);

      return content;
    }

    [[nodiscard]] auto listDirectory(const StringView path) const -> Result<Vec<String>> override {
      std::error_code         errc;
      fs::directory_iterator iter(path, errc);

      if (errc)
        ERR_FMT(CodeFromErrno(errc.value()), "Cannot list '{}': {}", path, errc.message());

      Vec<String> names;

      for (const fs::directory_iterator end {}; iter != end; iter.increment(errc)) {
        if (errc)
          ERR_FMT(IoError, "Failed while listing '{}': {}", path, errc.message());

        names.emplace_back(iter->path().filename().string());
      }

      if (errc)
        ERR_FMT(IoError, "Failed while listing '{}': {}", path, errc.message());

      return names;
    }

    [[nodiscard]] auto isFile(const StringView path) const -> bool override {
      std::error_code errc;
      return fs::is_regular_file(path, errc);
    }
  };

  class PosixCommandRunner final : public distro::core::CommandRunner {
   public:
    [[nodiscard]] auto execute(const Span<const String> argv) const -> Result<CommandOutput> override {
      if (argv.empty())
        ERR(InvalidArgument, "Cannot run an empty command line");

      Vec<char*> args;
      args.reserve(argv.size() + 1);

      for (const String& arg : argv)
        args.push_back(const_cast<char*>(arg.c_str())); // NOLINT(cppcoreguidelines-pro-type-const-cast) - posix_spawn takes char* const[]

      args.push_back(nullptr);

      Array<i32, 2> pipeEnds {};

      if (pipe2(pipeEnds.data(), O_CLOEXEC) != 0)
        ERR_FMT(ApiUnavailable, "pipe2 failed: {}", std::strerror(errno));

      const FileDescriptor readEnd(pipeEnds[0]);
      FileDescriptor       writeEnd(pipeEnds[1]);

      posix_spawn_file_actions_t actions;

      if (const i32 res = posix_spawn_file_actions_init(&actions); res != 0)
        ERR_FMT(ApiUnavailable, "posix_spawn_file_actions_init failed: {}", std::strerror(res));

      const UniquePointer<posix_spawn_file_actions_t, decltype(&posix_spawn_file_actions_destroy)> actionsGuard(
        &actions, posix_spawn_file_actions_destroy
      );

      // The child's stdout becomes the pipe; stderr is discarded. Both pipe ends are
      // O_CLOEXEC, so the child keeps only the duplicate.
      if (const i32 res = posix_spawn_file_actions_adddup2(&actions, writeEnd.get(), STDOUT_FILENO); res != 0)
        ERR_FMT(ApiUnavailable, "posix_spawn_file_actions_adddup2 failed: {}", std::strerror(res));

      if (const i32 res = posix_spawn_file_actions_addopen(&actions, STDERR_FILENO, "/dev/null", O_WRONLY, 0); res != 0)
        ERR_FMT(ApiUnavailable, "posix_spawn_file_actions_addopen failed: {}", std::strerror(res));

      pid_t pid = 0;

      if (const i32 res = posix_spawnp(&pid, args.front(), &actions, nullptr, args.data(), environ); res != 0) {
        if (res == ENOENT)
          ERR_FMT(NotFound, "Command '{}' not found", argv.front());

        ERR_FMT(ApiUnavailable, "Failed to spawn '{}': {}", argv.front(), std::strerror(res));
      }

      // Otherwise read() below never sees end-of-file.
      writeEnd.reset();

      CommandOutput output;
      Array<char, 4096> buffer {};
      i32 readError = 0;

      while (true) {
        const ssize_t count = read(readEnd.get(), buffer.data(), buffer.size());

        if (count == 0)
          break;

        if (count < 0) {
          if (errno == EINTR)
            continue;

          readError = errno;
          break;
        }

        output.stdOut.append(buffer.data(), static_cast<usize>(count));
      }

      i32 status = 0;

      while (waitpid(pid, &status, 0) == -1)
        if (errno != EINTR)
          ERR_FMT(ApiUnavailable, "waitpid for '{}' failed: {}", argv.front(), std::strerror(errno));

      if (readError != 0)
        ERR_FMT(IoError, "Failed to read output of '{}': {}", argv.front(), std::strerror(readError));

      output.exitCode = DecodeWaitStatus(status);

      debug_log("`{}` exited with status {}", argv.front(), output.exitCode);

      return output;
    }
  };
} // namespace

namespace distro::core {
  auto GetSystemFileReader() -> const FileReader& {
    static const PosixFileReader Instance {};
    return Instance;
  }

  auto GetSystemCommandRunner() -> const CommandRunner& {
    static const PosixCommandRunner Instance {};
    return Instance;
  }
} // namespace distro::core
