/**
 * @file HostAccess.hpp
 * @brief Interfaces through which the resolver touches the host system.
 *
 * Distribution never opens files or spawns processes itself; it goes through a
 * FileReader and a CommandRunner. The POSIX implementations are returned by
 * GetSystemFileReader() and GetSystemCommandRunner(). Tests substitute in-memory
 * fakes.
 */

#pragma once

#include "../Utils/Error.hpp"
#include "../Utils/Types.hpp"

namespace distro::core {
  namespace types = ::distro::utils::types;

  /**
   * @struct CommandOutput
   * @brief Result of running a command to completion.
   */
  struct CommandOutput {
    types::i32    exitCode = 0; ///< Exit status, or 128 + signal number when killed by a signal.
    types::String stdOut;       ///< Everything the command wrote to standard output.
  };

  /**
   * @class FileReader
   * @brief Read-only access to the filesystem.
   */
  class FileReader {
   public:
    FileReader()                                     = default;
    FileReader(const FileReader&)                    = delete;
    FileReader(FileReader&&)                         = delete;
    auto operator=(const FileReader&) -> FileReader& = delete;
    auto operator=(FileReader&&) -> FileReader&      = delete;
    virtual ~FileReader()                            = default;

    /**
     * @brief Reads a whole file.
     * @return The content, NotFound when the file does not exist, or
     *         PermissionDenied / IoError when it cannot be read.
     */
    [[nodiscard]] virtual auto readFile(types::StringView path) const -> types::Result<types::String> = 0;

    /**
     * @brief Lists the entry names (not full paths) of a directory, non-recursively.
     */
    [[nodiscard]] virtual auto listDirectory(types::StringView path) const -> types::Result<types::Vec<types::String>> = 0;

    /**
     * @brief Whether @p path names an existing regular file.
     */
    [[nodiscard]] virtual auto isFile(types::StringView path) const -> bool = 0;
  };

  /**
   * @class CommandRunner
   * @brief Runs external programs and captures their standard output.
   */
  class CommandRunner {
   public:
    CommandRunner()                                        = default;
    CommandRunner(const CommandRunner&)                    = delete;
    CommandRunner(CommandRunner&&)                         = delete;
    auto operator=(const CommandRunner&) -> CommandRunner& = delete;
    auto operator=(CommandRunner&&) -> CommandRunner&      = delete;
    virtual ~CommandRunner()                               = default;

    /**
     * @brief Runs @p argv (argv[0] is looked up in PATH) and waits for it to exit.
     *
     * Standard error is discarded. A non-zero exit status is not an error here;
     * callers inspect CommandOutput::exitCode.
     *
     * @return The captured output, NotFound when the program does not exist, or
     *         ApiUnavailable when the process could not be spawned or waited for.
     */
    [[nodiscard]] virtual auto execute(types::Span<const types::String> argv) const -> types::Result<CommandOutput> = 0;
  };

  /**
   * @brief The process-wide FileReader backed by the real filesystem.
   */
  auto GetSystemFileReader() -> const FileReader&;

  /**
   * @brief The process-wide CommandRunner backed by posix_spawnp.
   */
  auto GetSystemCommandRunner() -> const CommandRunner&;
} // namespace distro::core
