#include "xstory/process.h"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <sstream>

#if defined(_WIN32)
#include <windows.h>
#else
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>
#endif

namespace xstory {

namespace fs = std::filesystem;

#if defined(_WIN32)
namespace {
std::string quote_arg(const std::string& arg) {
  if (!arg.empty() && arg.find_first_of(" \t\"&|<>^") == std::string::npos) {
    return arg;
  }
  std::string out = "\"";
  for (char c : arg) {
    if (c == '"') out += '\\';
    out += c;
  }
  out += '"';
  return out;
}
} // namespace
#endif

ProcessResult run_process(const std::vector<std::string>& args, const fs::path& cwd, bool merge_stderr) {
  ProcessResult result;
#if defined(_WIN32)
  if (args.empty()) {
    result.error_message = "missing command";
    return result;
  }
  std::string command;
  if (!cwd.empty()) {
    command += "cd /d " + quote_arg(cwd.string()) + " && ";
  }
  for (size_t i = 0; i < args.size(); ++i) {
    if (i > 0) command += ' ';
    command += quote_arg(args[i]);
  }
  command += merge_stderr ? " 2>&1" : " 2>NUL";
  // cmd.exe strips one pair of outer quotes from the whole line.
  FILE* stream = ::_popen(("\"" + command + "\"").c_str(), "r");
  if (!stream) {
    result.error_message = std::string("_popen failed: ") + std::strerror(errno);
    return result;
  }
  result.started = true;
  char buffer[512];
  size_t n = 0;
  while ((n = std::fread(buffer, 1, sizeof(buffer), stream)) > 0) {
    result.output.append(buffer, n);
  }
  result.exit_code = ::_pclose(stream);
  return result;
#else
  if (args.empty()) {
    result.error_message = "missing command";
    return result;
  }

  int pipefd[2];
  if (pipe(pipefd) != 0) {
    result.error_message = std::string("pipe failed: ") + std::strerror(errno);
    return result;
  }

  pid_t pid = fork();
  if (pid == 0) {
    if (!cwd.empty() && ::chdir(cwd.c_str()) != 0) {
      _exit(126);
    }
    ::dup2(pipefd[1], STDOUT_FILENO);
    if (merge_stderr) {
      ::dup2(pipefd[1], STDERR_FILENO);
    } else {
      const int devnull = ::open("/dev/null", O_WRONLY);
      if (devnull >= 0) {
        ::dup2(devnull, STDERR_FILENO);
        ::close(devnull);
      }
    }
    ::close(pipefd[0]);
    ::close(pipefd[1]);

    std::vector<char*> cargs;
    cargs.reserve(args.size() + 1);
    for (const auto& arg : args) {
      cargs.push_back(const_cast<char*>(arg.c_str()));
    }
    cargs.push_back(nullptr);
    ::execvp(cargs[0], cargs.data());
    _exit(127);
  }

  if (pid < 0) {
    ::close(pipefd[0]);
    ::close(pipefd[1]);
    result.error_message = std::string("fork failed: ") + std::strerror(errno);
    return result;
  }

  ::close(pipefd[1]);
  result.started = true;

  FILE* stream = ::fdopen(pipefd[0], "r");
  if (stream) {
    char buffer[512];
    size_t n = 0;
    while ((n = std::fread(buffer, 1, sizeof(buffer), stream)) > 0) {
      result.output.append(buffer, n);
    }
    std::fclose(stream);
  } else {
    ::close(pipefd[0]);
  }

  int status = 0;
  if (::waitpid(pid, &status, 0) < 0) {
    result.error_message = std::string("waitpid failed: ") + std::strerror(errno);
    return result;
  }
  if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.exit_code = 128 + WTERMSIG(status);
  }
  if (result.exit_code == 127) {
    result.error_message = "command not found: " + args.front();
  }
  return result;
#endif
}

std::optional<fs::path> find_executable(const std::string& name) {
  if (name.find('/') != std::string::npos) {
    std::error_code ec;
    if (fs::is_regular_file(name, ec)) return fs::path(name);
    return std::nullopt;
  }
  const char* path_env = std::getenv("PATH");
  if (!path_env) return std::nullopt;

#if defined(_WIN32)
  const char separator = ';';
  const std::string suffix = ".exe";
#else
  const char separator = ':';
  const std::string suffix;
#endif
  std::istringstream dirs{std::string(path_env)};
  std::string dir;
  while (std::getline(dirs, dir, separator)) {
    if (dir.empty()) continue;
    const fs::path candidate = fs::path(dir) / (name + suffix);
    std::error_code ec;
    if (!fs::is_regular_file(candidate, ec)) continue;
#if !defined(_WIN32)
    if (::access(candidate.c_str(), X_OK) != 0) continue;
#endif
    return candidate;
  }
  return std::nullopt;
}

} // namespace xstory
