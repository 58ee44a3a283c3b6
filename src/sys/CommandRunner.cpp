#include "sys/CommandRunner.hpp"
#include "build/Errors.hpp"

#include <sys/types.h>
#include <sys/wait.h>
#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <string_view>

extern char** environ;

namespace gadgetimg::sys {

// The current environment with `overrides` applied, as KEY=VALUE strings.
static std::vector<std::string> merged_environment(const Env& overrides) {
  std::vector<std::string> out;
  for (char** e = environ; e && *e; ++e) {
    std::string_view kv(*e);
    std::string_view key = kv.substr(0, kv.find('='));
    bool replaced = false;
    for (const auto& [k, v] : overrides)
      if (k == key) { replaced = true; break; }
    if (!replaced) out.emplace_back(kv);
  }
  for (const auto& [k, v] : overrides) out.push_back(k + "=" + v);
  return out;
}

CommandResult ProcessRunner::run(const Argv& argv, const Env& env) {
  CommandResult result;
  if (argv.empty()) {
    result.output = "empty command line";
    return result;
  }
  log_.debug("exec: %s", join_argv(argv).c_str());

  // Build argv and envp before forking; only async-signal-safe calls in the child.
  std::vector<char*> cargv;
  cargv.reserve(argv.size() + 1);
  for (const auto& a : argv) cargv.push_back(const_cast<char*>(a.c_str()));
  cargv.push_back(nullptr);
  std::vector<std::string> envs = merged_environment(env);
  std::vector<char*> cenv;
  cenv.reserve(envs.size() + 1);
  for (auto& e : envs) cenv.push_back(e.data());
  cenv.push_back(nullptr);

  int fd[2];
  if (::pipe2(fd, O_CLOEXEC) < 0) {
    result.output = std::string("pipe() failed: ") + std::strerror(errno);
    return result;
  }

  pid_t pid = ::fork();
  if (pid < 0) {
    result.output = std::string("fork() failed: ") + std::strerror(errno);
    ::close(fd[0]);
    ::close(fd[1]);
    return result;
  }
  if (pid == 0) {
    ::dup2(fd[1], STDOUT_FILENO);
    ::dup2(fd[1], STDERR_FILENO);
    int devnull = ::open("/dev/null", O_RDONLY);
    if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);
    ::execvpe(cargv[0], cargv.data(), cenv.data());
    const char msg[] = "exec failed\n";
    (void)::write(STDERR_FILENO, msg, sizeof(msg) - 1);
    ::_exit(127);
  }

  ::close(fd[1]);
  char buf[4096];
  for (;;) {
    ssize_t n = ::read(fd[0], buf, sizeof(buf));
    if (n < 0) {
      if (errno == EINTR) continue;
      break;
    }
    if (n == 0) break;
    result.output.append(buf, static_cast<size_t>(n));
  }
  ::close(fd[0]);

  int status = 0;
  while (::waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      result.output += std::string("waitpid() failed: ") + std::strerror(errno);
      return result;
    }
  }
  if (WIFEXITED(status)) result.status = WEXITSTATUS(status);
  else if (WIFSIGNALED(status)) result.status = 128 + WTERMSIG(status);
  log_.debug("exit %d: %s", result.status, argv[0].c_str());
  return result;
}

CommandResult run_checked(CommandRunner& runner, const Argv& argv, const Env& env) {
  CommandResult r = runner.run(argv, env);
  if (!r.ok()) throw build::ExternalToolFailure(argv, r.status, r.output);
  return r;
}

Argv privileged(const std::string& helper, Argv argv) {
  if (!helper.empty()) argv.insert(argv.begin(), helper);
  return argv;
}

std::string join_argv(const Argv& argv) {
  std::string out;
  for (const auto& a : argv) {
    if (!out.empty()) out += ' ';
    bool quote = a.empty() || a.find_first_of(" \t'\"") != std::string::npos;
    if (quote) out += '\'' + a + '\'';
    else out += a;
  }
  return out;
}

} // namespace gadgetimg::sys
