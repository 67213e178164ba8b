#pragma once

#include "meetscribe_common/string_utils.hpp"

#include <cstdio>
#include <string>
#include <sys/wait.h>

namespace meetscribe_common
{

struct ShellResult
{
  bool ok = false;        ///< true when exit_code == 0
  int exit_code = -1;     ///< -1 when popen itself failed
  std::string output;     ///< captured stdout (callers append 2>&1 for stderr)
};

/// Runs a /bin/sh command line through popen. Output beyond max_output bytes
/// keeps only the tail.
inline ShellResult run_shell_command(const std::string & command, size_t max_output = 64 * 1024)
{
  ShellResult out;

  FILE * pipe = popen(command.c_str(), "r");
  if (!pipe) {
    return out;
  }

  char buffer[512];
  while (fgets(buffer, sizeof(buffer), pipe) != nullptr) {
    out.output += buffer;
    if (out.output.size() > max_output) {
      out.output.erase(0, out.output.size() - max_output);
    }
  }

  const int status = pclose(pipe);
  if (status == -1) {
    out.exit_code = -1;
  } else if (WIFEXITED(status)) {
    out.exit_code = WEXITSTATUS(status);
  } else {
    out.exit_code = status;
  }
  out.ok = out.exit_code == 0;
  return out;
}

/// True when `name` resolves on PATH (or is an executable path)
inline bool command_exists(const std::string & name)
{
  const ShellResult r = run_shell_command(
    "command -v " + shell_escape_single_quote(name) + " >/dev/null 2>&1");
  return r.ok;
}

}  // namespace meetscribe_common
