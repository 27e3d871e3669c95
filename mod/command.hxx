// file      : mod/command.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef MOD_COMMAND_HXX
#define MOD_COMMAND_HXX

#include <libstackhook/types.hxx>
#include <libstackhook/utility.hxx>

#include <libstackhook/deploy.hxx>

#include <mod/diagnostics.hxx>

namespace stackhook
{
  // Maximum size of the command output tail kept in the step result.
  //
  const size_t step_tail_size = 2000;

  // Maximum size of the command output kept in memory while the command is
  // running. Only the most recent complete lines are kept.
  //
  const size_t step_capture_size = 1024 * 1024;

  // Redact the values of the key/value lines where the key contains (case-
  // insensitively) secret, token, password, passwd, pwd, or key. For
  // example:
  //
  //   DB_PASSWORD=hunter2  ->  DB_PASSWORD: ***
  //     api_key: abc123    ->    api_key: ***
  //
  string
  sanitize (const string&);

  // Return the last n bytes of the string. If the cut falls in the middle
  // of a UTF-8 sequence, then skip the rest of this sequence.
  //
  string
  tail (const string&, size_t n = step_tail_size);

  // Run the deployment step command in the specified working directory with
  // the additional environment variables (NAME=VALUE) and the timeout (in
  // seconds, must not be zero), capturing the combined stdout and stderr.
  //
  // Return the step result with the sanitized output tail. The step fails if
  // the command exits with non-zero code (for the signal termination the
  // exit code is the negated signal number), times out (no exit code), or
  // cannot be executed (no exit code). Never throw due to the command
  // failure.
  //
  // Log the single step (or step_timeout) event with the info (ok) or warn
  // (failed) mark. Note that the event never contains the command output.
  // Trace the command line if the trace mark is specified.
  //
  step_result
  run_step (const string& stack,
            const string& name,
            const path& program,
            const strings& args,
            const dir_path& cwd,
            const strings& env,
            size_t timeout,
            const basic_mark& info,
            const basic_mark& warn,
            const basic_mark* trace = nullptr);
}

#endif // MOD_COMMAND_HXX
