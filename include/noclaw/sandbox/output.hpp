/*
 * noclaw C++ - Output Interpreter
 *
 * Turns what a sandboxed run left behind (process result, stdout document,
 * <workspace>/.noclaw_output.json sidecar) into an ExecutionResult.
 *
 * Order of checks:
 *   timed out          -> TIMEOUT (partial output discarded)
 *   could not spawn    -> EXECUTION_FAILED
 *   exit status != 0   -> NON_ZERO_EXIT (stdout kept verbatim)
 *   stdout not a document with a string "response" -> MALFORMED_OUTPUT
 *   "success": false   -> TASK_FAILED
 *   otherwise success; side_effects come from the sidecar's scheduled_tasks
 *   when it has them, else from the stdout document's
 *
 * The sidecar is removed on every one of these paths.
 */
#ifndef noclaw_SANDBOX_OUTPUT_HPP
#define noclaw_SANDBOX_OUTPUT_HPP

#include <noclaw/core/json.hpp>
#include <noclaw/core/types.hpp>
#include <noclaw/sandbox/process.hpp>
#include <string>

namespace noclaw {

extern const char* const SIDECAR_FILE;    // ".noclaw_output.json"

std::string sidecar_path(const std::string& workspace);

ExecutionResult interpret(const ProcessResult& proc, const std::string& workspace);

// Interpret an already-parsed response document (used by the local runner).
// `raw` is kept as diagnostics on error results.
ExecutionResult interpret_document(const Json& doc, const std::string& raw,
                                   const std::string& workspace);

// Read and delete the sidecar. Returns its scheduled_tasks array, or null
// if it is missing, unreadable or has no such array.
Json consume_sidecar(const std::string& workspace);

} // namespace noclaw

#endif // noclaw_SANDBOX_OUTPUT_HPP
