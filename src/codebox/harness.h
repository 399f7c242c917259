#ifndef CODEBOX_HARNESS_H_
#define CODEBOX_HARNESS_H_

// Scripts copied into every box (read-only for the jail uid).

// argv: <code path>
// exit 0 if the code compiles; otherwise prints "<Exception>: <message> (line N)" and exits 1
extern const char kCheckerScript[];

// argv: <code path> <bindings path> <comma-separated blocked modules>
// cwd must be the scratch directory. Writes exactly one JSON line to fd 3:
//   {"status": "ok", "value": ..., "value_repr": bool}
//   {"status": "error", "kind": "RuntimeError"|"PermissionDenied",
//    "exception": str, "message": str, "traceback": str}
//   {"status": "memory"}
extern const char kRunnerScript[];

#endif  // CODEBOX_HARNESS_H_
