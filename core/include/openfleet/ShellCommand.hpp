// Builders for the remote shell lines the runners execute. Every path or
// value interpolated here goes through escapeShellArg.
#pragma once
#include "TaskTypes.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace openfleet {

// Exit code of a POSIX shell when the program is not found.
constexpr int kShellCommandNotFound = 127;
// rsync's "error in rsync protocol data stream", seen when the remote rsync
// binary is missing.
constexpr int kRsyncProtocolError = 12;

// POSIX single-quoted literal; a literal ' becomes '\''.
std::string escapeShellArg(const std::string &arg);

// [A-Za-z_][A-Za-z0-9_]*
bool isValidEnvName(const std::string &name);

// Inside-out: env prefix, then sudo -n, then cd <workdir> &&.
// e.g. cd '/srv' && sudo -n env A='1' uptime
std::string buildBatchCommand(const BatchRequest &req);

// `command -v '<tool>' 2>/dev/null`; exits 0 and prints the path when present.
std::string commandProbeLine(const std::string &tool);

// `mkdir -p '<dir>'`
std::string mkdirLine(const std::string &dir);

struct TransferCommandOptions {
    std::string targetUserAndHost; // user@host
    std::optional<std::uint16_t> port;
    std::optional<std::string> identityFile; // path on the source host
    std::optional<std::string> sshpassPrefix; // "'<sshpass>' -p '<secret>'"
};

// Source side command that pushes sourcePath to targetPath on the target.
// method must be Rsync or Scp; executable is the probed binary path.
std::string buildTransferCommand(const std::string &sourcePath, bool isDir,
                                 const std::string &targetPath,
                                 const std::string &executable,
                                 TransferMethod method,
                                 const TransferCommandOptions &opts);

// Last "NN%" found in an rsync --progress chunk, or -1.
int parseRsyncPercent(const std::string &chunk);

// True only for the fixed "rsync is not installed" signature: exit 127, or
// exit 12 with "command not found" on stderr. Everything else is a real
// transfer failure.
bool isRsyncMissingSignature(int exitCode, const std::string &stderrText);

// Human readable byte size: "512 B", "1.5 KB", "2.0 MB", "1.1 GB".
std::string formatBytes(std::uint64_t bytes);

} // namespace openfleet
