#include "openfleet/ShellCommand.hpp"

#include <cctype>
#include <cstdio>
#include <vector>

namespace openfleet {

std::string escapeShellArg(const std::string &arg) {
    std::string out;
    out.reserve(arg.size() + 2);
    out.push_back('\'');
    for (char c : arg) {
        if (c == '\'')
            out += "'\\''";
        else
            out.push_back(c);
    }
    out.push_back('\'');
    return out;
}

bool isValidEnvName(const std::string &name) {
    if (name.empty())
        return false;
    const unsigned char first = static_cast<unsigned char>(name[0]);
    if (!(std::isalpha(first) || first == '_'))
        return false;
    for (char c : name) {
        const unsigned char u = static_cast<unsigned char>(c);
        if (!(std::isalnum(u) || u == '_'))
            return false;
    }
    return true;
}

std::string buildBatchCommand(const BatchRequest &req) {
    std::string full = req.command;
    if (!req.env.empty()) {
        std::string prefix = "env";
        for (const auto &kv : req.env)
            prefix += " " + kv.first + "=" + escapeShellArg(kv.second);
        full = prefix + " " + full;
    }
    if (req.sudo)
        full = "sudo -n " + full;
    if (req.workdir.has_value())
        full = "cd " + escapeShellArg(*req.workdir) + " && " + full;
    return full;
}

std::string commandProbeLine(const std::string &tool) {
    return "command -v " + escapeShellArg(tool) + " 2>/dev/null";
}

std::string mkdirLine(const std::string &dir) {
    return "mkdir -p " + escapeShellArg(dir);
}

std::string buildTransferCommand(const std::string &sourcePath, bool isDir,
                                 const std::string &targetPath,
                                 const std::string &executable,
                                 TransferMethod method,
                                 const TransferCommandOptions &opts) {
    const std::string remoteBase =
        (!targetPath.empty() && targetPath.back() == '/') ? targetPath
                                                          : targetPath + "/";
    const std::string remoteDest =
        opts.targetUserAndHost + ":" + escapeShellArg(remoteBase);

    std::vector<std::string> parts;
    if (opts.sshpassPrefix.has_value())
        parts.push_back(*opts.sshpassPrefix);
    parts.push_back(escapeShellArg(executable));

    if (method == TransferMethod::Rsync) {
        parts.push_back("-avz --progress");
        // ssh options for rsync travel inside -e; the inner values are
        // single-quoted, which is safe inside the double-quoted -e argument.
        std::string sshArgs =
            "ssh -o StrictHostKeyChecking=no -o UserKnownHostsFile=/dev/null";
        if (opts.port.has_value())
            sshArgs += " -p " + std::to_string(*opts.port);
        if (opts.identityFile.has_value())
            sshArgs += " -i " + escapeShellArg(*opts.identityFile);
        parts.push_back("-e \"" + sshArgs + "\"");
        // A trailing slash copies the directory contents, not the directory.
        std::string src = sourcePath;
        if (isDir && (src.empty() || src.back() != '/'))
            src.push_back('/');
        parts.push_back(escapeShellArg(src));
        parts.push_back(remoteDest);
    } else {
        parts.push_back("-o StrictHostKeyChecking=no");
        parts.push_back("-o UserKnownHostsFile=/dev/null");
        if (isDir)
            parts.push_back("-r");
        if (opts.port.has_value())
            parts.push_back("-P " + std::to_string(*opts.port));
        if (opts.identityFile.has_value())
            parts.push_back("-i " + escapeShellArg(*opts.identityFile));
        parts.push_back(escapeShellArg(sourcePath));
        parts.push_back(remoteDest);
    }

    std::string out;
    for (const auto &p : parts) {
        if (!out.empty())
            out.push_back(' ');
        out += p;
    }
    return out;
}

int parseRsyncPercent(const std::string &chunk) {
    int found = -1;
    for (std::size_t i = 0; i < chunk.size(); ++i) {
        if (chunk[i] != '%' || i == 0)
            continue;
        std::size_t j = i;
        while (j > 0 && std::isdigit(static_cast<unsigned char>(chunk[j - 1])))
            --j;
        if (j == i || i - j > 3)
            continue;
        found = std::stoi(chunk.substr(j, i - j));
    }
    return found;
}

bool isRsyncMissingSignature(int exitCode, const std::string &stderrText) {
    if (exitCode == kShellCommandNotFound)
        return true;
    return exitCode == kRsyncProtocolError &&
           stderrText.find("command not found") != std::string::npos;
}

std::string formatBytes(std::uint64_t bytes) {
    char buf[32];
    const double b = static_cast<double>(bytes);
    if (bytes < 1024ULL) {
        std::snprintf(buf, sizeof(buf), "%llu B",
                      static_cast<unsigned long long>(bytes));
    } else if (bytes < 1024ULL * 1024) {
        std::snprintf(buf, sizeof(buf), "%.1f KB", b / 1024.0);
    } else if (bytes < 1024ULL * 1024 * 1024) {
        std::snprintf(buf, sizeof(buf), "%.1f MB", b / (1024.0 * 1024.0));
    } else {
        std::snprintf(buf, sizeof(buf), "%.1f GB",
                      b / (1024.0 * 1024.0 * 1024.0));
    }
    return buf;
}

} // namespace openfleet
