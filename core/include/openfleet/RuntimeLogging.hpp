// Redaction of secrets in command lines before they reach a log.
#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <initializer_list>
#include <string>

namespace openfleet {

// Lower-cased, blank-trimmed value of an environment variable ("" if unset).
inline std::string envSetting(const char *name) {
    const char *raw = std::getenv(name);
    const std::string v = raw ? raw : "";
    const char *blanks = " \t\r\n";
    const std::size_t first = v.find_first_not_of(blanks);
    if (first == std::string::npos)
        return {};
    std::string out = v.substr(first, v.find_last_not_of(blanks) - first + 1);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

// Full command lines are logged only on a development host that also sets
// OPEN_FLEET_LOG_SENSITIVE.
inline bool sensitiveLoggingEnabled() {
    auto oneOf = [](const std::string &v, std::initializer_list<const char *> set) {
        return std::any_of(set.begin(), set.end(),
                           [&v](const char *s) { return v == s; });
    };
    return oneOf(envSetting("OPEN_FLEET_ENV"),
                 {"dev", "development", "local", "debug"}) &&
           oneOf(envSetting("OPEN_FLEET_LOG_SENSITIVE"), {"1", "true", "yes", "on"});
}

// Cuts the line after the first sshpass "-p" or "-P" flag.
inline std::string redactCommand(const std::string &command) {
    if (sensitiveLoggingEnabled())
        return command;
    const std::size_t pos = command.find("sshpass");
    if (pos == std::string::npos)
        return command;
    const std::size_t flag =
        std::min(command.find(" -p ", pos), command.find(" -P ", pos));
    if (flag == std::string::npos)
        return command;
    return command.substr(0, flag + 4) + "<redacted>";
}

} // namespace openfleet
