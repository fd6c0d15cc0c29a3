#include <mcphub/dynamic/interpreter_probe.hpp>

#include <mcphub/core/log.hpp>

#include <array>
#include <cctype>
#include <cstdio>
#include <sys/wait.h>

namespace mcphub {

namespace {

std::string ShellQuote(const std::string& s) {
    std::string quoted = "'";
    for (char c : s) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

std::string Trim(const std::string& s) {
    auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return {};
    }
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

Error MakeProbeError(const std::string& interpreter, const std::string& message) {
    return Error{"InterpreterProbe", interpreter, std::nullopt, message, std::nullopt,
                 ErrorCategory::Configuration};
}

} // anonymous namespace

Result<std::string, Error> InterpreterProbe::Version(const std::string& interpreter) {
    auto command = ShellQuote(interpreter) + " --version 2>/dev/null";
    FILE* pipe = ::popen(command.c_str(), "r");
    if (pipe == nullptr) {
        return Result<std::string, Error>::Err(
            MakeProbeError(interpreter, "Cannot run " + interpreter));
    }

    std::string output;
    std::array<char, 256> buffer{};
    while (std::fgets(buffer.data(), static_cast<int>(buffer.size()), pipe) != nullptr) {
        output += buffer.data();
    }
    int status = ::pclose(pipe);
    if (status == -1 || !WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        return Result<std::string, Error>::Err(
            MakeProbeError(interpreter, interpreter + " not found"));
    }

    auto newline = output.find('\n');
    auto version = Trim(newline == std::string::npos ? output : output.substr(0, newline));
    if (version.empty()) {
        return Result<std::string, Error>::Err(
            MakeProbeError(interpreter, interpreter + " printed no version"));
    }
    LogDebug("dynamic", interpreter + " reports " + version);
    return Result<std::string, Error>::Ok(version);
}

std::optional<int> ParseMajorVersion(std::string_view version) {
    size_t pos = 0;
    while (pos < version.size() && std::isspace(static_cast<unsigned char>(version[pos]))) {
        ++pos;
    }
    if (pos < version.size() && (version[pos] == 'v' || version[pos] == 'V')) {
        ++pos;
    }
    if (pos >= version.size() || !std::isdigit(static_cast<unsigned char>(version[pos]))) {
        return std::nullopt;
    }
    int major = 0;
    while (pos < version.size() && std::isdigit(static_cast<unsigned char>(version[pos]))) {
        major = major * 10 + (version[pos] - '0');
        if (major > 100000) {
            return std::nullopt;
        }
        ++pos;
    }
    return major;
}

} // namespace mcphub
