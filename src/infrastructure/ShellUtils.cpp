#include "infrastructure/ShellUtils.hpp"
#include <array>
#include <atomic>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <sstream>
#include <sys/wait.h>
#include <unistd.h>

namespace bidlens::infrastructure {

namespace fs = std::filesystem;

namespace {

int DecodeStatus(int status) {
    if (status == -1) return -1;
    return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
}

} // namespace

int ShellUtils::Run(const std::string& cmd) {
    return DecodeStatus(std::system(cmd.c_str()));
}

CommandResult ShellUtils::Capture(const std::string& cmd) {
    CommandResult result;
    FILE* pipe = popen(cmd.c_str(), "r");
    if (!pipe) return result;

    std::array<char, 4096> buffer;
    std::size_t n = 0;
    while ((n = std::fread(buffer.data(), 1, buffer.size(), pipe)) > 0) {
        result.output.append(buffer.data(), n);
    }
    result.exitCode = DecodeStatus(pclose(pipe));
    return result;
}

std::string ShellUtils::Quote(const std::string& arg) {
    std::string quoted = "'";
    for (char c : arg) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

bool ShellUtils::FindInPath(const std::string& tool) {
    const char* path = std::getenv("PATH");
    if (!path || tool.empty()) return false;

    std::stringstream dirs(path);
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        if (dir.empty()) continue;
        const fs::path candidate = fs::path(dir) / tool;
        if (::access(candidate.c_str(), X_OK) == 0) {
            std::error_code ec;
            if (fs::is_regular_file(candidate, ec)) return true;
        }
    }
    return false;
}

std::string ShellUtils::UniqueTempPath(const std::string& suffix) {
    static std::atomic<unsigned long> counter{0};
    const std::string name = "bidlens_" + std::to_string(::getpid()) + "_" +
                             std::to_string(counter.fetch_add(1)) + suffix;
    std::error_code ec;
    fs::path dir = fs::temp_directory_path(ec);
    if (ec) dir = "/tmp";
    return (dir / name).string();
}

} // namespace bidlens::infrastructure
