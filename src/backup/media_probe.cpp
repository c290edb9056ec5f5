#include "backup/media_probe.hpp"
#include "common/logger.hpp"
#include <cctype>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>
#include <vector>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {

// Primary volume descriptor lives in sector 16 (2048-byte sectors)
constexpr std::streamoff kIsoMagicOffset = 32769;
constexpr std::streamoff kIsoLabelOffset = 32808;
constexpr size_t kIsoLabelLength = 32;

bool readAt(std::ifstream& file, std::streamoff offset, char* buffer, size_t length) {
    file.clear();
    file.seekg(offset);
    if (!file) {
        return false;
    }
    file.read(buffer, static_cast<std::streamsize>(length));
    return static_cast<size_t>(file.gcount()) == length;
}

std::string trim(const std::string& text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
        --end;
    }
    return text.substr(begin, end - begin);
}

// Mount tables escape blanks and backslashes as \ooo octal sequences
std::string unescapeMountField(const std::string& field) {
    std::string result;
    for (size_t i = 0; i < field.size(); ++i) {
        if (field[i] == '\\' && i + 3 < field.size() &&
            std::isdigit(static_cast<unsigned char>(field[i + 1])) &&
            std::isdigit(static_cast<unsigned char>(field[i + 2])) &&
            std::isdigit(static_cast<unsigned char>(field[i + 3]))) {
            result += static_cast<char>(std::stoi(field.substr(i + 1, 3), nullptr, 8));
            i += 3;
        } else {
            result += field[i];
        }
    }
    return result;
}

std::string resolvePath(const std::string& path) {
    std::error_code ec;
    auto resolved = std::filesystem::weakly_canonical(path, ec);
    return ec ? path : resolved.string();
}

// Run a tool without a shell. Returns its exit status, or -1 if it could not
// be started; stdout is collected into output.
int runTool(const std::vector<std::string>& args, std::string& output, std::string& error) {
    std::vector<char*> argv;
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    int pipeFds[2];
    if (::pipe(pipeFds) != 0) {
        error = std::string("pipe failed: ") + strerror(errno);
        return -1;
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        error = std::string("fork failed: ") + strerror(errno);
        ::close(pipeFds[0]);
        ::close(pipeFds[1]);
        return -1;
    }
    if (pid == 0) {
        ::dup2(pipeFds[1], STDOUT_FILENO);
        int devNull = ::open("/dev/null", O_WRONLY);
        if (devNull >= 0) {
            ::dup2(devNull, STDERR_FILENO);
            ::close(devNull);
        }
        ::close(pipeFds[0]);
        ::close(pipeFds[1]);
        ::execvp(argv[0], argv.data());
        ::_exit(127);
    }

    ::close(pipeFds[1]);
    char buffer[4096];
    while (true) {
        ssize_t n = ::read(pipeFds[0], buffer, sizeof(buffer));
        if (n > 0) {
            output.append(buffer, static_cast<size_t>(n));
        } else if (n < 0 && errno == EINTR) {
            continue;
        } else {
            break;
        }
    }
    ::close(pipeFds[0]);

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            error = std::string("waitpid failed: ") + strerror(errno);
            return -1;
        }
    }
    if (!WIFEXITED(status)) {
        error = args.front() + " terminated abnormally";
        return -1;
    }
    if (WEXITSTATUS(status) == 127) {
        error = "Failed to execute " + args.front();
        return -1;
    }
    return WEXITSTATUS(status);
}

// Run a device command that must exit with status 0
bool runDeviceCommand(const std::vector<std::string>& args, std::string& error) {
    std::string output;
    int status = runTool(args, output, error);
    if (status < 0) {
        return false;
    }
    if (status != 0) {
        error = args.front() + " " + args.back() + " exited with status " + std::to_string(status);
        return false;
    }
    Logger::debug("Ran " + args.front() + " on " + args.back());
    return true;
}

// Only device nodes have trays; any other existing path needs nothing done
bool needsDeviceCommand(const std::string& path, std::string& error, bool& needed) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        error = "Source does not exist: " + path;
        return false;
    }
    needed = isBlockDevice(path);
    return true;
}

}

bool isReadable(const std::string& path) {
    if (path.empty()) {
        return false;
    }
    int fd = ::open(path.c_str(), O_RDONLY | O_NONBLOCK);
    if (fd < 0) {
        return false;
    }
    ::close(fd);
    return true;
}

bool isWritableDirectory(const std::string& path) {
    std::error_code ec;
    if (path.empty() || !std::filesystem::is_directory(path, ec)) {
        return false;
    }
    return ::access(path.c_str(), W_OK | X_OK) == 0;
}

bool isPortableName(const std::string& name) {
    if (name.empty() || name[0] == '-' || name[0] == '.') {
        return false;
    }
    for (char c : name) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '.' && c != '_' && c != '-') {
            return false;
        }
    }
    return true;
}

bool isBlockDevice(const std::string& path) {
    struct stat info;
    return ::stat(path.c_str(), &info) == 0 && S_ISBLK(info.st_mode);
}

bool isMounted(const std::string& path, const std::string& mountTable) {
    std::ifstream table(mountTable);
    if (!table.is_open()) {
        Logger::warning("Could not read mount table " + mountTable);
        return false;
    }

    const std::string resolved = resolvePath(path);
    std::string line;
    while (std::getline(table, line)) {
        std::istringstream fields(line);
        std::string device;
        if (!(fields >> device)) {
            continue;
        }
        device = unescapeMountField(device);
        if (device == path || (device[0] == '/' && resolvePath(device) == resolved)) {
            return true;
        }
    }
    return false;
}

bool readVolumeLabel(const std::string& path, std::string& label, std::string& error) {
    std::error_code ec;
    if (std::filesystem::is_directory(path, ec)) {
        error = "Not a device or image: " + path;
        return false;
    }

    // blkid also knows UDF and other post-ISO9660 formats
    std::string output;
    std::string toolError;
    if (runTool({"blkid", "-s", "LABEL", "-o", "value", path}, output, toolError) == 0) {
        std::string blkidLabel = trim(output);
        if (!blkidLabel.empty()) {
            label = blkidLabel;
            return true;
        }
    } else if (!toolError.empty()) {
        Logger::debug("blkid unavailable: " + toolError);
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        error = "Could not open for reading: " + path;
        return false;
    }

    char magic[2];
    if (!readAt(file, kIsoMagicOffset, magic, sizeof(magic))) {
        error = "Too short to hold an ISO9660 header: " + path;
        return false;
    }
    if (magic[0] != 'C' || magic[1] != 'D') {
        error = "Unrecognized file format: " + path;
        return false;
    }

    char raw[kIsoLabelLength];
    if (!readAt(file, kIsoLabelOffset, raw, sizeof(raw))) {
        error = "Truncated ISO9660 volume descriptor: " + path;
        return false;
    }

    std::string text(raw, sizeof(raw));
    size_t nul = text.find('\0');
    if (nul != std::string::npos) {
        text.resize(nul);
    }
    label = trim(text);
    return true;
}

bool waitForReady(const std::string& path, std::chrono::milliseconds timeout,
                  std::chrono::milliseconds interval) {
    auto start = std::chrono::steady_clock::now();
    while (true) {
        if (isReadable(path)) {
            return true;
        }
        if (std::chrono::steady_clock::now() - start >= timeout) {
            break;
        }
        std::this_thread::sleep_for(interval);
    }
    Logger::warning("Timed out waiting for " + path + " to become ready");
    return false;
}

bool loadMedium(const std::string& path, std::string& error) {
    bool needed = false;
    if (!needsDeviceCommand(path, error, needed)) {
        return false;
    }
    return !needed || runDeviceCommand({"eject", "-t", path}, error);
}

bool unmountSource(const std::string& path, std::string& error, const std::string& mountTable) {
    if (!isMounted(path, mountTable)) {
        return true;
    }
    Logger::info("Unmounting " + path + " for exclusive access");
    return runDeviceCommand({"umount", path}, error);
}

bool ejectMedium(const std::string& path, std::string& error) {
    bool needed = false;
    if (!needsDeviceCommand(path, error, needed)) {
        return false;
    }
    return !needed || runDeviceCommand({"eject", path}, error);
}
