#include "backup/process_extractor.hpp"
#include "common/backup_status.hpp"
#include "common/logger.hpp"
#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <thread>
#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {

void replaceAll(std::string& text, const std::string& from, const std::string& to) {
    size_t pos = 0;
    while ((pos = text.find(from, pos)) != std::string::npos) {
        text.replace(pos, from.size(), to);
        pos += to.size();
    }
}

bool isToolLog(const std::filesystem::path& path) {
    return path.extension() == ".log";
}

}

ProcessExtractor::ProcessExtractor(uint64_t unitSize, std::vector<std::string> commandTemplate,
                                   std::vector<std::string> recoveryPass, std::chrono::milliseconds killGrace)
    : ThreadedExtractor(unitSize)
    , commandTemplate_(std::move(commandTemplate))
    , recoveryPass_(std::move(recoveryPass))
    , killGrace_(killGrace) {
    if (commandTemplate_.empty()) {
        throw BackupError(ErrorKind::InvalidConfiguration, "Extractor command is empty");
    }
}

ProcessExtractor::~ProcessExtractor() {
    shutdown();
}

std::vector<std::string> ProcessExtractor::defaultCommandFor(MediumKind kind) {
    switch (kind) {
        case MediumKind::OpticalAudio:
            return {"cdparanoia", "-B", "-d", "{device}"};
        case MediumKind::OpticalData:
            return {"ddrescue", "-b", "2048", "{device}", "image.iso", "ddrescue.log"};
        case MediumKind::Cartridge:
        default:
            return {"dd", "if={device}", "of=cartridge.bin", "bs=64k"};
    }
}

std::vector<std::string> ProcessExtractor::defaultRecoveryPassFor(MediumKind kind) {
    // Second ddrescue pass retries the bad sectors recorded in the map file
    if (kind == MediumKind::OpticalData) {
        return {"ddrescue", "--direct", "-M", "-b", "2048", "{device}", "image.iso", "ddrescue.log"};
    }
    return {};
}

std::vector<std::string> ProcessExtractor::expandCommand(const std::vector<std::string>& commandTemplate,
                                                         const Source& source, const std::string& destination) {
    std::vector<std::string> argv;
    argv.reserve(commandTemplate.size());
    for (std::string arg : commandTemplate) {
        replaceAll(arg, "{device}", source.path);
        replaceAll(arg, "{dest}", destination);
        argv.push_back(std::move(arg));
    }
    return argv;
}

void ProcessExtractor::checkSource(const Source& source) const {
    std::error_code ec;
    if (source.path.empty() || !std::filesystem::exists(source.path, ec)) {
        throw BackupError(ErrorKind::DeviceError, "Source does not exist: " + source.path);
    }
    int fd = ::open(source.path.c_str(), O_RDONLY | O_NONBLOCK);
    if (fd < 0) {
        throw BackupError(ErrorKind::DeviceError,
                          "Source is not readable: " + source.path + ": " + strerror(errno));
    }
    ::close(fd);
}

uint64_t ProcessExtractor::directoryBytes(const std::string& path) {
    uint64_t total = 0;
    std::error_code ec;
    for (auto it = std::filesystem::recursive_directory_iterator(path, ec);
         !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
        std::error_code sizeEc;
        if (it->is_regular_file(sizeEc) && !isToolLog(it->path())) {
            auto size = it->file_size(sizeEc);
            if (!sizeEc) {
                total += size;
            }
        }
    }
    return total;
}

bool ProcessExtractor::runPass(Session& session, const std::vector<std::string>& commandTemplate, bool appendLog,
                               ExtractionStatus& failure) const {
    std::vector<std::string> args = expandCommand(commandTemplate, session.source, session.destination);
    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    std::string logPath = (std::filesystem::path(session.destination) / "extractor.log").string();
    const int logFlags = O_CREAT | O_WRONLY | (appendLog ? O_APPEND : O_TRUNC);
    Logger::info("Running extractor: " + args.front() + " (" + std::to_string(args.size() - 1) + " arguments)");

    pid_t pid = ::fork();
    if (pid < 0) {
        failure = ExtractionStatus::failed(std::string("fork failed: ") + strerror(errno));
        return false;
    }
    if (pid == 0) {
        // Child: only async-signal-safe calls until exec
        if (::chdir(session.destination.c_str()) != 0) {
            ::_exit(126);
        }
        int logFd = ::open(logPath.c_str(), logFlags, 0644);
        if (logFd >= 0) {
            ::dup2(logFd, STDOUT_FILENO);
            ::dup2(logFd, STDERR_FILENO);
            ::close(logFd);
        }
        ::execvp(argv[0], argv.data());
        ::_exit(127);
    }

    session.childPid = pid;
    if (session.cancelRequested) {
        ::kill(pid, SIGTERM);
    }

    int status = 0;
    bool killed = false;
    while (true) {
        pid_t waited = ::waitpid(pid, &status, WNOHANG);
        if (waited == pid) {
            break;
        }
        if (waited < 0 && errno != EINTR) {
            session.childPid = -1;
            failure = ExtractionStatus::failed(std::string("waitpid failed: ") + strerror(errno));
            return false;
        }

        session.bytes = directoryBytes(session.destination);

        if (session.cancelRequested && !killed) {
            std::chrono::steady_clock::time_point cancelTime;
            {
                std::lock_guard<std::mutex> lock(session.mutex);
                cancelTime = session.cancelTime;
            }
            if (std::chrono::steady_clock::now() - cancelTime > killGrace_) {
                Logger::warning("Extractor ignored SIGTERM, sending SIGKILL to pid " + std::to_string(pid));
                ::kill(pid, SIGKILL);
                killed = true;
            }
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    session.childPid = -1;

    if (session.cancelRequested) {
        failure = ExtractionStatus::failed("Cancelled", true);
        return false;
    }
    if (WIFSIGNALED(status)) {
        failure = ExtractionStatus::failed(args.front() + " killed by signal " + std::to_string(WTERMSIG(status)));
        return false;
    }
    int exitCode = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    if (exitCode == 127) {
        failure = ExtractionStatus::failed("Failed to execute " + args.front());
        return false;
    }
    if (exitCode != 0) {
        failure = ExtractionStatus::failed(args.front() + " exited with status " + std::to_string(exitCode));
        return false;
    }
    return true;
}

ExtractionStatus ProcessExtractor::run(Session& session) {
    ExtractionStatus failure;
    if (!runPass(session, commandTemplate_, false, failure)) {
        return failure;
    }
    if (!recoveryPass_.empty()) {
        Logger::info("Running recovery pass over " + session.source.path);
        if (!runPass(session, recoveryPass_, true, failure)) {
            return failure;
        }
    }

    std::vector<std::filesystem::path> produced;
    std::error_code ec;
    for (const auto& entry : std::filesystem::directory_iterator(session.destination, ec)) {
        if (entry.is_regular_file() && !isToolLog(entry.path())) {
            produced.push_back(entry.path());
        }
    }
    if (ec) {
        return ExtractionStatus::failed("Failed to list extractor output: " + ec.message());
    }
    std::sort(produced.begin(), produced.end());

    std::vector<UnitDescriptor> manifest;
    uint64_t offset = 0;
    for (const auto& path : produced) {
        std::ifstream input(path, std::ios::binary);
        if (!input.is_open()) {
            return ExtractionStatus::failed("Failed to open extractor output " + path.string());
        }
        std::string error;
        if (!writeUnits(input, session, manifest, offset, error)) {
            return ExtractionStatus::failed(error, session.cancelRequested);
        }
        input.close();
        std::filesystem::remove(path, ec);
        if (ec) {
            return ExtractionStatus::failed("Failed to remove " + path.string() + ": " + ec.message());
        }
    }

    return ExtractionStatus::done(std::move(manifest), offset);
}

void ProcessExtractor::onCancel(Session& session) {
    int pid = session.childPid;
    if (pid > 0) {
        ::kill(pid, SIGTERM);
    }
}
