#include "common/job.hpp"
#include "common/backup_status.hpp"
#include <chrono>
#include <random>
#include <sstream>
#include <iomanip>

Job::Job() : state_(State::CREATED), progress_(0) {}

void Job::updateProgress(int progress) {
    ProgressCallback callback;
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        progress_ = progress;
        callback = progressCallback_;
    }
    if (callback) {
        callback(progress);
    }
}

void Job::setError(const std::string& error) {
    std::lock_guard<std::mutex> lock(stateMutex_);
    error_ = error;
}

void Job::setState(State state) {
    std::lock_guard<std::mutex> lock(stateMutex_);
    state_ = state;
}

void Job::setStatus(const std::string& status) {
    StatusCallback callback;
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        status_ = status;
        callback = statusCallback_;
    }
    if (callback) {
        callback(status);
    }
}

void Job::setId(const std::string& id) {
    std::lock_guard<std::mutex> lock(stateMutex_);
    id_ = id;
}

void Job::setProgressCallback(ProgressCallback callback) {
    std::lock_guard<std::mutex> lock(stateMutex_);
    progressCallback_ = std::move(callback);
}

void Job::setStatusCallback(StatusCallback callback) {
    std::lock_guard<std::mutex> lock(stateMutex_);
    statusCallback_ = std::move(callback);
}

std::string Job::generateId() const {
    auto now = std::chrono::system_clock::now();
    auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch());

    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 15);
    const char* hex = "0123456789abcdef";

    std::stringstream ss;
    ss << std::hex << now_ms.count();
    for (int i = 0; i < 8; ++i) {
        ss << hex[dis(gen)];
    }

    return ss.str();
}

Job::State Job::getState() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return state_;
}

bool Job::isTerminal() const {
    return isTerminalState(getState());
}

int Job::getProgress() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return progress_;
}

std::string Job::getStatus() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return status_;
}

std::string Job::getError() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return error_;
}

std::string Job::getId() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return id_;
}

std::string Job::stateToString(State state) {
    switch (state) {
        case State::CREATED:      return "created";
        case State::EXTRACTING:   return "extracting";
        case State::CHECKSUMMING: return "checksumming";
        case State::ENCODING:     return "encoding";
        case State::VERIFYING:    return "verifying";
        case State::VERIFIED:     return "verified";
        case State::DEGRADED:     return "degraded";
        case State::FAILED:       return "failed";
        default:                  return "unknown";
    }
}

Job::State Job::parseState(const std::string& text) {
    static const State states[] = {
        State::CREATED, State::EXTRACTING, State::CHECKSUMMING, State::ENCODING,
        State::VERIFYING, State::VERIFIED, State::DEGRADED, State::FAILED
    };
    for (State state : states) {
        if (stateToString(state) == text) {
            return state;
        }
    }
    throw BackupError(ErrorKind::StorageIOError, "Unknown job state in job record: " + text);
}

bool Job::isTerminalState(State state) {
    return state == State::VERIFIED || state == State::DEGRADED || state == State::FAILED;
}
