#pragma once

#include <string>
#include <memory>
#include <functional>
#include <mutex>
#include <chrono>

// Callback type definitions
using ProgressCallback = std::function<void(int progress)>;
using StatusCallback = std::function<void(const std::string& status)>;

class Job {
public:
    enum class State {
        CREATED,
        EXTRACTING,
        CHECKSUMMING,
        ENCODING,
        VERIFYING,
        VERIFIED,
        DEGRADED,
        FAILED
    };

    Job();
    virtual ~Job() = default;

    // Job control
    virtual bool start() = 0;
    virtual bool cancel() = 0;

    // Status queries
    State getState() const;
    bool isTerminal() const;
    int getProgress() const;
    std::string getStatus() const;
    std::string getError() const;
    std::string getId() const;

    // Callbacks
    void setProgressCallback(ProgressCallback callback);
    void setStatusCallback(StatusCallback callback);

    static std::string stateToString(State state);
    static State parseState(const std::string& text);
    static bool isTerminalState(State state);

protected:
    void updateProgress(int progress);
    void setError(const std::string& error);
    void setState(State state);
    void setStatus(const std::string& status);
    void setId(const std::string& id);
    std::string generateId() const;

    std::string id_;
    State state_{State::CREATED};
    std::string status_{"created"};
    int progress_{0};
    std::string error_;
    ProgressCallback progressCallback_;
    StatusCallback statusCallback_;
    mutable std::mutex stateMutex_;
};
