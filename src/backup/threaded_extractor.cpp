#include "backup/threaded_extractor.hpp"
#include "common/backup_status.hpp"
#include "common/logger.hpp"
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <vector>

ThreadedExtractor::ThreadedExtractor(uint64_t unitSize)
    : unitSize_(unitSize) {
    if (unitSize_ == 0) {
        throw BackupError(ErrorKind::InvalidConfiguration, "Unit size must be greater than zero");
    }
}

ThreadedExtractor::~ThreadedExtractor() {
    shutdown();
}

void ThreadedExtractor::shutdown() {
    std::map<ExtractionHandle, std::shared_ptr<Session>> sessions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sessions.swap(sessions_);
    }

    for (auto& pair : sessions) {
        Session& session = *pair.second;
        bool finished = false;
        {
            std::lock_guard<std::mutex> lock(session.mutex);
            finished = session.finished;
            if (!finished && !session.cancelRequested) {
                session.cancelRequested = true;
                session.cancelTime = std::chrono::steady_clock::now();
            }
        }
        if (!finished) {
            onCancel(session);
        }
        if (session.worker.joinable()) {
            session.worker.join();
        }
    }
}

ExtractionHandle ThreadedExtractor::begin(const Source& source, const std::string& destination) {
    checkSource(source);

    std::error_code ec;
    std::filesystem::create_directories(destination, ec);
    if (ec) {
        throw BackupError(ErrorKind::StorageIOError,
                          "Failed to create extraction directory " + destination + ": " + ec.message());
    }

    auto session = std::make_shared<Session>();
    session->source = source;
    session->destination = destination;

    ExtractionHandle handle;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        handle = nextHandle_++;
        sessions_[handle] = session;
    }

    Logger::debug(name() + " extractor session " + std::to_string(handle) +
                  " reading " + source.path + " into " + destination);

    session->worker = std::thread([this, session]() {
        ExtractionStatus status;
        try {
            status = run(*session);
        } catch (const std::exception& e) {
            status = ExtractionStatus::failed(std::string("Extraction aborted: ") + e.what());
        }
        std::lock_guard<std::mutex> lock(session->mutex);
        session->result = std::move(status);
        session->finished = true;
    });

    return handle;
}

ExtractionStatus ThreadedExtractor::poll(ExtractionHandle handle) {
    auto session = findSession(handle);
    if (!session) {
        return ExtractionStatus::failed("Unknown extraction handle " + std::to_string(handle));
    }

    if (session->cancelRequested) {
        return ExtractionStatus::failed("Cancelled", true);
    }

    std::lock_guard<std::mutex> lock(session->mutex);
    if (!session->finished) {
        return ExtractionStatus::running(session->bytes.load());
    }
    return session->result;
}

void ThreadedExtractor::cancel(ExtractionHandle handle) {
    auto session = findSession(handle);
    if (!session) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(session->mutex);
        if (session->cancelRequested) {
            return;
        }
        session->cancelRequested = true;
        session->cancelTime = std::chrono::steady_clock::now();
        if (session->finished) {
            return;
        }
    }
    onCancel(*session);
}

std::shared_ptr<ThreadedExtractor::Session> ThreadedExtractor::findSession(ExtractionHandle handle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(handle);
    return it != sessions_.end() ? it->second : nullptr;
}

std::string ThreadedExtractor::unitFileName(size_t index) {
    char name[32];
    std::snprintf(name, sizeof(name), "unit_%05zu.bin", index);
    return name;
}

bool ThreadedExtractor::writeUnits(std::istream& input, Session& session, std::vector<UnitDescriptor>& manifest,
                                   uint64_t& offset, std::string& error) const {
    std::vector<char> buffer(unitSize_);

    while (!session.cancelRequested) {
        // Fill a whole unit unless the input ends first
        size_t filled = 0;
        while (filled < buffer.size() && input.good()) {
            input.read(buffer.data() + filled, static_cast<std::streamsize>(buffer.size() - filled));
            filled += static_cast<size_t>(input.gcount());
        }
        if (input.bad()) {
            error = "Read error at byte " + std::to_string(offset + filled) + " of " + session.source.path;
            return false;
        }
        if (filled == 0) {
            return true;
        }

        UnitDescriptor unit;
        unit.index = manifest.size();
        unit.fileName = unitFileName(unit.index);
        unit.offset = offset;
        unit.size = filled;

        std::string path = (std::filesystem::path(session.destination) / unit.fileName).string();
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out.write(buffer.data(), static_cast<std::streamsize>(filled));
        out.flush();
        if (!out) {
            error = "Failed to write " + path;
            return false;
        }

        manifest.push_back(unit);
        offset += filled;
        session.bytes = offset;

        if (filled < buffer.size()) {
            return true;
        }
    }
    error = "Cancelled";
    return false;
}
