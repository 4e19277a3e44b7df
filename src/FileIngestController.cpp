#include "FileIngestController.hpp"
#include <sys/stat.h>
#include <cerrno>
#include <ctime>
#include <cstdio>
#include <filesystem>
#include <system_error>
#include <type_traits>
#include <variant>
#include <trantor/net/EventLoop.h>
#include <trantor/utils/Logger.h>
#include "ChunkReader.hpp"
#include "StreamSession.hpp"

namespace {

struct StreamJob {
    StreamJob(const std::string& path, std::size_t chunkSize) : session(path, chunkSize) {}

    StreamSession session;
    FileIngestController::EventSink sink;
    FileIngestController::Completion done;
    trantor::EventLoop* loop = nullptr;
};

Json::Value stream_result(const StreamEvent& terminal) {
    Json::Value result;
    if (const auto* done = std::get_if<StreamCompletion>(&terminal)) {
        result["success"] = true;
        result["totalLines"] = static_cast<Json::UInt64>(done->totalLines);
        result["size"] = static_cast<Json::UInt64>(done->totalBytes);
    } else {
        result["success"] = false;
        result["error"] = std::get<StreamFailure>(terminal).error;
    }
    return result;
}

// Delivers one chunk's worth of events, then yields the loop so other
// sessions on the same worker make progress.
void pump(std::shared_ptr<StreamJob> job) {
    Json::Value result;
    try {
        while (auto event = job->session.next()) {
            job->sink(FileIngestController::channelFor(*event), FileIngestController::toJson(*event));
            if (is_terminal(*event)) {
                LOG_DEBUG << "Stream of " << job->session.path() << " finished: "
                          << job->session.lineCount() << " lines, " << job->session.bytesRead() << " bytes";
                result = stream_result(*event);
                break;
            }
            if (std::holds_alternative<ProgressEvent>(*event)) {
                break;
            }
        }
    } catch (const std::exception& e) {
        LOG_ERROR << "Stream of " << job->session.path() << " aborted by its consumer: " << e.what();
        result["success"] = false;
        result["error"] = std::string("Stream aborted: ") + e.what();
    }
    if (!result.isNull()) {
        job->done(result);
        return;
    }
    job->loop->queueInLoop([job]() { pump(job); });
}

std::string iso_timestamp(const struct timespec& ts) {
    std::tm utc{};
    gmtime_r(&ts.tv_sec, &utc);
    char date[32];
    std::strftime(date, sizeof(date), "%Y-%m-%dT%H:%M:%S", &utc);
    char stamp[48];
    std::snprintf(stamp, sizeof(stamp), "%s.%03ldZ", date, static_cast<long>(ts.tv_nsec / 1000000));
    return stamp;
}

}

FileIngestController::FileIngestController(std::size_t workerThreads)
    : workers_(std::make_unique<trantor::EventLoopThreadPool>(workerThreads == 0 ? 1 : workerThreads,
                                                              "StreamWorker")) {
    workers_->start();
}

FileIngestController::~FileIngestController() {
    shutdown();
}

Json::Value FileIngestController::failure(const std::string& error) const {
    Json::Value result;
    result["success"] = false;
    result["error"] = error;
    return result;
}

Json::Value FileIngestController::readFile(const std::string& path) const {
    if (!policy_.isPathAllowed(path)) {
        return failure("Access denied: path not in allowed list");
    }
    try {
        std::error_code ec;
        std::uint64_t size = std::filesystem::file_size(path, ec);
        if (ec) {
            return failure("Cannot read " + path + ": " + ec.message());
        }
        std::string data;
        if (size > 0) {
            // one chunk covering the whole file
            ChunkReader reader(path, size, static_cast<std::size_t>(size));
            if (reader.next()) {
                data.assign(reader.data(), reader.size());
            }
        }
        Json::Value result;
        result["success"] = true;
        result["data"] = data;
        return result;
    } catch (const std::exception& e) {
        return failure("Cannot read " + path + ": " + e.what());
    }
}

Json::Value FileIngestController::getFileInfo(const std::string& path) const {
    if (!policy_.isPathAllowed(path)) {
        return failure("Access denied: path not in allowed list");
    }
    struct stat st{};
    if (::stat(path.c_str(), &st) != 0) {
        return failure("Cannot stat " + path + ": " + std::error_code(errno, std::generic_category()).message());
    }
    std::filesystem::path p(path);
    Json::Value result;
    result["success"] = true;
    result["info"]["size"] = static_cast<Json::UInt64>(st.st_size);
    result["info"]["modified"] = iso_timestamp(st.st_mtim);
    result["info"]["name"] = p.filename().string();
    result["info"]["extension"] = p.extension().string();
    return result;
}

void FileIngestController::streamFile(const std::string& path, std::size_t chunkSize, EventSink sink, Completion done) {
    if (!policy_.isPathAllowed(path)) {
        Json::Value denied;
        denied["error"] = "Access denied: path not in allowed list";
        sink("file-stream-error", denied);
        done(failure(denied["error"].asString()));
        return;
    }
    if (!workers_) {
        done(failure("File service is shut down"));
        return;
    }
    auto job = std::make_shared<StreamJob>(path, chunkSize);
    job->sink = std::move(sink);
    job->done = std::move(done);
    job->loop = workers_->getNextLoop();
    LOG_DEBUG << "Streaming " << path << " (" << job->session.totalBytes() << " bytes, chunk " << chunkSize << ")";
    job->loop->queueInLoop([job]() { pump(job); });
}

void FileIngestController::shutdown() {
    if (!workers_) return;
    for (auto* loop : workers_->getLoops()) {
        loop->quit();
    }
    workers_->wait();
    workers_.reset();
}

void FileIngestController::setAllowedPaths(const std::vector<std::string>& paths) {
    policy_.setAllowedPaths(paths);
}

const char* FileIngestController::channelFor(const StreamEvent& event) {
    switch (event.index()) {
        case 0: return "file-lines-chunk";
        case 1: return "file-read-progress";
        case 2: return "file-stream-complete";
        default: return "file-stream-error";
    }
}

Json::Value FileIngestController::toJson(const StreamEvent& event) {
    Json::Value payload;
    std::visit([&payload](const auto& e) {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, LineChunkBatch>) {
            payload["lines"] = Json::Value(Json::arrayValue);
            for (const auto& line : e.lines) {
                payload["lines"].append(line);
            }
            payload["lineCount"] = static_cast<Json::UInt64>(e.lineCount);
        } else if constexpr (std::is_same_v<T, ProgressEvent>) {
            payload["progress"] = e.percent;
            payload["totalRead"] = static_cast<Json::UInt64>(e.bytesRead);
            payload["fileSize"] = static_cast<Json::UInt64>(e.totalBytes);
        } else if constexpr (std::is_same_v<T, StreamCompletion>) {
            payload["totalLines"] = static_cast<Json::UInt64>(e.totalLines);
            payload["totalBytes"] = static_cast<Json::UInt64>(e.totalBytes);
        } else {
            payload["error"] = e.error;
        }
    }, event);
    return payload;
}
