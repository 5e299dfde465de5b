#pragma once

#include <spdlog/sinks/base_sink.h>
#include <spdlog/spdlog.h>

#include <LogCompat.hpp>
#include <algorithm>
#include <concepts>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <type_traits>
#include <utility>

template <typename Mutex>
using base_sink = spdlog::sinks::base_sink<Mutex>;

// Attaches a sink to the default logger for the lifetime of the holder.
template <std::derived_from<base_sink<std::mutex>> Sink>
struct RAIILogSink {
    RAIILogSink() = default;

    template <typename... Args>
    explicit RAIILogSink(Args&&... args)
        requires std::is_constructible_v<Sink, Args...> &&
                 (sizeof...(Args) != 0)
        : _sink(std::make_shared<Sink>(std::forward<Args>(args)...)) {
        spdlog::default_logger()->sinks().push_back(_sink);
    }

    ~RAIILogSink() { detach(); }

    RAIILogSink(const RAIILogSink&) = delete;
    RAIILogSink& operator=(const RAIILogSink&) = delete;

    RAIILogSink& operator=(std::shared_ptr<Sink>&& sink) & {
        detach();
        _sink = std::move(sink);
        if (_sink) {
            spdlog::default_logger()->sinks().push_back(_sink);
        }
        return *this;
    }

    [[nodiscard]] bool attached() const { return _sink != nullptr; }

   private:
    void detach() {
        if (!_sink) {
            return;
        }
        auto& sinks = spdlog::default_logger()->sinks();
        sinks.erase(std::remove(sinks.begin(), sinks.end(), _sink),
                    sinks.end());
        _sink.reset();
    }

    std::shared_ptr<Sink> _sink;
};

// Appends every formatted entry to a file.
struct LogFileSink : base_sink<std::mutex> {
    explicit LogFileSink(const std::filesystem::path& filename)
        : file(filename, std::ios::out | std::ios::app) {
        if (!file.is_open()) {
            LOG(ERROR) << "Couldn't open log file " << filename;
        }
    }

    void sink_it_(const spdlog::details::log_msg& msg) override {
        if (!file.is_open()) {
            return;
        }
        spdlog::memory_buf_t formatted;
        base_sink<std::mutex>::formatter_->format(msg, formatted);
        file.write(formatted.data(),
                   static_cast<std::streamsize>(formatted.size()));
    }

    void flush_() override { file.flush(); }

    ~LogFileSink() override = default;

   private:
    std::ofstream file;
};
