//
//  logger.cpp
//  motion_comic
//

#include "logger.hpp"

#include <cstdlib>
#include <iostream>

std::mutex Logger::mutex_;
bool Logger::debug_enabled_ = false;
std::function<void(const std::string &)> Logger::sink_;

void Logger::SetDebug(bool enabled){
    std::lock_guard<std::mutex> lock(mutex_);
    debug_enabled_ = enabled;
}

void Logger::SetSink(std::function<void(const std::string &)> sink){
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = std::move(sink);
}

void Logger::Info(const std::string &line){
    emit("INFO", line, false);
}

void Logger::Debug(const std::string &line){
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!debug_enabled_ && std::getenv("MOTION_COMIC_DEBUG") == nullptr) return;
    }
    emit("DEBUG", line, false);
}

void Logger::Warn(const std::string &line){
    emit("WARN", line, true);
}

void Logger::Error(const std::string &line){
    emit("ERROR", line, true);
}

void Logger::emit(const char *level, const std::string &line, bool to_stderr){
    std::lock_guard<std::mutex> lock(mutex_);
    std::string text = std::string("[") + level + "] " + line;
    if (sink_) {
        sink_(text);
    }
    std::ostream &out = to_stderr ? std::cerr : std::cout;
    out << text << '\n';
    out.flush();
}
