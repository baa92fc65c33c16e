//
//  progress_channel.cpp
//  motion_comic
//

#include "progress_channel.hpp"

void ProgressChannel::push(int percent, const std::string &message){
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) return;
        events_.push_back({percent, message});
    }
    cv_.notify_one();
}

std::optional<ProgressEvent> ProgressChannel::pop(std::chrono::milliseconds timeout){
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [this]{ return !events_.empty() || closed_; });
    if (events_.empty()) return std::nullopt;
    ProgressEvent event = events_.front();
    events_.pop_front();
    return event;
}

std::vector<ProgressEvent> ProgressChannel::drain(){
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ProgressEvent> events(events_.begin(), events_.end());
    events_.clear();
    return events;
}

void ProgressChannel::close(){
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool ProgressChannel::closed() const{
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}
