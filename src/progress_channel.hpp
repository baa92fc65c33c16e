//
//  progress_channel.hpp
//  motion_comic
//

#ifndef progress_channel_hpp
#define progress_channel_hpp

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

struct ProgressEvent {
    int percent = 0;
    std::string message;
};

//進捗イベントのキュー　ワーカーからpush，呼び出し側(UI/CLI)がpop
class ProgressChannel
{
public:
    void push(int percent, const std::string &message);
    //timeoutまで待つ．イベントがなければstd::nullopt
    std::optional<ProgressEvent> pop(std::chrono::milliseconds timeout);
    std::vector<ProgressEvent> drain();
    void close();
    bool closed() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<ProgressEvent> events_;
    bool closed_ = false;
};

#endif /* progress_channel_hpp */
