//
//  logger.hpp
//  motion_comic
//

#ifndef logger_hpp
#define logger_hpp

#include <functional>
#include <mutex>
#include <string>

// 1行ずつmutexで排他して出力する（animate/narrateのワーカーから同時に呼ばれる）
// Info,Debug -> stdout   Warn,Error -> stderr
// DebugはMOTION_COMIC_DEBUGが設定されているか SetDebug(true) の時だけ出す
class Logger
{
public:
    static void Info(const std::string &line);
    static void Debug(const std::string &line);
    static void Warn(const std::string &line);
    static void Error(const std::string &line);

    static void SetDebug(bool enabled);
    //全レベルの行を受け取るコールバック（ログファイル出力やテスト用）nullptrで解除
    static void SetSink(std::function<void(const std::string &)> sink);

private:
    static void emit(const char *level, const std::string &line, bool to_stderr);

    static std::mutex mutex_;
    static bool debug_enabled_;
    static std::function<void(const std::string &)> sink_;
};

#endif /* logger_hpp */
