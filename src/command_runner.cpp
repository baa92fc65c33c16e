//
//  command_runner.cpp
//  motion_comic
//

#include "command_runner.hpp"
#include "logger.hpp"

#include <stdio.h>
#include <sys/wait.h>

CommandRunner::CommandRunner(int timeout_seconds) : timeout_seconds(timeout_seconds) {}

std::string CommandRunner::quote(const std::string &arg){
    std::string quoted = "'";
    for (char c : arg) {
        if (c == '\'') quoted += "'\\''";
        else quoted += c;
    }
    quoted += "'";
    return quoted;
}

std::string CommandRunner::join(const std::vector<std::string> &args){
    std::string command;
    for (int i=0; i<args.size(); i++) {
        if (i > 0) command += " ";
        command += quote(args[i]);
    }
    return command;
}

int CommandRunner::run(const std::vector<std::string> &args, std::string *capture) const{
    return run(join(args), capture);
}

int CommandRunner::run(const std::string &command, std::string *capture) const{
    std::string full = command;
    if (timeout_seconds > 0) {
        full = "timeout " + std::to_string(timeout_seconds) + " " + full;
    }
    //標準出力を使わない時は捨てる．標準エラーはログに残すため捨てない
    if (capture == nullptr) full += " > /dev/null";
    Logger::Debug("exec: " + full);

    FILE *pipe = popen(full.c_str(), "r");
    if (pipe == nullptr) {
        Logger::Error("failed to start command: " + full);
        return -1;
    }
    char buffer[4096];
    size_t n;
    while ((n = fread(buffer, 1, sizeof(buffer), pipe)) > 0) {
        if (capture) capture->append(buffer, n);
    }
    int status = pclose(pipe);
    if (status == -1) return -1;
    if (WIFEXITED(status)) {
        int code = WEXITSTATUS(status);
        if (code == 124 && timeout_seconds > 0) {
            Logger::Warn("command timed out after " + std::to_string(timeout_seconds) + "s: " + command);
        }
        return code;
    }
    return -1;
}
