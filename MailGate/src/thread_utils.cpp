#include "mailgate/thread_utils.hpp"
#include <spdlog/details/os.h>
#include <stdio.h>
#include <map>
#include <mutex>
#include <thread>
#include <pthread.h>

static std::map<size_t, std::string> names{};
static std::mutex namesMtx;

void SetThreadName(const char* threadName)
{
    {
        std::lock_guard<std::mutex> lock(namesMtx);
        names[spdlog::details::os::thread_id()] = threadName;
    }
    // the kernel truncates names to 15 characters plus the terminator
    std::string shortName = std::string(threadName).substr(0, 15);
#ifdef __APPLE__
    pthread_setname_np(shortName.c_str());
#else
    pthread_setname_np(pthread_self(), shortName.c_str());
#endif
}

std::string GetThreadName(size_t spdlog_thread_id) {
    std::lock_guard<std::mutex> lock(namesMtx);
    auto it = names.find(spdlog_thread_id);
    if (it == names.end()) {
        return std::to_string(spdlog_thread_id);
    }
    return it->second;
}
