#include "mailgate/request_dispatcher.hpp"
#include "mailgate/thread_utils.hpp"

#include <string>
#include <thread>

RequestDispatcher::RequestDispatcher(int maxInflight) :
    maxInflight(maxInflight > 0 ? maxInflight : 1), inflight(0), dispatched(0)
{
}

void RequestDispatcher::dispatch(std::function<void()> work) {
    int number = 0;
    {
        std::unique_lock<std::mutex> lck(mtx);
        cv.wait(lck, [&]() { return inflight < maxInflight; });
        inflight += 1;
        dispatched += 1;
        number = dispatched;
    }

    std::thread([this, number](std::function<void()> fn) {
        SetThreadName(("request-" + std::to_string(number)).c_str());
        fn();
        fn = nullptr;

        std::lock_guard<std::mutex> lck(mtx);
        inflight -= 1;
        cv.notify_all();
    }, std::move(work)).detach();
}

void RequestDispatcher::waitForIdle() {
    std::unique_lock<std::mutex> lck(mtx);
    cv.wait(lck, [&]() { return inflight == 0; });
}

int RequestDispatcher::inflightCount() {
    std::lock_guard<std::mutex> lck(mtx);
    return inflight;
}
