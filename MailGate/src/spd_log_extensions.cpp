#include "mailgate/spd_log_extensions.hpp"
#include "mailgate/thread_utils.hpp"

#include <chrono>

SPDFlusherSink::SPDFlusherSink() :
    flushThread(&SPDFlusherSink::runFlushLoop, this)
{
}

SPDFlusherSink::~SPDFlusherSink() {
    {
        std::lock_guard<std::mutex> lck(flushMtx);
        exiting = true;
        flushCV.notify_one();
    }
    if (flushThread.joinable()) {
        flushThread.join();
    }
}

void SPDFlusherSink::runFlushLoop() {
    SetThreadName("log-flusher");

    while (true) {
        std::chrono::system_clock::time_point desiredTime = std::chrono::system_clock::now();
        desiredTime += std::chrono::milliseconds(30000);
        {
            // Wait for a message, or for 30 seconds, whichever happens first
            std::unique_lock<std::mutex> lck(flushMtx);
            flushCV.wait_until(lck, desiredTime);
            if (exiting) {
                return;
            }
            if (unflushed == 0) {
                continue; // spurious wake
            }
        }

        // Debounce 1sec for more messages to arrive
        std::this_thread::sleep_for(std::chrono::milliseconds(1000));

        {
            std::lock_guard<std::mutex> lck(flushMtx);
            unflushed = 0;
            if (exiting) {
                return;
            }
        }
        // flush outside our lock, the logger takes each sink's own mutex
        auto logger = spdlog::get("logger");
        if (logger) {
            logger->flush();
        }
    }
}

void SPDFlusherSink::sink_it_(const spdlog::details::log_msg & msg) {
    // ensure we have a flush queued
    std::lock_guard<std::mutex> lck(flushMtx);
    unflushed += 1;
    flushCV.notify_one();
}

void SPDFlusherSink::flush_() {
    // no-op
}

void SPDThreadNameFlag::format(const spdlog::details::log_msg & msg, const std::tm & tm, spdlog::memory_buf_t & dest) {
    std::string name = GetThreadName(msg.thread_id);
    dest.append(name.data(), name.data() + name.size());
}

std::unique_ptr<spdlog::custom_flag_formatter> SPDThreadNameFlag::clone() const {
    return std::unique_ptr<spdlog::custom_flag_formatter>(new SPDThreadNameFlag());
}

std::unique_ptr<spdlog::formatter> SPDFormatterWithThreadNames(std::string pattern) {
    std::unique_ptr<spdlog::pattern_formatter> formatter(new spdlog::pattern_formatter());
    formatter->add_flag<SPDThreadNameFlag>('*').set_pattern(pattern);
    return std::move(formatter);
}
