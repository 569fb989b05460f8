/** SPDLogExtensions [MailGate]
 */

/* LICENSE
* Copyright (C) 2017-2021 Foundry 376.
*
* This program is free software: you can redistribute it and/or modify
* it under the terms of the GNU General Public License as published by
* the Free Software Foundation, either version 3 of the License, or
* (at your option) any later version.
*
* This program is distributed in the hope that it will be useful,
* but WITHOUT ANY WARRANTY; without even the implied warranty of
* MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
* GNU General Public License for more details.
*
* You should have received a copy of the GNU General Public License
* along with this program.  If not, see <http://www.gnu.org/licenses/>.
*/

#ifndef SPDLogExtensions_hpp
#define SPDLogExtensions_hpp

#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "spdlog/spdlog.h"
#include "spdlog/pattern_formatter.h"
#include "spdlog/sinks/base_sink.h"
#include "spdlog/details/null_mutex.h"

/*
 Keeps the rotating log file reasonably fresh without flushing on every
 line: each message schedules a flush of the "logger" logger, which runs
 after a one second debounce on a background thread.
*/
class SPDFlusherSink : public spdlog::sinks::base_sink<spdlog::details::null_mutex> {
    std::mutex flushMtx;
    std::condition_variable flushCV;
    int unflushed = 0;
    bool exiting = false;
    std::thread flushThread;

    void runFlushLoop();

protected:
    void sink_it_(const spdlog::details::log_msg & msg) override;
    void flush_() override;

public:
    SPDFlusherSink();
    ~SPDFlusherSink();
};

// Renders the name given to the logging thread with SetThreadName.
class SPDThreadNameFlag : public spdlog::custom_flag_formatter {
public:
    void format(const spdlog::details::log_msg & msg, const std::tm & tm, spdlog::memory_buf_t & dest) override;
    std::unique_ptr<spdlog::custom_flag_formatter> clone() const override;
};

// A pattern formatter that understands %* as the thread name.
std::unique_ptr<spdlog::formatter> SPDFormatterWithThreadNames(std::string pattern);

#endif /* SPDLogExtensions_hpp */
