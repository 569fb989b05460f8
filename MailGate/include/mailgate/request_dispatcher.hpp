/** RequestDispatcher [MailGate]
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

#ifndef RequestDispatcher_hpp
#define RequestDispatcher_hpp

#include <condition_variable>
#include <functional>
#include <mutex>

/*
 Runs each request on its own detached thread, named "request-N". At most
 `maxInflight` requests run at once: dispatch() blocks the reader until a
 slot frees up. A request counts as finished only after its work function
 and everything it captured have been destroyed.
*/
class RequestDispatcher {
    std::mutex mtx;
    std::condition_variable cv;
    int maxInflight;
    int inflight;
    int dispatched;

public:
    RequestDispatcher(int maxInflight);

    void dispatch(std::function<void()> work);

    // Blocks until every dispatched request has finished.
    void waitForIdle();

    int inflightCount();
};

#endif /* RequestDispatcher_hpp */
