/** CommStream [MailGate]
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

#ifndef CommStream_hpp
#define CommStream_hpp

#include <stdio.h>
#include <iostream>
#include <mutex>
#include "nlohmann/json.hpp"

/*
 Line-delimited JSON over a pair of streams, stdin and stdout by default.
 sendJSON may be called from any thread.
*/
class CommStream {
    std::mutex mtx_;
    std::istream & in;
    std::ostream & out;

public:
    CommStream(std::istream & in = std::cin, std::ostream & out = std::cout);
    ~CommStream();

    void sendJSON(const nlohmann::json & msg);

    // Returns null for blank lines and at end of input. Throws
    // std::invalid_argument when the line is not JSON.
    nlohmann::json waitForJSON();

    bool good();
};

#endif /* CommStream_hpp */
