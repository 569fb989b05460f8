/** SendReceipt [MailGate]
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

#ifndef SendReceipt_hpp
#define SendReceipt_hpp

#include <stdio.h>
#include <string>
#include "nlohmann/json.hpp"

/*
 The outcome of a successful send. Delivery already happened when one of
 these exists; `archived` only says whether the copy made it into the
 Sent folder.
*/
class SendReceipt {
    nlohmann::json _data;

public:
    SendReceipt();

    bool archived() const;
    std::string archiveFolder() const;
    std::string warning() const;

    void setArchived(std::string folder);
    void setWarning(std::string warning);

    nlohmann::json toJSON() const;
};

#endif /* SendReceipt_hpp */
