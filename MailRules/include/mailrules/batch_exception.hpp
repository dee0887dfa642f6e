/** BatchException [MailRules]
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

#ifndef BatchException_hpp
#define BatchException_hpp

#include <stdio.h>
#include <string>
#include "MailCore/MailCore.h"
#include "nlohmann/json.hpp"

#include "mailrules/generic_exception.hpp"

#define BATCH_MALFORMED_INPUT   "malformed-input"

// Raised for input the engine refuses to act on (key `malformed-input`) and for
// failed mailbox calls. Neither is retried here; `retryable` only tells the
// caller whether running the batch again could succeed.

class BatchException : public GenericException {
    bool retryable = false;

public:
    BatchException(std::string key, std::string di, bool retryable);
    BatchException(mailcore::ErrorCode c, std::string di);

    std::string key;
    std::string debuginfo;

    bool isRetryable();
    bool isMalformedInput();
    nlohmann::json toJSON();
};


#endif /* BatchException_hpp */
