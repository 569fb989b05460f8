/** Constants [MailGate]
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

#ifndef constants_h
#define constants_h

#include <map>
#include <string>
#include "MailCore/MailCore.h"

#define AS_MCSTR(X)         mailcore::String::uniquedStringWithUTF8Characters(X.c_str())
// Autoreleased copy for per-request text. Uniqued strings are never freed.
#define AS_TRANSIENT_MCSTR(X) mailcore::String::stringWithUTF8Characters(X.c_str())

#define MAILGATE_USER_AGENT         "MailGate"
#define MAILGATE_LIST_LIMIT         10
#define MAILGATE_PREVIEW_LENGTH     100
#define MAILGATE_TOKEN_BYTES        32
#define MAILGATE_MAX_INFLIGHT       16

#define DEFAULT_IMAP_HOST           "imap.migadu.com"
#define DEFAULT_IMAP_PORT           993
#define DEFAULT_SMTP_HOST           "smtp.migadu.com"
#define DEFAULT_SMTP_PORT           587
#define DEFAULT_CONNECTION_TIMEOUT  10

static std::string PLACEHOLDER_UNKNOWN_ADDRESS = "Unknown";
static std::string PLACEHOLDER_NO_SUBJECT = "(no subject)";
static std::string PLACEHOLDER_EMPTY_PREVIEW = "(empty)";

static std::map<mailcore::ErrorCode, std::string> ErrorCodeToTypeMap = {
    {mailcore::ErrorNone, "ErrorNone"}, // 0
    {mailcore::ErrorConnection, "ErrorConnection"},
    {mailcore::ErrorTLSNotAvailable, "ErrorTLSNotAvailable"},
    {mailcore::ErrorParse, "ErrorParse"},
    {mailcore::ErrorCertificate, "ErrorCertificate"},
    {mailcore::ErrorAuthentication, "ErrorAuthentication"},
    {mailcore::ErrorGmailIMAPNotEnabled, "ErrorGmailIMAPNotEnabled"},
    {mailcore::ErrorGmailExceededBandwidthLimit, "ErrorGmailExceededBandwidthLimit"},
    {mailcore::ErrorGmailTooManySimultaneousConnections, "ErrorGmailTooManySimultaneousConnections"},
    {mailcore::ErrorMobileMeMoved, "ErrorMobileMeMoved"},
    {mailcore::ErrorYahooUnavailable, "ErrorYahooUnavailable"},
    {mailcore::ErrorNonExistantFolder, "ErrorNonExistantFolder"},
    {mailcore::ErrorRename, "ErrorRename"},
    {mailcore::ErrorDelete, "ErrorDelete"},
    {mailcore::ErrorCreate, "ErrorCreate"},
    {mailcore::ErrorSubscribe, "ErrorSubscribe"},
    {mailcore::ErrorAppend, "ErrorAppend"},
    {mailcore::ErrorCopy, "ErrorCopy"},
    {mailcore::ErrorExpunge, "ErrorExpunge"},
    {mailcore::ErrorFetch, "ErrorFetch"},
    {mailcore::ErrorIdle, "ErrorIdle"}, // 20
    {mailcore::ErrorIdentity, "ErrorIdentity"},
    {mailcore::ErrorNamespace, "ErrorNamespace"},
    {mailcore::ErrorStore, "ErrorStore"},
    {mailcore::ErrorCapability, "ErrorCapability"},
    {mailcore::ErrorStartTLSNotAvailable, "ErrorStartTLSNotAvailable"},
    {mailcore::ErrorSendMessageIllegalAttachment, "ErrorSendMessageIllegalAttachment"},
    {mailcore::ErrorStorageLimit, "ErrorStorageLimit"},
    {mailcore::ErrorSendMessageNotAllowed, "ErrorSendMessageNotAllowed"},
    {mailcore::ErrorNeedsConnectToWebmail, "ErrorNeedsConnectToWebmail"},
    {mailcore::ErrorSendMessage, "ErrorSendMessage"}, // 30
    {mailcore::ErrorAuthenticationRequired, "ErrorAuthenticationRequired"},
    {mailcore::ErrorFetchMessageList, "ErrorFetchMessageList"},
    {mailcore::ErrorDeleteMessage, "ErrorDeleteMessage"},
    {mailcore::ErrorInvalidAccount, "ErrorInvalidAccount"},
    {mailcore::ErrorFile, "ErrorFile"},
    {mailcore::ErrorCompression, "ErrorCompression"},
    {mailcore::ErrorNoSender, "ErrorNoSender"},
    {mailcore::ErrorNoRecipient, "ErrorNoRecipient"},
    {mailcore::ErrorNoop, "ErrorNoop"},
    {mailcore::ErrorGmailApplicationSpecificPasswordRequired, "ErrorGmailApplicationSpecificPasswordRequired"},
    {mailcore::ErrorServerDate, "ErrorServerDate"},
    {mailcore::ErrorNoValidServerFound, "ErrorNoValidServerFound"},
    {mailcore::ErrorCustomCommand, "ErrorCustomCommand"},
    {mailcore::ErrorYahooSendMessageSpamSuspected, "ErrorYahooSendMessageSpamSuspected"},
    {mailcore::ErrorYahooSendMessageDailyLimitExceeded, "ErrorYahooSendMessageDailyLimitExceeded"},
    {mailcore::ErrorOutlookLoginViaWebBrowser, "ErrorOutlookLoginViaWebBrowser"},
    {mailcore::ErrorTiscaliSimplePassword, "ErrorTiscaliSimplePassword"},
};

#endif /* constants_h */
