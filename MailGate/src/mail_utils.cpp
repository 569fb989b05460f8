#include "mailgate/mail_utils.hpp"
#include "mailgate/gateway_config.hpp"
#include "mailgate/gateway_exception.hpp"
#include "mailgate/constants.hpp"

#include <algorithm>
#include <cctype>
#include <stdlib.h>
#include <openssl/rand.h>

using namespace mailcore;

static const char * BASE58_ALPHABET = "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

std::string MailUtils::toBase58(const unsigned char * pbegin, size_t len) {
    const unsigned char * pend = pbegin + len;

    // Skip & count leading zeroes.
    int zeroes = 0;
    while (pbegin != pend && *pbegin == 0) {
        pbegin++;
        zeroes++;
    }
    // Allocate enough space in big-endian base58 representation.
    size_t size = (pend - pbegin) * 138 / 100 + 1; // log(256) / log(58), rounded up.
    std::vector<unsigned char> b58(size);
    int length = 0;

    while (pbegin != pend) {
        int carry = *pbegin;
        int i = 0;
        // Apply "b58 = b58 * 256 + ch".
        for (std::vector<unsigned char>::reverse_iterator it = b58.rbegin(); (carry != 0 || i < length) && (it != b58.rend()); it++, i++) {
            carry += 256 * (*it);
            *it = carry % 58;
            carry /= 58;
        }
        length = i;
        pbegin++;
    }

    std::vector<unsigned char>::iterator it = b58.begin() + (size - length);
    while (it != b58.end() && *it == 0) {
        it++;
    }
    std::string str;
    str.reserve(zeroes + (b58.end() - it));
    str.assign(zeroes, '1');
    while (it != b58.end()) {
        str += BASE58_ALPHABET[*(it++)];
    }
    return str;
}

std::string MailUtils::getEnvUTF8(std::string key) {
    const char * val = getenv(key.c_str());
    if (val == nullptr) {
        return "";
    }
    return std::string(val);
}

nlohmann::json MailUtils::merge(const nlohmann::json &a, const nlohmann::json &b)
{
    nlohmann::json result = a.flatten();
    nlohmann::json tmp = b.flatten();

    for (nlohmann::json::iterator it = tmp.begin(); it != tmp.end(); ++it)
    {
        result[it.key()] = it.value();
    }

    return result.unflatten();
}

std::string MailUtils::randomToken(size_t bytes) {
    std::vector<unsigned char> buffer(bytes);
    if (RAND_bytes(buffer.data(), (int)buffer.size()) != 1) {
        throw GatewayException(GatewayErrorKind::OperationFailed, "random-unavailable", "The system random number generator could not produce a session token.");
    }
    return MailUtils::toBase58(buffer.data(), buffer.size());
}

std::vector<uint32_t> MailUtils::uidsOfIndexSet(IndexSet * set) {
    std::vector<uint32_t> uids {};
    if (set == nullptr) {
        return uids;
    }
    Range * ranges = set->allRanges();
    for (unsigned int ii = 0; ii < set->rangesCount(); ii++) {
        // a range covers location ... location + length, inclusive
        for (uint64_t x = 0; x <= ranges[ii].length; x ++) {
            uids.push_back((uint32_t)(ranges[ii].location + x));
        }
    }
    return uids;
}

std::string MailUtils::stringOrBlank(String * str) {
    if (str == nullptr) {
        return "";
    }
    return std::string(str->UTF8Characters());
}

std::string MailUtils::rawHeaderValue(Data * data, std::string name) {
    if (data == nullptr) {
        return "";
    }
    std::string raw(data->bytes(), data->length());
    std::string prefix = name + ":";
    std::transform(prefix.begin(), prefix.end(), prefix.begin(), [](unsigned char c) { return (char)std::tolower(c); });

    std::string value;
    bool collecting = false;
    size_t pos = 0;

    while (pos < raw.size()) {
        size_t eol = raw.find('\n', pos);
        if (eol == std::string::npos) {
            eol = raw.size();
        }
        std::string line = raw.substr(pos, eol - pos);
        pos = eol + 1;
        if (line.size() > 0 && line.back() == '\r') {
            line.pop_back();
        }
        if (line.size() == 0) {
            break; // end of the header block
        }
        if (line[0] == ' ' || line[0] == '\t') {
            size_t text = line.find_first_not_of(" \t");
            if (collecting && text != std::string::npos) {
                value += " " + line.substr(text);
            }
            continue;
        }
        if (collecting) {
            break;
        }
        std::string lower = line.substr(0, prefix.size());
        std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return (char)std::tolower(c); });
        if (lower == prefix) {
            value = line.substr(prefix.size());
            collecting = true;
        }
    }

    size_t start = value.find_first_not_of(" \t");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = value.find_last_not_of(" \t");
    return value.substr(start, end - start + 1);
}

void MailUtils::configureSessionForCredentials(IMAPSession & session, GatewayConfig * config, const Credentials & creds) {
    session.setHostname(AS_MCSTR(config->IMAPHost()));
    session.setPort(config->IMAPPort());
    session.setUsername(AS_TRANSIENT_MCSTR(creds.emailAddress));
    session.setPassword(AS_TRANSIENT_MCSTR(creds.secret));
    session.setConnectionType(ConnectionTypeTLS);
    session.setTimeout(config->connectionTimeout());
    session.setCheckCertificateEnabled(!config->IMAPAllowInsecureSSL());
}

void MailUtils::configureSessionForCredentials(SMTPSession & session, GatewayConfig * config, const Credentials & creds) {
    session.setHostname(AS_MCSTR(config->SMTPHost()));
    session.setPort(config->SMTPPort());
    session.setUsername(AS_TRANSIENT_MCSTR(creds.emailAddress));
    session.setPassword(AS_TRANSIENT_MCSTR(creds.secret));
    session.setConnectionType(ConnectionTypeStartTLS);
    session.setTimeout(config->connectionTimeout());
    session.setCheckCertificateEnabled(!config->SMTPAllowInsecureSSL());
}
