#include "mailgate/comm_stream.hpp"

#include <string>

CommStream::CommStream(std::istream & in, std::ostream & out) :
    in(in), out(out)
{
}

CommStream::~CommStream() {
}

nlohmann::json CommStream::waitForJSON() {
    std::string buffer;
    std::getline(in, buffer);
    if (buffer.find_first_not_of(" \t\r\n") == std::string::npos) {
        return nlohmann::json();
    }
    try {
        return nlohmann::json::parse(buffer);
    } catch (nlohmann::json::parse_error & ex) {
        throw std::invalid_argument(ex.what());
    }
}

void CommStream::sendJSON(const nlohmann::json & msg) {
    std::lock_guard<std::mutex> lock(mtx_);
    out << msg.dump() + "\n";
    out << std::flush;
}

bool CommStream::good() {
    return in.good();
}
