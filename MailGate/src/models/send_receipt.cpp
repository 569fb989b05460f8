#include "mailgate/models/send_receipt.hpp"

SendReceipt::SendReceipt() {
    _data["archived"] = false;
    _data["archiveFolder"] = "";
    _data["warning"] = "";
}

bool SendReceipt::archived() const {
    return _data["archived"].get<bool>();
}

std::string SendReceipt::archiveFolder() const {
    return _data["archiveFolder"].get<std::string>();
}

std::string SendReceipt::warning() const {
    return _data["warning"].get<std::string>();
}

void SendReceipt::setArchived(std::string folder) {
    _data["archived"] = true;
    _data["archiveFolder"] = folder;
}

void SendReceipt::setWarning(std::string warning) {
    _data["warning"] = warning;
}

nlohmann::json SendReceipt::toJSON() const {
    nlohmann::json j = {
        {"archived", archived()},
    };
    if (archived()) {
        j["archive_folder"] = archiveFolder();
    }
    if (warning() != "") {
        j["warning"] = warning();
    }
    return j;
}
