#include "mailgate/generic_exception.hpp"

GenericException::GenericException(std::string what) :
    _what(what)
{
}

const char * GenericException::what() const noexcept {
    return _what.c_str();
}

nlohmann::json GenericException::toJSON() {
    return {
        {"what", what()},
    };
}
