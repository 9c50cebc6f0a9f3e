#ifndef SHUTTLE_RESPONSE_STATUS_HPP_
#define SHUTTLE_RESPONSE_STATUS_HPP_

#include <string>

class ResponseStatus {
public:
    // empty for unregistered codes
    static auto phrase(int code) -> std::string;
};

#endif  // SHUTTLE_RESPONSE_STATUS_HPP_
