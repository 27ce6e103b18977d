#pragma once

#include <string>
#include <stdexcept>

// raised synchronously from construction, nothing has been started when it escapes
class ConfigurationError : public std::invalid_argument {
public:
    explicit ConfigurationError(const std::string& what): std::invalid_argument(what) {}
};

// no round has produced a successful selection yet
class NotReadyError : public std::runtime_error {
public:
    NotReadyError(): std::runtime_error("No provider has been selected yet") {}
};
