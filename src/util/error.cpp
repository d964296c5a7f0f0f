#include "util/error.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <iostream>

void die(const std::string& message) {
    std::cerr << "fatal: " << message << std::endl;
    std::exit(EXIT_FAILURE);
}

void logErrno(const std::string& message) {
    int saved = errno;
    if (!message.empty()) {
        std::cerr << message << ": ";
    }
    std::cerr << std::strerror(saved) << " (errno=" << saved << ")" << std::endl;
}
