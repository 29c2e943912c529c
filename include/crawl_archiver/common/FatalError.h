#pragma once

#include <stdexcept>
#include <string>

namespace crawl_archiver {

// Conditions that abort the whole run before (or instead of) any retry
class FatalError : public std::runtime_error {
public:
    explicit FatalError(const std::string& message) : std::runtime_error(message) {}
};

} // namespace crawl_archiver
