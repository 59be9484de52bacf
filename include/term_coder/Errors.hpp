#pragma once
#include <stdexcept>
#include <string>

namespace term_coder {

// Raised only for I/O that was expected to succeed (disk full, permissions
// during a staged write). Ordinary refusals are reported through return values.
class PatchIoError : public std::runtime_error {
public:
    explicit PatchIoError(const std::string& what) : std::runtime_error(what) {}
};

}
