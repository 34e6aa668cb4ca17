#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace stash::storage {

enum class ErrorCode {
    NotFound,            // no file for the key
    EncodeData,          // value cannot be serialized, even wrapped
    DecodeData,          // bytes do not decode as the requested type, even wrapped
    CreateFile,          // the driver could not write the file
    ReadFile,            // the file exists but could not be read
    DirectoryResolution, // OS root unavailable
    CreateDirectory,
    Attribute,
    Remove
};

std::string_view to_string(ErrorCode code);

class Error : public std::runtime_error {
public:
    Error(ErrorCode code, const std::string& message);

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

}
