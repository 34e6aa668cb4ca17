#include "storage/Error.hpp"

namespace stash::storage {

std::string_view to_string(const ErrorCode code) {
    switch (code) {
        case ErrorCode::NotFound: return "not_found";
        case ErrorCode::EncodeData: return "encode_data";
        case ErrorCode::DecodeData: return "decode_data";
        case ErrorCode::CreateFile: return "create_file";
        case ErrorCode::ReadFile: return "read_file";
        case ErrorCode::DirectoryResolution: return "directory_resolution";
        case ErrorCode::CreateDirectory: return "create_directory";
        case ErrorCode::Attribute: return "attribute";
        case ErrorCode::Remove: return "remove";
    }
    return "unknown";
}

Error::Error(const ErrorCode code, const std::string& message)
    : std::runtime_error(std::string(to_string(code)) + ": " + message), code_(code) {}

}
