/**
 * @file Errors.cpp
 * @brief PatchError construction and messages
 */

#include "pathpatch/Errors.hpp"
#include <sstream>

namespace pathpatch {

const char* to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::invalid_key_path: return "invalid_key_path";
        case ErrorKind::index_out_of_bounds: return "index_out_of_bounds";
        case ErrorKind::invalid_root_object: return "invalid_root_object";
        case ErrorKind::encoding_failed: return "encoding_failed";
        case ErrorKind::decoding_failed: return "decoding_failed";
        case ErrorKind::serialization_failed: return "serialization_failed";
    }
    return "unknown";
}

PatchError PatchError::invalid_key_path(std::string key_path) {
    PatchError error(ErrorKind::invalid_key_path);
    error.key_path_ = std::move(key_path);
    return error;
}

PatchError PatchError::index_out_of_bounds(std::string key_path, std::size_t index) {
    PatchError error(ErrorKind::index_out_of_bounds);
    error.key_path_ = std::move(key_path);
    error.index_ = index;
    return error;
}

PatchError PatchError::invalid_root_object() {
    return PatchError(ErrorKind::invalid_root_object);
}

PatchError PatchError::encoding_failed(std::exception_ptr cause) {
    PatchError error(ErrorKind::encoding_failed);
    error.cause_ = describe(cause);
    error.cause_exception_ = std::move(cause);
    return error;
}

PatchError PatchError::encoding_failed(std::string cause) {
    PatchError error(ErrorKind::encoding_failed);
    error.cause_ = std::move(cause);
    return error;
}

PatchError PatchError::decoding_failed(std::exception_ptr cause) {
    PatchError error(ErrorKind::decoding_failed);
    error.cause_ = describe(cause);
    error.cause_exception_ = std::move(cause);
    return error;
}

PatchError PatchError::serialization_failed(std::exception_ptr cause) {
    PatchError error(ErrorKind::serialization_failed);
    error.cause_ = describe(cause);
    error.cause_exception_ = std::move(cause);
    return error;
}

PatchError PatchError::serialization_failed(std::string cause) {
    PatchError error(ErrorKind::serialization_failed);
    error.cause_ = std::move(cause);
    return error;
}

std::string PatchError::describe(const std::exception_ptr& cause) {
    if (!cause) return "";
    try {
        std::rethrow_exception(cause);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "unknown exception";
    }
}

std::string PatchError::message() const {
    std::ostringstream oss;
    switch (kind_) {
        case ErrorKind::invalid_key_path:
            oss << "The key path '" << key_path_ << "' is not valid.";
            break;
        case ErrorKind::index_out_of_bounds:
            oss << "Index " << index_ << " is out of bounds for key path '" << key_path_ << "'.";
            break;
        case ErrorKind::invalid_root_object:
            oss << "Unable to convert the value into a JSON object.";
            break;
        case ErrorKind::encoding_failed:
            oss << "Encoding failed with error: " << cause_;
            break;
        case ErrorKind::decoding_failed:
            oss << "Decoding failed with error: " << cause_;
            break;
        case ErrorKind::serialization_failed:
            oss << "JSON serialization failed with error: " << cause_;
            break;
    }
    return oss.str();
}

} // namespace pathpatch
