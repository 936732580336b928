#include "utils/ErrorHandler.hpp"

#include <cerrno>
#include <system_error>

namespace reading_service {
namespace utils {

std::string ErrorHandler::GetLastErrorMessage() {
    return GetErrorMessage(errno);
}

std::string ErrorHandler::GetErrorMessage(int errorCode) {
    if (errorCode == 0) {
        return "No error";
    }

    std::string result = std::generic_category().message(errorCode);
    if (result.empty()) {
        return "Unknown error (code: " + std::to_string(errorCode) + ")";
    }

    while (!result.empty() && (result.back() == '\n' || result.back() == '\r')) {
        result.pop_back();
    }

    return result;
}

std::string ErrorHandler::FormatError(const std::string& context, int errorCode) {
    return context + ": " + GetErrorMessage(errorCode) + " (errno: " + std::to_string(errorCode) + ")";
}

std::string ErrorHandler::FormatLastError(const std::string& context) {
    int errorCode = errno;
    return FormatError(context, errorCode);
}

} // namespace utils
} // namespace reading_service
