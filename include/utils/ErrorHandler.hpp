#pragma once

#include <string>

namespace reading_service {
namespace utils {

// Renders errno values from the socket layer.
class ErrorHandler {
public:
    static std::string GetLastErrorMessage();
    static std::string GetErrorMessage(int errorCode);
    static std::string FormatError(const std::string& context, int errorCode);
    static std::string FormatLastError(const std::string& context);
};

} // namespace utils
} // namespace reading_service
