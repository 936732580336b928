#pragma once

#include "http/HttpRequest.hpp"
#include <cstddef>
#include <string>

namespace reading_service {
namespace http {

enum class ParseResult {
    Complete,
    NeedMoreData,
    MalformedRequest,
    RequestTooLarge
};

enum class ParserState {
    RequestLine,
    Headers,
    Body,
    Complete,
    Error
};

// Incremental HTTP/1.x request parser. Methods are not restricted here; the
// handler decides which verbs it serves.
class HttpParser {
public:
    HttpParser();

    ParseResult Feed(const char* data, size_t length);
    ParseResult Feed(const std::string& data);

    bool IsComplete() const { return m_state == ParserState::Complete; }
    bool HasError() const { return m_state == ParserState::Error; }
    // True once any byte of a request has arrived and the request is not yet complete.
    bool HasPartialRequest() const {
        return m_state != ParserState::Complete && (m_state != ParserState::RequestLine || !m_buffer.empty());
    }

    HttpRequest& GetRequest() { return m_request; }
    const HttpRequest& GetRequest() const { return m_request; }

    ParserState GetState() const { return m_state; }

    // Bytes received after a complete request (pipelined data).
    std::string TakeRemainder();

    void Reset();

    size_t GetBytesConsumed() const { return m_bytesConsumed; }

    static constexpr size_t MAX_REQUEST_LINE_SIZE = 8192;
    static constexpr size_t MAX_HEADER_SIZE = 8192;
    static constexpr size_t MAX_HEADER_COUNT = 100;
    static constexpr size_t MAX_BODY_SIZE = 2 * 1024 * 1024;
    static constexpr size_t MAX_REQUEST_SIZE = MAX_BODY_SIZE + 64 * 1024;
    static constexpr size_t MAX_PATH_LENGTH = 2048;

private:
    bool TryParseRequestLine();
    bool TryParseHeaders();
    bool TryParseBody();
    bool ValidatePath(const std::string& path) const;
    bool Fail(ParseResult result);

    std::string m_buffer;
    HttpRequest m_request;
    ParserState m_state;
    size_t m_contentLength;
    size_t m_headerCount;
    size_t m_bytesConsumed;
    ParseResult m_lastError;
};

} // namespace http
} // namespace reading_service
