#include "http/HttpStatus.hpp"

#include <gtest/gtest.h>

using namespace reading_service::http;

TEST(HttpStatusTest, StatusToString) {
    EXPECT_EQ(StatusToString(HttpStatus::OK), "OK");
    EXPECT_EQ(StatusToString(HttpStatus::BadRequest), "Bad Request");
    EXPECT_EQ(StatusToString(HttpStatus::NotFound), "Not Found");
    EXPECT_EQ(StatusToString(HttpStatus::MethodNotAllowed), "Method Not Allowed");
    EXPECT_EQ(StatusToString(HttpStatus::InternalServerError), "Internal Server Error");
    EXPECT_EQ(StatusToString(HttpStatus::RequestTimeout), "Request Timeout");
    EXPECT_EQ(StatusToString(HttpStatus::ServiceUnavailable), "Service Unavailable");
}

TEST(HttpStatusTest, StatusCodes) {
    EXPECT_EQ(static_cast<int>(HttpStatus::OK), 200);
    EXPECT_EQ(static_cast<int>(HttpStatus::BadRequest), 400);
    EXPECT_EQ(static_cast<int>(HttpStatus::NotFound), 404);
    EXPECT_EQ(static_cast<int>(HttpStatus::MethodNotAllowed), 405);
    EXPECT_EQ(static_cast<int>(HttpStatus::RequestTimeout), 408);
    EXPECT_EQ(static_cast<int>(HttpStatus::InternalServerError), 500);
    EXPECT_EQ(static_cast<int>(HttpStatus::ServiceUnavailable), 503);
}

TEST(HttpStatusTest, MethodRoundTrip) {
    for (auto method : {HttpMethod::GET, HttpMethod::POST, HttpMethod::PUT, HttpMethod::DELETE_,
                        HttpMethod::PATCH, HttpMethod::HEAD, HttpMethod::OPTIONS}) {
        EXPECT_EQ(StringToMethod(MethodToString(method)), method);
    }
}

TEST(HttpStatusTest, StringToMethodIsCaseInsensitive) {
    EXPECT_EQ(StringToMethod("post"), HttpMethod::POST);
    EXPECT_EQ(StringToMethod("Get"), HttpMethod::GET);
    EXPECT_EQ(StringToMethod("dElEtE"), HttpMethod::DELETE_);
}

TEST(HttpStatusTest, StringToMethodUnknown) {
    EXPECT_EQ(StringToMethod("FETCH"), HttpMethod::UNKNOWN);
    EXPECT_EQ(StringToMethod(""), HttpMethod::UNKNOWN);
    EXPECT_EQ(MethodToString(HttpMethod::UNKNOWN), "UNKNOWN");
}

TEST(HttpStatusTest, IsMethodToken) {
    EXPECT_TRUE(IsMethodToken("GET"));
    EXPECT_TRUE(IsMethodToken("M-SEARCH"));
    EXPECT_FALSE(IsMethodToken(""));
    EXPECT_FALSE(IsMethodToken("GE T"));
    EXPECT_FALSE(IsMethodToken("GET\""));
}
