#pragma once
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <string>

#include "transport/connection.hpp"

namespace vibium::tests {

using namespace testing;

class MockConnection : public transport::Connection {
public:
    MOCK_METHOD(void, send, (const std::string &), (override));
    MOCK_METHOD(void, close, (), (override));
    MOCK_METHOD(bool, is_closed, (), (const, override));
    MOCK_METHOD(transport::ConnectionState, state, (), (const, override));
    MOCK_METHOD(std::string, close_reason, (), (const, override));
    MOCK_METHOD(bool, wait_closed, (int), (override));
    MOCK_METHOD(const std::string &, endpoint, (), (const, override));

    // Helper to store/return endpoint reference
    std::string _endpoint = "mock://clicker";
};

}  // namespace vibium::tests
