/**
 * @file MockTransport.hpp
 * @brief Google Mock implementation of ITransport
 */

#pragma once

#include "services/ITransport.hpp"

#include <gmock/gmock.h>

#include <memory>

class MockTransport : public ITransport {
public:
    MOCK_METHOD((std::expected<void, util::Error>), publish_single,
                (const std::string& topic, const std::string& payload, bool retain), (override));
    MOCK_METHOD((std::expected<void, util::Error>), publish_multiple,
                (const std::vector<MqttMessage>& messages), (override));

    // Helper: Create a nice mock where every publish succeeds
    static std::shared_ptr<MockTransport> CreateNiceMock() {
        auto mock = std::make_shared<testing::NiceMock<MockTransport>>();

        ON_CALL(*mock, publish_single(testing::_, testing::_, testing::_))
            .WillByDefault(testing::Return(std::expected<void, util::Error>{}));
        ON_CALL(*mock, publish_multiple(testing::_))
            .WillByDefault(testing::Return(std::expected<void, util::Error>{}));

        return mock;
    }
};
