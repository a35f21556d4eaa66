#pragma once
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "persistence/i_persistence_adapter.hpp"

namespace ascot::tests {

using namespace ascot;
using namespace testing;

class MockPersistenceAdapter : public persistence::IPersistenceAdapter {
public:
    MOCK_METHOD(bool, load_known_devices, (std::vector<persistence::KnownDevice> &, std::string &), (override));
    MOCK_METHOD(bool, save_device, (const discovery::DeviceIdentity &, const net::NetworkEndpoint &, std::string &),
                (override));
    MOCK_METHOD(bool, delete_device, (const discovery::DeviceIdentity &, std::string &), (override));
};

}  // namespace ascot::tests
