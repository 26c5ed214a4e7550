/**
 * @file BLEPlatform.cpp
 * @brief BLE Platform factory implementation
 */

#include "BLEPlatform.h"
#include "Log.h"

#if defined(ESP32) && (defined(USE_NIMBLE) || defined(CONFIG_BT_NIMBLE_ENABLED))
#include "platforms/NimBLEPlatform.h"
#endif

using namespace RNS;

namespace BAB { namespace BLE {

IBLEPlatform::Ptr BLEPlatformFactory::create() {
    return create(getDetectedPlatform());
}

IBLEPlatform::Ptr BLEPlatformFactory::create(PlatformType type) {
    switch (type) {
#if defined(ESP32) && (defined(USE_NIMBLE) || defined(CONFIG_BT_NIMBLE_ENABLED))
        case PlatformType::NIMBLE_ARDUINO:
            INFO("BLEPlatformFactory: Creating NimBLE platform");
            return std::make_shared<NimBLEPlatform>();
#endif

        case PlatformType::LOOPBACK:
            ERROR("BLEPlatformFactory: Loopback platforms must be attached to a LoopbackAir");
            return nullptr;

        default:
            ERROR("BLEPlatformFactory: No platform available for type " +
                  std::to_string(static_cast<int>(type)));
            return nullptr;
    }
}

PlatformType BLEPlatformFactory::getDetectedPlatform() {
#if defined(ESP32) && (defined(USE_NIMBLE) || defined(CONFIG_BT_NIMBLE_ENABLED))
    return PlatformType::NIMBLE_ARDUINO;
#else
    return PlatformType::NONE;
#endif
}

}} // namespace BAB::BLE
