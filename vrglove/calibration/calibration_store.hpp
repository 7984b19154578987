// vrglove/calibration/calibration_store.hpp
#pragma once

#include <string>
#include <vector>

#include "../error.h"
#include "../types.hpp"

namespace vrglove {

// YAML file of calibration profiles, one node per device, one child per
// source:
//
//   dev_AA_BB_CC_DD_EE_FF:
//      imu1: { offset: [...], scale: [...], drift: 0., calibrated_at_ms: ..., samples: 100 }
class CalibrationStore {
public:
    explicit CalibrationStore(std::string path);

    // Missing file or device yields ok with no profiles.
    ErrorCode load(const std::string& device_address, std::vector<CalibrationProfile>& out) const;
    // Replaces the device's entry, keeping other devices.
    ErrorCode save(const std::string& device_address, const std::vector<CalibrationProfile>& profiles);

    const std::string& path() const { return path_; }

    static std::string device_key(const std::string& device_address);

private:
    std::string path_;
};

} // namespace vrglove
