#ifndef VRGLOVE_CONFIG_H
#define VRGLOVE_CONFIG_H

#include <cstddef>
#include <string>

// ---- link / session ----
const std::string kDefaultBridgeDevice  = "/dev/ttyACM0";
const int   kBridgeBaudrate             = 921600;
const int   kDiscoveryTimeoutMs         = 3000;
const int   kConnectTimeoutMs           = 10000;
const int   kConnectAttempts            = 3;
const int   kConnectRetryDelayMs        = 500;
const int   kServiceCheckAttempts       = 5;
const int   kServiceCheckDelayMs        = 200;
const int   kNotifyAttempts             = 5;
const int   kNotifyRetryDelayMs         = 200;
const int   kReconnectAttempts          = 5;
const int   kReconnectIntervalMs        = 5000;
const int   kHeartbeatIntervalMs        = 3000;
const int   kCancelGraceMs              = 500;
const std::string kDeviceNameFilter     = "DegapVrGlove";

// ---- queues ----
const size_t kLinkEventQueueCapacity    = 1024;
const size_t kNotificationQueueCapacity = 2048;
const size_t kSubscriberQueueCapacity   = 512;

// ---- calibration ----
const int   kCalibrationWindow          = 100;
const int   kCalibrationMinSamples      = 50;
const int   kCalibrationTimeoutMs       = 5000;
const int   kDriftWindow                = 100;
const float kDriftBoundFraction         = 0.01f;   // 1% of full scale
const std::string kDefaultCalibrationFile = "./vrglove_calibration.yml";

// ---- data logging ----
const std::string kDefaultLogDirectory  = "./log";
const size_t kStreamQueueCapacity       = 4096;
const size_t kDegradedBufferCapacity    = 2048;
const int   kLogRetryIntervalMs         = 1000;

// ---- display / alignment ----
const int   kDisplayRefreshMs           = 100;
const int   kImuPairToleranceMs         = 10;

#endif  // VRGLOVE_CONFIG_H
