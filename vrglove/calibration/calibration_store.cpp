// vrglove/calibration/calibration_store.cpp
#include "calibration_store.hpp"
#include "../log.h"

#include <cctype>
#include <cstdio>
#include <map>

#include <opencv2/core.hpp>

namespace vrglove {

static Logger::ptr g_logger = VRGLOVE_LOG_NAME("calibration");

typedef std::map<std::string, std::vector<CalibrationProfile>> ProfileMap;

CalibrationStore::CalibrationStore(std::string path)
    : path_(std::move(path))
{}

std::string CalibrationStore::device_key(const std::string& device_address) {
    std::string key = "dev_";
    for (char c : device_address) {
        key += std::isalnum(static_cast<unsigned char>(c)) ? c : '_';
    }
    return key;
}

static void read_device(const cv::FileNode& dev, std::vector<CalibrationProfile>& out) {
    for (auto it = dev.begin(); it != dev.end(); ++it) {
        const cv::FileNode node = *it;
        SourceId source;
        if (!source_from_tag(node.name(), source)) {
            VRGLOVE_LOG_WARN(g_logger) << "unknown source '" << node.name() << "' in calibration file";
            continue;
        }
        CalibrationProfile p;
        p.source = source;
        node["offset"] >> p.offset;
        node["scale"] >> p.scale;
        p.drift = static_cast<float>(node["drift"]);
        p.calibrated_at_ms = static_cast<std::int64_t>(static_cast<double>(node["calibrated_at_ms"]));
        p.samples = static_cast<std::uint32_t>(static_cast<int>(node["samples"]));
        if (p.scale.empty()) p.scale.assign(p.offset.size(), 1.0f);
        out.push_back(p);
    }
}

static bool read_all(const std::string& path, ProfileMap& all) {
    cv::FileStorage fs(path, cv::FileStorage::READ);
    if (!fs.isOpened()) return false;
    const cv::FileNode root = fs.root();
    for (auto it = root.begin(); it != root.end(); ++it) {
        const cv::FileNode dev = *it;
        if (!dev.isMap()) continue;
        read_device(dev, all[dev.name()]);
    }
    return true;
}

ErrorCode CalibrationStore::load(const std::string& device_address,
                                 std::vector<CalibrationProfile>& out) const {
    out.clear();
    try {
        cv::FileStorage fs(path_, cv::FileStorage::READ);
        if (!fs.isOpened()) {
            VRGLOVE_LOG_INFO(g_logger) << "no calibration file at " << path_;
            return ErrorCode::ok;
        }
        const cv::FileNode dev = fs[device_key(device_address)];
        if (dev.empty() || !dev.isMap()) return ErrorCode::ok;
        read_device(dev, out);
    } catch (const cv::Exception& e) {
        VRGLOVE_LOG_ERROR(g_logger) << "failed to read " << path_ << ": " << e.what();
        return ErrorCode::decode_error;
    }
    VRGLOVE_LOG_INFO(g_logger) << "loaded " << out.size() << " profile(s) for " << device_address;
    return ErrorCode::ok;
}

ErrorCode CalibrationStore::save(const std::string& device_address,
                                 const std::vector<CalibrationProfile>& profiles) {
    const std::string tmp = path_ + ".tmp";
    try {
        ProfileMap all;
        read_all(path_, all);
        all[device_key(device_address)] = profiles;

        cv::FileStorage fs(tmp, cv::FileStorage::WRITE | cv::FileStorage::FORMAT_YAML);
        if (!fs.isOpened()) {
            VRGLOVE_LOG_ERROR(g_logger) << "cannot open " << tmp << " for writing";
            return ErrorCode::write_failure;
        }
        for (const auto& entry : all) {
            fs << entry.first << "{";
            for (const CalibrationProfile& p : entry.second) {
                fs << std::string(source_tag(p.source)) << "{";
                fs << "offset" << p.offset;
                fs << "scale" << p.scale;
                fs << "drift" << p.drift;
                fs << "calibrated_at_ms" << static_cast<double>(p.calibrated_at_ms);
                fs << "samples" << static_cast<int>(p.samples);
                fs << "}";
            }
            fs << "}";
        }
        fs.release();
    } catch (const cv::Exception& e) {
        VRGLOVE_LOG_ERROR(g_logger) << "failed to write " << tmp << ": " << e.what();
        std::remove(tmp.c_str());
        return ErrorCode::write_failure;
    }

    if (std::rename(tmp.c_str(), path_.c_str()) != 0) {
        VRGLOVE_LOG_ERROR(g_logger) << "failed to replace " << path_;
        std::remove(tmp.c_str());
        return ErrorCode::write_failure;
    }
    VRGLOVE_LOG_INFO(g_logger) << "saved " << profiles.size() << " profile(s) for " << device_address
                               << " to " << path_;
    return ErrorCode::ok;
}

} // namespace vrglove
