#ifndef __VRGLOVE_BRIDGE_LINK_H__
#define __VRGLOVE_BRIDGE_LINK_H__

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "bridge_frame.hpp"
#include "gatt_link.hpp"
#include "../config.h"

namespace vrglove {

    // GATT central reached through a USB CDC bridge dongle.
    class BridgeLink : public GattLink {
        public:
        BridgeLink(const std::string& device_path, int baudrate = kBridgeBaudrate);
        ~BridgeLink() override;

        bool open();
        bool close();
        bool isOpen() const;

        void attach(std::shared_ptr<LinkEventQueue> events) override;
        ErrorCode scan(std::chrono::milliseconds timeout, std::vector<DeviceHandle>& out) override;
        ErrorCode connect(const DeviceHandle& device, std::chrono::milliseconds timeout) override;
        ErrorCode discover(std::vector<CharacteristicInfo>& out) override;
        ErrorCode read(std::uint16_t handle, std::vector<std::uint8_t>& out) override;
        ErrorCode write(std::uint16_t handle, const std::vector<std::uint8_t>& data) override;
        ErrorCode set_notify(std::uint16_t handle, bool enable) override;
        void disconnect() override;
        void cancel() override;
        bool is_connected() const override;

        std::uint64_t crcErrors() const { return crc_errors_.load(); }

        private:
            bool configure(int baudrate);
            void worker();
            void handle_frame(const BridgeFrame& frame);
            bool send_frame(const BridgeFrame& frame);
            ErrorCode request(BridgeProtocol::Type op,
                              const std::vector<std::uint8_t>& payload,
                              std::chrono::milliseconds timeout,
                              std::vector<std::uint8_t>* response);

            std::string device_path_;
            int baudrate_;
            int fd_;
            std::atomic<bool> is_open_;
            std::atomic<bool> running_;
            std::atomic<bool> connected_;
            std::atomic<std::uint64_t> crc_errors_;
            std::thread thread_;

            std::mutex write_mutex_;
            std::mutex request_mutex_;      // one outstanding request

            std::mutex state_mutex_;
            std::condition_variable response_cv_;
            bool waiting_;
            bool response_ready_;
            bool cancelled_;
            BridgeProtocol::Type pending_op_;
            BridgeProtocol::Status response_status_;
            std::vector<std::uint8_t> response_data_;
            std::vector<DeviceHandle> scan_results_;
            std::shared_ptr<LinkEventQueue> events_;
    };
}

#endif
