#include "bridge_link.h"
#include "../log.h"

#include <fcntl.h>
#include <unistd.h>
#include <termios.h>
#include <cerrno>
#include <cstring>

namespace vrglove {

static Logger::ptr g_logger = VRGLOVE_LOG_NAME("bridge");

static constexpr int kRequestTimeoutMs = 2000;
static constexpr int kScanSlackMs      = 1000;

    BridgeLink::BridgeLink(const std::string& device_path, int baudrate)
        : device_path_(device_path)
        , baudrate_(baudrate)
        , fd_(-1)
        , is_open_(false)
        , running_(false)
        , connected_(false)
        , crc_errors_(0)
        , waiting_(false)
        , response_ready_(false)
        , cancelled_(false)
        , pending_op_(BridgeProtocol::Type::response)
        , response_status_(BridgeProtocol::Status::ok) {
        VRGLOVE_LOG_DEBUG(g_logger) << "BridgeLink created for device: " << device_path_;
    }

    BridgeLink::~BridgeLink() {
        close();
    }

    bool BridgeLink::open() {
        if (is_open_) {
            VRGLOVE_LOG_WARN(g_logger) << "Device already open: " << device_path_;
            return true;
        }

        VRGLOVE_LOG_INFO(g_logger) << "Opening bridge device: " << device_path_;

        fd_ = ::open(device_path_.c_str(), O_RDWR | O_NOCTTY);
        if (fd_ < 0) {
            VRGLOVE_LOG_ERROR(g_logger) << "Failed to open bridge device: " << device_path_
                                        << ", error: " << strerror(errno);
            return false;
        }

        if (!configure(baudrate_)) {
            ::close(fd_);
            fd_ = -1;
            return false;
        }

        is_open_ = true;
        running_ = true;
        thread_ = std::thread(&BridgeLink::worker, this);
        return true;
    }

    bool BridgeLink::close() {
        running_ = false;
        cancel();
        if (thread_.joinable()) {
            thread_.join();
        }
        if (fd_ >= 0) {
            VRGLOVE_LOG_INFO(g_logger) << "Closing bridge device: " << device_path_;
            ::close(fd_);
            fd_ = -1;
        }
        is_open_ = false;
        connected_ = false;
        return true;
    }

    bool BridgeLink::isOpen() const {
        return is_open_;
    }

    bool BridgeLink::configure(int baudrate) {
        struct termios tty;
        if (tcgetattr(fd_, &tty) != 0) {
            VRGLOVE_LOG_ERROR(g_logger) << "Error getting termios attributes: " << strerror(errno);
            return false;
        }

        speed_t speed = B921600;
        switch (baudrate) {
            case 115200: speed = B115200; break;
            case 230400: speed = B230400; break;
            case 460800: speed = B460800; break;
            case 921600: speed = B921600; break;
            default:
                VRGLOVE_LOG_WARN(g_logger) << "Unsupported baudrate " << baudrate << ", using 921600";
                speed = B921600;
        }

        cfmakeraw(&tty);
        cfsetospeed(&tty, speed);
        cfsetispeed(&tty, speed);

        // 8N1, no flow control
        tty.c_cflag &= ~(PARENB | PARODD | CSTOPB | CRTSCTS);
        tty.c_cflag |= (CLOCAL | CREAD);

        // read() returns after 100 ms without data so the reader can see stop
        tty.c_cc[VMIN]  = 0;
        tty.c_cc[VTIME] = 1;

        if (tcsetattr(fd_, TCSANOW, &tty) != 0) {
            VRGLOVE_LOG_ERROR(g_logger) << "Error setting termios attributes: " << strerror(errno);
            return false;
        }
        tcflush(fd_, TCIOFLUSH);
        return true;
    }

    void BridgeLink::attach(std::shared_ptr<LinkEventQueue> events) {
        std::lock_guard<std::mutex> lock(state_mutex_);
        events_ = std::move(events);
    }

    bool BridgeLink::send_frame(const BridgeFrame& frame) {
        if (!is_open_ || fd_ < 0) {
            VRGLOVE_LOG_ERROR(g_logger) << "Cannot send: bridge device not open";
            return false;
        }

        std::vector<std::uint8_t> packet;
        if (!encode_bridge_frame(frame, packet)) {
            return false;
        }

        std::lock_guard<std::mutex> lock(write_mutex_);
        std::size_t total = 0;
        while (total < packet.size()) {
            ssize_t written = ::write(fd_, packet.data() + total, packet.size() - total);
            if (written < 0) {
                if (errno == EINTR || errno == EAGAIN) continue;
                VRGLOVE_LOG_ERROR(g_logger) << "Write failed: expected " << packet.size()
                                            << " bytes, wrote " << total << ", error: " << strerror(errno);
                return false;
            }
            total += static_cast<std::size_t>(written);
        }
        return true;
    }

    ErrorCode BridgeLink::request(BridgeProtocol::Type op,
                                  const std::vector<std::uint8_t>& payload,
                                  std::chrono::milliseconds timeout,
                                  std::vector<std::uint8_t>* response) {
        std::lock_guard<std::mutex> req_lock(request_mutex_);
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            waiting_ = true;
            response_ready_ = false;
            cancelled_ = false;
            pending_op_ = op;
            response_data_.clear();
        }

        BridgeFrame frame;
        frame.type = op;
        frame.payload = payload;
        if (!send_frame(frame)) {
            std::lock_guard<std::mutex> lock(state_mutex_);
            waiting_ = false;
            return ErrorCode::device_unreachable;
        }

        std::unique_lock<std::mutex> lock(state_mutex_);
        const bool woke = response_cv_.wait_for(lock, timeout, [this] {
            return response_ready_ || cancelled_ || !running_;
        });
        waiting_ = false;

        if (cancelled_ || !running_) {
            return ErrorCode::cancelled;
        }
        if (!woke) {
            VRGLOVE_LOG_WARN(g_logger) << "Request 0x" << std::hex << static_cast<int>(op)
                                       << std::dec << " timed out";
            return op == BridgeProtocol::Type::connect ? ErrorCode::connect_timeout
                                                       : ErrorCode::connection_lost;
        }
        if (response) {
            *response = std::move(response_data_);
        }
        return status_to_error(response_status_, op);
    }

    ErrorCode BridgeLink::scan(std::chrono::milliseconds timeout, std::vector<DeviceHandle>& out) {
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            scan_results_.clear();
        }
        const auto ms = static_cast<std::uint16_t>(timeout.count());
        std::vector<std::uint8_t> payload = {
            static_cast<std::uint8_t>(ms & 0xFF),
            static_cast<std::uint8_t>((ms >> 8) & 0xFF)
        };
        ErrorCode rc = request(BridgeProtocol::Type::scan, payload,
                               timeout + std::chrono::milliseconds(kScanSlackMs), nullptr);
        std::lock_guard<std::mutex> lock(state_mutex_);
        out = scan_results_;
        // A scan that found something is good even if the bridge reports timeout.
        if (rc == ErrorCode::connect_timeout && !out.empty()) return ErrorCode::ok;
        return rc;
    }

    ErrorCode BridgeLink::connect(const DeviceHandle& device, std::chrono::milliseconds timeout) {
        const auto ms = static_cast<std::uint16_t>(timeout.count());
        std::vector<std::uint8_t> payload = {
            static_cast<std::uint8_t>(ms & 0xFF),
            static_cast<std::uint8_t>((ms >> 8) & 0xFF)
        };
        payload.insert(payload.end(), device.address.begin(), device.address.end());

        ErrorCode rc = request(BridgeProtocol::Type::connect, payload, timeout, nullptr);
        connected_ = (rc == ErrorCode::ok);
        if (connected_) {
            VRGLOVE_LOG_INFO(g_logger) << "Connected to " << device.address;
        }
        return rc;
    }

    ErrorCode BridgeLink::discover(std::vector<CharacteristicInfo>& out) {
        std::vector<std::uint8_t> data;
        ErrorCode rc = request(BridgeProtocol::Type::discover, {},
                               std::chrono::milliseconds(kRequestTimeoutMs), &data);
        if (rc != ErrorCode::ok) return rc;
        if (!parse_discover_payload(data.data(), data.size(), out)) {
            VRGLOVE_LOG_ERROR(g_logger) << "Malformed discovery response (" << data.size() << " bytes)";
            return ErrorCode::decode_error;
        }
        return ErrorCode::ok;
    }

    ErrorCode BridgeLink::read(std::uint16_t handle, std::vector<std::uint8_t>& out) {
        std::vector<std::uint8_t> payload = {
            static_cast<std::uint8_t>(handle & 0xFF),
            static_cast<std::uint8_t>((handle >> 8) & 0xFF)
        };
        return request(BridgeProtocol::Type::read, payload,
                       std::chrono::milliseconds(kRequestTimeoutMs), &out);
    }

    ErrorCode BridgeLink::write(std::uint16_t handle, const std::vector<std::uint8_t>& data) {
        std::vector<std::uint8_t> payload = {
            static_cast<std::uint8_t>(handle & 0xFF),
            static_cast<std::uint8_t>((handle >> 8) & 0xFF)
        };
        payload.insert(payload.end(), data.begin(), data.end());
        return request(BridgeProtocol::Type::write, payload,
                       std::chrono::milliseconds(kRequestTimeoutMs), nullptr);
    }

    ErrorCode BridgeLink::set_notify(std::uint16_t handle, bool enable) {
        std::vector<std::uint8_t> payload = {
            static_cast<std::uint8_t>(handle & 0xFF),
            static_cast<std::uint8_t>((handle >> 8) & 0xFF),
            static_cast<std::uint8_t>(enable ? 1 : 0)
        };
        return request(BridgeProtocol::Type::set_notify, payload,
                       std::chrono::milliseconds(kRequestTimeoutMs), nullptr);
    }

    void BridgeLink::disconnect() {
        if (!connected_) return;
        ErrorCode rc = request(BridgeProtocol::Type::disconnect, {},
                               std::chrono::milliseconds(kRequestTimeoutMs), nullptr);
        if (rc != ErrorCode::ok) {
            VRGLOVE_LOG_WARN(g_logger) << "Disconnect request failed: " << to_string(rc);
        }
        connected_ = false;
    }

    void BridgeLink::cancel() {
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            if (waiting_) cancelled_ = true;
        }
        response_cv_.notify_all();
    }

    bool BridgeLink::is_connected() const {
        return connected_;
    }

    void BridgeLink::handle_frame(const BridgeFrame& frame) {
        switch (frame.type) {
        case BridgeProtocol::Type::scan_result: {
            DeviceHandle dev;
            if (parse_scan_result(frame.payload, dev)) {
                std::lock_guard<std::mutex> lock(state_mutex_);
                scan_results_.push_back(dev);
            }
            break;
        }
        case BridgeProtocol::Type::response: {
            if (frame.payload.size() < 2) break;
            std::lock_guard<std::mutex> lock(state_mutex_);
            const auto op = static_cast<BridgeProtocol::Type>(frame.payload[0]);
            if (!waiting_ || op != pending_op_) {
                VRGLOVE_LOG_DEBUG(g_logger) << "Stray response for op " << static_cast<int>(frame.payload[0]);
                break;
            }
            response_status_ = static_cast<BridgeProtocol::Status>(frame.payload[1]);
            response_data_.assign(frame.payload.begin() + 2, frame.payload.end());
            response_ready_ = true;
            response_cv_.notify_all();
            break;
        }
        case BridgeProtocol::Type::notification: {
            if (frame.payload.size() < 2) break;
            LinkEvent ev;
            ev.type = LinkEvent::Type::notification;
            ev.handle = static_cast<std::uint16_t>(frame.payload[0] | (frame.payload[1] << 8));
            ev.payload.assign(frame.payload.begin() + 2, frame.payload.end());
            ev.timestamp = Clock::now();
            std::shared_ptr<LinkEventQueue> events;
            {
                std::lock_guard<std::mutex> lock(state_mutex_);
                events = events_;
            }
            if (events) events->push_drop_oldest(std::move(ev));
            break;
        }
        case BridgeProtocol::Type::disconnected: {
            connected_ = false;
            LinkEvent ev;
            ev.type = LinkEvent::Type::disconnected;
            ev.reason = frame.payload.empty() ? 0 : frame.payload[0];
            ev.timestamp = Clock::now();
            VRGLOVE_LOG_WARN(g_logger) << "Peripheral disconnected, reason " << ev.reason;
            std::shared_ptr<LinkEventQueue> events;
            {
                std::lock_guard<std::mutex> lock(state_mutex_);
                events = events_;
                // Any request in flight will not be answered.
                if (waiting_ && pending_op_ != BridgeProtocol::Type::scan) cancelled_ = true;
            }
            response_cv_.notify_all();
            if (events) events->push_drop_oldest(std::move(ev));
            break;
        }
        default:
            VRGLOVE_LOG_DEBUG(g_logger) << "Unknown frame type 0x" << std::hex
                                        << static_cast<int>(frame.type) << std::dec;
            break;
        }
    }

    void BridgeLink::worker() {
        BridgeFrameParser parser;
        std::uint8_t buf[256];
        std::vector<BridgeFrame> frames;

        while (running_.load()) {
            ssize_t ret = ::read(fd_, buf, sizeof(buf));
            if (ret < 0) {
                if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
                    continue;
                }
                VRGLOVE_LOG_ERROR(g_logger) << "read: " << strerror(errno);
                break;
            } else if (ret == 0) {
                continue;
            }

            frames.clear();
            parser.feed(buf, static_cast<std::size_t>(ret), frames);
            crc_errors_.store(parser.crc_errors());
            for (const BridgeFrame& frame : frames) {
                handle_frame(frame);
            }
        }

        // Bridge gone: surface as link loss if we were connected.
        if (running_.load() && connected_.exchange(false)) {
            BridgeFrame lost;
            lost.type = BridgeProtocol::Type::disconnected;
            handle_frame(lost);
        }
    }

} // namespace vrglove
