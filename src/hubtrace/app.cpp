#include "hubtrace/app.hpp"
#include "hubtrace/data/orientation.hpp"
#include "hubtrace/io/clock.hpp"
#include "hubtrace/io/i2c_transport.hpp"
#include "hubtrace/protocol/report_layout.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <stdexcept>
#include <string_view>
#include <thread>

namespace hubtrace {

namespace {

std::atomic<bool> g_stop{false};

void handle_signal(int /*signal*/) { g_stop.store(true); }

// Default stream when the config enables nothing
constexpr uint32_t kDefaultRotationIntervalUs = 10000;

} // namespace

App::App() = default;
App::~App() = default;

int App::run(int argc, char *argv[]) {
    if (!parse_args(argc, argv)) {
        return 0;
    }

    if (!options_.config_path.empty()) {
        config_ = load_config(options_.config_path);
    }
    if (config_.features.empty()) {
        config_.features.push_back(
            FeatureRequest{protocol::report_id::kRotationVector, kDefaultRotationIntervalUs});
    }

    io::I2cTransport transport(config_.bus, config_.address);
    io::SteadyClock clock;
    Driver driver(transport, clock, config_);
    start_us_ = clock.now_us();
    std::printf("[hubtrace] Opened %s at 0x%02X\n", config_.bus.c_str(), config_.address);

    if (config_.publish_url.has_value()) {
        publisher_ = std::make_unique<publish::SamplePublisher>(*config_.publish_url);
        publisher_->connect();
    }

    driver.set_sample_callback([this](const protocol::DecodedSample &s) { on_sample(s); });

    for (const auto &feature : config_.features) {
        driver.enable_feature(feature.report_id, feature.interval_us);
    }

    run_actions(driver);

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    const auto start = std::chrono::steady_clock::now();
    while (!g_stop.load()) {
        if (driver.update() == 0 && config_.idle_poll_us > 0) {
            std::this_thread::sleep_for(std::chrono::microseconds(config_.idle_poll_us));
        }
    }
    const double seconds =
        std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

    if (publisher_) {
        std::printf("[hubtrace] Published %llu samples, dropped %llu\n",
                    static_cast<unsigned long long>(publisher_->published_count()),
                    static_cast<unsigned long long>(publisher_->dropped_count()));
        publisher_->disconnect();
    }

    const auto &framing = driver.framer().stats();
    std::printf("[hubtrace] %llu samples in %.1f s (%.1f Hz), %llu resyncs, %llu sequence gaps\n",
                static_cast<unsigned long long>(sample_count_), seconds,
                seconds > 0.0 ? static_cast<double>(sample_count_) / seconds : 0.0,
                static_cast<unsigned long long>(framing.resyncs),
                static_cast<unsigned long long>(framing.sequence_gaps));
    return 0;
}

bool App::parse_args(int argc, char *argv[]) {
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg(argv[i]);
        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return false;
        } else if (arg == "--tare") {
            options_.tare = true;
        } else if (arg == "--save-calibration") {
            options_.save_calibration = true;
        } else if (arg == "--begin-calibration") {
            options_.begin_calibration = true;
        } else if (arg == "--product-id") {
            options_.product_id = true;
        } else if (arg == "-q" || arg == "--quiet") {
            options_.quiet = true;
        } else if (!arg.empty() && arg.front() == '-') {
            throw std::runtime_error("Unknown option '" + std::string(arg) + "'");
        } else if (options_.config_path.empty()) {
            options_.config_path = std::string(arg);
        } else {
            throw std::runtime_error("Unexpected argument '" + std::string(arg) + "'");
        }
    }
    return true;
}

void App::print_usage(const char *program) const {
    std::printf("Usage: %s [config.json] [options]\n"
                "  --begin-calibration  start motion engine calibration\n"
                "  --save-calibration   persist dynamic calibration data\n"
                "  --tare               tare all axes against the rotation vector\n"
                "  --product-id         request product id reports\n"
                "  -q, --quiet          do not print samples\n",
                program);
}

void App::run_actions(Driver &driver) {
    if (options_.product_id) {
        driver.request_product_id();
    }

    if (options_.begin_calibration) {
        driver.begin_calibration();
        const auto status = driver.calibration_status();
        std::printf("[hubtrace] Calibration enabled: accel=%d gyro=%d mag=%d\n",
                    status.accelerometer ? 1 : 0, status.gyroscope ? 1 : 0,
                    status.magnetometer ? 1 : 0);
    }

    if (options_.tare) {
        driver.tare_now();
        driver.persist_tare();
    }

    if (options_.save_calibration) {
        try {
            driver.save_calibration_data();
            std::printf("[hubtrace] Calibration data saved\n");
        } catch (const protocol::CommandRejectedError &e) {
            std::fprintf(stderr, "[hubtrace] %s\n", e.what());
        }
    }
}

void App::on_sample(const protocol::DecodedSample &sample) {
    ++sample_count_;

    if (publisher_) {
        publisher_->publish(sample);
    }
    if (options_.quiet) {
        return;
    }

    const std::string name = protocol::report_name(sample.report_id);
    char stamp[32] = "untimed";
    if (sample.timestamp_us.has_value()) {
        // Seconds since startup; negative for samples taken before it
        std::snprintf(stamp, sizeof(stamp), "%+.6f",
                      static_cast<double>(io::ticks_diff(*sample.timestamp_us, start_us_, 0)) /
                          1e6);
    }

    if (const auto q = data::orientation_of(sample)) {
        const auto euler = data::to_euler(*q);
        std::printf("[hubtrace] %s %s yaw=%.2f pitch=%.2f roll=%.2f\n", stamp, name.c_str(),
                    euler.yaw, euler.pitch, euler.roll);
        return;
    }

    std::string values;
    for (double field : sample.fields) {
        char buffer[32];
        std::snprintf(buffer, sizeof(buffer), " %.6g", field);
        values += buffer;
    }
    std::printf("[hubtrace] %s %s%s\n", stamp, name.c_str(), values.c_str());
}

} // namespace hubtrace
