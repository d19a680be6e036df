#pragma once

#include "hubtrace/config.hpp"
#include "hubtrace/driver.hpp"
#include "hubtrace/publish/sample_publisher.hpp"

#include <memory>
#include <string>

namespace hubtrace {

/// Command-line monitor: opens the hub on an I2C bus, enables the configured
/// reports and prints (and optionally publishes) every sample until interrupted.
class App {
  public:
    App();
    ~App();

    /// Run the monitor loop.
    /// Returns exit code (0 = success).
    int run(int argc, char *argv[]);

  private:
    /// Parse argv into options_. Returns false if the program should exit.
    bool parse_args(int argc, char *argv[]);
    void print_usage(const char *program) const;

    /// One-shot actions requested on the command line, run before streaming.
    void run_actions(Driver &driver);

    void on_sample(const protocol::DecodedSample &sample);

    struct Options {
        std::string config_path;
        bool tare = false;
        bool save_calibration = false;
        bool begin_calibration = false;
        bool product_id = false;
        bool quiet = false;
    };

    // --- State ---
    Options options_;
    DriverConfig config_;
    std::unique_ptr<publish::SamplePublisher> publisher_;
    uint64_t sample_count_ = 0;
    uint64_t start_us_ = 0; // host counter when streaming began
};

} // namespace hubtrace
