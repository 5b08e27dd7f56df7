/// @file main.cpp
/// @brief gatesim entry point — runs the built-in device test vectors
///
/// Builds each bundled device (adders, JK flip-flop, D register), drives it
/// through its documented test vector and prints a per-device summary.
/// Exits with status 1 if any vector fails.

#include "simulation/circuit_builder.hpp"
#include "testing/test_vector.hpp"
#include "util/log.hpp"

#include <cstdio>
#include <exception>
#include <memory>
#include <string_view>

namespace {

constexpr int MAX_SETTLE_PASSES = 1000;
constexpr gatesim::LogLevel LOG_LEVEL = gatesim::LogLevel::WARNING;

using Builder = std::unique_ptr<gatesim::Model> (*)(gatesim::SimulationConfig);
using VectorSource = std::string_view (*)();

/// A device together with the test vector that documents it
struct DeviceCase {
    const char* name;
    Builder build;
    VectorSource vector;
};

constexpr DeviceCase DEVICES[] = {
    {"half adder", gatesim::build_half_adder, gatesim::half_adder_test_vector},
    {"full adder", gatesim::build_full_adder, gatesim::full_adder_test_vector},
    {"JK flip-flop", gatesim::build_jk_device, gatesim::jk_device_test_vector},
    {"D register", gatesim::build_d_register, gatesim::d_register_test_vector},
};

/// Runs one device's vector; returns true if every row passed
bool run_device(const DeviceCase& device, const gatesim::SimulationConfig& config) {
    auto model = device.build(config);
    gatesim::TestReport report = gatesim::run_test_vector(*model, device.vector());

    std::printf("%-14s %s\n", device.name, report.passed() ? "PASS" : "FAIL");
    if (!report.passed()) {
        std::printf("%s\n", report.summary().c_str());
    }
    return report.passed();
}

} // namespace

int main() {
    gatesim::set_log_level(LOG_LEVEL);

    gatesim::SimulationConfig config;
    config.max_settle_passes = MAX_SETTLE_PASSES;

    int failures = 0;
    for (const DeviceCase& device : DEVICES) {
        try {
            if (!run_device(device, config)) {
                failures++;
            }
        } catch (const std::exception& e) {
            gatesim::log_message(gatesim::LogLevel::ERROR, "%s: %s", device.name, e.what());
            failures++;
        }
    }

    std::printf("%d of %zu device(s) failed\n", failures, sizeof(DEVICES) / sizeof(DEVICES[0]));
    return failures == 0 ? 0 : 1;
}
