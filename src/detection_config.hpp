#pragma once
#include <chrono>
#include <map>
#include <string>
#include <vector>

namespace nmeascout
{

// ==================== Detection Configuration ====================
struct DetectionConfig {
    // Transport categories
    bool allowBluetooth;              // Probe Bluetooth RFCOMM ports
    bool allowSerial;                 // Probe wired serial ports
    bool allowMultiplexer;            // Probe a platform multiplexer (gpsd)
    bool allowExhaustiveSerialScan;   // Probe ports with no evidence they exist
    int maxSerialPortNumber;          // Exhaustive scan covers 0..max-1, range [0,100]
    std::string exhaustivePortPrefix; // Port path prefix for exhaustive candidates

    // Session policy
    std::chrono::milliseconds detectionTimeout;          // Watchdog budget, > 0
    std::chrono::milliseconds cancelAcknowledgeTimeout;  // Bound on waiting for devices to stop
    bool onlyFirstDeviceDetected;                        // Stop at first confirmed device

    // Sniffing
    int maximumAllowedFailures;        // Stop probing a device that never succeeded
    std::vector<int> detectionBaudRates;
    int readTimeoutMs;

    // Collaborators
    std::string multiplexerAddress;    // host:port
    std::string profileStorePath;

    DetectionConfig()
        : allowBluetooth(true), allowSerial(true), allowMultiplexer(true),
          allowExhaustiveSerialScan(false), maxSerialPortNumber(20),
          exhaustivePortPrefix("/dev/ttyS"),
          detectionTimeout(std::chrono::minutes(20)),
          cancelAcknowledgeTimeout(std::chrono::seconds(5)),
          onlyFirstDeviceDetected(false),
          maximumAllowedFailures(100),
          detectionBaudRates({115200, 57600, 38400, 19200, 9600, 4800}),
          readTimeoutMs(1000),
          multiplexerAddress("127.0.0.1:2947"),
          profileStorePath("nmeascout_profiles.yml") {}

    // Throws std::invalid_argument naming the offending option.
    void validate() const;
};

// Flat "key: value" reader (dotted keys, '#' comments). First existing path wins.
std::map<std::string, std::string> loadConfigFile(const std::vector<std::string> &candidatePaths);

std::string cfgStr(const std::map<std::string, std::string> &cfg, const std::string &key, const std::string &defVal);
int cfgInt(const std::map<std::string, std::string> &cfg, const std::string &key, int defVal);
bool cfgBool(const std::map<std::string, std::string> &cfg, const std::string &key, bool defVal);

// Builds a validated configuration from loaded keys; unknown keys are ignored.
DetectionConfig detectionConfigFrom(const std::map<std::string, std::string> &cfg);

} // namespace nmeascout
