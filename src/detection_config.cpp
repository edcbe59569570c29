#include "detection_config.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace nmeascout
{

static std::string trim(const std::string &s)
{
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos)
        return "";
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

void DetectionConfig::validate() const
{
    if (maxSerialPortNumber < 0 || maxSerialPortNumber > 100)
        throw std::invalid_argument("maxSerialPortNumber must be between 0 and 100, got " +
                                    std::to_string(maxSerialPortNumber));
    if (detectionTimeout.count() <= 0)
        throw std::invalid_argument("detectionTimeout must be greater than zero");
    if (cancelAcknowledgeTimeout.count() <= 0)
        throw std::invalid_argument("cancelAcknowledgeTimeout must be greater than zero");
    if (maximumAllowedFailures < 1)
        throw std::invalid_argument("maximumAllowedFailures must be at least 1");
    if (readTimeoutMs <= 0)
        throw std::invalid_argument("readTimeoutMs must be greater than zero");
    if (detectionBaudRates.empty())
        throw std::invalid_argument("detectionBaudRates must not be empty");
    for (int baud : detectionBaudRates)
    {
        if (baud <= 0)
            throw std::invalid_argument("detectionBaudRates contains non-positive rate " + std::to_string(baud));
    }
}

// ========== Simple config loader (key: value, dotted keys supported) ==========
std::map<std::string, std::string> loadConfigFile(const std::vector<std::string> &candidatePaths)
{
    std::map<std::string, std::string> cfg;
    for (const auto &path : candidatePaths)
    {
        std::ifstream in(path);
        if (!in.is_open())
            continue;
        std::string line;
        while (std::getline(in, line))
        {
            if (line.empty())
                continue;
            if (line[0] == '#')
                continue;
            auto pos = line.find(':');
            if (pos == std::string::npos)
                continue;
            std::string key = trim(line.substr(0, pos));
            std::string value = trim(line.substr(pos + 1));
            // strip trailing comment
            auto hash = value.find(" #");
            if (hash != std::string::npos)
                value = trim(value.substr(0, hash));
            // remove surrounding quotes if any
            if (!value.empty() && (value.front() == '"' || value.front() == '\''))
                value.erase(0, 1);
            if (!value.empty() && (value.back() == '"' || value.back() == '\''))
                value.pop_back();
            if (!key.empty())
                cfg[key] = value;
        }
        break; // stop at the first file found
    }
    return cfg;
}

std::string cfgStr(const std::map<std::string, std::string> &cfg, const std::string &key, const std::string &defVal)
{
    auto it = cfg.find(key);
    return it == cfg.end() ? defVal : it->second;
}

int cfgInt(const std::map<std::string, std::string> &cfg, const std::string &key, int defVal)
{
    auto it = cfg.find(key);
    if (it == cfg.end())
        return defVal;
    size_t used = 0;
    int value = 0;
    try
    {
        value = std::stoi(it->second, &used);
    }
    catch (const std::exception &)
    {
        throw std::invalid_argument(key + " is not a number: '" + it->second + "'");
    }
    if (used != it->second.size())
        throw std::invalid_argument(key + " is not a number: '" + it->second + "'");
    return value;
}

bool cfgBool(const std::map<std::string, std::string> &cfg, const std::string &key, bool defVal)
{
    auto it = cfg.find(key);
    if (it == cfg.end())
        return defVal;
    const std::string &v = it->second;
    if (v == "true" || v == "yes" || v == "1")
        return true;
    if (v == "false" || v == "no" || v == "0")
        return false;
    throw std::invalid_argument(key + " is not a boolean: '" + v + "'");
}

static std::vector<int> parseBaudList(const std::string &key, const std::string &text)
{
    // Accepts "115200, 9600" or "[115200, 9600]"
    std::string body = text;
    if (!body.empty() && body.front() == '[')
        body.erase(0, 1);
    if (!body.empty() && body.back() == ']')
        body.pop_back();
    std::vector<int> rates;
    std::stringstream ss(body);
    std::string item;
    while (std::getline(ss, item, ','))
    {
        item = trim(item);
        if (item.empty())
            continue;
        std::map<std::string, std::string> one{{key, item}};
        rates.push_back(cfgInt(one, key, 0));
    }
    return rates;
}

DetectionConfig detectionConfigFrom(const std::map<std::string, std::string> &cfg)
{
    DetectionConfig c;
    c.allowBluetooth = cfgBool(cfg, "detection.allow_bluetooth", c.allowBluetooth);
    c.allowSerial = cfgBool(cfg, "detection.allow_serial", c.allowSerial);
    c.allowMultiplexer = cfgBool(cfg, "detection.allow_multiplexer", c.allowMultiplexer);
    c.allowExhaustiveSerialScan = cfgBool(cfg, "detection.allow_exhaustive_serial_scan", c.allowExhaustiveSerialScan);
    c.maxSerialPortNumber = cfgInt(cfg, "detection.max_serial_port_number", c.maxSerialPortNumber);
    c.exhaustivePortPrefix = cfgStr(cfg, "detection.exhaustive_port_prefix", c.exhaustivePortPrefix);
    c.onlyFirstDeviceDetected = cfgBool(cfg, "detection.only_first_device", c.onlyFirstDeviceDetected);

    int timeoutSec = cfgInt(cfg, "detection.timeout_seconds",
                            static_cast<int>(std::chrono::duration_cast<std::chrono::seconds>(c.detectionTimeout).count()));
    c.detectionTimeout = std::chrono::seconds(timeoutSec);
    int cancelMs = cfgInt(cfg, "detection.cancel_ack_ms", static_cast<int>(c.cancelAcknowledgeTimeout.count()));
    c.cancelAcknowledgeTimeout = std::chrono::milliseconds(cancelMs);

    c.maximumAllowedFailures = cfgInt(cfg, "sniffer.max_failures", c.maximumAllowedFailures);
    c.readTimeoutMs = cfgInt(cfg, "sniffer.read_timeout_ms", c.readTimeoutMs);
    auto it = cfg.find("sniffer.baud_rates");
    if (it != cfg.end())
        c.detectionBaudRates = parseBaudList(it->first, it->second);

    c.multiplexerAddress = cfgStr(cfg, "multiplexer.address", c.multiplexerAddress);
    c.profileStorePath = cfgStr(cfg, "profiles.path", c.profileStorePath);

    c.validate();
    return c;
}

} // namespace nmeascout
