#include "linux_enumerators.hpp"
#include "log.hpp"
#include "multiplexer_device.hpp"
#include "serial_device.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <map>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

namespace nmeascout
{

static bool startsWith(const std::string &s, const std::string &prefix)
{
    return s.compare(0, prefix.size(), prefix) == 0;
}

static std::string readFirstLine(const fs::path &p)
{
    std::ifstream f(p);
    std::string line;
    if (f)
        std::getline(f, line);
    while (!line.empty() && (line.back() == '\r' || line.back() == ' ' || line.back() == '\n'))
        line.pop_back();
    return line;
}

// Sorted directory entries whose name starts with one of `prefixes`. Missing dirs yield nothing.
static std::vector<std::string> listNames(const fs::path &dir, const std::vector<std::string> &prefixes)
{
    std::vector<std::string> names;
    std::error_code ec;
    if (!fs::is_directory(dir, ec))
        return names;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec))
    {
        std::string name = it->path().filename().string();
        for (const auto &prefix : prefixes)
        {
            if (startsWith(name, prefix))
            {
                names.push_back(name);
                break;
            }
        }
    }
    std::sort(names.begin(), names.end());
    return names;
}

// ==================== Wired serial ====================

LinuxSerialEnumerator::LinuxSerialEnumerator(std::shared_ptr<ProfileStore> store, const SnifferSettings &settings,
                                             const std::string &exhaustivePrefix, const std::string &devRoot,
                                             const std::string &sysRoot)
    : store_(std::move(store)), settings_(settings), exhaustivePrefix_(exhaustivePrefix),
      devRoot_(devRoot), sysRoot_(sysRoot)
{
}

std::shared_ptr<Device> LinuxSerialEnumerator::makeDevice(const std::string &path,
                                                          const std::string &friendlyName) const
{
    auto device = std::make_shared<SerialDevice>(path, store_);
    device->setSnifferSettings(settings_);
    if (!friendlyName.empty() && device->profile().friendlyName.empty())
        device->setName(friendlyName);
    return device;
}

std::vector<std::shared_ptr<Device>> LinuxSerialEnumerator::listCandidates()
{
    // by-id symlink name for each resolved tty
    std::map<std::string, std::string> friendly;
    fs::path byId = fs::path(devRoot_) / "serial" / "by-id";
    std::error_code ec;
    for (const auto &link : listNames(byId, {""}))
    {
        fs::path target = fs::canonical(byId / link, ec);
        if (!ec)
            friendly[target.filename().string()] = link;
    }

    std::vector<std::shared_ptr<Device>> devices;
    for (const auto &name : listNames(devRoot_, {"ttyUSB", "ttyACM", "ttyS"}))
    {
        // ttyS nodes exist for every legacy UART slot; only those with hardware behind them count
        if (startsWith(name, "ttyS") && !fs::exists(fs::path(sysRoot_) / "class" / "tty" / name / "device", ec))
            continue;
        auto it = friendly.find(name);
        devices.push_back(makeDevice((fs::path(devRoot_) / name).string(), it == friendly.end() ? "" : it->second));
    }
    log::debug("[DETECT] serial enumerator found " + std::to_string(devices.size()) + " port(s)");
    return devices;
}

std::shared_ptr<Device> LinuxSerialEnumerator::createForPortNumber(int n)
{
    if (n < 0)
        return nullptr;
    return makeDevice(exhaustivePrefix_ + std::to_string(n), "");
}

// ==================== Bluetooth RFCOMM ====================

RfcommEnumerator::RfcommEnumerator(std::shared_ptr<ProfileStore> store, const SnifferSettings &settings,
                                   const std::string &devRoot, const std::string &sysRoot)
    : store_(std::move(store)), settings_(settings), devRoot_(devRoot), sysRoot_(sysRoot)
{
}

std::vector<std::shared_ptr<Device>> RfcommEnumerator::listCandidates()
{
    std::vector<std::shared_ptr<Device>> devices;
    fs::path ttyClass = fs::path(sysRoot_) / "class" / "tty";
    for (const auto &name : listNames(ttyClass, {"rfcomm"}))
    {
        std::string address = readFirstLine(ttyClass / name / "address");
        if (address.empty())
            continue;
        auto device = std::make_shared<BluetoothVirtualDevice>(address, (fs::path(devRoot_) / name).string(), store_);
        device->setSnifferSettings(settings_);
        devices.push_back(device);
    }
    return devices;
}

bool RfcommEnumerator::isAvailable() const
{
    if (listNames(fs::path(sysRoot_) / "class" / "bluetooth", {"hci"}).empty())
        return false;

    // Any bluetooth rfkill switch that is not blocked counts as radio on.
    fs::path rfkill = fs::path(sysRoot_) / "class" / "rfkill";
    auto switches = listNames(rfkill, {"rfkill"});
    bool sawBluetooth = false;
    for (const auto &sw : switches)
    {
        if (readFirstLine(rfkill / sw / "type") != "bluetooth")
            continue;
        sawBluetooth = true;
        if (readFirstLine(rfkill / sw / "soft") != "1" && readFirstLine(rfkill / sw / "hard") != "1")
            return true;
    }
    return !sawBluetooth;
}

// ==================== gpsd ====================

GpsdEnumerator::GpsdEnumerator(std::shared_ptr<ProfileStore> store, const SnifferSettings &settings,
                               const std::string &address)
    : store_(std::move(store)), settings_(settings), address_(address)
{
}

std::vector<std::shared_ptr<Device>> GpsdEnumerator::listCandidates()
{
    std::vector<std::shared_ptr<Device>> devices;
    if (address_.empty())
        return devices;
    try
    {
        auto device = std::make_shared<PlatformMultiplexerDevice>(address_, store_);
        device->setSnifferSettings(settings_);
        if (device->profile().friendlyName.empty())
            device->setName("gpsd@" + address_);
        devices.push_back(device);
    }
    catch (const std::exception &ex)
    {
        log::warn(std::string("gpsd enumerator: ") + ex.what());
    }
    return devices;
}

} // namespace nmeascout
