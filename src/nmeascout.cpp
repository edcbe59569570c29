#include "connection_arbiter.hpp"
#include "console_observer.hpp"
#include "detection_config.hpp"
#include "detection_orchestrator.hpp"
#include "linux_enumerators.hpp"
#include "log.hpp"
#include "reliability_profile.hpp"
#include "serial_device.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <thread>
#include <opencv2/core.hpp>

using namespace nmeascout;

static const char *kKeys =
    "{help h usage ? |      | print this message}"
    "{config c       |      | config file (default config/nmeascout.yaml)}"
    "{profiles p     |      | reliability profile store, overrides profiles.path}"
    "{timeout t      | 0    | detection timeout in seconds, overrides detection.timeout_seconds}"
    "{first          |      | stop at the first confirmed device}"
    "{exhaustive     |      | also probe ports with no device node evidence}"
    "{list           |      | print known devices and their profiles, then exit}"
    "{forget         |      | delete the stored profiles of every present device, then exit}"
    "{verbose v      |      | log every attempt}";

static DetectionOrchestrator *gOrchestrator = nullptr;
static volatile std::sig_atomic_t gInterrupted = 0;

static void onSignal(int)
{
    gInterrupted = 1;
}

static std::string describe(const std::shared_ptr<Device> &device)
{
    ReliabilityProfile p = device->profile();
    std::ostringstream os;
    os << std::left << std::setw(28) << device->identity() << " " << std::setw(11) << categoryName(device->category())
       << " " << std::setw(9) << deviceStateName(device->state()) << " ok=" << p.successCount << " fail=" << p.failCount;
    if (p.lastSuccessBaud)
        os << " baud=" << *p.lastSuccessBaud;
    if (device->name() != device->identity())
        os << "  (" << device->name() << ")";
    return os.str();
}

int main(int argc, char *argv[])
{
    cv::CommandLineParser parser(argc, argv, kKeys);
    parser.about("nmeascout: find the receiver that is streaming NMEA sentences");
    if (parser.has("help"))
    {
        parser.printMessage();
        return 0;
    }

    std::cout << "========================================\n";
    std::cout << "NMEASCOUT (serial / Bluetooth / gpsd)\n";
    std::cout << "========================================\n\n";

    log::setVerbose(parser.has("verbose"));

    // Load config
    std::vector<std::string> configPaths = {"../config/nmeascout.yaml", "config/nmeascout.yaml"};
    if (parser.has("config"))
        configPaths.insert(configPaths.begin(), parser.get<std::string>("config"));

    DetectionConfig config;
    try
    {
        config = detectionConfigFrom(loadConfigFile(configPaths));
        if (parser.has("profiles"))
            config.profileStorePath = parser.get<std::string>("profiles");
        int timeoutSeconds = parser.get<int>("timeout");
        if (timeoutSeconds > 0)
            config.detectionTimeout = std::chrono::seconds(timeoutSeconds);
        if (parser.has("first"))
            config.onlyFirstDeviceDetected = true;
        if (parser.has("exhaustive"))
            config.allowExhaustiveSerialScan = true;
        config.validate();
    }
    catch (const std::exception &ex)
    {
        log::error(std::string("invalid configuration: ") + ex.what());
        return 2;
    }
    if (!parser.check())
    {
        parser.printErrors();
        return 2;
    }

    auto store = std::make_shared<YamlProfileStore>(config.profileStorePath);
    std::cout << "✓ Profiles: " << config.profileStorePath << "\n";

    SnifferSettings sniffer;
    sniffer.baudRates = config.detectionBaudRates;
    sniffer.readTimeoutMs = config.readTimeoutMs;

    std::vector<std::shared_ptr<TransportEnumerator>> enumerators = {
        std::make_shared<GpsdEnumerator>(store, sniffer, config.multiplexerAddress),
        std::make_shared<LinuxSerialEnumerator>(store, sniffer, config.exhaustivePortPrefix),
        std::make_shared<RfcommEnumerator>(store, sniffer),
    };

    if (parser.has("list"))
    {
        try
        {
            for (const auto &enumerator : enumerators)
            {
                for (const auto &device : enumerator->listCandidates())
                    std::cout << "  " << describe(device) << "\n";
            }
        }
        catch (const std::exception &ex)
        {
            log::error(std::string("could not list devices: ") + ex.what());
            return 1;
        }
        return 0;
    }

    if (parser.has("forget"))
    {
        try
        {
            for (const auto &enumerator : enumerators)
            {
                for (const auto &device : enumerator->listCandidates())
                    store->remove(device->identity());
            }
        }
        catch (const std::exception &ex)
        {
            log::error(std::string("could not clear profiles: ") + ex.what());
            return 1;
        }
        std::cout << "✓ Stored profiles cleared\n";
        return 0;
    }

    DetectionOrchestrator orchestrator(config, enumerators, store);
    orchestrator.addObserver(std::make_shared<ConsoleObserver>());

    gOrchestrator = &orchestrator;
    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    // Ctrl-C handling without doing work in the signal handler.
    std::atomic<bool> done(false);
    std::thread interruptWatcher([&done]() {
        while (!done.load())
        {
            if (gInterrupted)
            {
                gInterrupted = 0;
                log::warn("interrupted, canceling detection");
                gOrchestrator->cancelDetection();
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });

    int rc = 0;
    try
    {
        ConnectionArbiter arbiter(orchestrator);
        auto device = arbiter.acquireConnection();
        orchestrator.waitForDetection();
        log::info(std::string("[DETECT] Session ") + sessionPhaseName(orchestrator.phase()));

        std::cout << "\nConfirmed devices (best first):\n";
        for (const auto &confirmed : orchestrator.confirmedDevices())
            std::cout << "  " << describe(confirmed) << "\n";

        if (device)
        {
            std::cout << "\n✓ Using " << device->name() << "\n";
            device->close();
        }
        else
        {
            std::cout << "\nNo NMEA receiver found\n";
            rc = 1;
        }
    }
    catch (const DeviceError &ex)
    {
        log::error(std::string("no confirmed device could be opened: ") + ex.what() + " [" +
                   errorKindName(ex.kind()) + "]");
        rc = 1;
    }

    done.store(true);
    interruptWatcher.join();
    gOrchestrator = nullptr;
    return rc;
}
