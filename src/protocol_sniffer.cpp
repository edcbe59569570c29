#include "protocol_sniffer.hpp"
#include "log.hpp"
#include <algorithm>
#include <chrono>

namespace nmeascout
{

namespace
{

int remainingMs(const std::chrono::steady_clock::time_point &deadline)
{
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
    return left.count() > 0 ? static_cast<int>(left.count()) : 0;
}

// Splits channel bytes into lines. Seeded with the bytes the baud probe already read.
class LineReader {
public:
    LineReader(const std::vector<uint8_t> &seed, size_t maxLineLength)
        : pending_(seed.begin(), seed.end()), maxLineLength_(maxLineLength) {}

    ReadStatus readLine(ByteChannel &channel, std::string &line, int timeoutMs, const std::atomic<bool> &cancel)
    {
        auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
        while (true)
        {
            if (takeLine(line))
                return ReadStatus::Ok;
            if (cancel.load())
                return ReadStatus::Interrupted;

            int left = remainingMs(deadline);
            if (left == 0)
                return ReadStatus::Timeout;

            uint8_t chunk[128];
            ReadResult r = channel.read(chunk, sizeof(chunk), left);
            if (r.status != ReadStatus::Ok)
                return r.status;
            pending_.append(reinterpret_cast<const char *>(chunk), r.bytes);
        }
    }

private:
    std::string pending_;
    size_t maxLineLength_;

    bool takeLine(std::string &line)
    {
        auto nl = pending_.find('\n');
        if (nl == std::string::npos)
        {
            if (pending_.size() < maxLineLength_)
                return false;
            nl = maxLineLength_;
            line = pending_.substr(0, nl);
            pending_.erase(0, nl);
            return true;
        }
        line = pending_.substr(0, nl);
        pending_.erase(0, nl + 1);
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        return true;
    }
};

} // namespace

ProtocolSniffer::ProtocolSniffer(const SnifferSettings &settings) : settings_(settings) {}

std::vector<int> ProtocolSniffer::buildBaudCandidates(const std::vector<int> &defaults, std::optional<int> lastSuccessBaud)
{
    std::vector<int> rates;
    rates.reserve(defaults.size() + 1);
    if (lastSuccessBaud && *lastSuccessBaud > 0)
        rates.push_back(*lastSuccessBaud);
    for (int baud : defaults)
    {
        if (std::find(rates.begin(), rates.end(), baud) == rates.end())
            rates.push_back(baud);
    }
    return rates;
}

size_t ProtocolSniffer::longestAsciiRun(const uint8_t *data, size_t size)
{
    size_t run = 0;
    size_t best = 0;
    for (size_t i = 0; i < size; ++i)
    {
        uint8_t b = data[i];
        if (b == 0)
            continue;  // filler, not noise
        if (b < 10 || b > 125)
        {
            run = 0;
            continue;
        }
        ++run;
        best = std::max(best, run);
    }
    return best;
}

bool ProtocolSniffer::isSentenceShape(const std::string &line)
{
    if (line.size() < 4 || line[0] != '$')
        return false;
    auto star = line.find('*');
    return star != std::string::npos && star == line.size() - 3;
}

ReadStatus ProtocolSniffer::readBuffer(ByteChannel &channel, std::vector<uint8_t> &buffer,
                                       const std::atomic<bool> &cancel) const
{
    buffer.assign(settings_.bufferSize, 0);
    size_t filled = 0;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(settings_.readTimeoutMs);

    while (filled < buffer.size())
    {
        if (cancel.load())
            return ReadStatus::Interrupted;
        int left = remainingMs(deadline);
        if (left == 0)
            break;
        ReadResult r = channel.read(buffer.data() + filled, buffer.size() - filled, left);
        if (r.status == ReadStatus::Ok)
        {
            filled += r.bytes;
            continue;
        }
        if (r.status == ReadStatus::Timeout)
            break;
        buffer.resize(filled);
        return r.status;
    }
    buffer.resize(filled);
    return filled == 0 ? ReadStatus::Timeout : ReadStatus::Ok;
}

DetectionOutcome ProtocolSniffer::scanLines(ByteChannel &channel, const std::vector<uint8_t> &seed, int baud,
                                            const std::atomic<bool> &cancel, const std::string &name,
                                            bool &exhausted) const
{
    exhausted = false;
    LineReader reader(seed, settings_.maxLineLength);
    for (int count = 0; count < settings_.maxSentenceLines; ++count)
    {
        std::string line;
        ReadStatus st = reader.readLine(channel, line, settings_.readTimeoutMs, cancel);
        if (st == ReadStatus::Interrupted)
            return DetectionOutcome::canceled(name + " detection was canceled");
        if (st == ReadStatus::Timeout)
            return DetectionOutcome::transportError(name + " did not respond to an attempt to read data");
        if (st == ReadStatus::Error)
            return DetectionOutcome::transportError(name + " stopped responding while reading sentences");

        if (isSentenceShape(line))
        {
            log::debug("[SNIFF] " + name + " @" + std::to_string(baud) + ": " + line);
            return DetectionOutcome::confirmed(baud);
        }
    }
    exhausted = true;
    return DetectionOutcome::rejected(name + " sent ASCII but no sentence");
}

DetectionOutcome ProtocolSniffer::sniff(ByteChannel &channel, std::optional<int> lastSuccessBaud,
                                        const std::atomic<bool> &cancel, const std::string &name) const
{
    std::vector<int> rates = buildBaudCandidates(settings_.baudRates, lastSuccessBaud);
    std::vector<uint8_t> buffer;

    for (int baud : rates)
    {
        if (cancel.load())
            return DetectionOutcome::canceled(name + " detection was canceled");

        if (!channel.setBaudRate(baud))
        {
            log::debug("[SNIFF] " + name + " refused " + std::to_string(baud) + " baud");
            continue;
        }
        channel.discardInput();

        ReadStatus st = readBuffer(channel, buffer, cancel);
        if (st == ReadStatus::Interrupted)
            return DetectionOutcome::canceled(name + " detection was canceled");
        if (st == ReadStatus::Error)
        {
            // The channel dropped; one re-open, then give up on the whole device.
            try
            {
                channel.open();
            }
            catch (const DeviceError &ex)
            {
                return DetectionOutcome::transportError(name + " could not be opened: " + ex.what(), ex.kind());
            }
            continue;
        }
        if (st == ReadStatus::Timeout)
        {
            log::debug("[SNIFF] " + name + " silent at " + std::to_string(baud));
            continue;
        }

        size_t run = longestAsciiRun(buffer.data(), buffer.size());
        if (run < settings_.minAsciiRun)
        {
            log::debug("[SNIFF] " + name + " noise at " + std::to_string(baud) + " (run " + std::to_string(run) + ")");
            continue;
        }

        bool exhausted = false;
        DetectionOutcome outcome = scanLines(channel, buffer, baud, cancel, name, exhausted);
        if (!exhausted)
            return outcome;
    }

    return DetectionOutcome::rejected(name + ": no protocol data found at any tested rate");
}

DetectionOutcome ProtocolSniffer::confirmSentences(ByteChannel &channel, const std::atomic<bool> &cancel,
                                                   const std::string &name) const
{
    bool exhausted = false;
    DetectionOutcome outcome = scanLines(channel, std::vector<uint8_t>(), channel.baudRate(), cancel, name, exhausted);
    if (exhausted)
        return DetectionOutcome::rejected(name + ": no protocol data found");
    return outcome;
}

} // namespace nmeascout
