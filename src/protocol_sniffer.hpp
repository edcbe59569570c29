#pragma once
#include "byte_channel.hpp"
#include "detection_outcome.hpp"
#include <atomic>
#include <optional>
#include <string>
#include <vector>

namespace nmeascout
{

// ==================== Sniffer Settings ====================
struct SnifferSettings {
    std::vector<int> baudRates;  // Tested in order after the last successful rate
    int readTimeoutMs;           // Aggressive: a real receiver talks as soon as it is opened
    size_t bufferSize;           // Bytes sampled per baud rate
    size_t minAsciiRun;          // Contiguous printable bytes that make a rate plausible
    int maxSentenceLines;        // Lines inspected for a sentence once ASCII is seen
    size_t maxLineLength;        // A longer run without newline is treated as one line

    SnifferSettings()
        : baudRates({115200, 57600, 38400, 19200, 9600, 4800}),
          readTimeoutMs(1000), bufferSize(512), minAsciiRun(10),
          maxSentenceLines(10), maxLineLength(1024) {}
};

// ==================== Protocol Sniffer ====================
// Handshake-less check that an open channel is streaming NMEA-style sentences:
// find a baud rate that yields printable ASCII, then confirm a "$...*hh" line.
class ProtocolSniffer {
public:
    explicit ProtocolSniffer(const SnifferSettings &settings);

    // Full baud scan over an already open channel. The channel is left open on
    // return; the caller owns closing it. `name` is used in failure reasons.
    DetectionOutcome sniff(ByteChannel &channel, std::optional<int> lastSuccessBaud,
                           const std::atomic<bool> &cancel, const std::string &name) const;

    // Sentence check only, at whatever rate the channel already runs.
    DetectionOutcome confirmSentences(ByteChannel &channel, const std::atomic<bool> &cancel,
                                      const std::string &name) const;

    const SnifferSettings &settings() const { return settings_; }

    // Last successful rate first, then the defaults without it.
    static std::vector<int> buildBaudCandidates(const std::vector<int> &defaults, std::optional<int> lastSuccessBaud);

    // Longest run of bytes in [10,125]; zero bytes are skipped without breaking the run.
    static size_t longestAsciiRun(const uint8_t *data, size_t size);

    // Starts with '$' and the first '*' is exactly three characters from the end.
    static bool isSentenceShape(const std::string &line);

private:
    SnifferSettings settings_;

    ReadStatus readBuffer(ByteChannel &channel, std::vector<uint8_t> &buffer,
                          const std::atomic<bool> &cancel) const;
    DetectionOutcome scanLines(ByteChannel &channel, const std::vector<uint8_t> &seed, int baud,
                               const std::atomic<bool> &cancel, const std::string &name,
                               bool &exhausted) const;
};

} // namespace nmeascout
