#include "protocol_sniffer.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>

using namespace nmeascout;
using namespace nmeascout::test;

namespace
{

SnifferSettings fastSettings()
{
    SnifferSettings s;
    s.readTimeoutMs = 40;
    return s;
}

struct SnifferFixture : public ::testing::Test {
    std::shared_ptr<FakeChannelState> state = std::make_shared<FakeChannelState>();
    FakeChannel channel{state};
    std::atomic<bool> cancel{false};
    ProtocolSniffer sniffer{fastSettings()};

    void SetUp() override { channel.open(); }
};

} // namespace

TEST(AsciiRun, ZeroBytesDoNotBreakTheRun)
{
    const uint8_t data[] = {'$', 'G', 0, 'P', 'G', 0, 0, 'G', 'A', ',', '1', '2', '3'};
    EXPECT_EQ(ProtocolSniffer::longestAsciiRun(data, sizeof(data)), 10u);
}

TEST(AsciiRun, ReturnsLongestRunNotTrailingOne)
{
    std::vector<uint8_t> data(15, 'a');
    data.push_back(0xFF);
    data.insert(data.end(), 4, 'b');
    EXPECT_EQ(ProtocolSniffer::longestAsciiRun(data.data(), data.size()), 15u);
}

TEST(AsciiRun, ControlAndHighBytesReset)
{
    const uint8_t data[] = {'a', 'b', 5, 'c', 126, 'd', 'e'};
    EXPECT_EQ(ProtocolSniffer::longestAsciiRun(data, sizeof(data)), 2u);
}

TEST(SentenceShape, AcceptsChecksummedSentence)
{
    EXPECT_TRUE(ProtocolSniffer::isSentenceShape("$GPGGA,123519,4807.038,N,01131.000,E,1,08,0.9,545.4,M,46.9,M,,*47"));
    EXPECT_TRUE(ProtocolSniffer::isSentenceShape("$*47"));
}

TEST(SentenceShape, RejectsMisplacedChecksumOrMissingDollar)
{
    EXPECT_FALSE(ProtocolSniffer::isSentenceShape("GPGGA,1,2*47"));
    EXPECT_FALSE(ProtocolSniffer::isSentenceShape("$GPGGA,1,2*4"));
    EXPECT_FALSE(ProtocolSniffer::isSentenceShape("$GP*GA,1,2*47"));
    EXPECT_FALSE(ProtocolSniffer::isSentenceShape("$GPGGA,1,2"));
    EXPECT_FALSE(ProtocolSniffer::isSentenceShape("$*4"));
}

TEST(BaudCandidates, LastSuccessfulRateMovesToFront)
{
    std::vector<int> defaults = {115200, 57600, 9600, 4800};
    EXPECT_EQ(ProtocolSniffer::buildBaudCandidates(defaults, 9600), (std::vector<int>{9600, 115200, 57600, 4800}));
    EXPECT_EQ(ProtocolSniffer::buildBaudCandidates(defaults, 2400),
              (std::vector<int>{2400, 115200, 57600, 9600, 4800}));
    EXPECT_EQ(ProtocolSniffer::buildBaudCandidates(defaults, std::nullopt), defaults);
}

TEST_F(SnifferFixture, FindsTheRateCarryingSentences)
{
    DetectionOutcome outcome = sniffer.sniff(channel, std::nullopt, cancel, "fake");
    ASSERT_EQ(outcome.kind, DetectionOutcome::Kind::Confirmed);
    EXPECT_EQ(outcome.baud, 9600);
    EXPECT_EQ(state->baudHistory(), (std::vector<int>{115200, 57600, 38400, 19200, 9600}));
}

TEST_F(SnifferFixture, TriesLastSuccessfulRateFirst)
{
    DetectionOutcome outcome = sniffer.sniff(channel, 9600, cancel, "fake");
    ASSERT_EQ(outcome.kind, DetectionOutcome::Kind::Confirmed);
    EXPECT_EQ(state->baudHistory(), std::vector<int>{9600});
}

TEST_F(SnifferFixture, SilentChannelIsRejected)
{
    state->mode = FakeMode::Silent;
    DetectionOutcome outcome = sniffer.sniff(channel, std::nullopt, cancel, "fake");
    EXPECT_EQ(outcome.kind, DetectionOutcome::Kind::Rejected);
    EXPECT_NE(outcome.reason.find("no protocol data found at any tested rate"), std::string::npos);
    EXPECT_EQ(state->baudHistory().size(), 6u);
}

TEST_F(SnifferFixture, AsciiWithoutSentencesIsRejected)
{
    state->mode = FakeMode::AsciiNoSentence;
    DetectionOutcome outcome = sniffer.sniff(channel, std::nullopt, cancel, "fake");
    EXPECT_EQ(outcome.kind, DetectionOutcome::Kind::Rejected);
    EXPECT_TRUE(outcome.countsAsFailure());
}

TEST_F(SnifferFixture, AsciiThenSilenceIsTransportErrorAndStopsTheScan)
{
    state->mode = FakeMode::AsciiBurst;
    DetectionOutcome outcome = sniffer.sniff(channel, std::nullopt, cancel, "fake");

    EXPECT_EQ(outcome.kind, DetectionOutcome::Kind::TransportError);
    EXPECT_TRUE(outcome.countsAsFailure());
    // 4800 comes after 9600 in the default list and is never tried.
    std::vector<int> tried = state->baudHistory();
    ASSERT_FALSE(tried.empty());
    EXPECT_EQ(tried.back(), 9600);
    EXPECT_EQ(std::count(tried.begin(), tried.end(), 4800), 0);
}

TEST_F(SnifferFixture, ReadErrorReopensAndCarriesOn)
{
    state->failReads = 1;
    DetectionOutcome outcome = sniffer.sniff(channel, std::nullopt, cancel, "fake");
    ASSERT_EQ(outcome.kind, DetectionOutcome::Kind::Confirmed);
    EXPECT_EQ(outcome.baud, 9600);
    EXPECT_EQ(state->opens, 2);  // fixture open + one re-open
}

TEST_F(SnifferFixture, FailedReopenIsTransportError)
{
    state->failReads = 1;
    state->openError = ErrorKind::PermissionDenied;
    DetectionOutcome outcome = sniffer.sniff(channel, std::nullopt, cancel, "fake");
    EXPECT_EQ(outcome.kind, DetectionOutcome::Kind::TransportError);
    EXPECT_EQ(outcome.errorKind, ErrorKind::PermissionDenied);
}

TEST_F(SnifferFixture, CanceledBeforeStartDoesNoIo)
{
    cancel = true;
    DetectionOutcome outcome = sniffer.sniff(channel, std::nullopt, cancel, "fake");
    EXPECT_EQ(outcome.kind, DetectionOutcome::Kind::Canceled);
    EXPECT_FALSE(outcome.countsAsFailure());
    EXPECT_EQ(state->readCount(), 0);
}

TEST_F(SnifferFixture, InterruptedReadIsCanceled)
{
    channel.interrupt();
    DetectionOutcome outcome = sniffer.sniff(channel, std::nullopt, cancel, "fake");
    EXPECT_EQ(outcome.kind, DetectionOutcome::Kind::Canceled);
}

TEST_F(SnifferFixture, ConfirmSentencesAtFixedRate)
{
    state->goodBaud = 0;
    DetectionOutcome outcome = sniffer.confirmSentences(channel, cancel, "gpsd");
    EXPECT_EQ(outcome.kind, DetectionOutcome::Kind::Confirmed);
    EXPECT_TRUE(state->baudHistory().empty());
}

TEST_F(SnifferFixture, ConfirmSentencesTimeoutIsTransportError)
{
    state->mode = FakeMode::Silent;
    DetectionOutcome outcome = sniffer.confirmSentences(channel, cancel, "gpsd");
    EXPECT_EQ(outcome.kind, DetectionOutcome::Kind::TransportError);
}
