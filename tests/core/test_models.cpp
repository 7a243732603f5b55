// test_models.cpp — UsageWindow, UsageSnapshot, ConnectedDevice и timestamps

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "meterlink/Models.h"
#include "meterlink/Types.h"

using namespace MeterLink;
using json = nlohmann::json;
using namespace std::chrono_literals;

namespace {

// JSON хранит миллисекунды: сравниваем только округлённые моменты
Timestamp nowMillis() {
    return std::chrono::time_point_cast<std::chrono::milliseconds>(SystemClock::now());
}

UsageWindow makeWindow(double utilization, std::chrono::seconds remaining,
                       UsageWindowType type, Timestamp now) {
    UsageWindow w;
    w.utilization = utilization;
    w.resetsAt = now + remaining;
    w.windowType = type;
    return w;
}

} // namespace

// ═══════════════════════════════════════════════════════════
// Timestamps
// ═══════════════════════════════════════════════════════════

TEST(TimestampTest, FormatsIso8601WithMillis) {
    auto ts = Timestamp(std::chrono::milliseconds(1700000000123LL));
    EXPECT_EQ(formatTimestamp(ts), "2023-11-14T22:13:20.123Z");
}

TEST(TimestampTest, ParsesWithAndWithoutFraction) {
    auto withFraction = parseTimestamp("2023-11-14T22:13:20.123Z");
    ASSERT_TRUE(withFraction.has_value());
    EXPECT_EQ(*withFraction, Timestamp(std::chrono::milliseconds(1700000000123LL)));

    auto plain = parseTimestamp("2023-11-14T22:13:20Z");
    ASSERT_TRUE(plain.has_value());
    EXPECT_EQ(*plain, Timestamp(std::chrono::seconds(1700000000LL)));
}

TEST(TimestampTest, AppliesZoneOffset) {
    auto ts = parseTimestamp("2023-11-15T00:13:20+02:00");
    ASSERT_TRUE(ts.has_value());
    EXPECT_EQ(*ts, Timestamp(std::chrono::seconds(1700000000LL)));
}

TEST(TimestampTest, RejectsGarbage) {
    EXPECT_FALSE(parseTimestamp("").has_value());
    EXPECT_FALSE(parseTimestamp("yesterday").has_value());
    EXPECT_FALSE(parseTimestamp("2023-13-14T22:13:20Z").has_value());
    EXPECT_FALSE(parseTimestamp("2023-11-14T22:13:20Zjunk").has_value());
}

TEST(TimestampTest, RejectsImpossibleDates) {
    EXPECT_FALSE(parseTimestamp("2030-02-31T00:00:00Z").has_value());
    EXPECT_FALSE(parseTimestamp("2023-02-29T00:00:00Z").has_value());
    EXPECT_FALSE(parseTimestamp("2023-04-31T12:00:00Z").has_value());
    EXPECT_FALSE(parseTimestamp("2100-02-29T00:00:00Z").has_value());
    EXPECT_FALSE(parseTimestamp("2023-11-00T00:00:00Z").has_value());

    EXPECT_TRUE(parseTimestamp("2024-02-29T00:00:00Z").has_value());
    EXPECT_TRUE(parseTimestamp("2000-02-29T00:00:00Z").has_value());
    EXPECT_TRUE(parseTimestamp("2023-12-31T23:59:59Z").has_value());
}

TEST(TimestampTest, RejectsSignsAndPadding) {
    EXPECT_FALSE(parseTimestamp("+2023-11-14T22:13:20Z").has_value());
    EXPECT_FALSE(parseTimestamp("-2023-11-14T22:13:20Z").has_value());
    EXPECT_FALSE(parseTimestamp(" 2023-11-14T22:13:20Z").has_value());
    EXPECT_FALSE(parseTimestamp("2023-+1-14T22:13:20Z").has_value());
    EXPECT_FALSE(parseTimestamp("2023-11- 4T22:13:20Z").has_value());
    EXPECT_FALSE(parseTimestamp("2023-11-14T22:-3:20Z").has_value());
}

TEST(TimestampTest, FormatParseRoundTripAtMillisecondPrecision) {
    auto now = nowMillis();
    auto parsed = parseTimestamp(formatTimestamp(now));
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, now);
}

// ═══════════════════════════════════════════════════════════
// UsageWindow
// ═══════════════════════════════════════════════════════════

TEST(UsageWindowTest, PercentAndLimit) {
    UsageWindow w;
    w.utilization = 42.7;
    EXPECT_EQ(w.percentUsed(), 42);
    EXPECT_FALSE(w.isAtLimit());
    EXPECT_DOUBLE_EQ(w.normalized(), 0.427);

    w.utilization = 100.0;
    EXPECT_TRUE(w.isAtLimit());

    w.utilization = 130.0;
    EXPECT_DOUBLE_EQ(w.normalized(), 1.0);
}

TEST(UsageWindowTest, WindowDurations) {
    EXPECT_EQ(usageWindowDuration(UsageWindowType::Session), std::chrono::hours(5));
    EXPECT_EQ(usageWindowDuration(UsageWindowType::Opus), std::chrono::hours(168));
    EXPECT_EQ(usageWindowDuration(UsageWindowType::Sonnet), std::chrono::hours(168));
}

TEST(UsageWindowTest, AbsoluteThresholdsWin) {
    auto now = SystemClock::now();
    // Окно только началось: темп не важен при высоком использовании
    EXPECT_EQ(makeWindow(95, 5h - 1min, UsageWindowType::Session, now).status(now),
              UsageStatus::Critical);
    EXPECT_EQ(makeWindow(80, 5h - 1min, UsageWindowType::Session, now).status(now),
              UsageStatus::Warning);
}

TEST(UsageWindowTest, PaceBasedStatus) {
    auto now = SystemClock::now();
    // Прошла половина окна: ожидается 50%
    EXPECT_EQ(makeWindow(55, 150min, UsageWindowType::Session, now).status(now),
              UsageStatus::OnTrack);
    EXPECT_EQ(makeWindow(70, 150min, UsageWindowType::Session, now).status(now),
              UsageStatus::Warning);

    // Прошла десятая часть окна, ожидается 10%
    EXPECT_EQ(makeWindow(40, 270min, UsageWindowType::Session, now).status(now),
              UsageStatus::Critical);
}

TEST(UsageWindowTest, ExpiredWindowIsOnTrack) {
    auto now = SystemClock::now();
    EXPECT_EQ(makeWindow(99, -1min, UsageWindowType::Opus, now).status(now),
              UsageStatus::OnTrack);
}

TEST(UsageWindowTest, StatusNames) {
    EXPECT_STREQ(usageStatusToString(UsageStatus::OnTrack), "onTrack");
    EXPECT_STREQ(usageStatusToString(UsageStatus::Warning), "warning");
    EXPECT_STREQ(usageStatusToString(UsageStatus::Critical), "critical");
}

// ═══════════════════════════════════════════════════════════
// UsageSnapshot
// ═══════════════════════════════════════════════════════════

TEST(UsageSnapshotTest, JsonRoundTripWithOptionalSonnet) {
    auto now = nowMillis();

    UsageSnapshot s;
    s.session = makeWindow(12.5, 3h, UsageWindowType::Session, now);
    s.opus = makeWindow(40.0, 72h, UsageWindowType::Opus, now);
    s.fetchedAt = now;

    auto without = UsageSnapshot::fromJson(s.toJson());
    ASSERT_TRUE(without.has_value());
    EXPECT_EQ(*without, s);
    EXPECT_FALSE(without->sonnet.has_value());

    s.sonnet = makeWindow(5.0, 100h, UsageWindowType::Sonnet, now);
    auto with = UsageSnapshot::fromJson(s.toJson());
    ASSERT_TRUE(with.has_value());
    EXPECT_EQ(*with, s);
}

TEST(UsageSnapshotTest, OverallStatusIsWorstWindow) {
    auto now = SystemClock::now();

    UsageSnapshot s;
    s.session = makeWindow(20, 4h, UsageWindowType::Session, now);
    s.opus = makeWindow(10, 160h, UsageWindowType::Opus, now);
    EXPECT_EQ(s.overallStatus(now), UsageStatus::OnTrack);

    s.opus.utilization = 80;
    EXPECT_EQ(s.overallStatus(now), UsageStatus::Warning);

    // sonnet учитывается, только если есть
    s.sonnet = makeWindow(95, 100h, UsageWindowType::Sonnet, now);
    EXPECT_EQ(s.overallStatus(now), UsageStatus::Critical);

    s.sonnet.reset();
    s.session.utilization = 92;
    EXPECT_EQ(s.overallStatus(now), UsageStatus::Critical);
}

TEST(UsageSnapshotTest, FieldNames) {
    UsageSnapshot s;
    s.session.windowType = UsageWindowType::Session;
    s.opus.windowType = UsageWindowType::Opus;

    auto j = json::parse(s.toJson());
    EXPECT_TRUE(j.contains("session"));
    EXPECT_TRUE(j.contains("opus"));
    EXPECT_TRUE(j.contains("fetchedAt"));
    EXPECT_FALSE(j.contains("sonnet"));
    EXPECT_EQ(j["opus"]["windowType"], "opus");
    EXPECT_TRUE(j["session"].contains("utilization"));
    EXPECT_TRUE(j["session"].contains("resetsAt"));
}

TEST(UsageSnapshotTest, RejectsMalformed) {
    EXPECT_FALSE(UsageSnapshot::fromJson("not json").has_value());
    EXPECT_FALSE(UsageSnapshot::fromJson("{}").has_value());
    EXPECT_FALSE(UsageSnapshot::fromJson(R"({"session": {}, "opus": {}, "fetchedAt": "x"})").has_value());
}

// ═══════════════════════════════════════════════════════════
// ConnectedDevice
// ═══════════════════════════════════════════════════════════

TEST(ConnectedDeviceTest, JsonRoundTrip) {
    ConnectedDevice d;
    d.id = "c0ffee";
    d.name = "Pixel 8";
    d.address = "192.168.1.20:51234";
    d.connectedAt = nowMillis();

    auto parsed = ConnectedDevice::fromJson(d.toJson());
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->id, d.id);
    EXPECT_EQ(parsed->name, d.name);
    EXPECT_EQ(parsed->address, d.address);
    EXPECT_EQ(parsed->connectedAt, d.connectedAt);
}
