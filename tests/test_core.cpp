//
//  test_core.cpp
//  speech-io
//

#include <gtest/gtest.h>

#include <string>
#include <vector>
#include <boost/asio.hpp>
#include <nlohmann/json.hpp>
#include "speech-io/core/cache.hpp"
#include "speech-io/core/channel.hpp"
#include "speech-io/core/correlation_queue.hpp"
#include "speech-io/core/metadata.hpp"
#include "speech-io/core/result.hpp"
#include "speech-io/utils/log.hpp"

using namespace sio::core;

namespace {

Metadata make_meta(const std::string& id) {
  Metadata m;
  m.request_id = id;
  return m;
}

}  // namespace

// =============================================================================
// CORRELATION QUEUE
// =============================================================================

TEST(CorrelationQueue, DequeueFollowsEnqueueOrder) {
  CorrelationQueue q;
  q.enqueue(make_meta("a"));
  q.enqueue(make_meta("b"));
  q.enqueue(make_meta("c"));

  EXPECT_EQ(q.size(), 3u);
  EXPECT_EQ(q.dequeue()->request_id, "a");
  EXPECT_EQ(q.dequeue()->request_id, "b");
  EXPECT_EQ(q.dequeue()->request_id, "c");
  EXPECT_TRUE(q.empty());
}

TEST(CorrelationQueue, DequeueEmptyReturnsNothing) {
  CorrelationQueue q;
  EXPECT_FALSE(q.dequeue().has_value());
}

TEST(CorrelationQueue, ClearKeepsTotal) {
  CorrelationQueue q;
  const auto m = make_meta("x");
  q.enqueue(m);
  q.enqueue(make_meta("y"));
  q.clear();

  EXPECT_TRUE(q.empty());
  EXPECT_EQ(q.total_enqueued(), 2u);
  EXPECT_FALSE(q.dequeue().has_value());
}

// =============================================================================
// CHANNEL
// =============================================================================

TEST(Channel, BufferedValuesArePoppedInOrder) {
  boost::asio::io_context io;
  Channel<int> ch(io.get_executor());
  std::vector<int> got;

  ch.push(1);
  ch.push(2);
  EXPECT_EQ(ch.size(), 2u);

  ch.async_pop([&](boost::system::error_code ec, int v) {
    EXPECT_FALSE(ec);
    got.push_back(v);
  });
  ch.async_pop([&](boost::system::error_code ec, int v) {
    EXPECT_FALSE(ec);
    got.push_back(v);
  });

  // completions are posted, never inline
  EXPECT_TRUE(got.empty());
  io.run();

  ASSERT_EQ(got.size(), 2u);
  EXPECT_EQ(got[0], 1);
  EXPECT_EQ(got[1], 2);
}

TEST(Channel, WaiterGetsNextPush) {
  boost::asio::io_context io;
  Channel<std::string> ch(io.get_executor());
  std::string got;

  ch.async_pop([&](boost::system::error_code ec, std::string v) {
    EXPECT_FALSE(ec);
    got = v;
  });
  EXPECT_TRUE(ch.has_waiter());

  ch.push("hello");
  EXPECT_FALSE(ch.has_waiter());
  io.run();

  EXPECT_EQ(got, "hello");
}

TEST(Channel, SecondWaiterIsRejected) {
  boost::asio::io_context io;
  Channel<int> ch(io.get_executor());
  boost::system::error_code second;

  ch.async_pop([](boost::system::error_code, int) { });
  ch.async_pop([&](boost::system::error_code ec, int) { second = ec; });
  io.poll();

  EXPECT_EQ(second, boost::asio::error::in_progress);
}

TEST(Channel, CloseAbortsWaiterAndDropsValues) {
  boost::asio::io_context io;
  Channel<int> ch(io.get_executor());
  boost::system::error_code first, later;

  ch.async_pop([&](boost::system::error_code ec, int) { first = ec; });
  ch.close();
  ch.push(5);
  ch.async_pop([&](boost::system::error_code ec, int) { later = ec; });
  io.run();

  EXPECT_TRUE(ch.is_closed());
  EXPECT_EQ(ch.size(), 0u);
  EXPECT_EQ(first, boost::asio::error::operation_aborted);
  EXPECT_EQ(later, boost::asio::error::operation_aborted);
}

TEST(Channel, CloseCanKeepBufferedValues) {
  boost::asio::io_context io;
  Channel<int> ch(io.get_executor());
  std::vector<int> got;
  boost::system::error_code last;

  ch.push(1);
  ch.close(true);
  ch.push(2);
  ch.async_pop([&](boost::system::error_code ec, int v) {
    EXPECT_FALSE(ec);
    got.push_back(v);
  });
  io.run();
  ch.async_pop([&](boost::system::error_code ec, int) { last = ec; });
  io.restart();
  io.run();

  ASSERT_EQ(got.size(), 1u);
  EXPECT_EQ(got[0], 1);
  EXPECT_EQ(last, boost::asio::error::operation_aborted);
}

// =============================================================================
// METADATA / RESULTS
// =============================================================================

TEST(Metadata, FromJsonKeepsUnknownKeys) {
  auto j = nlohmann::json::parse(R"({
    "request_id": "r1",
    "sequence_id": 4,
    "end_of_llm_stream": true,
    "turn": 7,
    "channel": "phone"
  })");

  auto m = Metadata::from_json(j);
  EXPECT_EQ(m.request_id, "r1");
  EXPECT_EQ(m.sequence_id, 4u);
  EXPECT_TRUE(m.end_of_upstream);
  EXPECT_FALSE(m.eos);
  EXPECT_EQ(m.extra["turn"], 7);
  EXPECT_EQ(m.extra["channel"], "phone");
  EXPECT_FALSE(m.extra.contains("request_id"));
}

TEST(Metadata, ToJsonUsesWireNames) {
  Metadata m;
  m.request_id = "r2";
  m.format = "wav";
  m.is_first_chunk = true;
  m.end_of_stream = true;
  m.extra["turn"] = 1;

  auto j = m.to_json();
  EXPECT_EQ(j["request_id"], "r2");
  EXPECT_EQ(j["format"], "wav");
  EXPECT_EQ(j["is_first_chunk"], true);
  EXPECT_EQ(j["end_of_synthesizer_stream"], true);
  EXPECT_EQ(j["end_of_llm_stream"], false);
  EXPECT_EQ(j["turn"], 1);
  EXPECT_FALSE(j.contains("eos"));
}

TEST(Metadata, FromJsonNonObjectGivesDefaults) {
  auto m = Metadata::from_json(nlohmann::json::array());
  EXPECT_TRUE(m.request_id.empty());
  EXPECT_EQ(m.sequence_id, 0u);
}

TEST(Metadata, FromJsonRejectsMistypedKnownKey) {
  auto j = nlohmann::json::parse(R"({"request_id": 12, "turn": 1})");
  EXPECT_THROW(Metadata::from_json(j), nlohmann::json::type_error);
}

TEST(SpeechResult, TypeNames) {
  EXPECT_STREQ(to_string(ResultType::Audio), "audio");
  EXPECT_STREQ(to_string(ResultType::InterimTranscript), "interim_transcript_received");
  EXPECT_STREQ(to_string(ResultType::Transcript), "transcript");
  EXPECT_STREQ(to_string(ResultType::ConnectionClosed), "transcriber_connection_closed");
}

// =============================================================================
// CACHE
// =============================================================================

TEST(InMemoryCache, GetMissingReturnsNothing) {
  InMemoryCache cache;
  EXPECT_FALSE(cache.get("nope").has_value());
}

TEST(InMemoryCache, SetOverwrites) {
  InMemoryCache cache;
  cache.set("k", "one");
  cache.set("k", "two");

  EXPECT_EQ(cache.size(), 1u);
  EXPECT_EQ(*cache.get("k"), "two");
}

TEST(CacheKey, DependsOnEveryField) {
  auto base = make_cache_key("hi", "voice", "model", "wav");

  EXPECT_EQ(base, make_cache_key("hi", "voice", "model", "wav"));
  EXPECT_NE(base, make_cache_key("hi!", "voice", "model", "wav"));
  EXPECT_NE(base, make_cache_key("hi", "other", "model", "wav"));
  EXPECT_NE(base, make_cache_key("hi", "voice", "other", "wav"));
  EXPECT_NE(base, make_cache_key("hi", "voice", "model", "mulaw"));
}

// =============================================================================
// LOGGING
// =============================================================================

TEST(Log, SameNameSameLogger) {
  auto a = sio::utils::get_logger("core-test");
  auto b = sio::utils::get_logger("core-test");
  EXPECT_EQ(a.get(), b.get());
}

TEST(Log, LevelAppliesToExistingAndNewLoggers) {
  auto before = sio::utils::get_logger("core-test-before");
  sio::utils::set_log_level("debug");
  auto after = sio::utils::get_logger("core-test-after");

  EXPECT_EQ(before->level(), spdlog::level::debug);
  EXPECT_EQ(after->level(), spdlog::level::debug);

  sio::utils::set_log_level(spdlog::level::info);
  EXPECT_EQ(before->level(), spdlog::level::info);
}
