//
//  test_protocol.cpp
//  speech-io
//

#include <gtest/gtest.h>

#include <string>
#include <nlohmann/json.hpp>
#include "speech-io/speech/audio_normalizer.hpp"
#include "speech-io/speech/elevenlabs_protocol.hpp"
#include "speech-io/speech/recognizer.hpp"
#include "speech-io/speech/text_chunker.hpp"
#include "test_util.hpp"

using namespace sio::speech;
using sio::test::b64;

// =============================================================================
// TEXT CHUNKER
// =============================================================================

TEST(TextChunker, SplitsAfterPunctuation) {
  TextChunker chunker;
  auto chunks = chunker.split("Hello there, how are you? Fine.");

  ASSERT_EQ(chunks.size(), 3u);
  EXPECT_EQ(chunks[0], "Hello there, ");
  EXPECT_EQ(chunks[1], "how are you? ");
  EXPECT_EQ(chunks[2], "Fine. ");
}

TEST(TextChunker, TrailingTextWithoutPunctuation) {
  TextChunker chunker;
  auto chunks = chunker.split("  one   two\tthree ");

  ASSERT_EQ(chunks.size(), 1u);
  EXPECT_EQ(chunks[0], "one two three ");
}

TEST(TextChunker, RespectsMaxChars) {
  TextChunker chunker(10);
  auto chunks = chunker.split("aaaa bbbb cccc dddd");

  ASSERT_EQ(chunks.size(), 2u);
  EXPECT_EQ(chunks[0], "aaaa bbbb ");
  EXPECT_EQ(chunks[1], "cccc dddd ");
}

TEST(TextChunker, LongWordIsNeverCut) {
  TextChunker chunker(4);
  auto chunks = chunker.split("abcdefgh ij");

  ASSERT_EQ(chunks.size(), 2u);
  EXPECT_EQ(chunks[0], "abcdefgh ");
  EXPECT_EQ(chunks[1], "ij ");
}

TEST(TextChunker, EmptyInput) {
  TextChunker chunker;
  EXPECT_TRUE(chunker.split("").empty());
  EXPECT_TRUE(chunker.split("   ").empty());
}

TEST(TextChunker, EndsClause) {
  EXPECT_TRUE(TextChunker::ends_clause("word;"));
  EXPECT_TRUE(TextChunker::ends_clause("ok:"));
  EXPECT_FALSE(TextChunker::ends_clause("word"));
  EXPECT_FALSE(TextChunker::ends_clause(""));
}

// =============================================================================
// ELEVENLABS FRAMES
// =============================================================================

TEST(ElevenLabsMessage, Target) {
  auto target = ElevenLabsMessage::make_target("v1", "eleven_turbo_v2_5",
                                               ElevenLabsMessage::output_format(true));
  EXPECT_EQ(target,
            "/v1/text-to-speech/v1/stream-input?model_id=eleven_turbo_v2_5"
            "&output_format=ulaw_8000&inactivity_timeout=60");
  EXPECT_EQ(ElevenLabsMessage::output_format(false), "mp3_44100_128");
}

TEST(ElevenLabsMessage, BeginningOfStream) {
  auto j = nlohmann::json::parse(ElevenLabsMessage::make_bos("key", {}));

  EXPECT_EQ(j["text"], " ");
  EXPECT_EQ(j["xi_api_key"], "key");
  EXPECT_DOUBLE_EQ(j["voice_settings"]["stability"].get<double>(), 0.5);
  EXPECT_DOUBLE_EQ(j["voice_settings"]["similarity_boost"].get<double>(), 0.8);
}

TEST(ElevenLabsMessage, TextAndFlush) {
  auto text = nlohmann::json::parse(ElevenLabsMessage::make_text("Hi \"you\" "));
  EXPECT_EQ(text["text"], "Hi \"you\" ");
  EXPECT_FALSE(text.contains("flush"));

  auto flush = nlohmann::json::parse(ElevenLabsMessage::make_flush());
  EXPECT_EQ(flush["text"], "");
  EXPECT_EQ(flush["flush"], true);
}

TEST(ElevenLabsMessage, ParseAudio) {
  std::string raw("\x01\x02\x03\xff", 4);
  auto msg = ElevenLabsMessage::parse(R"({"audio":")" + b64(raw) + R"(","isFinal":true})");

  ASSERT_TRUE(msg.audio.has_value());
  EXPECT_EQ(*msg.audio, raw);
  EXPECT_TRUE(msg.is_final);
}

TEST(ElevenLabsMessage, ParseWithoutAudio) {
  auto msg = ElevenLabsMessage::parse(R"({"isFinal":null,"normalizedAlignment":{}})");
  EXPECT_FALSE(msg.audio.has_value());
  EXPECT_FALSE(msg.is_final);

  msg = ElevenLabsMessage::parse(R"({"audio":"","isFinal":true})");
  EXPECT_FALSE(msg.audio.has_value());
  EXPECT_TRUE(msg.is_final);
}

TEST(ElevenLabsMessage, MalformedFramesThrow) {
  EXPECT_ANY_THROW(ElevenLabsMessage::parse("not json"));
  EXPECT_ANY_THROW(ElevenLabsMessage::parse("[1,2]"));
  EXPECT_ANY_THROW(ElevenLabsMessage::parse(R"({"audio":"@@@@"})"));
}

// =============================================================================
// RECOGNIZER EVENTS
// =============================================================================

TEST(AudioStreamFormat, PerProvider) {
  auto twilio = AudioStreamFormat::for_provider("twilio");
  EXPECT_EQ(twilio.encoding, "mulaw");
  EXPECT_EQ(twilio.sampling_rate, 8000);
  EXPECT_EQ(twilio.bits_per_sample, 8);

  auto web = AudioStreamFormat::for_provider("web_based_call");
  EXPECT_EQ(web.encoding, "linear16");
  EXPECT_EQ(web.sampling_rate, 16000);

  auto plivo = AudioStreamFormat::for_provider("plivo");
  EXPECT_EQ(plivo.encoding, "linear16");
  EXPECT_EQ(plivo.sampling_rate, 8000);
  EXPECT_EQ(plivo.bits_per_sample, 16);
}

TEST(RecognitionEvent, DumpThenParse) {
  RecognitionEvent ev;
  ev.type = RecognitionEvent::Canceled;
  ev.session_id = "s";
  ev.reason = "EndOfStream";

  auto back = RecognitionEvent::parse(ev.dump());
  EXPECT_EQ(back.type, RecognitionEvent::Canceled);
  EXPECT_EQ(back.session_id, "s");
  EXPECT_EQ(back.reason, "EndOfStream");
}

TEST(RecognitionEvent, UnknownEventThrows) {
  EXPECT_ANY_THROW(RecognitionEvent::parse(R"({"event":"speech_start_detected"})"));
  EXPECT_ANY_THROW(RecognitionEvent::parse(R"({"text":"no event"})"));
}

// =============================================================================
// NORMALIZERS
// =============================================================================

TEST(PassthroughNormalizer, KeepsBytes) {
  PassthroughNormalizer norm("mulaw");
  std::string chunk("\x7f\x00\xff", 3);

  EXPECT_EQ(norm.format(), "mulaw");
  EXPECT_EQ(norm.normalize(chunk), chunk);
  EXPECT_EQ(norm.normalize_marker(std::string(1, '\0')), std::string(1, '\0'));
}

TEST(FFmpegNormalizer, MarkerIsWav) {
  FFmpegNormalizer norm(16000);
  auto wav = norm.normalize_marker(std::string(1, '\0'));

  EXPECT_EQ(norm.format(), "wav");
  ASSERT_GE(wav.size(), 46u);
  EXPECT_EQ(wav.substr(0, 4), "RIFF");
  EXPECT_EQ(wav.substr(8, 4), "WAVE");
  EXPECT_EQ(wav.substr(wav.size() - 2), std::string(2, '\0'));
}

TEST(FFmpegNormalizer, RejectsBadRate) {
  EXPECT_THROW(FFmpegNormalizer(0), std::invalid_argument);
}
