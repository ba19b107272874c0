/**
 * Unit tests for SessionSequencer
 *
 * Runs sessions against a recording fake port; delays are recorded,
 * not slept.
 */
#include <panoctl/command_message.h>
#include <panoctl/session_sequencer.h>

#include "../TestUtil.h"
#include <nlohmann/json.hpp>
#include <unity.h>

using json = nlohmann::json;

static std::shared_ptr<PortRecord> record;
static std::unique_ptr<FakeSerialPort> port;
static FakeTelemetrySource* telemetry;
static EventChannel* events;
static SleepLog* sleeps;

void setUp(void) {
  record = std::make_shared<PortRecord>();
  port.reset(new FakeSerialPort(record));
  telemetry = new FakeTelemetrySource();
  events = new EventChannel();
  sleeps = new SleepLog();
}

void tearDown(void) {
  port.reset();
  record.reset();
  delete telemetry;
  delete events;
  delete sleeps;
}

static std::vector<std::string> written_commands() {
  std::vector<std::string> names;
  for (const auto& frame : record->writes) {
    names.push_back(frame_command(frame));
  }
  return names;
}

static bool has_log(const std::vector<SessionEvent>& drained, const std::string& needle) {
  for (const auto& e : drained) {
    if (e.kind == SessionEvent::Kind::LOG && e.text.find(needle) != std::string::npos) return true;
  }
  return false;
}

void test_standard_session_command_order(void) {
  SessionSequencer sequencer(*port, *telemetry, *events, sleeps->sleeper());

  StepResult r = sequencer.run("2024-01-01_10-00-00-000.png", ScreenConfig());

  TEST_ASSERT_TRUE(r.success);
  std::vector<std::string> expected = {
      "all", "mediaDelete", "all", "waterBlockScreenId", "all", "all", "all", "all", "all",
  };
  std::vector<std::string> actual = written_commands();
  TEST_ASSERT_EQUAL(expected.size(), actual.size());
  for (size_t i = 0; i < expected.size(); i++) {
    TEST_ASSERT_EQUAL_STRING(expected[i].c_str(), actual[i].c_str());
  }
  TEST_ASSERT_EQUAL(9, sequencer.commands_sent());
  TEST_ASSERT_EQUAL(9, record->flushes);
  TEST_ASSERT_EQUAL(1, record->clears);
  TEST_ASSERT_EQUAL(7, telemetry->reads.load());
}

void test_standard_session_pacing(void) {
  SessionSequencer sequencer(*port, *telemetry, *events, sleeps->sleeper());
  sequencer.run("a.png", ScreenConfig());

  std::vector<long> expected = {500, 300, 300, 300, 800, 800, 800, 800, 800};
  TEST_ASSERT_EQUAL(expected.size(), sleeps->delays.size());
  for (size_t i = 0; i < expected.size(); i++) {
    TEST_ASSERT_EQUAL(expected[i], sleeps->delays[i].count());
  }
  TEST_ASSERT_EQUAL(5400, sleeps->total_ms());
}

void test_media_delete_excludes_new_file(void) {
  SessionSequencer sequencer(*port, *telemetry, *events, sleeps->sleeper());
  sequencer.run("new.gif", ScreenConfig());

  json body = json::parse(frame_body(record->writes[1]));
  TEST_ASSERT_TRUE(body == json::parse("{\"exclude\":[\"new.gif\"]}"));
}

void test_screen_config_body(void) {
  ScreenConfig config;
  config.ratio = "16:9";
  config.filter_opacity = 40;
  SessionSequencer sequencer(*port, *telemetry, *events, sleeps->sleeper());
  sequencer.run("new.gif", config);

  json body = json::parse(frame_body(record->writes[3]));
  TEST_ASSERT_EQUAL_STRING("Customization", body["id"].get<std::string>().c_str());
  TEST_ASSERT_EQUAL_STRING("16:9", body["ratio"].get<std::string>().c_str());
  TEST_ASSERT_EQUAL_STRING("new.gif", body["media"][0].get<std::string>().c_str());
  TEST_ASSERT_TRUE(body["settings"]["filter"]["value"].is_null());
  TEST_ASSERT_EQUAL(40, body["settings"]["filter"]["opacity"].get<int>());
  TEST_ASSERT_EQUAL(2, body["settings"]["badges"].size());
  TEST_ASSERT_EQUAL(2, body["sysinfoDisplay"].size());
}

void test_keepalive_carries_telemetry(void) {
  SessionSequencer sequencer(*port, *telemetry, *events, sleeps->sleeper());
  TEST_ASSERT_TRUE(sequencer.send_keepalive().success);

  json body = json::parse(frame_body(record->writes[0]));
  TEST_ASSERT_EQUAL(42, body["cpu"]["temperature"].get<int>());
  TEST_ASSERT_TRUE(body["cpu"].contains("speedAverage"));
  TEST_ASSERT_TRUE(body["disk"].contains("readSpeed"));
  TEST_ASSERT_TRUE(body["motherboard"].contains("pchTemperature"));
  TEST_ASSERT_TRUE(body["fans"].is_array());
}

void test_every_write_is_a_full_frame(void) {
  SessionSequencer sequencer(*port, *telemetry, *events, sleeps->sleeper());
  sequencer.run("a.png", ScreenConfig());

  for (const auto& frame : record->writes) {
    TEST_ASSERT_FALSE(frame_message(frame).empty());
  }
}

void test_failure_on_third_sustained_keepalive(void) {
  // 4 setup commands, then keepalives 1 and 2 succeed and 3 fails.
  port->fail_on_write = 7;
  SessionSequencer sequencer(*port, *telemetry, *events, sleeps->sleeper());

  StepResult r = sequencer.run("a.png", ScreenConfig());

  TEST_ASSERT_FALSE(r.success);
  TEST_ASSERT_EQUAL_STRING("Keepalive 3/5: Failed to send all: Input/output error", r.error.c_str());
  TEST_ASSERT_EQUAL(7, record->write_attempts);
  TEST_ASSERT_EQUAL(6, record->writes.size());
  TEST_ASSERT_EQUAL(7, sequencer.commands_sent());

  // no keepalive 4 or 5, and no pause after the failure
  TEST_ASSERT_EQUAL(7, sleeps->delays.size());
  TEST_ASSERT_FALSE(has_log(events->drain(), "All commands sent"));
}

void test_flush_failure_aborts(void) {
  port->fail_on_flush = 2;
  SessionSequencer sequencer(*port, *telemetry, *events, sleeps->sleeper());

  StepResult r = sequencer.run("a.png", ScreenConfig());

  TEST_ASSERT_FALSE(r.success);
  TEST_ASSERT_EQUAL_STRING("Media cleanup: Failed to flush mediaDelete: tcdrain failed", r.error.c_str());
  TEST_ASSERT_EQUAL(2, record->writes.size());
}

void test_clear_failure_is_ignored(void) {
  port->fail_clear = true;
  SessionSequencer sequencer(*port, *telemetry, *events, sleeps->sleeper());

  StepResult r = sequencer.run("a.png", ScreenConfig());

  TEST_ASSERT_TRUE(r.success);
  TEST_ASSERT_EQUAL(9, record->writes.size());
  TEST_ASSERT_TRUE(has_log(events->drain(), "Ignoring buffer clear failure"));
}

void test_progress_stays_in_range(void) {
  SessionSequencer sequencer(*port, *telemetry, *events, sleeps->sleeper());
  sequencer.run("a.png", ScreenConfig());

  float last = 0.5f;
  int updates = 0;
  for (const auto& e : events->drain()) {
    if (e.kind != SessionEvent::Kind::PROGRESS) continue;
    TEST_ASSERT_TRUE(e.progress > last);
    TEST_ASSERT_TRUE(e.progress <= 0.95f + 1e-6f);
    last = e.progress;
    updates++;
  }
  TEST_ASSERT_EQUAL(9, updates);
  TEST_ASSERT_FLOAT_WITHIN(1e-4f, 0.95f, last);
}

void test_send_logs_sizes(void) {
  SessionSequencer sequencer(*port, *telemetry, *events, sleeps->sleeper());
  sequencer.send_command("mediaDelete", json{{"exclude", json::array({"a.png"})}});

  std::vector<SessionEvent> drained = events->drain();
  TEST_ASSERT_EQUAL(1, drained.size());
  std::string expected = "Sending mediaDelete (21 bytes, frame: " +
                         std::to_string(record->writes[0].size()) + " bytes)";
  TEST_ASSERT_EQUAL_STRING(expected.c_str(), drained[0].text.c_str());
}

void test_verbose_logs_hex(void) {
  SessionSequencer sequencer(*port, *telemetry, *events, sleeps->sleeper());
  sequencer.set_verbose(true);
  sequencer.send_command("all", json::object());

  std::vector<SessionEvent> drained = events->drain();
  TEST_ASSERT_EQUAL(2, drained.size());
  TEST_ASSERT_TRUE(drained[1].text.rfind("Frame hex: 5a00", 0) == 0);
}

void test_legacy_session(void) {
  SessionSequencer sequencer(*port, *telemetry, *events, sleeps->sleeper());

  StepResult r = sequencer.run_legacy("b.jpg", 1234, "0123456789abcdef0123456789abcdef", ScreenConfig());

  TEST_ASSERT_TRUE(r.success);
  std::vector<std::string> actual = written_commands();
  TEST_ASSERT_EQUAL(3, actual.size());
  TEST_ASSERT_EQUAL_STRING("transport", actual[0].c_str());
  TEST_ASSERT_EQUAL_STRING("transported", actual[1].c_str());
  TEST_ASSERT_EQUAL_STRING("waterBlockScreenId", actual[2].c_str());

  json announce = json::parse(frame_body(record->writes[0]));
  TEST_ASSERT_EQUAL_STRING("media", announce["type"].get<std::string>().c_str());
  TEST_ASSERT_EQUAL(1234, announce["fileSize"].get<int>());
  TEST_ASSERT_EQUAL_STRING("b.jpg", announce["fileName"].get<std::string>().c_str());

  json confirm = json::parse(frame_body(record->writes[1]));
  TEST_ASSERT_EQUAL_STRING("0123456789abcdef0123456789abcdef", confirm["md5"].get<std::string>().c_str());

  std::vector<long> expected = {500, 300, 300, 500};
  TEST_ASSERT_EQUAL(expected.size(), sleeps->delays.size());
  for (size_t i = 0; i < expected.size(); i++) {
    TEST_ASSERT_EQUAL(expected[i], sleeps->delays[i].count());
  }
  TEST_ASSERT_EQUAL(0, telemetry->reads.load());
}

void test_legacy_failure_stops(void) {
  port->fail_on_write = 2;
  SessionSequencer sequencer(*port, *telemetry, *events, sleeps->sleeper());

  StepResult r = sequencer.run_legacy("b.jpg", 1, "00", ScreenConfig());

  TEST_ASSERT_FALSE(r.success);
  TEST_ASSERT_TRUE(r.error.rfind("Transfer confirmation: ", 0) == 0);
  TEST_ASSERT_EQUAL(2, record->write_attempts);
}

int main(void) {
  UNITY_BEGIN();

  // standard flow
  RUN_TEST(test_standard_session_command_order);
  RUN_TEST(test_standard_session_pacing);
  RUN_TEST(test_media_delete_excludes_new_file);
  RUN_TEST(test_screen_config_body);
  RUN_TEST(test_keepalive_carries_telemetry);
  RUN_TEST(test_every_write_is_a_full_frame);
  RUN_TEST(test_progress_stays_in_range);

  // failures
  RUN_TEST(test_failure_on_third_sustained_keepalive);
  RUN_TEST(test_flush_failure_aborts);
  RUN_TEST(test_clear_failure_is_ignored);

  // logging
  RUN_TEST(test_send_logs_sizes);
  RUN_TEST(test_verbose_logs_hex);

  // legacy flow
  RUN_TEST(test_legacy_session);
  RUN_TEST(test_legacy_failure_stops);

  return UNITY_END();
}
