#include "fdv/classifier.hpp"
#include "fdv/errors.hpp"
#include "fdv/session.hpp"

#include "test_support.hpp"

#include <iostream>
#include <string>

using namespace fdv;

static ClassifiedFile sample_file() {
  TableReaderOptions ropts;
  ropts.header_keywords = default_timestamp_keywords();
  const std::string text =
    "Time,Depth (mm)\n"
    "2024-05-01 00:00,10\n"
    "2024-05-01 00:15,11\n"
    "2024-05-01 00:30,12\n";
  return classify(parse_table(text, "SW3.csv", ropts));
}

template <class F>
static bool throws_code(F&& fn, ErrorCode code) {
  try {
    fn();
  } catch (const ValidationError& e) {
    return e.code() == code;
  }
  return false;
}

int main() {
  try {
    DiagnosticsChannel diag;
    Session s(&diag);
    assert(!s.has_file());
    assert(throws_code([&]() { (void)s.file(); }, ErrorCode::NoFileLoaded));
    assert(throws_code([&]() { (void)s.update_site_id("X"); }, ErrorCode::NoFileLoaded));

    s.load(sample_file());
    assert(s.has_file());
    assert(s.identity().site_id == "SW3");
    assert(s.identity().start_timestamp == make_timestamp(2024, 5, 1, 0, 0));
    assert(s.identity().end_timestamp == make_timestamp(2024, 5, 1, 0, 30));

    // Updates keep the file's mirrored fields in sync.
    s.update_site_id("  SW3A ");
    assert(s.identity().site_id == "SW3A");
    assert(s.file().site_id == "SW3A");
    s.update_site_name("High Street");
    assert(s.file().site_name == "High Street");

    assert(throws_code([&]() { (void)s.update_site_id("   "); }, ErrorCode::EmptyField));
    assert(throws_code([&]() { (void)s.update_site_name(""); }, ErrorCode::EmptyField));
    assert(s.identity().site_id == "SW3A");

    // Time window.
    s.update_timestamps("2024-05-01 00:15:00", "2024-05-01T00:30");
    assert(s.identity().start_timestamp == make_timestamp(2024, 5, 1, 0, 15));
    assert(s.file().start_timestamp == make_timestamp(2024, 5, 1, 0, 15));

    assert(throws_code([&]() { (void)s.update_timestamps("2024-05-01 00:30", "2024-05-01 00:00"); },
                       ErrorCode::InvalidTimeRange));
    assert(throws_code([&]() { (void)s.update_timestamps("yesterday", "2024-05-01 00:00"); },
                       ErrorCode::InvalidTimestamp));
    assert(s.identity().start_timestamp == make_timestamp(2024, 5, 1, 0, 15));

    // A window too long for the sampling interval is refused and leaves the identity alone.
    assert(throws_code([&]() { (void)s.update_timestamps("0001-01-01 00:00", "9999-12-31 23:59"); },
                       ErrorCode::InvalidTimeRange));
    assert(s.identity().start_timestamp == make_timestamp(2024, 5, 1, 0, 15));
    assert(s.identity().end_timestamp == make_timestamp(2024, 5, 1, 0, 30));

    // A window beyond the data is kept but warned about.
    const size_t before = diag.size();
    s.update_timestamps(make_timestamp(2024, 4, 30), make_timestamp(2024, 5, 2));
    assert(s.identity().start_timestamp == make_timestamp(2024, 4, 30));
    const auto tail = diag.drain_since(before);
    assert(tail.size() == 1);
    assert(tail[0].level == LogLevel::Warn);

    // Loading again replaces everything.
    s.load(sample_file());
    assert(s.identity().site_id == "SW3");
    assert(s.identity().start_timestamp == make_timestamp(2024, 5, 1, 0, 0));

    s.reset();
    assert(!s.has_file());
    assert(throws_code([&]() { (void)s.identity(); }, ErrorCode::NoFileLoaded));

    std::cout << "test_session: OK\n";
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "test_session failed: " << e.what() << "\n";
    return 1;
  }
}
