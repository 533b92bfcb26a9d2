#include "fdv/channel_rules.hpp"

#include "test_support.hpp"

#include <iostream>
#include <string>

using namespace fdv;

static MonitorGroup group_of(const std::string& header) {
  return classify_column(parse_column_header(header)).group;
}

int main() {
  try {
    // Units.
    assert(normalize_unit("MM") == "mm");
    assert(normalize_unit("metres") == "m");
    assert(normalize_unit("m/sec") == "m/s");
    assert(normalize_unit("mm/s") == "mm/s");
    assert(normalize_unit("LPS") == "l/s");
    assert(normalize_unit(u8"m³/s") == "m3/s");
    assert(normalize_unit("m^3/s") == "m3/s");
    assert(normalize_unit("mm/h") == "mm/hr");
    assert(normalize_unit("mm / hour") == "mm/hr");
    assert(normalize_unit("degC").empty());

    // Structured logger header.
    {
      const ColumnMetadata m = parse_column_header("4711_1|Depth|mm");
      assert(m.qualifier == "4711");
      assert(m.channel_number == "1");
      assert(m.unit == "mm");
      assert(m.label == "Depth");
    }
    {
      const ColumnMetadata m = parse_column_header("FM12_3|Velocity|m/s");
      assert(m.qualifier == "FM12");
      assert(m.label == "Velocity");
      assert(m.unit == "m/s");
    }

    // Bracketed and suffix units.
    {
      const ColumnMetadata a = parse_column_header("Velocity [m/s]");
      assert(a.label == "Velocity");
      assert(a.unit == "m/s");

      const ColumnMetadata b = parse_column_header("Depth (mm)");
      assert(b.label == "Depth");
      assert(b.unit == "mm");

      const ColumnMetadata c = parse_column_header("Depth_mm");
      assert(c.label == "Depth");
      assert(c.unit == "mm");

      const ColumnMetadata d = parse_column_header("Level");
      assert(d.label == "Level");
      assert(d.unit.empty());

      // Unknown bracket content is not a unit.
      const ColumnMetadata e = parse_column_header("Depth (sensor A)");
      assert(e.unit.empty());
      assert(e.label == "Depth (sensor A)");
    }

    // Classification.
    assert(group_of("4711_1|Depth|mm") == MonitorGroup::Depth);
    assert(group_of("Level") == MonitorGroup::Depth);
    assert(group_of("Velocity [m/s]") == MonitorGroup::Velocity);
    assert(group_of("Vel mm/s") == MonitorGroup::Velocity);
    assert(group_of("Rain (mm)") == MonitorGroup::Rainfall);
    assert(group_of("Rain Intensity (mm/hr)") == MonitorGroup::Rainfall);
    assert(group_of("Flow (l/s)") == MonitorGroup::Flow);
    assert(group_of("Temperature") == MonitorGroup::Unclassified);

    // Rainfall outranks depth when both keywords hit.
    {
      const ColumnClass c = classify_column(parse_column_header("Rainfall Depth (mm)"));
      assert(c.group == MonitorGroup::Rainfall);
      assert(c.score == 22);
      assert(!c.ambiguous);
    }

    // Scores: keyword 10, compatible unit +10, plus priority.
    assert(classify_column(parse_column_header("Depth (mm)")).score == 20);
    assert(classify_column(parse_column_header("Level")).score == 10);
    assert(classify_column(parse_column_header("Flow (l/s)")).score == 21);

    // Incompatible unit removes the match.
    assert(group_of("Depth (l/s)") == MonitorGroup::Unclassified);

    // Short keywords must be whole words.
    assert(group_of("Deposit") == MonitorGroup::Unclassified);
    assert(group_of("Dep") == MonitorGroup::Depth);

    // Equal scores in different groups are ambiguous.
    {
      const ColumnClass c = classify_column(parse_column_header("Level Velocity"));
      assert(c.ambiguous);
      assert(c.group == MonitorGroup::Depth);
      assert(c.rival == MonitorGroup::Velocity);
    }

    assert(is_timestamp_header("Date/Time", default_timestamp_keywords()));
    assert(is_timestamp_header("TIMESTAMP", default_timestamp_keywords()));
    assert(!is_timestamp_header("Depth", default_timestamp_keywords()));
    assert(std::string(monitor_group_name(MonitorGroup::Flow)) == "Flow");

    std::cout << "test_channel_rules: OK\n";
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "test_channel_rules failed: " << e.what() << "\n";
    return 1;
  }
}
