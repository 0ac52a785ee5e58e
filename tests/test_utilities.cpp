// Tests for replacement rules, transcript history, the worker log buffer
// and the JSON helpers

#include "replacement_rules.hpp"
#include "transcript_history.hpp"
#include "log_buffer.hpp"
#include "json_util.hpp"
#include <iostream>
#include <cassert>
#include <limits>

using namespace voxbridge;

void test_rule_parsing() {
    std::cout << "Testing replacement rule parsing..." << std::endl;

    auto rules = ReplacementRuleLoader::parse(
        "# comment\n"
        "\n"
        "btw => by the way\n"
        "=teh => the\n"
        "re:\\bcolon\\b => :\n"
        "no arrow here\n"
        " => nothing\n"
        "re:([unclosed => x\n"
        "  gonna   =>   going to  \n");

    assert(rules.size() == 4);

    assert(rules[0].id == "rule-3");
    assert(rules[0].kind == "literal");
    assert(rules[0].pattern == "btw");
    assert(rules[0].replacement == "by the way");
    assert(rules[0].word_boundary);
    assert(!rules[0].case_sensitive);

    assert(rules[1].pattern == "teh");
    assert(rules[1].case_sensitive);
    assert(!rules[1].word_boundary);

    assert(rules[2].kind == "regex");
    assert(rules[2].pattern == "\\bcolon\\b");
    assert(rules[2].replacement == ":");
    assert(!rules[2].word_boundary);

    // Whitespace around both sides is trimmed
    assert(rules[3].id == "rule-9");
    assert(rules[3].pattern == "gonna");
    assert(rules[3].replacement == "going to");

    std::cout << "  PASS" << std::endl;
}

void test_rule_params() {
    std::cout << "Testing replacements.set_rules params..." << std::endl;

    auto rules = ReplacementRuleLoader::parse("btw => by the way\n");
    Json::Value params = ReplacementRuleLoader::to_params(rules);
    assert(params["rules"].isArray());
    assert(params["rules"].size() == 1);

    const Json::Value& rule = params["rules"][0];
    assert(rule["id"].asString() == "rule-1");
    assert(rule["kind"].asString() == "literal");
    assert(rule["enabled"].asBool());
    assert(rule["word_boundary"].asBool());
    assert(!rule["case_sensitive"].asBool());

    Json::Value empty = ReplacementRuleLoader::to_params({});
    assert(empty["rules"].isArray() && empty["rules"].empty());

    assert(ReplacementRuleLoader::load_from_file("/nonexistent/voxbridge/rules.txt").empty());

    std::cout << "  PASS" << std::endl;
}

static TranscriptEntry entry(const std::string& id, const std::string& text) {
    TranscriptEntry e;
    e.session_id = id;
    e.text = text;
    e.timestamp = std::chrono::system_clock::now();
    e.injection = "pending";
    return e;
}

void test_history() {
    std::cout << "Testing transcript history..." << std::endl;

    TranscriptHistory history(3);
    assert(!history.last().has_value());

    history.add(entry("a", "one"));
    history.add(entry("b", "two"));
    history.add(entry("c", "three"));
    history.add(entry("d", "four"));
    assert(history.size() == 3);

    auto all = history.entries();
    assert(all[0].session_id == "d");
    assert(all[2].session_id == "b");
    assert(history.last()->text == "four");

    assert(history.set_outcome("c", "clipboard_only", "Focus changed"));
    assert(!history.set_outcome("a", "injected", ""));
    all = history.entries();
    assert(all[1].injection == "clipboard_only");
    assert(all[1].warning == "Focus changed");

    history.resize(1);
    assert(history.size() == 1);
    assert(history.last()->session_id == "d");

    history.resize(0);
    assert(history.max_size() == 1);

    history.clear();
    assert(history.size() == 0);

    std::cout << "  PASS" << std::endl;
}

void test_log_buffer_limits() {
    std::cout << "Testing worker log buffer limits..." << std::endl;

    LogBuffer lines(3, 1024);
    for (int i = 1; i <= 5; ++i) {
        lines.append("line " + std::to_string(i));
    }
    auto kept = lines.lines();
    assert(kept.size() == 3);
    assert(kept[0] == "line 3");
    assert(kept[2] == "line 5");

    auto tail = lines.tail(2);
    assert(tail.size() == 2 && tail[0] == "line 4");
    assert(lines.tail(10).size() == 3);

    // Byte limit evicts even under the line limit
    LogBuffer bytes(100, 10);
    bytes.append("abcd");
    bytes.append("efgh");
    bytes.append("ijkl");
    assert(bytes.size() == 2);
    assert(bytes.bytes() == 8);
    assert(bytes.lines()[0] == "efgh");

    // A single oversized line is truncated, not dropped
    bytes.append(std::string(50, 'x'));
    assert(bytes.size() == 1);
    assert(bytes.bytes() == 10);

    bytes.clear();
    assert(bytes.size() == 0 && bytes.bytes() == 0);

    std::cout << "  PASS" << std::endl;
}

void test_json_helpers() {
    std::cout << "Testing JSON helpers..." << std::endl;

    Json::Value v(Json::objectValue);
    v["text"] = "line one\nline two";
    v["n"] = 42;
    std::string line = to_json_line(v);
    assert(line.find('\n') == std::string::npos);

    Json::Value back;
    assert(parse_json(line, back));
    assert(json_string(back, "text") == "line one\nline two");
    assert(json_int(back, "n") == 42);
    assert(json_double(back, "n") == 42.0);

    // Missing or mistyped members fall back
    assert(json_string(back, "n", "none") == "none");
    assert(json_int(back, "text", -1) == -1);
    assert(json_bool(back, "missing", true));
    assert(json_string(Json::Value("scalar"), "text") == "");

    // Out-of-range numbers saturate instead of wrapping
    Json::Value numbers(Json::objectValue);
    numbers["huge"] = Json::UInt64(18446744073709551615ULL);
    numbers["big_real"] = 1e30;
    numbers["small_real"] = -1e30;
    numbers["inf"] = std::numeric_limits<double>::infinity();
    numbers["nan"] = std::numeric_limits<double>::quiet_NaN();
    numbers["frac"] = 2.9;
    assert(json_int(numbers, "huge") == std::numeric_limits<int64_t>::max());
    assert(json_int(numbers, "big_real") == std::numeric_limits<int64_t>::max());
    assert(json_int(numbers, "small_real") == std::numeric_limits<int64_t>::min());
    assert(json_int(numbers, "inf") == std::numeric_limits<int64_t>::max());
    assert(json_int(numbers, "nan", -5) == -5);
    assert(json_int(numbers, "frac") == 2);

    std::string error;
    Json::Value untouched(7);
    assert(!parse_json("{\"open\": ", untouched, &error));
    assert(!error.empty());
    assert(untouched.asInt() == 7);

    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "\n=== Utilities Test Suite ===" << std::endl << std::endl;

    test_rule_parsing();
    test_rule_params();
    test_history();
    test_log_buffer_limits();
    test_json_helpers();

    std::cout << "\n=== All Tests Passed! ===" << std::endl << std::endl;
    return 0;
}
