// Tests for LineFramer and FramedTransport

#include "framed_transport.hpp"
#include <iostream>
#include <cassert>
#include <cstring>
#include <unistd.h>

using namespace voxbridge;

static bool feed(LineFramer& framer, const std::string& data, std::vector<std::string>& out) {
    return framer.feed(data.data(), data.size(), out);
}

void test_partial_lines() {
    std::cout << "Testing lines split across reads..." << std::endl;

    LineFramer framer;
    std::vector<std::string> lines;

    assert(feed(framer, "{\"id\":1,", lines));
    assert(lines.empty());
    assert(framer.buffered() == 8);

    assert(feed(framer, "\"result\":{}}\n{\"method\":", lines));
    assert(lines.size() == 1);
    assert(lines[0] == "{\"id\":1,\"result\":{}}");

    assert(feed(framer, "\"event.x\"}\n", lines));
    assert(lines.size() == 2);
    assert(lines[1] == "{\"method\":\"event.x\"}");
    assert(framer.buffered() == 0);

    std::cout << "  PASS" << std::endl;
}

void test_crlf_and_blank_lines() {
    std::cout << "Testing CRLF stripping and blank lines..." << std::endl;

    LineFramer framer;
    std::vector<std::string> lines;

    assert(feed(framer, "first\r\n\n\r\nsecond\n", lines));
    assert(lines.size() == 2);
    assert(lines[0] == "first");
    assert(lines[1] == "second");

    std::cout << "  PASS" << std::endl;
}

void test_oversized_line_latches() {
    std::cout << "Testing oversized line is fatal..." << std::endl;

    LineFramer framer(8);
    std::vector<std::string> lines;

    // Exactly at the limit is fine
    assert(feed(framer, "12345678\n", lines));
    assert(lines.size() == 1);

    assert(!feed(framer, "123456789\n", lines));
    assert(framer.failed());
    assert(lines.size() == 1);

    // Stays failed
    assert(!feed(framer, "ok\n", lines));
    assert(lines.size() == 1);

    std::cout << "  PASS" << std::endl;
}

void test_unterminated_overflow() {
    std::cout << "Testing unterminated overflow..." << std::endl;

    LineFramer framer(8);
    std::vector<std::string> lines;

    // Limit plus a trailing CR may still complete
    assert(feed(framer, "12345678\r", lines));
    assert(!framer.failed());
    assert(feed(framer, "\n", lines));
    assert(lines.size() == 1 && lines[0] == "12345678");

    assert(!feed(framer, "abcdefghijk", lines));
    assert(framer.failed());

    std::cout << "  PASS" << std::endl;
}

void test_transport_roundtrip() {
    std::cout << "Testing transport over a pipe..." << std::endl;

    int fds[2];
    assert(pipe(fds) == 0);
    FramedTransport transport(fds[0], fds[1]);

    std::string line;
    assert(transport.read_message(line, 10) == FramedTransport::ReadStatus::Timeout);

    assert(transport.write_message("{\"a\":1}"));
    assert(transport.write_message("{\"b\":2}"));
    assert(transport.read_message(line, 1000) == FramedTransport::ReadStatus::Message);
    assert(line == "{\"a\":1}");
    assert(transport.read_message(line, 1000) == FramedTransport::ReadStatus::Message);
    assert(line == "{\"b\":2}");

    // A body with a newline would split into two frames
    assert(!transport.write_message("{\"a\":\n1}"));

    transport.close();
    assert(!transport.is_open());
    assert(!transport.write_message("{}"));
    assert(transport.read_message(line, 1000) == FramedTransport::ReadStatus::Closed);
    assert(transport.read_message(line, 1000) == FramedTransport::ReadStatus::Closed);

    std::cout << "  PASS" << std::endl;
}

void test_transport_fatal_after_good_lines() {
    std::cout << "Testing framing violation after valid lines..." << std::endl;

    int fds[2];
    assert(pipe(fds) == 0);
    FramedTransport transport(fds[0], -1, 16);

    std::string data = "ok\n" + std::string(40, 'x') + "\n";
    assert(write(fds[1], data.data(), data.size()) == static_cast<ssize_t>(data.size()));

    std::string line;
    assert(transport.read_message(line, 1000) == FramedTransport::ReadStatus::Message);
    assert(line == "ok");
    assert(transport.read_message(line, 1000) == FramedTransport::ReadStatus::Fatal);
    assert(transport.read_message(line, 1000) == FramedTransport::ReadStatus::Fatal);

    close(fds[1]);
    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "\n=== Framed Transport Test Suite ===" << std::endl << std::endl;

    test_partial_lines();
    test_crlf_and_blank_lines();
    test_oversized_line_latches();
    test_unterminated_overflow();
    test_transport_roundtrip();
    test_transport_fatal_after_good_lines();

    std::cout << "\n=== All Tests Passed! ===" << std::endl << std::endl;
    return 0;
}
