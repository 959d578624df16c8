#include <iostream>
#include <string>
#include "../src/SSEMessage.hpp"

#define ASSERT_TRUE(cond) if(!(cond)) { std::cerr << "Assertion failed: " << #cond << " at " << __FILE__ << ":" << __LINE__ << std::endl; return 1; }

int main() {
    // 1) data only
    ASSERT_TRUE(encodeMessage(EventMessage{"", "", "test"}) == "data: test\n\n");

    // 2) id comes first
    ASSERT_TRUE(encodeMessage(EventMessage{"1", "", "test"}) == "id: 1\ndata: test\n\n");

    // 3) newlines are stripped from id and event, not split into lines
    ASSERT_TRUE(encodeMessage(EventMessage{"1\n1", "", "test"}) == "id: 11\ndata: test\n\n");
    ASSERT_TRUE(encodeMessage(EventMessage{"", "notification", "test"}) == "event: notification\ndata: test\n\n");
    ASSERT_TRUE(encodeMessage(EventMessage{"", "notification\n2", "test"}) == "event: notification2\ndata: test\n\n");

    // 4) multi-line data, trailing newline keeps an empty data line
    ASSERT_TRUE(encodeMessage(EventMessage{"", "", "test\ntest2\ntest3\n"})
                == "data: test\ndata: test2\ndata: test3\ndata: \n\n");

    // 5) field order: id, event, data
    ASSERT_TRUE(encodeMessage(EventMessage{"7", "tick", "a\nb"}) == "id: 7\nevent: tick\ndata: a\ndata: b\n\n");

    // 6) nothing set still terminates the frame
    ASSERT_TRUE(encodeMessage(EventMessage{"", "", ""}) == "\n");

    // 7) retry in whole milliseconds
    ASSERT_TRUE(encodeMessage(RetryMessage{std::chrono::seconds(3)}) == "retry: 3000\n\n");
    ASSERT_TRUE(encodeMessage(RetryMessage{std::chrono::milliseconds(1500)}) == "retry: 1500\n\n");

    std::cout << "All SSE message tests passed" << std::endl;
    return 0;
}
