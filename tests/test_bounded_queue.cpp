#include <chrono>
#include <iostream>
#include <string>
#include <thread>
#include "../src/BoundedQueue.hpp"

#define ASSERT_TRUE(cond) if(!(cond)) { std::cerr << "Assertion failed: " << #cond << " at " << __FILE__ << ":" << __LINE__ << std::endl; return 1; }

using Queue = BoundedQueue<std::string>;
using namespace std::chrono_literals;

int main() {
    // full queue rejects without blocking
    {
        Queue q(2);
        ASSERT_TRUE(q.tryPush("a"));
        ASSERT_TRUE(q.tryPush("b"));
        ASSERT_TRUE(!q.tryPush("c"));
        ASSERT_TRUE(q.size() == 2);

        std::string out;
        ASSERT_TRUE(q.pop(out, 10ms) == Queue::PopResult::Item);
        ASSERT_TRUE(out == "a");
        ASSERT_TRUE(q.tryPush("d"));
        ASSERT_TRUE(q.pop(out, 10ms) == Queue::PopResult::Item);
        ASSERT_TRUE(out == "b");
        ASSERT_TRUE(q.pop(out, 10ms) == Queue::PopResult::Item);
        ASSERT_TRUE(out == "d");
    }

    // empty queue times out
    {
        Queue q(1);
        std::string out;
        auto start = std::chrono::steady_clock::now();
        ASSERT_TRUE(q.pop(out, 50ms) == Queue::PopResult::Timeout);
        ASSERT_TRUE(std::chrono::steady_clock::now() - start >= 45ms);
    }

    // closed queue drains before reporting Closed and refuses new items
    {
        Queue q(4);
        ASSERT_TRUE(q.tryPush("x"));
        q.close();
        ASSERT_TRUE(q.closed());
        ASSERT_TRUE(!q.tryPush("y"));
        std::string out;
        ASSERT_TRUE(q.pop(out, 10ms) == Queue::PopResult::Item);
        ASSERT_TRUE(out == "x");
        ASSERT_TRUE(q.pop(out, 10ms) == Queue::PopResult::Closed);
    }

    // closing with discardPending drops what is left
    {
        Queue q(4);
        ASSERT_TRUE(q.tryPush("x"));
        ASSERT_TRUE(q.tryPush("y"));
        q.close(true);
        ASSERT_TRUE(q.size() == 0);
        std::string out;
        ASSERT_TRUE(q.pop(out, 10ms) == Queue::PopResult::Closed);
    }

    // close wakes a waiting consumer
    {
        Queue q(1);
        Queue::PopResult result = Queue::PopResult::Item;
        std::thread waiter([&] {
            std::string out;
            result = q.pop(out, 10s);
        });
        std::this_thread::sleep_for(20ms);
        q.close();
        waiter.join();
        ASSERT_TRUE(result == Queue::PopResult::Closed);
    }

    std::cout << "All bounded queue tests passed" << std::endl;
    return 0;
}
