#include <cassert>
#include <chrono>
#include <string>
#include <thread>
#include <vector>
#include "core/message_queue.hpp"

int main() {
    // FIFO order
    {
        core::MessageQueue<int> q;
        for (int i = 0; i < 5; ++i) assert(q.push(int(i)));
        assert(q.size() == 5);
        int v = -1;
        for (int i = 0; i < 5; ++i) {
            assert(q.pop(v));
            assert(v == i);
        }
        assert(!q.pop_for(v, std::chrono::milliseconds(1)));
    }

    // Bounded queue drops the oldest when the consumer falls behind
    {
        core::MessageQueue<int> q(2);
        for (int i = 0; i < 5; ++i) q.push(int(i));
        int v = -1;
        assert(q.pop(v));
        assert(v == 3);
        assert(q.dropped_count() == 3);
        assert(q.pop(v));
        assert(v == 4);
    }

    // stop(): no new messages, pending ones still drain
    {
        core::MessageQueue<std::string> q;
        assert(q.push(std::string("a")));
        q.stop();
        assert(q.stopped());
        assert(!q.push(std::string("b")));
        std::string s;
        assert(q.pop(s));
        assert(s == "a");
        assert(!q.pop(s));
    }

    // Consumer thread wakes on push and on stop
    {
        core::MessageQueue<std::vector<float>> q;
        size_t received = 0;
        std::thread consumer([&] {
            std::vector<float> chunk;
            while (q.pop(chunk)) received += chunk.size();
        });
        for (int i = 0; i < 100; ++i) q.push(std::vector<float>(320, 0.0f));
        q.stop();
        consumer.join();
        assert(received == 100 * 320);
    }
    return 0;
}
