#include "test_common.h"

#include "pitchbox/work_queue.h"

#include <string>
#include <thread>
#include <chrono>
#include <vector>

using pitchbox::WorkQueue;

int main() {
    WorkQueue<std::string> q(2);

    std::string a = "first", b = "second", c = "third";
    expect_true(q.try_push(a), "push 1 should succeed");
    expect_true(q.try_push(b), "push 2 should succeed");
    expect_true(!q.try_push(c), "push beyond capacity should be refused");
    expect_true(c == "third", "refused value left untouched");
    expect_eq_ll((long long)q.size(), 2, "size");

    std::string out;
    expect_true(q.pop(out) && out == "first", "FIFO order 1");
    expect_true(q.try_push(c), "room again after pop");
    expect_true(q.pop(out) && out == "second", "FIFO order 2");
    expect_true(q.pop(out) && out == "third", "FIFO order 3");

    // remove_if takes out only the first match
    std::string x = "x", y = "y", x2 = "x";
    WorkQueue<std::string> r(8);
    r.try_push(x);
    r.try_push(y);
    r.try_push(x2);
    expect_true(r.remove_if([](const std::string& s) { return s == "x"; }), "remove_if hit");
    expect_eq_ll((long long)r.size(), 2, "one removed");
    expect_true(!r.remove_if([](const std::string& s) { return s == "z"; }), "remove_if miss");
    auto rest = r.drain();
    expect_eq_ll((long long)rest.size(), 2, "drain returns the rest");
    expect_true(rest[0] == "y" && rest[1] == "x", "drain keeps order");
    expect_eq_ll((long long)r.size(), 0, "empty after drain");

    // Blocking pop should unblock on shutdown
    WorkQueue<int> q2(4);
    bool popped = true;
    std::thread t([&] {
        int v = 0;
        popped = q2.pop(v);
    });

    // Give the thread a moment to block
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    q2.shutdown();
    t.join();

    expect_true(popped == false, "pop should return false after shutdown on empty queue");
    int late = 1;
    expect_true(!q2.try_push(late), "push after shutdown refused");
    expect_true(q2.closed(), "closed");

    // Queued values are still handed out after shutdown
    WorkQueue<int> q3(4);
    int v1 = 7;
    q3.try_push(v1);
    q3.shutdown();
    int got = 0;
    expect_true(q3.pop(got) && got == 7, "pending value popped after shutdown");
    expect_true(!q3.pop(got), "then empty");

    // Many producers, one consumer
    WorkQueue<int> q4(1000);
    std::vector<std::thread> producers;
    for (int p = 0; p < 4; p++) {
        producers.emplace_back([&q4, p] {
            for (int i = 0; i < 100; i++) {
                int v = p * 1000 + i;
                q4.try_push(v);
            }
        });
    }
    for (auto& th : producers) th.join();
    expect_eq_ll((long long)q4.size(), 400, "all pushes landed");

    std::cerr << "test_work_queue: ALL PASSED" << std::endl;
    return 0;
}
