// Text containers built with every debugging switch on.  Overlapping access
// is turned into an exception so it can be observed.
#include <stdexcept>

struct overlapping_access : std::runtime_error {
    overlapping_access() : std::runtime_error("overlapping access") {}
};

#define IVL_DEBUG_THREAD_SAFETY 1
#define IVL_CHECK_INVARIANTS 1
#define IVL_THREAD_SAFETY_ABORT() throw overlapping_access()

#include <ivl.hpp>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#define TEST(condition, name) \
    if (!(condition)) { \
        std::cerr << "FAIL: " << name << "\n"; \
        return 1; \
    } else { \
        std::cout << "PASS: " << name << "\n"; \
    }

int main() {
    // Construction and text access
    {
        ivl::text_buffer buf("hello");
        TEST(buf.text() == "hello", "text: contents");
        TEST(buf.size() == 5 && buf.length() == 5 && !buf.empty(), "text: sizes");
        TEST(buf.begin_offset() == 1, "text_buffer: positions start at 1");
        TEST(ivl::text_string("x").begin_offset() == 0, "text_string: positions start at 0");
        TEST(buf.root() == nullptr, "intervals: not created before first use");
    }

    // Lazy interval creation
    {
        ivl::text_string str("some text");
        ivl::interval* root = str.intervals();
        TEST(root != nullptr && str.root() == root, "intervals: created on first use");
        TEST(root->total_length() == 9 && root->is_default(), "intervals: one default interval");
        TEST(str.intervals() == root, "intervals: created once");

        ivl::text_string empty;
        TEST(empty.intervals() == nullptr, "intervals: none for empty text");
        TEST(empty.root() == nullptr, "intervals: empty text stays without a tree");
        empty.check_intervals();
        TEST(true, "check_intervals: empty text passes");
    }

    // find_interval creates the tree on demand
    {
        ivl::text_buffer buf("abcdef");
        ivl::interval& i = buf.find_interval(4);
        TEST(buf.root() == &i && i.position() == 1 && i.length() == 6, "find_interval: lazy root");
        ivl::interval& end = buf.find_interval(7);
        TEST(&end == &i, "find_interval: end position allowed");

        ivl::text_buffer empty;
        bool threw = false;
        try {
            (void)empty.find_interval(1);
        } catch (const ivl::position_out_of_range& e) {
            threw = e.first() == 1 && e.last() == 1;
        }
        TEST(threw, "find_interval: empty buffer reports its only valid position");
    }

    // traverse_intervals visits in order with container positions
    {
        ivl::text_buffer buf("one two three");
        ivl::interval& one = *buf.intervals();
        one.plist().put("word", "one");
        ivl::interval& two = one.split_right(4);
        two.plist().put("word", "two");
        ivl::interval& three = two.split_right(4);
        three.plist().put("word", "three");

        std::vector<std::string> words;
        std::vector<std::size_t> starts;
        buf.traverse_intervals([&](ivl::interval& i) {
            words.emplace_back(i.plist().get("word").value_or("?"));
            starts.push_back(i.position());
        });
        TEST((words == std::vector<std::string>{"one", "two", "three"}), "traverse_intervals: order");
        TEST((starts == std::vector<std::size_t>{1, 5, 9}), "traverse_intervals: buffer positions");

        std::size_t calls = 0;
        ivl::text_string().traverse_intervals([&](ivl::interval&) { ++calls; });
        TEST(calls == 0, "traverse_intervals: nothing to visit in empty text");
    }

    // check_intervals detects a tree that does not cover the text
    {
        ivl::text_string str("0123456789");
        (void)str.intervals();
        (void)str.detach_root();
        str.attach_root(std::make_unique<ivl::interval>(4));

        bool threw = false;
        try {
            str.check_intervals();
        } catch (const ivl::violated_invariant& e) {
            threw = std::string(e.what()).find("cover") != std::string::npos;
        }
        TEST(threw, "check_intervals: short tree rejected");

        str.attach_root(std::make_unique<ivl::interval>(10));
        str.check_intervals();
        TEST(str.root()->owner() == &str, "attach_root: replacement tagged with the container");
    }

    // check_intervals detects corrupted weights below the root
    {
        ivl::text_string str("0123456789");
        ivl::interval& root = *str.intervals();
        ivl::interval& head = root.split_left(3);
        (void)head.set_left(std::make_unique<ivl::interval>(3));

        bool threw = false;
        try {
            str.check_intervals();
        } catch (const ivl::violated_invariant&) {
            threw = true;
        }
        TEST(threw, "check_intervals: interval with no own length rejected");
    }

    // Overlapping access is reported
    {
        ivl::text_string str("abcdefgh");
        ivl::interval& root = *str.intervals();
        (void)root.split_right(4);

        bool reported = false;
        try {
            str.traverse_intervals([&](ivl::interval&) { (void)str.find_interval(2); });
        } catch (const overlapping_access&) {
            reported = true;
        }
        TEST(reported, "access: lookup during traversal is reported");

        reported = false;
        try {
            str.traverse_intervals([&](ivl::interval&) { (void)str.text(); });
        } catch (const overlapping_access&) {
            reported = true;
        }
        TEST(reported, "access: read during a write session is reported");

        // Sessions close on unwind, so the container is usable again.
        ivl::interval& i = str.find_interval(6);
        TEST(i.position() == 4 && i.length() == 4, "access: container usable after a report");
        TEST(str.text() == "abcdefgh", "access: text readable after a report");
        str.check_intervals();
    }

    // Tracker sessions directly
    {
        ivl::debug::access_tracker tracker;
        {
            auto r1 = tracker.open_read(IVL_LOC);
            auto r2 = tracker.open_read(IVL_LOC);
            TEST(true, "tracker: concurrent readers admitted");

            bool reported = false;
            try {
                auto w = tracker.open_write(IVL_LOC);
            } catch (const overlapping_access&) {
                reported = true;
            }
            TEST(reported, "tracker: writer blocked by readers");
        }
        {
            auto w = tracker.open_write(IVL_LOC);
            TEST(true, "tracker: writer admitted once readers leave");
        }
        auto moved = tracker.open_write(IVL_LOC);
        auto owner = std::move(moved);
        bool reported = false;
        try {
            auto r = tracker.open_read(IVL_LOC);
        } catch (const overlapping_access&) {
            reported = true;
        }
        TEST(reported, "tracker: moved session stays open");
    }

    // balance_intervals keeps the container consistent
    {
        ivl::text_buffer buf(std::string(32, 'c'));
        for (std::size_t p = 1; p < 32; p += 3) {
            ivl::interval& i = buf.find_interval(p);
            if (i.end_position() > p + 1 && p > i.position())
                (void)i.split_left(p - i.position());
        }
        (void)buf.balance_intervals();
        buf.check_intervals();
        TEST(buf.balance_intervals() == 0, "balance_intervals: second run performs no rotations");
        TEST(buf.root()->owner() == &buf, "balance_intervals: root still tagged");
    }

    std::cout << "\nAll text container tests passed.\n";
    return 0;
}
