#include <iostream>
#include <string>
#include "../include/ivl.hpp"

/// Prints every interval of a text with its span and properties.
template <typename Text>
static void dump(Text& text) {
    text.traverse_intervals([](ivl::interval& i) {
        std::cout << "  [" << i.position() << ", " << i.end_position() << ")";
        if (i.is_default()) {
            std::cout << " (default)";
        } else {
            for (const auto& [key, value] : i.plist())
                std::cout << " " << key << "=" << value;
        }
        if (i.write_protect()) std::cout << " write-protected";
        std::cout << std::endl;
    });
}

/// Basic ivl interval tree usage
int main() {
    std::cout << "=== ivl library version " << ivl::version() << " ===" << std::endl << std::endl;

    // Example 1: A buffer starts with one default interval
    {
        std::cout << "1. Lazily created root:" << std::endl;

        ivl::text_buffer buf("The quick brown fox jumps over the lazy dog");
        std::cout << "  Text: '" << buf.text() << "'" << std::endl;
        std::cout << "  Tree before first use: " << (buf.root() ? "present" : "absent") << std::endl;

        ivl::interval* root = buf.intervals();
        std::cout << "  Root covers " << root->total_length() << " characters from position "
                  << root->position() << std::endl << std::endl;
    }

    // Example 2: Splitting intervals to attach properties
    {
        std::cout << "2. Splitting and properties:" << std::endl;

        ivl::text_buffer buf("The quick brown fox jumps over the lazy dog");
        ivl::interval& head = *buf.intervals();

        // "The " | "quick" | " " | "brown" | " fox jumps over the lazy dog"
        ivl::interval& quick = head.split_right(4);
        ivl::interval& space = quick.split_right(5);
        ivl::interval& brown = space.split_right(1);
        (void)brown.split_right(5);

        quick.plist().put("face", "bold");
        brown.plist().put("face", "italic");
        brown.set_write_protect(true);
        dump(buf);
        std::cout << std::endl;
    }

    // Example 3: Walking and searching
    {
        std::cout << "3. Navigation:" << std::endl;

        ivl::text_string str("alpha beta gamma delta");
        for (std::size_t at : {6, 11, 17}) {
            ivl::interval& i = str.find_interval(at - 1);
            (void)i.split_right(at - i.position());
        }

        ivl::interval* i = &str.find_interval(0);
        std::size_t count = 0;
        while (i) {
            ++count;
            i = i->next();
        }
        std::cout << "  Intervals: " << count << std::endl;

        ivl::interval& cur = str.find_interval(2);
        ivl::interval& later = cur.update(18);
        std::cout << "  Position 18 lies in [" << later.position() << ", " << later.end_position()
                  << ")" << std::endl << std::endl;
    }

    // Example 4: Merging and rebalancing
    {
        std::cout << "4. Merging:" << std::endl;

        ivl::text_string str(std::string(24, '-'));
        for (std::size_t p = 0; p + 4 < 24; p += 4)
            (void)str.find_interval(p).split_right(4);

        ivl::interval& first = str.find_interval(0);
        first.plist().put("kind", "header");
        ivl::interval& merged = str.find_interval(4).merge_left();
        std::cout << "  After merge_left the first interval spans " << merged.length()
                  << " characters" << std::endl;

        std::cout << "  Rotations to fully balance: " << str.balance_intervals() << std::endl;
        dump(str);
        str.check_intervals();
        std::cout << "  Tree is consistent" << std::endl << std::endl;
    }

    // Example 5: Errors
    {
        std::cout << "5. Out-of-range positions:" << std::endl;

        ivl::text_buffer buf("short");
        try {
            (void)buf.find_interval(42);
        } catch (const ivl::position_out_of_range& e) {
            std::cout << "  " << e.what() << std::endl;
        }
    }

    std::cout << "=== All examples completed ===" << std::endl;
    return 0;
}
