#include <ivl.hpp>
#include <algorithm>
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

// A degenerate chain of `n` single-character intervals leaning to one side.
static std::unique_ptr<ivl::interval> make_chain(std::size_t n, bool lean_left) {
    std::unique_ptr<ivl::interval> top;
    for (std::size_t k = 1; k <= n; ++k) {
        auto node = std::make_unique<ivl::interval>(k);
        if (top) {
            if (lean_left)
                node->set_left(std::move(top));
            else
                node->set_right(std::move(top));
        }
        top = std::move(node);
    }
    return top;
}

static std::size_t height(const ivl::interval* i) {
    if (!i) return 0;
    return 1 + std::max(height(i->left()), height(i->right()));
}

static void lengths_in_order(const ivl::interval* i, std::vector<std::size_t>& out) {
    if (!i) return;
    lengths_in_order(i->left(), out);
    out.push_back(i->length());
    lengths_in_order(i->right(), out);
}

int main() {
    // balance: whole-tree rebalancing of both chain shapes
    for (bool lean_left : {true, false}) {
        const char* side = lean_left ? "left chain" : "right chain";
        std::unique_ptr<ivl::interval> tree = make_chain(8, lean_left);
        ivl::interval* old_top = tree.get();
        TEST(height(tree.get()) == 8, std::string(side) + ": starts degenerate");

        const std::size_t rotations = ivl::interval::balance(tree);
        TEST(rotations == 11, std::string(side) + ": rotation count");
        TEST(tree.get() != old_top, std::string(side) + ": slot holds a new subtree root");
        TEST(height(tree.get()) == 4, std::string(side) + ": height is logarithmic");
        TEST(tree->total_length() == 8, std::string(side) + ": total preserved");
        TEST(!tree->has_parent() && !tree->is_root(), std::string(side) + ": new top inherits the unset link");
        tree->check_invariants();

        std::vector<std::size_t> lengths;
        lengths_in_order(tree.get(), lengths);
        TEST(lengths == std::vector<std::size_t>(8, 1), std::string(side) + ": in-order spans preserved");

        TEST(ivl::interval::balance(tree) == 0, std::string(side) + ": second balance is a no-op");
    }

    // balance_self only works at the top of the slot
    {
        std::unique_ptr<ivl::interval> tree = make_chain(8, true);
        const std::size_t rotations = ivl::interval::balance_self(tree);
        TEST(rotations == 4, "balance_self: rotation count");
        TEST(tree->left_total_length() == 4 && tree->right_total_length() == 3,
             "balance_self: top is weight-balanced");
        TEST(height(tree.get()) == 5, "balance_self: subtrees left as they were rotated");
        tree->check_invariants();

        std::unique_ptr<ivl::interval> empty;
        bool threw = false;
        try {
            (void)ivl::interval::balance_self(empty);
        } catch (const ivl::violated_invariant&) {
            threw = true;
        }
        TEST(threw, "balance_self: empty slot is a violated invariant");
        TEST(ivl::interval::balance(empty) == 0, "balance: empty slot is a no-op");
    }

    // balance_self reaches its fixpoint on chains of any size
    {
        bool converged = true;
        bool balanced = true;
        for (std::size_t n = 2; n <= 300 && converged; ++n) {
            for (bool lean_left : {true, false}) {
                std::unique_ptr<ivl::interval> tree = make_chain(n, lean_left);
                try {
                    (void)ivl::interval::balance_self(tree);
                    tree->check_invariants();
                } catch (const ivl::violated_invariant&) {
                    converged = false;
                    break;
                }
                const std::size_t l = tree->left_total_length();
                const std::size_t r = tree->right_total_length();
                if ((l > r ? l - r : r - l) > 1) balanced = false;
            }
        }
        TEST(converged, "balance_self: chains of 2 to 300 intervals converge");
        TEST(balanced, "balance_self: top weights differ by at most one");
    }

    // balance handles a very deep chain
    {
        std::unique_ptr<ivl::interval> tree = make_chain(20000, false);
        TEST(ivl::interval::balance(tree) > 0, "deep chain: rotations performed");
        TEST(tree->total_length() == 20000, "deep chain: total preserved");
        TEST(height(tree.get()) <= 30, "deep chain: height is logarithmic");
        tree->check_invariants();
        TEST(ivl::interval::balance(tree) == 0, "deep chain: second balance is a no-op");
    }

    // find on a deep chain attached to a container
    for (std::size_t n : {16, 64}) {
        ivl::text_string str(std::string(n, 'd'));
        (void)str.intervals();
        (void)str.detach_root();
        str.attach_root(make_chain(n, true));
        str.check_intervals();

        ivl::interval& found = str.find_interval(3);
        TEST(found.position() == 3 && found.length() == 1, "deep root: find after rebalancing");
        TEST(str.root()->left_total_length() == n / 2, "deep root: root weights balanced");
        str.check_intervals();

        bool covered = true;
        for (std::size_t p = 0; p < n; ++p) {
            ivl::interval& i = str.find_interval(p);
            if (!(i.position() <= p && p < i.end_position())) covered = false;
        }
        TEST(covered, "deep root: point coverage");
    }

    // balance_possible_root on a container root
    {
        ivl::text_buffer buf("abcdefgh");
        (void)buf.intervals();
        std::unique_ptr<ivl::interval> plain = buf.detach_root();
        TEST(buf.root() == nullptr && plain->owner() == &buf, "possible root: detached root keeps its container tag");

        std::unique_ptr<ivl::interval> chain = make_chain(8, true);
        ivl::interval* old_root = chain.get();
        buf.attach_root(std::move(chain));
        TEST(old_root->owner() == &buf, "possible root: attached chain is tagged");

        ivl::interval& fresh = old_root->balance_possible_root();
        TEST(&fresh != old_root, "possible root: a new interval reaches the root");
        TEST(buf.root() == &fresh && fresh.owner() == &buf, "possible root: container informed");
        TEST(!old_root->is_root() && old_root->has_parent(), "possible root: old root moved down");
        TEST(fresh.left_total_length() == 4 && fresh.right_total_length() == 3,
             "possible root: weights balanced at the top");
        buf.check_intervals();

        ivl::interval& child = *fresh.left();
        TEST(&child.balance_possible_root() == &child, "possible root: non-root interval untouched");
        TEST(&fresh.balance_possible_root() == &fresh, "possible root: balanced root stays");
    }

    // find rebalances an unbalanced root before descending
    {
        ivl::text_buffer buf("abcdefgh");
        (void)buf.intervals();
        (void)buf.detach_root();
        std::unique_ptr<ivl::interval> chain = make_chain(8, false);
        ivl::interval* old_root = chain.get();
        buf.attach_root(std::move(chain));

        ivl::interval& found = buf.find_interval(3);
        TEST(found.position() == 3 && found.length() == 1, "find: correct interval after rebalancing");
        TEST(buf.root() != old_root, "find: root replaced");
        TEST(buf.root()->left_total_length() == 3 && buf.root()->right_total_length() == 4,
             "find: root weights balanced");
        buf.check_intervals();
    }

    // balance_intervals on a text
    {
        ivl::text_string str(std::string(64, 'b'));
        TEST(ivl::text_string().balance_intervals() == 0, "balance_intervals: empty text");
        for (std::size_t p = 0; p + 1 < 64; p += 2) {
            ivl::interval& i = str.find_interval(p);
            if (i.length() > 2) (void)i.split_right(p + 2 - i.position());
        }
        str.check_intervals();
        (void)str.balance_intervals();
        str.check_intervals();
        TEST(str.balance_intervals() == 0, "balance_intervals: idempotent");

        std::size_t weight = 0;
        str.traverse_intervals([&](ivl::interval& i) { weight += i.length(); });
        TEST(weight == 64, "balance_intervals: weight unchanged");
    }

    std::cout << "\nAll interval balance tests passed.\n";
    return 0;
}
