/**
 * @file test_remove.cpp
 * @brief Unit tests for the remove-by-content (shrink) path.
 */

#include <exactstr/exactstr.hpp>

#include <catch2/catch_test_macros.hpp>

#include <limits>

#include "test_allocator.hpp"

using namespace exactstr;

TEST_CASE("ExactString remove first occurrence", "[remove]") {
    TestAllocator::reset();

    SECTION("suffix") {
        TestString s("hello my friend");
        REQUIRE(s.remove(" friend") == Error::Ok);
        REQUIRE(s.view() == "hello my");
        REQUIRE(is_exact_fit(s));
    }

    SECTION("explicit count of one") {
        TestString s("Hello my friend");
        REQUIRE(s.remove(" friend", 1) == Error::Ok);
        REQUIRE(s.view() == "Hello my");
    }

    SECTION("leftmost occurrence only") {
        TestString s("ab-ab-ab");
        REQUIRE(s.remove("ab") == Error::Ok);
        REQUIRE(s.view() == "-ab-ab");
    }

    SECTION("middle") {
        TestString s("one two three");
        REQUIRE(s.remove("two ") == Error::Ok);
        REQUIRE(s.view() == "one three");
        REQUIRE(is_exact_fit(s));
    }

    SECTION("multi-byte UTF-8 fragment") {
        TestString s("\xC6\x92oo bar \xC6\x92oo");
        REQUIRE(s.remove("\xC6\x92oo ") == Error::Ok);
        REQUIRE(s.view() == "bar \xC6\x92oo");
    }

    REQUIRE(TestAllocator::blocks.empty());
}

TEST_CASE("ExactString remove several occurrences", "[remove]") {
    TestAllocator::reset();

    SECTION("two of three") {
        TestString s("hello my friend friend friend");
        REQUIRE(s.remove(" friend", 2) == Error::Ok);
        REQUIRE(s.view() == "hello my friend");
        REQUIRE(is_exact_fit(s));
    }

    SECTION("count saturates at available occurrences") {
        TestString s("a-a-a");
        std::size_t removed = 0;
        REQUIRE(s.remove("a-", 5, &removed) == Error::Ok);
        REQUIRE(s.view() == "a");
        REQUIRE(removed == 2);
        REQUIRE(is_exact_fit(s));
    }

    SECTION("remove_all") {
        TestString s("x.y.z.");
        std::size_t removed = 0;
        REQUIRE(s.remove_all(".", &removed) == Error::Ok);
        REQUIRE(s.view() == "xyz");
        REQUIRE(removed == 3);
    }

    SECTION("maximum count") {
        TestString s("--a--b--");
        REQUIRE(s.remove("-", std::numeric_limits<std::size_t>::max()) == Error::Ok);
        REQUIRE(s.view() == "ab");
    }

    SECTION("one reallocation regardless of count") {
        TestString s("a1a2a3a4");
        REQUIRE(s.remove("a", 4) == Error::Ok);
        REQUIRE(s.view() == "1234");
        REQUIRE(TestAllocator::allocations == 2);
        REQUIRE(TestAllocator::blocks.size() == 1);
    }

    REQUIRE(TestAllocator::blocks.empty());
}

TEST_CASE("ExactString remove scanning policy", "[remove][edge]") {
    TestAllocator::reset();

    SECTION("overlapping candidates are not both matched") {
        TestString s("aaa");
        std::size_t removed = 0;
        REQUIRE(s.remove_all("aa", &removed) == Error::Ok);
        REQUIRE(s.view() == "a");
        REQUIRE(removed == 1);
    }

    SECTION("bytes joined by a removal are not rescanned") {
        TestString s("aabb");
        std::size_t removed = 0;
        REQUIRE(s.remove_all("ab", &removed) == Error::Ok);
        REQUIRE(s.view() == "ab");
        REQUIRE(removed == 1);
    }

    SECTION("nested pattern") {
        TestString s("abcabcc");
        REQUIRE(s.remove("abc", 2) == Error::Ok);
        REQUIRE(s.view() == "c");
    }

    REQUIRE(TestAllocator::blocks.empty());
}

TEST_CASE("ExactString remove without effect", "[remove][edge]") {
    TestAllocator::reset();

    SECTION("no match leaves content and block untouched") {
        const std::size_t counts[] = {1, 2, 100};
        for (std::size_t count : counts) {
            TestString s("hello my friend");
            const void* block = block_of(s);
            std::size_t removed = 42;
            REQUIRE(s.remove("enemy", count, &removed) == Error::Ok);
            REQUIRE(s.view() == "hello my friend");
            REQUIRE(block_of(s) == block);
            REQUIRE(removed == 0);
        }
        REQUIRE(TestAllocator::allocations == 3);
    }

    SECTION("empty fragment matches nowhere") {
        TestString s("abc");
        REQUIRE(s.remove("") == Error::Ok);
        REQUIRE(s.remove_all("") == Error::Ok);
        REQUIRE(s.view() == "abc");
        REQUIRE(TestAllocator::allocations == 1);
    }

    SECTION("count of zero") {
        TestString s("abc");
        REQUIRE(s.remove("a", 0) == Error::Ok);
        REQUIRE(s.view() == "abc");
        REQUIRE(TestAllocator::allocations == 1);
    }

    SECTION("fragment longer than content") {
        TestString s("ab");
        REQUIRE(s.remove("abc") == Error::Ok);
        REQUIRE(s.view() == "ab");
    }

    SECTION("empty buffer") {
        TestString s;
        REQUIRE(s.remove("a") == Error::Ok);
        REQUIRE(s.empty());
        REQUIRE(TestAllocator::allocations == 0);
    }

    REQUIRE(TestAllocator::blocks.empty());
}

TEST_CASE("ExactString remove down to empty", "[remove][edge]") {
    TestAllocator::reset();

    SECTION("whole content") {
        TestString s("friend");
        REQUIRE(s.remove("friend") == Error::Ok);
        REQUIRE(s.empty());
        REQUIRE(block_of(s) == nullptr);
        REQUIRE(TestAllocator::blocks.empty());
        REQUIRE(TestAllocator::allocations == 1);
        REQUIRE(TestAllocator::zero_size_requests == 0);
    }

    SECTION("repeated fragment") {
        TestString s("ababab");
        REQUIRE(s.remove_all("ab") == Error::Ok);
        REQUIRE(s.empty());
        REQUIRE(TestAllocator::blocks.empty());
    }

    SECTION("buffer grows again afterwards") {
        TestString s("x");
        REQUIRE(s.remove("x") == Error::Ok);
        REQUIRE(s.append("y") == Error::Ok);
        REQUIRE(s.view() == "y");
        REQUIRE(is_exact_fit(s));
    }

    REQUIRE(TestAllocator::blocks.empty());
}

TEST_CASE("ExactString remove fragment taken from itself", "[remove][edge]") {
    TestString s("abXabXab");
    REQUIRE(s.remove_all(s.substr(0, 2)) == Error::Ok);
    REQUIRE(s.view() == "XX");

    TestString t("same");
    REQUIRE(t.remove(t.view()) == Error::Ok);
    REQUIRE(t.empty());
}

TEST_CASE("ExactString operator-=", "[remove]") {
    SECTION("removes first occurrence") {
        ExactString s("Hello my friend");
        s -= " friend";
        REQUIRE(s.view() == "Hello my");
    }

    SECTION("only one occurrence per call") {
        ExactString s("x x x");
        s -= " x";
        REQUIRE(s.view() == "x x");
        s -= " x";
        REQUIRE(s.view() == "x");
        s -= " x";
        REQUIRE(s.view() == "x");
    }
}
