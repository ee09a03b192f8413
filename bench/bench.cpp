/**
 * @file bench.cpp
 * @brief Performance benchmarks for ExactString.
 *
 * Compares ExactString against std::string and a boxed immutable string
 * (std::unique_ptr<char[]> plus length) for construction, whole-content
 * replacement and append/remove edits.
 *
 * Usage:
 *   ./build/exactstr_bench              # Run with default 100000 iterations
 *   ./build/exactstr_bench 1000000      # Run with custom iteration count
 */

#include <exactstr/exactstr.hpp>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <string>
#include <string_view>

using namespace exactstr;

static constexpr int DEFAULT_ITERATIONS = 100000;

// 27 x "ƒoo" separated by spaces
static constexpr std::string_view SAMPLE =
    "\xC6\x92oo \xC6\x92oo \xC6\x92oo \xC6\x92oo \xC6\x92oo \xC6\x92oo \xC6\x92oo \xC6\x92oo "
    "\xC6\x92oo \xC6\x92oo \xC6\x92oo \xC6\x92oo \xC6\x92oo \xC6\x92oo \xC6\x92oo \xC6\x92oo "
    "\xC6\x92oo \xC6\x92oo \xC6\x92oo \xC6\x92oo \xC6\x92oo \xC6\x92oo \xC6\x92oo \xC6\x92oo "
    "\xC6\x92oo \xC6\x92oo \xC6\x92oo";

// Keeps results observable so the loops are not optimised away
static volatile std::size_t sink = 0;

/**
 * @brief Immutable boxed text: replacing content means a new box.
 */
struct BoxedText {
    std::unique_ptr<char[]> data;
    std::size_t size = 0;

    static BoxedText from(std::string_view text) {
        BoxedText box;
        box.data = std::make_unique<char[]>(text.size());
        std::memcpy(box.data.get(), text.data(), text.size());
        box.size = text.size();
        return box;
    }
};

template <typename Fn>
static void run(const char* name, int iterations, Fn&& body) {
    // Warmup run
    body(0);

    auto start = std::chrono::high_resolution_clock::now();

    for (int i = 0; i < iterations; i++) {
        body(i);
    }

    auto end = std::chrono::high_resolution_clock::now();

    double total_ns = std::chrono::duration<double, std::nano>(end - start).count();
    double per_iter_ns = total_ns / static_cast<double>(iterations);

    std::printf("%-28s %10.1f ns/iter\n", name, per_iter_ns);
}

static std::string_view numbered(char* buf, std::size_t buf_size, int number) {
    int written = std::snprintf(buf, buf_size, "\xC6\x92oo%d", number);
    if (written < 0) {
        return {};
    }
    std::size_t len = static_cast<std::size_t>(written);
    return std::string_view(buf, len < buf_size ? len : buf_size - 1);
}

static void bench_create(int iterations) {
    run("create boxed", iterations, [](int) {
        BoxedText box = BoxedText::from(SAMPLE);
        sink = sink + box.size;
    });

    run("create std::string", iterations, [](int) {
        std::string str(SAMPLE);
        sink = sink + str.size();
    });

    run("create ExactString", iterations, [](int) {
        ExactString str;
        if (ExactString::from(SAMPLE, str) == Error::Ok) {
            sink = sink + str.size();
        }
    });
}

static void bench_replace(int iterations) {
    char buf[32];

    BoxedText box = BoxedText::from(SAMPLE);
    run("replace boxed", iterations, [&](int i) {
        box = BoxedText::from(numbered(buf, sizeof(buf), i));
        sink = sink + box.size;
    });

    std::string str(SAMPLE);
    run("replace std::string", iterations, [&](int i) {
        str.assign(numbered(buf, sizeof(buf), i));
        sink = sink + str.size();
    });

    ExactString exact(SAMPLE);
    run("replace ExactString", iterations, [&](int i) {
        if (exact.replace_with(numbered(buf, sizeof(buf), i)) == Error::Ok) {
            sink = sink + exact.size();
        }
    });
}

static void bench_edit(int iterations) {
    std::string str(SAMPLE);
    run("append+erase std::string", iterations, [&](int) {
        str.append(" :)");
        str.erase(str.find(" :)"), 3);
        sink = sink + str.size();
    });

    ExactString exact(SAMPLE);
    run("append+remove ExactString", iterations, [&](int) {
        if (exact.append(" :)") == Error::Ok && exact.remove(" :)") == Error::Ok) {
            sink = sink + exact.size();
        }
    });
}

int main(int argc, char* argv[]) {
    int iterations = DEFAULT_ITERATIONS;

    if (argc >= 2) {
        iterations = std::atoi(argv[1]);
        if (iterations <= 0) {
            iterations = DEFAULT_ITERATIONS;
        }
    }

    std::printf("exactstr Benchmarks (v%s)\n", version());
    std::printf("=========================\n");
    std::printf("Iterations: %d\n", iterations);
    std::printf("Footprint: ExactString %zu bytes, std::string %zu bytes\n\n",
                sizeof(ExactString), sizeof(std::string));

    std::printf("\nConstruction:\n");
    bench_create(iterations);

    std::printf("\nReplace content:\n");
    bench_replace(iterations);

    std::printf("\nAppend and remove:\n");
    bench_edit(iterations);

    std::printf("\nNote: ExactString trades reallocation on every edit for a\n");
    std::printf("smaller footprint. Use these results for relative comparisons only.\n");

    return 0;
}
