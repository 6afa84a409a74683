#include <cstdio>
#include <string>
#include <vector>

#include <benchmark/benchmark.h>

#include "bytestring/core/errors.hpp"
#include "bytestring/io/data_input.hpp"
#include "bytestring/seq/bytes.hpp"

using namespace bytestring::core;
using namespace bytestring::seq;

static void BM_ReadIntStream(benchmark::State& state){
    const std::size_t count = static_cast<std::size_t>(state.range(0));
    std::vector<u8> v(count * 4);
    for (std::size_t i = 0; i < v.size(); ++i) {
        v[i] = static_cast<u8>(i);
    }
    Bytes b;
    const Status s = Bytes::copy_of({v.data(), v.size()}, &b);
    if (!is_ok(s)) {
        status_print(stderr, "copy_of", s);
        state.SkipWithError("setup failed");
        return;
    }

    for (auto _ : state){
        bytestring::io::BytesDataInput in = b.data_input();
        i64 sum = 0;
        i32 x = 0;
        while (is_ok(in.read_int(&x))) {
            sum += x;
        }
        benchmark::DoNotOptimize(sum);
    }
    state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(v.size()));
}
BENCHMARK(BM_ReadIntStream)->Arg(16)->Arg(1024)->Arg(16384);

static void BM_ReadLines(benchmark::State& state){
    std::vector<u8> v;
    for (int64_t i = 0; i < state.range(0); ++i) {
        const char line[] = "header-name: some value\r\n";
        v.insert(v.end(), line, line + sizeof(line) - 1);
    }
    Bytes b;
    const Status s = Bytes::copy_of({v.data(), v.size()}, &b);
    if (!is_ok(s)) {
        status_print(stderr, "copy_of", s);
        state.SkipWithError("setup failed");
        return;
    }

    for (auto _ : state){
        bytestring::io::BytesDataInput in = b.data_input();
        std::string line;
        std::size_t n = 0;
        while (in.remaining() > 0 && is_ok(in.read_line(&line))) {
            ++n;
        }
        benchmark::DoNotOptimize(n);
    }
}
BENCHMARK(BM_ReadLines)->Arg(16)->Arg(1024);
