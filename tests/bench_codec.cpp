// bench_codec.cpp
//
// Per-id cost of each allocation path and of decoding. Codec and sequencer
// construction stay outside the measured loop.

#include "safeid/core/coroutine.hpp"
#include "safeid/id/codec.hpp"
#include "safeid/id/sequencer.hpp"

#include <benchmark/benchmark.h>

#include <boost/asio/io_context.hpp>
#include <boost/asio/use_future.hpp>

#include <cstdint>
#include <memory>

namespace safeid {
namespace {

// Drives one coroutine to completion on `io`; the context is reusable after.
template <typename T>
[[nodiscard]] auto run_on_io(boost::asio::io_context &io, task<T> t) -> T {
  auto fut = co_spawn(io, std::move(t), boost::asio::use_future);
  io.run();
  io.restart();
  return fut.get();
}

void BM_RandomId(benchmark::State &state) {
  IdCodec codec{CodecOptions{.random_source = RandomSourceKind::Fast}};
  for (auto _ : state) {
    benchmark::DoNotOptimize(codec.next_random_id());
  }
  state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_RandomId);

void BM_RandomIdSecure(benchmark::State &state) {
  IdCodec codec{CodecOptions{.random_source = RandomSourceKind::Secure}};
  for (auto _ : state) {
    benchmark::DoNotOptimize(codec.next_random_id());
  }
  state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_RandomIdSecure);

void BM_RandomIdContended(benchmark::State &state) {
  static const IdCodec codec{};
  for (auto _ : state) {
    benchmark::DoNotOptimize(codec.next_random_id());
  }
  state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_RandomIdContended)->Threads(1)->Threads(4);

// Space in range(0); small spaces make the sequencer wait on the clock.
void BM_SequencerNext(benchmark::State &state) {
  Sequencer sequencer{
      IdCodec{CodecOptions{.disambiguation_space = state.range(0)}}};
  for (auto _ : state) {
    benchmark::DoNotOptimize(sequencer.next());
  }
  state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_SequencerNext)->Arg(1024)->Arg(16)->Unit(benchmark::kNanosecond);

void BM_SequencerNextAsync(benchmark::State &state) {
  constexpr int kBatch = 256;
  Sequencer sequencer{
      IdCodec{CodecOptions{.disambiguation_space = state.range(0)}}};
  boost::asio::io_context io;

  for (auto _ : state) {
    auto last = run_on_io(io, [&]() -> task<std::int64_t> {
      std::int64_t id = 0;
      for (int i = 0; i < kBatch; ++i) {
        id = co_await sequencer.next_async();
      }
      co_return id;
    }());
    benchmark::DoNotOptimize(last);
  }
  state.SetItemsProcessed(state.iterations() * kBatch);
}
BENCHMARK(BM_SequencerNextAsync)
    ->Arg(1024)
    ->Arg(16)
    ->Unit(benchmark::kMicrosecond);

void BM_CreatedAt(benchmark::State &state) {
  IdCodec codec;
  const auto id = codec.next_random_id();
  const bool utc = state.range(0) != 0;
  for (auto _ : state) {
    benchmark::DoNotOptimize(codec.created_at(id, utc));
  }
  state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_CreatedAt)->Arg(0)->Arg(1);

} // namespace
} // namespace safeid

BENCHMARK_MAIN();
