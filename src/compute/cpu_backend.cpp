#include "astro_compute/compute/cpu_backend.hpp"
#include "astro_compute/registration/correlation.hpp"
#include "astro_compute/tonemap/stf.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <mutex>
#include <thread>
#include <vector>

namespace astro_compute::compute {

namespace {

constexpr size_t kToneMapChunkPixels = 64 * 1024;

// Runs work(item) for every item in [0, count) on up to `workers` threads.
// The first exception thrown by any worker is rethrown after all joined.
template <typename Fn>
void parallel_for_items(size_t count, int workers, Fn&& work) {
    if (count == 0) return;

    const int n_workers = static_cast<int>(
        std::min<size_t>(static_cast<size_t>(std::max(workers, 1)), count));

    std::atomic<size_t> next{0};
    std::atomic<bool> failed{false};
    std::exception_ptr first_error;
    std::mutex error_mutex;

    auto worker = [&]() {
        while (!failed.load(std::memory_order_relaxed)) {
            const size_t item = next.fetch_add(1, std::memory_order_relaxed);
            if (item >= count) break;
            try {
                work(item);
            } catch (...) {
                std::lock_guard<std::mutex> lock(error_mutex);
                if (!first_error) first_error = std::current_exception();
                failed.store(true, std::memory_order_relaxed);
            }
        }
    };

    if (n_workers > 1) {
        std::vector<std::thread> threads;
        threads.reserve(static_cast<size_t>(n_workers));
        for (int w = 0; w < n_workers; ++w) {
            threads.emplace_back(worker);
        }
        for (auto& t : threads) {
            if (t.joinable()) {
                t.join();
            }
        }
    } else {
        worker();
    }

    if (first_error) {
        std::rethrow_exception(first_error);
    }
}

} // namespace

CpuBackend::CpuBackend(int workers) : workers_(workers) {
    if (workers_ <= 0) {
        workers_ = std::max(1, static_cast<int>(std::thread::hardware_concurrency()));
    }
}

std::string CpuBackend::device_description() const {
    return "host (" + std::to_string(workers_) + " threads)";
}

PackedImage CpuBackend::tone_map(const float* pixels, const ToneMapParams& params) {
    const size_t total = static_cast<size_t>(params.width) * static_cast<size_t>(params.height);
    PackedImage out(total);
    if (total == 0) return out;

    const size_t chunks = (total + kToneMapChunkPixels - 1) / kToneMapChunkPixels;
    parallel_for_items(chunks, workers_, [&](size_t chunk) {
        const size_t begin = chunk * kToneMapChunkPixels;
        const size_t end = std::min(begin + kToneMapChunkPixels, total);
        tonemap::tone_map_span(pixels, out.data(), begin, end, params);
    });
    return out;
}

OffsetMatch CpuBackend::find_offset(const float* ref, const float* tgt,
                                    const CorrelationParams& params) {
    // Phase 1: each candidate shift writes only its own slot
    std::vector<ShiftScore> grid(params.candidate_count());
    parallel_for_items(grid.size(), workers_, [&](size_t idx) {
        grid[idx] = registration::score_shift(ref, tgt, params,
                                              registration::index_to_dx(idx, params),
                                              registration::index_to_dy(idx, params));
    });

    // Phase 2 after every worker joined
    return registration::match_from_grid(grid, params);
}

} // namespace astro_compute::compute
