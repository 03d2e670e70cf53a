#pragma once

#include <sys/resource.h>

#include <chrono>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <string>

#ifdef USE_JEMALLOC
#include <jemalloc/jemalloc.h>
#endif

namespace LoOP {
namespace Utils {

/**
 * @brief Wall time and memory reporting for the CLI and the test listener.
 *
 * Memory is jemalloc's allocated byte count when built with USE_JEMALLOC,
 * otherwise the peak resident set size of the process.
 */
class ResourceMonitor {
public:
    ResourceMonitor() {
        reset();
    }

    void reset() {
        start_time_ = std::chrono::steady_clock::now();
    }

    double get_elapsed_seconds() const {
        std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start_time_;
        return elapsed.count();
    }

    /**
     * @brief Memory usage in bytes; 0 if it cannot be queried.
     */
    size_t get_memory_usage() const {
#ifdef USE_JEMALLOC
        size_t allocated = 0;
        size_t sz = sizeof(size_t);
        // epoch needs to be advanced to get up-to-date stats
        uint64_t epoch = 1;
        mallctl("epoch", &epoch, &sz, &epoch, sizeof(epoch));
        if (mallctl("stats.allocated", &allocated, &sz, NULL, 0) != 0) {
            return 0;
        }
        return allocated;
#else
        struct rusage usage;
        if (getrusage(RUSAGE_SELF, &usage) != 0) {
            return 0;
        }
        // ru_maxrss is in kilobytes on Linux
        return static_cast<size_t>(usage.ru_maxrss) * 1024;
#endif
    }

    void print_stats(const std::string& label = "Execution") const {
        double mb = get_memory_usage() / 1024.0 / 1024.0;

        std::cout << "[" << label << "] ";
        std::cout << "Time: " << std::fixed << std::setprecision(4) << get_elapsed_seconds() << " s";
#ifdef USE_JEMALLOC
        std::cout << ", Allocated: ";
#else
        std::cout << ", Peak RSS: ";
#endif
        std::cout << std::fixed << std::setprecision(2) << mb << " MB" << std::endl;
    }

private:
    std::chrono::steady_clock::time_point start_time_;
};

}  // namespace Utils
}  // namespace LoOP
