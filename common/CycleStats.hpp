#ifndef CYCLESTATS_HPP
#define CYCLESTATS_HPP

#include <algorithm>
#include <cstdint>
#include <limits>

// Execution time of each monitor cycle, in microseconds
struct CycleStats {
    uint64_t min_us = std::numeric_limits<uint64_t>::max();
    uint64_t max_us = 0;
    uint64_t total_us = 0;
    uint64_t count = 0;

    void update(uint64_t exec_us) {
        min_us = std::min(min_us, exec_us);
        max_us = std::max(max_us, exec_us);
        total_us += exec_us;
        count++;
    }

    double average() const { return count ? static_cast<double>(total_us) / count : 0.0; }
    uint64_t jitter() const { return count ? max_us - min_us : 0; }
};

#endif // CYCLESTATS_HPP
