#include <gtest/gtest.h>

#include <algorithm>
#include <numeric>
#include <stdexcept>
#include <vector>

#include "threadpool.hpp"

TEST(ThreadPool, blocks_cover_every_item_once) {
    std::vector<int> hits(1000, 0);
    parallel_for_blocks(
      hits.size(),
      4,
      [&](size_t begin, size_t end) {
          for (size_t i = begin; i < end; ++i) {
              ++hits[i];
          }
      },
      64);
    EXPECT_EQ(std::accumulate(hits.begin(), hits.end(), 0), 1000);
    EXPECT_EQ(*std::min_element(hits.begin(), hits.end()), 1);
}

TEST(ThreadPool, exception_in_block_reaches_caller) {
    std::vector<int> hits(100, 0);
    auto body = [&](size_t begin, size_t end) {
        if (begin <= 50 && 50 < end) {
            throw std::runtime_error("block failed");
        }
        for (size_t i = begin; i < end; ++i) {
            hits[i] = 1;
        }
    };
    EXPECT_THROW(parallel_for_blocks(hits.size(), 4, body, 10), std::runtime_error);
    // Blocks other than the failing one still ran
    EXPECT_EQ(std::accumulate(hits.begin(), hits.end(), 0), 90);

    // A single thread runs the body directly
    EXPECT_THROW(parallel_for_blocks(hits.size(), 1, body, 10), std::runtime_error);
}
