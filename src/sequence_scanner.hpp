/**
 * @file sequence_scanner.hpp
 * @brief Sliding-window pass over an encoded sequence
 */

#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "hash_counter.hpp"
#include "symbol_encoding.hpp"

/**
 * @brief Feed every window of length L into counter, one increment per position
 * @return number of windows counted (0 when the sequence is shorter than L)
 * @throws std::invalid_argument if L is not a valid window length
 */
size_t count_into(const EncodedSequence& encoded, size_t length, HashCounter& counter);

/**
 * @brief Like count_into, but no window crosses a record boundary
 *
 * record_ends lists where each record stops (ascending offsets into
 * encoded); the packer starts over at every boundary. Bases after the
 * last listed end form one more record.
 *
 * @throws std::invalid_argument if record_ends is not ascending or
 *         points past the end of encoded
 */
size_t count_records(const EncodedSequence& encoded, const std::vector<size_t>& record_ends,
                     size_t length, HashCounter& counter);

/**
 * @brief Count all windows of length L into a fresh table of 2^hash_bits buckets
 */
HashCounter count_all(const EncodedSequence& encoded, size_t length,
                      size_t hash_bits = HashCounter::DEFAULT_HASH_BITS);

/**
 * @brief Look up an unencoded query after a count of windows of length L
 *
 * The query goes through the same encoder and packer as the corpus. A
 * query whose length differs from L cannot match and yields 0.
 */
uint64_t count_occurrences(const HashCounter& counter, const std::string& query, size_t length);
