/**
 * @file hash_counter.hpp
 * @brief Fixed-bucket chained hash table counting window keys
 *
 * Layout:
 * - heads_: one chain head per bucket (index into entries_, or NIL)
 * - entries_: append-only arena of {key, count, next}
 *
 * The bucket is the low bits of the key. The table never resizes; an
 * undersized table only makes chains longer. Chains link by arena index,
 * so entries never move between buckets and are all released together
 * with the table.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "window_key.hpp"

class HashCounter {
public:
    static constexpr uint32_t NIL = ~0U;
    static constexpr size_t DEFAULT_HASH_BITS = 18;
    static constexpr size_t MAX_HASH_BITS = 30;

    struct Entry {
        WindowKey key;
        uint64_t count;
        uint32_t next;
    };

private:
    std::vector<uint32_t> heads_;
    std::vector<Entry> entries_;
    WindowKey mask_;

    void init(size_t bucket_count);

public:
    /**
     * @brief Table of 2^hash_bits buckets
     * @throws std::invalid_argument unless 1 <= hash_bits <= MAX_HASH_BITS
     */
    explicit HashCounter(size_t hash_bits = DEFAULT_HASH_BITS);

    /**
     * @brief Table with an explicit bucket count
     * @throws std::invalid_argument unless bucket_count is a power of two
     */
    static HashCounter with_buckets(size_t bucket_count);

    HashCounter(const HashCounter&) = delete;
    HashCounter& operator=(const HashCounter&) = delete;
    // A moved-from counter is left as an empty one-bucket table.
    HashCounter(HashCounter&& other);
    HashCounter& operator=(HashCounter&& other);

    size_t bucket_index(WindowKey key) const {
        return static_cast<size_t>(key & mask_);
    }

    /**
     * @brief Add one occurrence of key, inserting it with count 1 if new
     *
     * Single chain walk: the matching entry is bumped in place, otherwise a
     * new entry becomes the head of the chain.
     */
    void increment(WindowKey key) {
        uint32_t& head = heads_[bucket_index(key)];
        for (uint32_t i = head; i != NIL; i = entries_[i].next) {
            if (entries_[i].key == key) {
                ++entries_[i].count;
                return;
            }
        }
        insert_head(head, key);
    }

    /**
     * @brief Occurrences of key so far, 0 if never seen
     */
    uint64_t get(WindowKey key) const {
        for (uint32_t i = heads_[bucket_index(key)]; i != NIL; i = entries_[i].next) {
            if (entries_[i].key == key) {
                return entries_[i].count;
            }
        }
        return 0;
    }

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }
    size_t bucket_count() const { return heads_.size(); }
    double load_factor() const { return static_cast<double>(entries_.size()) / heads_.size(); }

    size_t chain_length(size_t bucket) const;

    // Mainly for diagnostics: walks every chain.
    size_t max_chain_length() const;

    // Entries in insertion order
    std::vector<Entry>::const_iterator begin() const { return entries_.begin(); }
    std::vector<Entry>::const_iterator end() const { return entries_.end(); }

private:
    void insert_head(uint32_t& head, WindowKey key);
};
