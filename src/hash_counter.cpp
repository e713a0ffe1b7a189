#include "hash_counter.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

HashCounter::HashCounter(size_t hash_bits) : mask_(0) {
    if (hash_bits < 1 || hash_bits > MAX_HASH_BITS) {
        throw std::invalid_argument("Hash bits must be between 1 and " +
                                    std::to_string(MAX_HASH_BITS) + ", got " +
                                    std::to_string(hash_bits));
    }
    init(size_t{1} << hash_bits);
}

HashCounter::HashCounter(HashCounter&& other)
    : heads_(std::move(other.heads_)), entries_(std::move(other.entries_)), mask_(other.mask_) {
    other.heads_ = {NIL};
    other.entries_.clear();
    other.mask_ = 0;
}

HashCounter& HashCounter::operator=(HashCounter&& other) {
    if (this != &other) {
        heads_ = std::move(other.heads_);
        entries_ = std::move(other.entries_);
        mask_ = other.mask_;
        other.heads_ = {NIL};
        other.entries_.clear();
        other.mask_ = 0;
    }
    return *this;
}

HashCounter HashCounter::with_buckets(size_t bucket_count) {
    if (bucket_count == 0 || (bucket_count & (bucket_count - 1)) != 0) {
        throw std::invalid_argument("Bucket count must be a power of two, got " +
                                    std::to_string(bucket_count));
    }
    if (bucket_count > (size_t{1} << MAX_HASH_BITS)) {
        throw std::invalid_argument("Bucket count too large: " + std::to_string(bucket_count));
    }
    HashCounter counter(1);
    counter.init(bucket_count);
    return counter;
}

void HashCounter::init(size_t bucket_count) {
    heads_.assign(bucket_count, NIL);
    entries_.clear();
    mask_ = static_cast<WindowKey>(bucket_count - 1);
}

void HashCounter::insert_head(uint32_t& head, WindowKey key) {
    if (entries_.size() >= NIL) {
        throw std::length_error("Hash counter holds too many distinct keys");
    }
    // head is a reference into heads_, which never reallocates
    entries_.push_back(Entry{key, 1, head});
    head = static_cast<uint32_t>(entries_.size() - 1);
}

size_t HashCounter::chain_length(size_t bucket) const {
    if (bucket >= heads_.size()) {
        throw std::out_of_range("Bucket " + std::to_string(bucket) + " out of range");
    }
    size_t length = 0;
    for (uint32_t i = heads_[bucket]; i != NIL; i = entries_[i].next) {
        ++length;
    }
    return length;
}

size_t HashCounter::max_chain_length() const {
    size_t longest = 0;
    for (size_t b = 0; b < heads_.size(); ++b) {
        if (heads_[b] != NIL) {
            longest = std::max(longest, chain_length(b));
        }
    }
    return longest;
}
