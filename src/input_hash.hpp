#ifndef RETIREPLAN_INPUT_HASH_HPP
#define RETIREPLAN_INPUT_HASH_HPP

#include "projection_input.hpp"
#include <cstdint>
#include <string>

namespace retireplan {

// 64-bit FNV-1a. Stable across processes and platforms, not cryptographic.
class Fnv1a64 {
public:
    static constexpr uint64_t OFFSET_BASIS = 14695981039346656037ull;
    static constexpr uint64_t PRIME = 1099511628211ull;

    Fnv1a64() : hash_(OFFSET_BASIS) {}

    void update(const std::string& bytes);
    uint64_t value() const { return hash_; }

private:
    uint64_t hash_;
};

// Content hash of an input for memoising projections and narrative caches.
// Computed over the canonical JSON form, so income-stream order and a
// disabled phase config do not change it. Returns 16 lowercase hex digits.
std::string hash_projection_input(const ProjectionInput& input);

} // namespace retireplan

#endif // RETIREPLAN_INPUT_HASH_HPP
