#pragma once

namespace asmhom {

// Return-count bounds for distance searches
inline constexpr int kDefaultReturnCount = 10;
inline constexpr int kMaxReturnCount = 100;

// Reserved sketch database name for the query. Not a valid namespace ID,
// so it can never collide with a stored namespace.
inline constexpr const char* kQueryDbName = "<query>";

// Values outside [1, kMaxReturnCount] are replaced with kDefaultReturnCount.
inline constexpr int sanitize_return_count(int count) {
    return (count < 1 || count > kMaxReturnCount) ? kDefaultReturnCount : count;
}

} // namespace asmhom
