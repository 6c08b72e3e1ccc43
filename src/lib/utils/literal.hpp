#pragma once

namespace seqpart {

// Kibibyte
constexpr unsigned long long operator"" _KB(unsigned long long n) { return n * 1024; }

// Mebibyte
constexpr unsigned long long operator"" _MB(unsigned long long n) { return n * 1024 * 1024; }

// Gibibyte
constexpr unsigned long long operator"" _GB(unsigned long long n) { return n * 1024 * 1024 * 1024; }

}  // namespace seqpart
