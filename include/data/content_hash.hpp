/**
 * @file content_hash.hpp
 * @brief FNV-1a content hashing for fingerprints and cache keys
 *
 * Stable across runs and platforms of the same endianness, which is all
 * the persisted statistics artifact needs.
 */

#pragma once

#include <cstdint>
#include <cstdio>
#include <string>

namespace advisor
{
    namespace data
    {

        /**
         * @class ContentHash
         * @brief Incremental 64-bit FNV-1a hash
         */
        class ContentHash
        {
        public:
            void add_bytes(const void *data, size_t size)
            {
                const unsigned char *bytes = static_cast<const unsigned char *>(data);
                for (size_t i = 0; i < size; ++i)
                {
                    state_ ^= bytes[i];
                    state_ *= kPrime;
                }
            }

            /// Strings are length-prefixed so ("ab","c") and ("a","bc") differ
            void add(const std::string &text)
            {
                add(static_cast<std::uint64_t>(text.size()));
                add_bytes(text.data(), text.size());
            }

            void add(double value) { add_bytes(&value, sizeof(value)); }
            void add(long long value) { add_bytes(&value, sizeof(value)); }
            void add(int value) { add_bytes(&value, sizeof(value)); }
            void add(std::uint64_t value) { add_bytes(&value, sizeof(value)); }
            void add(bool value) { add(static_cast<int>(value)); }

            std::uint64_t value() const { return state_; }

            /// 16 lowercase hex digits
            std::string hex() const
            {
                char buffer[17];
                std::snprintf(buffer, sizeof(buffer), "%016llx", static_cast<unsigned long long>(state_));
                return std::string(buffer);
            }

        private:
            static constexpr std::uint64_t kOffset = 1469598103934665603ULL;
            static constexpr std::uint64_t kPrime = 1099511628211ULL;

            std::uint64_t state_ = kOffset;
        };

    } // namespace data
} // namespace advisor
