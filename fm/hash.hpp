/*	BSD 3-Clause License

	Copyright (c) 2022-2024, Paul Varga
	All rights reserved.

	Redistribution and use in source and binary forms, with or without
	modification, are permitted provided that the following conditions are met:

	1. Redistributions of source code must retain the above copyright notice, this
	   list of conditions and the following disclaimer.

	2. Redistributions in binary form must reproduce the above copyright notice,
	   this list of conditions and the following disclaimer in the documentation
	   and/or other materials provided with the distribution.

	3. Neither the name of the copyright holder nor the names of its
	   contributors may be used to endorse or promote products derived from
	   this software without specific prior written permission.

	THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
	AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
	IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
	DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE
	FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL
	DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR
	SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER
	CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY,
	OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
	OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
*/

#ifndef INC_FM__HASH_HPP
#define INC_FM__HASH_HPP

/**	@file
 *	Default hashers for the fastermap containers. Each produces a 32-bit hash
 *	suitable for Fibonacci indexing: scalar keys hash to (a fold of) their own
 *	bit pattern, since the multiplicative index mapping already spreads
 *	sequential values. Other keys defer to std::hash.
 */

#include <cstdint>
#include <cstring>
#include <functional>
#include <type_traits>

namespace fm
{

/**	Default hasher of the fastermap containers.
 *	@details
 *		* Integral & enumeration keys: the value itself, with 64-bit values folded by exclusive-or of their halves.
 *		* Floating point keys: the bit pattern, with negative zero normalized to zero so that equal keys hash equally.
 *		* Pointers: std::hash of the pointer, folded.
 *		* Anything else: std::hash, folded.
 *	@tparam T The key type.
 */
template <typename T>
struct hash
{
	std::uint32_t operator()(const T& value) const noexcept
	{
		if constexpr (std::is_enum_v<T>)
		{
			return fold(static_cast<std::make_unsigned_t<std::underlying_type_t<T>>>(value));
		}
		else if constexpr (std::is_same_v<T, bool>)
		{
			return value ? 1u : 0u;
		}
		else if constexpr (std::is_integral_v<T>)
		{
			return fold(static_cast<std::make_unsigned_t<T>>(value));
		}
		else if constexpr (std::is_floating_point_v<T>)
		{
			// +0.0 == -0.0, yet their bit patterns differ.
			const T normalized = value == T(0) ? T(0) : value;
			if constexpr (sizeof(T) <= sizeof(std::uint32_t))
			{
				std::uint32_t bits = 0;
				std::memcpy(&bits, &normalized, sizeof(T));
				return bits;
			}
			else if constexpr (sizeof(T) == sizeof(std::uint64_t))
			{
				std::uint64_t bits = 0;
				std::memcpy(&bits, &normalized, sizeof(T));
				return fold(bits);
			}
			else
			{
				return fold(std::hash<T>{}(normalized));
			}
		}
		else
		{
			return fold(std::hash<T>{}(value));
		}
	}

private:
	template <typename U>
	constexpr static std::uint32_t fold(const U value) noexcept
	{
		static_assert(std::is_unsigned_v<U>, "fm::hash::fold expects an unsigned value.");
		if constexpr (sizeof(U) > sizeof(std::uint32_t))
		{
			return std::uint32_t(std::uint64_t(value) ^ (std::uint64_t(value) >> 32));
		}
		else
		{
			return std::uint32_t(value);
		}
	}
};

/**	An injectable hasher for integral keys that fully mixes their bits (the murmur3 finalizer).
 *	@details Useful where keys share low bits, such as multiples of a large power of two, or where the hash
 *	tag of a generic_map should depend on every bit of the key.
 */
struct integer_mixer
{
	constexpr std::uint32_t operator()(const std::uint32_t value) const noexcept
	{
		std::uint32_t h = value;
		h ^= h >> 16;
		h *= 0x85ebca6bu;
		h ^= h >> 13;
		h *= 0xc2b2ae35u;
		h ^= h >> 16;
		return h;
	}
	constexpr std::uint32_t operator()(const std::uint64_t value) const noexcept
	{
		std::uint64_t h = value;
		h ^= h >> 33;
		h *= 0xff51afd7ed558ccdull;
		h ^= h >> 33;
		h *= 0xc4ceb9fe1a85ec53ull;
		h ^= h >> 33;
		return std::uint32_t(h ^ (h >> 32));
	}
	template <typename T, typename = std::enable_if_t<std::is_integral_v<T>>>
	constexpr std::uint32_t operator()(const T value) const noexcept
	{
		using unsigned_type = std::make_unsigned_t<T>;
		if constexpr (sizeof(T) > sizeof(std::uint32_t))
		{
			return (*this)(std::uint64_t(unsigned_type(value)));
		}
		else
		{
			return (*this)(std::uint32_t(unsigned_type(value)));
		}
	}
};

} // namespace fm

#endif
