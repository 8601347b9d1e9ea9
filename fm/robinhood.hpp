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

#ifndef INC_FM__ROBINHOOD_HPP
#define INC_FM__ROBINHOOD_HPP

/**	@file
 *	This file declares the Robinhood-style open addressing engine shared by the
 *	fastermap containers (map, generic_map, multimap). Collisions are resolved
 *	by displacing the occupant that is closer to its home bucket ("richer")
 *	in favor of the entry that has travelled further, which bounds the
 *	variance of probe sequence lengths (PSL).
 *
 *	Like its sibling containers, the Robinhood "info" (distance & any cached
 *	hash) is stored apart from the "data" (key & value) so that probing mostly
 *	touches the dense info array.
 *
 *	Bucket indexes are derived by Fibonacci hashing of a 32-bit hash: the hash
 *	is multiplied by 2^32/phi and only the high bits are kept. Every table
 *	carries a run of tail slots past its nominal capacity equal to its probe
 *	limit (plus one empty sentinel), so that no probe sequence ever wraps
 *	around to the front of the table.
 *
 *	The probe limit is a resize trigger: an insertion whose candidate would
 *	reach the limit grows the table and retries. Removal uses backward-shift
 *	deletion instead of tombstones.
 *
 *	Performance considerations:
 *	a. The empty distance is zero and stored distances are PSL + 1, allowing a
 *	   single less-than comparison to detect both empty and richer slots.
 *	b. A running maximum distance bounds unsuccessful lookups.
 *	c. Growth always doubles and reinserts in slot order.
 *
 *	Numerous runtime asserts are enabled if NDEBUG is not defined due to
 *	FM_ROBINHOOD_ASSERT being defined to use the standard assert. It can be
 *	hollowed out if this is a performance issue during debugging.
 *
 *	Exception guarantees: key & value types must be noexcept move constructible
 *	and noexcept swappable. If the allocator throws while growing, the
 *	exception propagates and the container remains valid, but entries in
 *	flight during a nested growth may be released.
 *
 *	Iterator invalidation:
 *		Never:
 *			* get, find, at, contains, count, update.
 *		Always:
 *			* insert (when it grows), reserve (when it grows), erase, clear,
 *			  copy/move operator=, swap.
 *
 *	Iterators hold a pointer to the table's buckets and re-read their bounds on
 *	every increment, so a stale iterator never reads outside the allocation.
 */

#include <algorithm>
#include <cassert>
#include <climits>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <limits>
#include <memory>
#include <stdexcept>
#include <type_traits>
#include <utility>

#if !defined(FM_ROBINHOOD_ASSERT)
	/**	Transparently wraps assert to allow asserts to be turned off for the fm Robinhood-style hashtables in one location, if too costly.
	 */
	#define FM_ROBINHOOD_ASSERT(CONDITION, ...) \
		/* Comment: __VA_ARGS__ */ \
		assert(CONDITION)
#endif // !FM_ROBINHOOD_ASSERT

// Macros for branch prediction suggestion:
#if defined(__has_cpp_attribute)
	#if __has_cpp_attribute(likely)
		#define FM_ROBINHOOD_LIKELY(EXPRESSION) (EXPRESSION) [[likely]]
	#endif // __has_cpp_attribute(likely)
	#if __has_cpp_attribute(unlikely)
		#define FM_ROBINHOOD_UNLIKELY(EXPRESSION) (EXPRESSION) [[unlikely]]
	#endif // __has_cpp_attribute(unlikely)
#endif // __has_cpp_attribute
#if defined(__has_builtin)
	#if __has_builtin(__builtin_expect)
		#define FM_ROBINHOOD_EXPECT(EXPRESSION, CONSTANT) (__builtin_expect((EXPRESSION), (CONSTANT)))
	#endif
#elif defined(__GNUC__) && !defined(__llvm__) && __GNUC__ >= 3
	// Older versions of GCC support __builtin_expect, but don't provide __has_builtin.
	#define FM_ROBINHOOD_EXPECT(EXPRESSION, CONSTANT) (__builtin_expect((EXPRESSION), (CONSTANT)))
#endif // __GNUC__ && !__llvm__ && __GNUC__ >= 3
#if !defined(FM_ROBINHOOD_LIKELY)
	#if defined(FM_ROBINHOOD_EXPECT)
		#define FM_ROBINHOOD_LIKELY(EXPRESSION) FM_ROBINHOOD_EXPECT(!!(EXPRESSION), 1)
	#else // !FM_ROBINHOOD_EXPECT
		#define FM_ROBINHOOD_LIKELY(EXPRESSION) (EXPRESSION)
	#endif // !FM_ROBINHOOD_EXPECT
#endif // !FM_ROBINHOOD_LIKELY
#if !defined(FM_ROBINHOOD_UNLIKELY)
	#if defined(FM_ROBINHOOD_EXPECT)
		#define FM_ROBINHOOD_UNLIKELY(EXPRESSION) FM_ROBINHOOD_EXPECT(!!(EXPRESSION), 0)
	#else // !FM_ROBINHOOD_EXPECT
		#define FM_ROBINHOOD_UNLIKELY(EXPRESSION) (EXPRESSION)
	#endif // !FM_ROBINHOOD_EXPECT
#endif // !FM_ROBINHOOD_UNLIKELY

/**	A Robinhood-style hashtable implementation.
 */
namespace fm::robinhood
{
	/**	The size type of all tables. Determines the maximum table size.
	 */
	using size_type = std::uint32_t;

	/**	The hash width consumed by the engine. Wider hasher results are folded into this width.
	 */
	using hash_result = std::uint32_t;

	/**	The distance type of Robinhood info elements: zero for empty, otherwise PSL + 1.
	 */
	using distance_type = std::uint8_t;

	/**	The magic (sentinel) distance value that represents an empty Robinhood info.
	 *	@note Must be the minimum value so that other distances compare greater-than (so, zero).
	 *	@tparam DistanceType The distance type of the Robinhood hashtable information elements.
	 */
	template <typename DistanceType>
	constexpr DistanceType empty_distance_v = 0;

	/**	Count the bits needed to represent an unsigned value.
	 *	@param value The input value.
	 *	@returns floor(log2(value)) + 1, or zero if value is zero.
	 *	@tparam T An unsigned integer type.
	 */
	template <typename T>
	constexpr T bit_length(T value) noexcept
	{
		static_assert(std::is_unsigned_v<T>, "bit_length expects an unsigned integer type.");
		T bits = 0;
		for (; value != 0; value >>= 1)
		{
			++bits;
		}
		return bits;
	}
	/**	floor(log2(value)), taking log2ui(0) as zero.
	 */
	template <typename T>
	constexpr T log2ui(const T value) noexcept
	{
		static_assert(std::is_unsigned_v<T>, "log2ui expects an unsigned integer type.");
		return value == 0 ? T(0) : T(bit_length(value) - 1);
	}
	/**	Round up to a power of two.
	 *	@returns The smallest power of two not less than value. Zero if value is zero or if that power does not fit in T.
	 */
	template <typename T>
	constexpr T ceilui_power_of_two_or_zero(const T value) noexcept
	{
		static_assert(std::is_unsigned_v<T>, "ceilui_power_of_two_or_zero expects an unsigned integer type.");
		if (value <= 1)
		{
			return value;
		}
		const T bits = bit_length(T(value - 1));
		return bits < T(std::numeric_limits<T>::digits) ? T(T(1) << bits) : T(0);
	}
	// As above, but zero rounds up to one.
	template <typename T>
	constexpr T ceilui_power_of_two(const T value) noexcept
	{
		return value == 0 ? T(1) : ceilui_power_of_two_or_zero(value);
	}

	/**	The Fibonacci hashing multiplier for hash_result: 2^32 / phi, rounded to an odd number.
	 */
	constexpr hash_result fibonacci_fraction = 2654435769u;

	/**	Fold the result of a hasher into a hash_result.
	 *	@details Results wider than hash_result have their high half folded onto their low half by exclusive-or.
	 *	@param hash A result of a hash function.
	 *	@return The folded hash.
	 *	@tparam T An integral hasher result type.
	 */
	template <typename T>
	constexpr hash_result fold_hash(const T hash) noexcept
	{
		static_assert(std::is_integral_v<T>, "fold_hash expects an integral hash result.");
		using unsigned_type = std::make_unsigned_t<T>;
		if constexpr (sizeof(T) > sizeof(hash_result))
		{
			const std::uint64_t wide = std::uint64_t(unsigned_type(hash));
			return hash_result(wide ^ (wide >> 32));
		}
		else
		{
			return hash_result(unsigned_type(hash));
		}
	}

	// Expected to be a power-of-two by users:
	constexpr size_type default_bucket_count = 16;
	static_assert(ceilui_power_of_two(default_bucket_count) == default_bucket_count,
		"default_bucket_count expects to be used without rounding.");

	/**	The largest nominal capacity of any table.
	 */
	constexpr size_type max_bucket_count = size_type(1) << 31;

	/**	Derives a bucket index from a hash by Fibonacci (multiplicative) hashing.
	 *	@details Multiplies by 2^32/phi with wraparound and keeps the log2(capacity) high bits.
	 */
	class index_mapper final
	{
	public:
		/**	Construct for a given power-of-two capacity.
		 *	@param capacity The nominal capacity of the table. Zero maps every hash to zero.
		 */
		constexpr explicit index_mapper(const size_type capacity) noexcept
			: m_shift{ shift_bits(capacity) }
		{ }

		/**	Return the home bucket of a hash.
		 *	@param hash The hash of a key.
		 *	@return An index in [0, capacity), or zero if capacity is zero or one.
		 */
		constexpr size_type operator()(const hash_result hash) const noexcept
		{
			const hash_result product = hash_result(hash * fibonacci_fraction);
			// Shifted in 64 bits so that a shift of the full 32 bits is well-defined.
			return size_type(std::uint64_t(product) >> m_shift);
		}

		/**	Return the number of bits a product is shifted.
		 *	@return 32 - log2(capacity) where log2 rounds down.
		 */
		constexpr size_type get_shift() const noexcept
		{
			return m_shift;
		}

		/**	Return the number of bits to shift a product to clamp it to a given power-of-two.
		 *	@param capacity The nominal capacity of the table.
		 *	@return The shift width, sizeof(hash_result)*CHAR_BIT - bit_length(capacity) + 1.
		 */
		constexpr static size_type shift_bits(const size_type capacity) noexcept
		{
			return size_type(sizeof(hash_result)*CHAR_BIT) - bit_length(capacity) + 1;
		}

	private:
		size_type m_shift;
	};

	/**	Derives the maximum probe sequence length permitted for a capacity and load factor.
	 *	@details Exceeding the limit during insertion triggers growth rather than failure.
	 */
	class probe_limiter final
	{
	public:
		/**	The ceiling of any probe limit. Keeps room in one-byte distances for the multimap group tail.
		 */
		constexpr static size_type max_limit = 127;
		/**	The limit used for capacities absent from the lookup table.
		 */
		constexpr static size_type fallback_limit = 10;

		/**	Return the maximum PSL for a given capacity & load factor.
		 *	@details A load factor at or below one half uses the bit length of the capacity, a tight bound that
		 *	resizes early. Higher load factors use a lookup table that tolerates longer probes between resizes.
		 *	@param capacity The nominal (power-of-two) capacity.
		 *	@param load_factor The table's maximum load factor.
		 *	@return A probe limit in [1, max_limit].
		 */
		constexpr static size_type max_psl(const size_type capacity, const float load_factor) noexcept
		{
			size_type limit = fallback_limit;
			if (load_factor <= 0.5f)
			{
				limit = bit_length(capacity);
			}
			else if (capacity == ceilui_power_of_two(capacity))
			{
				const size_type bits = log2ui(capacity);
				if (bits >= first_table_bits && bits - first_table_bits < table_size)
				{
					limit = table[bits - first_table_bits];
				}
			}
			return std::clamp<size_type>(limit, 1, max_limit);
		}

		/**	Return the maximum PSL for a table grown from one with a given limit.
		 *	@details Never shrinks, so that the reinsertion of a table's entries into a larger one always has more room.
		 *	@param capacity The grown nominal (power-of-two) capacity.
		 *	@param load_factor The table's maximum load factor.
		 *	@param previous The probe limit before growing.
		 *	@return A probe limit in [1, max_limit].
		 */
		constexpr static size_type grown(const size_type capacity, const float load_factor, const size_type previous) noexcept
		{
			return std::min(std::max(max_psl(capacity, load_factor), size_type(previous + 1)), max_limit);
		}

	private:
		constexpr static size_type first_table_bits = 4;
		constexpr static size_type table_size = 26;
		// Capacities 2^4 (16) through 2^29.
		constexpr static size_type table[table_size] = {
			6, 8, 12, 16, 20, 24, 32, 36,
			40, 50, 60, 65, 70, 75, 80, 85,
			90, 94, 98, 102, 104, 108, 112, 116,
			120, 124
		};
	};

	/**	Distance bookkeeping shared by the Robinhood information elements below.
	 *	@details An element's distance is its probe sequence length plus one, so that zero can mean empty (see
	 *		empty_distance_v above). Derived elements add whatever part of the hash they cache.
	 *	@tparam Derived The information element type, returned by move_back().
	 *	@tparam DistanceType The distance type of the Robinhood hashtable information elements.
	 */
	template <typename Derived, typename DistanceType>
	class distance_info
	{
	public:
		static_assert(std::is_unsigned_v<DistanceType>, "Negative and non-integral DistanceType not supported.");

		using distance_type = DistanceType;

		constexpr bool empty() const noexcept
		{
			return m_distance == empty_distance_v<distance_type>;
		}
		constexpr distance_type get_distance() const noexcept
		{
			return m_distance;
		}
		constexpr static distance_type max_distance() noexcept
		{
			return std::numeric_limits<distance_type>::max();
		}
		/**	Mark the position empty. Cached hash bits are left as they are.
		 */
		constexpr void clear() noexcept
		{
			m_distance = empty_distance_v<distance_type>;
		}
		// One step further from home.
		constexpr void push_forward() noexcept
		{
			++m_distance;
		}
		/**	Return a copy one step closer to home, for backward-shift deletion.
		 */
		constexpr Derived move_back() const noexcept
		{
			FM_ROBINHOOD_ASSERT(m_distance > 1, "robinhood::distance_info::move_back on an element already at home or empty.");
			Derived result{ static_cast<const Derived&>(*this) };
			--static_cast<distance_info&>(result).m_distance;
			return result;
		}

	protected:
		// Defaulted so that derived elements stay trivial.
		distance_info() = default;
		constexpr explicit distance_info(const distance_type distance) noexcept
			: m_distance{ distance }
		{ }

		void swap_distance(distance_info& other) noexcept
		{
			using std::swap;
			swap(m_distance, other.m_distance);
		}

	private:
		distance_type m_distance;
	};

	/**	Information element holding only a distance; every hash "matches" and keys are always compared.
	 */
	template <typename DistanceType>
	class info final : public distance_info<info<DistanceType>, DistanceType>
	{
		using base_type = distance_info<info<DistanceType>, DistanceType>;

	public:
		using typename base_type::distance_type;

		info() = default;
		constexpr info(const distance_type distance, [[maybe_unused]] const hash_result hash) noexcept
			: base_type{ distance }
		{ }

		friend void swap(info& lhs, info& rhs) noexcept
		{
			lhs.swap_distance(rhs);
		}
		constexpr static bool cached_hash_equal(const hash_result /*hash*/) noexcept
		{
			return true;
		}
	};

	/**	Information element with a partial hash tag beside the distance.
	 *	@details The tag is the low TagBits bits of the hash. Comparing tags first rejects most mismatching keys
	 *		without reading the entry itself.
	 *	@tparam DistanceType The distance type of the Robinhood hashtable information elements.
	 *	@tparam TagBits The width of the tag in bits, 1 through 8.
	 */
	template <typename DistanceType, unsigned TagBits>
	class tagged_info final : public distance_info<tagged_info<DistanceType, TagBits>, DistanceType>
	{
		using base_type = distance_info<tagged_info<DistanceType, TagBits>, DistanceType>;

	public:
		static_assert(TagBits >= 1 && TagBits <= 8, "tagged_info supports tags of 1 to 8 bits.");

		using typename base_type::distance_type;
		using tag_type = std::uint8_t;

		constexpr static hash_result tag_mask = (hash_result(1) << TagBits) - 1;

		tagged_info() = default;
		constexpr tagged_info(const distance_type distance, const hash_result hash) noexcept
			: base_type{ distance }
			, m_tag{ make_tag(hash) }
		{ }

		friend void swap(tagged_info& lhs, tagged_info& rhs) noexcept
		{
			lhs.swap_distance(rhs);
			using std::swap;
			swap(lhs.m_tag, rhs.m_tag);
		}

		constexpr tag_type get_tag() const noexcept
		{
			return m_tag;
		}
		constexpr bool cached_hash_equal(const hash_result hash) const noexcept
		{
			return m_tag == make_tag(hash);
		}
		constexpr static tag_type make_tag(const hash_result hash) noexcept
		{
			return tag_type(hash & tag_mask);
		}

	private:
		tag_type m_tag;
	};

	/**	Information element caching the full hash of its entry.
	 *	@details The multimap needs whole hashes to tell where one key's group ends and the next begins. Growth
	 *		also reuses them instead of hashing every key again.
	 */
	template <typename DistanceType>
	class hashed_info final : public distance_info<hashed_info<DistanceType>, DistanceType>
	{
		using base_type = distance_info<hashed_info<DistanceType>, DistanceType>;

	public:
		using typename base_type::distance_type;

		hashed_info() = default;
		constexpr hashed_info(const distance_type distance, const hash_result hash) noexcept
			: base_type{ distance }
			, m_hash{ hash }
		{ }

		friend void swap(hashed_info& lhs, hashed_info& rhs) noexcept
		{
			lhs.swap_distance(rhs);
			using std::swap;
			swap(lhs.m_hash, rhs.m_hash);
		}

		constexpr hash_result get_hash() const noexcept
		{
			return m_hash;
		}
		constexpr bool cached_hash_equal(const hash_result hash) const noexcept
		{
			return m_hash == hash;
		}

	private:
		hash_result m_hash;
	};

	/**	A key/value container akin to std::pair, stored in table "data".
	 *	@details Exposed to users only by const reference (iteration) so the key cannot be mutated in place.
	 *	@tparam K The key or first member's type.
	 *	@tparam V The value or second member's type.
	 */
	template <typename K, typename V>
	struct key_value_pair final
	{
		using key_type = K;
		using value_type = V;
		using first_type = key_type;
		using second_type = value_type;

		/**	std::pair-like accessible first member.
		 */
		first_type first;
		/**	std::pair-like accessible second member.
		 */
		second_type second;

		/**	Construct from a given key and value.
		 *	@param key The value to forward to first (or key).
		 *	@param value The value to forward to second (or value).
		 */
		template <typename KeyArg, typename ValueArg>
		constexpr key_value_pair(KeyArg&& key, ValueArg&& value)
			noexcept(std::is_nothrow_constructible_v<key_type, KeyArg&&>
				&& std::is_nothrow_constructible_v<value_type, ValueArg&&>)
			: first(std::forward<KeyArg>(key))
			, second(std::forward<ValueArg>(value))
		{ }
		key_value_pair(const key_value_pair&) = default;
		key_value_pair(key_value_pair&&) = default;
		key_value_pair& operator=(const key_value_pair&) = default;
		key_value_pair& operator=(key_value_pair&&) = default;
		~key_value_pair() = default;

		void swap(key_value_pair& other)
			noexcept(std::is_nothrow_swappable_v<key_type> && std::is_nothrow_swappable_v<value_type>)
		{
			using std::swap;
			swap(first, other.first);
			swap(second, other.second);
		}
		friend void swap(key_value_pair& lhs, key_value_pair& rhs)
			noexcept(std::is_nothrow_swappable_v<key_type> && std::is_nothrow_swappable_v<value_type>)
		{
			lhs.swap(rhs);
		}
	};

	/**	Describes the storage of a table's key/value pairs.
	 *	@tparam Key The key type.
	 *	@tparam T The mapped type.
	 *	@tparam InfoType The Robinhood info type (info, tagged_info, hashed_info).
	 *	@tparam GroupTail Slots appended past the probe limit to absorb hash groups shifted at the end of the table.
	 */
	template <typename Key, typename T, typename InfoType, size_type GroupTail = 0>
	struct policy final
	{
		using key_type = Key;
		using mapped_type = T;
		using value_type = key_value_pair<Key, T>;
		using info_type = InfoType;
		constexpr static size_type group_tail = GroupTail;
	};

	/**	Return a zero-capacity buckets' shared info element.
	 *	@details Never written: zero-capacity buckets have a slot count of zero and a running max distance of zero.
	 *	@tparam InfoType The type of Robinhood info.
	 */
	template <typename InfoType>
	InfoType& empty_info() noexcept
	{
		static InfoType empty{ empty_distance_v<typename InfoType::distance_type>, 0 };
		return empty;
	}

	/**	A sized container of key/value pairs, associated Robinhood info, an element count, and allocator.
	 *	@details Also owns the per-table state that is replaced with the allocation: the index mapper, the
	 *	probe limit and the running maximum distance.
	 *	@tparam PolicyType The Robinhood hashtable policy type.
	 *	@tparam Allocator An std::allocator-like class.
	 */
	template <typename PolicyType, typename Allocator>
	class buckets
		// To take advantage of empty base optimization:
		: private std::allocator_traits<Allocator>::template rebind_alloc<typename PolicyType::value_type>
	{
	public:
		using policy_type = PolicyType;
		using value_type = typename policy_type::value_type;
		using info_type = typename policy_type::info_type;
		using distance_type = typename info_type::distance_type;
		using allocator_type = typename std::allocator_traits<Allocator>::template rebind_alloc<value_type>;
		using allocator_traits = std::allocator_traits<allocator_type>;
		using info_allocator_type = typename allocator_traits::template rebind_alloc<info_type>;
		using info_allocator_traits = std::allocator_traits<info_allocator_type>;

		/**	The number of Robinhood info items in addition to the capacity and probe limit.
		 *	@details One always-empty sentinel, plus any group tail.
		 */
		constexpr static size_type info_tail = 1 + policy_type::group_tail;

		/**	Minimal constructor for zero capacity.
		 */
		explicit buckets(const allocator_type& alloc) noexcept
			: allocator_type{ alloc }
			, m_info{ &empty_info<info_type>() }
			, m_data{ nullptr }
			, m_mapper{ 0 }
			, m_capacity{ 0 }
			, m_slot_count{ 0 }
			, m_count{ 0 }
			, m_probe_limit{ 0 }
			, m_max_distance{ 0 }
		{ }
		/**	Constructor for a given capacity and probe limit.
		 *	@param capacity The nominal capacity. Zero results in zero capacity buckets.
		 *	@param probe_limit The maximum PSL of the table.
		 */
		buckets(const size_type capacity, const size_type probe_limit, const allocator_type& alloc)
			: buckets{ alloc }
		{
			if (capacity > 0)
			{
				const size_type slot_count = capacity + probe_limit + info_tail;
				info_allocator_type info_alloc{ get_allocator() };
				info_type* const info = info_allocator_traits::allocate(info_alloc, slot_count);
				try
				{
					m_data = allocator_traits::allocate(get_allocator(), slot_count);
				}
				catch (...)
				{
					info_allocator_traits::deallocate(info_alloc, info, slot_count);
					throw;
				}
				std::uninitialized_fill_n(info, slot_count, info_type{ empty_distance_v<distance_type>, 0 });
				m_info = info;
				m_mapper = index_mapper{ capacity };
				m_capacity = capacity;
				m_slot_count = slot_count;
				m_probe_limit = probe_limit;
			}
		}
		/**	Copy constructor with a given allocator.
		 *	@details Copies each entry into the same slot, preserving the Robinhood layout.
		 */
		buckets(const buckets& other, const allocator_type& alloc)
			: buckets{ other.m_capacity, other.m_probe_limit, alloc }
		{
			// The delegated constructor has completed: should a copy throw, ~buckets destroys those already copied.
			for (size_type index = 0; index < other.m_slot_count; ++index)
			{
				if (!other.m_info[index].empty())
				{
					allocator_traits::construct(get_allocator(), m_data + index, other.m_data[index]);
					m_info[index] = other.m_info[index];
					++m_count;
				}
			}
			m_max_distance = other.m_max_distance;
		}
		buckets(const buckets& other)
			: buckets{ other, allocator_traits::select_on_container_copy_construction(other.get_allocator()) }
		{ }
		buckets(buckets&& other) noexcept
			: buckets{ other.get_allocator() }
		{
			swap(other);
		}
		buckets& operator=(const buckets&) = delete;
		buckets& operator=(buckets&&) = delete;
		~buckets()
		{
			release();
		}

		/**	Swap operation with a given buckets.
		 *	@param other The buckets with which to swap allocator, storage and state.
		 */
		void swap(buckets& other) noexcept
		{
			using std::swap;
			swap(static_cast<allocator_type&>(*this), static_cast<allocator_type&>(other));
			swap(m_info, other.m_info);
			swap(m_data, other.m_data);
			swap(m_mapper, other.m_mapper);
			swap(m_capacity, other.m_capacity);
			swap(m_slot_count, other.m_slot_count);
			swap(m_count, other.m_count);
			swap(m_probe_limit, other.m_probe_limit);
			swap(m_max_distance, other.m_max_distance);
		}
		friend void swap(buckets& lhs, buckets& rhs) noexcept
		{
			lhs.swap(rhs);
		}

		constexpr allocator_type& get_allocator() noexcept
		{
			return *this;
		}
		constexpr const allocator_type& get_allocator() const noexcept
		{
			return *this;
		}

		/**	Return the nominal (power-of-two) capacity.
		 */
		constexpr size_type get_capacity() const noexcept
		{
			return m_capacity;
		}
		/**	Return the number of slots: capacity, probe limit and info_tail.
		 */
		constexpr size_type get_slot_count() const noexcept
		{
			return m_slot_count;
		}
		constexpr size_type get_count() const noexcept
		{
			return m_count;
		}
		constexpr size_type get_probe_limit() const noexcept
		{
			return m_probe_limit;
		}
		/**	Return the greatest distance stored since the last clear.
		 *	@details Never decreases on erase, so it remains an upper bound.
		 */
		constexpr distance_type get_max_distance() const noexcept
		{
			return m_max_distance;
		}
		/**	Record a distance that has been stored.
		 *	@param distance The distance of an info placed in these buckets.
		 */
		constexpr void note_distance(const distance_type distance) noexcept
		{
			m_max_distance = std::max(m_max_distance, distance);
		}

		/**	Return the home bucket of a hash.
		 */
		constexpr size_type home(const hash_result hash) const noexcept
		{
			return m_mapper(hash);
		}

		constexpr info_type* get_info() noexcept
		{
			return m_info;
		}
		constexpr const info_type* get_info() const noexcept
		{
			return m_info;
		}
		constexpr value_type& get_value(const size_type index) noexcept
		{
			FM_ROBINHOOD_ASSERT(index < m_slot_count && !m_info[index].empty(), "robinhood::buckets::get_value expects an occupied index.");
			return m_data[index];
		}
		constexpr const value_type& get_value(const size_type index) const noexcept
		{
			FM_ROBINHOOD_ASSERT(index < m_slot_count && !m_info[index].empty(), "robinhood::buckets::get_value expects an occupied index.");
			return m_data[index];
		}

		/**	Return the first occupied index at or after a given index.
		 *	@param index The index from which to search.
		 *	@return The index of an occupied slot, or the slot count if none.
		 */
		constexpr size_type next_occupied(size_type index) const noexcept
		{
			while (index < m_slot_count && m_info[index].empty())
			{
				++index;
			}
			return std::min(index, m_slot_count);
		}

		/**	Construct a value and info at an empty index.
		 *	@param index The empty index.
		 *	@param info The info to store at index.
		 *	@param value The value to move into index.
		 */
		void emplace(const size_type index, const info_type& info, value_type&& value) noexcept
		{
			FM_ROBINHOOD_ASSERT(index < m_slot_count && m_info[index].empty(), "robinhood::buckets::emplace expects an empty index.");
			FM_ROBINHOOD_ASSERT(!info.empty(), "robinhood::buckets::emplace expects a non-empty info.");
			allocator_traits::construct(get_allocator(), m_data + index, std::move(value));
			m_info[index] = info;
			note_distance(info.get_distance());
			++m_count;
		}
		/**	Destroy the value at an occupied index and mark it empty.
		 *	@param index The occupied index.
		 */
		void erase(const size_type index) noexcept
		{
			FM_ROBINHOOD_ASSERT(index < m_slot_count && !m_info[index].empty(), "robinhood::buckets::erase expects an occupied index.");
			allocator_traits::destroy(get_allocator(), m_data + index);
			m_info[index].clear();
			--m_count;
		}
		/**	Move a value and info to the previous, empty index. Decrements the info's distance.
		 *	@param former The empty index, one before current.
		 *	@param current The occupied index to vacate.
		 */
		void move_back(const size_type former, const size_type current) noexcept
		{
			FM_ROBINHOOD_ASSERT(former + 1 == current, "robinhood::buckets::move_back expects adjacent indexes.");
			FM_ROBINHOOD_ASSERT(m_info[former].empty(), "robinhood::buckets::move_back expects an empty former index.");
			allocator_traits::construct(get_allocator(), m_data + former, std::move(m_data[current]));
			m_info[former] = m_info[current].move_back();
			allocator_traits::destroy(get_allocator(), m_data + current);
			m_info[current].clear();
		}
		/**	Move a value and info to the next, empty index. Increments the info's distance.
		 *	@param current The occupied index to vacate.
		 */
		void move_forward(const size_type current) noexcept
		{
			const size_type next = current + 1;
			FM_ROBINHOOD_ASSERT(next < m_slot_count && m_info[next].empty(), "robinhood::buckets::move_forward expects an empty next index.");
			FM_ROBINHOOD_ASSERT(m_info[current].get_distance() < info_type::max_distance(), "robinhood::buckets::move_forward would overflow the distance.");
			allocator_traits::construct(get_allocator(), m_data + next, std::move(m_data[current]));
			m_info[next] = m_info[current];
			m_info[next].push_forward();
			note_distance(m_info[next].get_distance());
			allocator_traits::destroy(get_allocator(), m_data + current);
			m_info[current].clear();
		}

		/**	Destroy every value and reset every info to empty. Capacity is retained.
		 */
		void clear() noexcept
		{
			for (size_type index = 0; index < m_slot_count; ++index)
			{
				if (!m_info[index].empty())
				{
					if constexpr (!std::is_trivially_destructible_v<value_type>)
					{
						allocator_traits::destroy(get_allocator(), m_data + index);
					}
					m_info[index].clear();
				}
			}
			m_count = 0;
			m_max_distance = 0;
		}

	private:
		/**	Destroy all values and deallocate.
		 */
		void release() noexcept
		{
			if (m_slot_count > 0)
			{
				clear();
				info_allocator_type info_alloc{ get_allocator() };
				info_allocator_traits::deallocate(info_alloc, m_info, m_slot_count);
				allocator_traits::deallocate(get_allocator(), m_data, m_slot_count);
			}
		}

		/**	Robinhood info, one per slot.
		 *	@details Points to empty_info when m_slot_count is zero.
		 */
		info_type* m_info;
		/**	Storage for values, one per slot. Only constructed where the matching info is non-empty.
		 */
		value_type* m_data;
		index_mapper m_mapper;
		size_type m_capacity;
		size_type m_slot_count;
		size_type m_count;
		size_type m_probe_limit;
		distance_type m_max_distance;
	};

	/**	A read-only forward iterator over the occupied slots of buckets.
	 *	@tparam BucketsType The buckets type iterated.
	 */
	template <typename BucketsType>
	class const_iterator final
	{
	public:
		using buckets_type = BucketsType;
		using iterator_category = std::forward_iterator_tag;
		using value_type = typename buckets_type::value_type;
		using difference_type = std::ptrdiff_t;
		using pointer = const value_type*;
		using reference = const value_type&;

		constexpr const_iterator() noexcept
			: m_buckets{ nullptr }
			, m_index{ 0 }
		{ }
		/**	Construct for a given buckets and index.
		 *	@param buckets The iterated buckets. Stored as a pointer.
		 *	@param index An occupied index or the slot count.
		 */
		constexpr const_iterator(const buckets_type& buckets, const size_type index) noexcept
			: m_buckets{ &buckets }
			, m_index{ index }
		{ }

		constexpr reference operator*() const noexcept
		{
			return m_buckets->get_value(m_index);
		}
		constexpr pointer operator->() const noexcept
		{
			return &m_buckets->get_value(m_index);
		}
		constexpr const_iterator& operator++() noexcept
		{
			m_index = m_buckets->next_occupied(m_index + 1);
			return *this;
		}
		constexpr const_iterator operator++(int) noexcept
		{
			const_iterator result{ *this };
			++(*this);
			return result;
		}
		constexpr bool operator==(const const_iterator& other) const noexcept
		{
			return m_buckets == other.m_buckets && m_index == other.m_index;
		}
		constexpr bool operator!=(const const_iterator& other) const noexcept
		{
			return !(*this == other);
		}

		/**	Return the slot index of this iterator.
		 */
		constexpr size_type get_index() const noexcept
		{
			return m_index;
		}

	private:
		const buckets_type* m_buckets;
		size_type m_index;
	};

	/**	Default max load factor for single-value tables.
	 */
	constexpr float default_load_factor = 0.875f;

	/**	Throws std::invalid_argument if a load factor is outside (0, 1].
	 *	@param load_factor The max load factor given to a constructor.
	 *	@return The validated load factor.
	 */
	inline float checked_load_factor(const float load_factor)
	{
		if (!(load_factor > 0.0f && load_factor <= 1.0f))
		{
			throw std::invalid_argument("fm::robinhood load_factor must be within (0, 1].");
		}
		return load_factor;
	}

	/**	Return the power-of-two capacity for a requested bucket count.
	 *	@param bucket_count The requested bucket count. Zero yields one.
	 *	@return The next power of two at or above bucket_count.
	 */
	inline size_type checked_bucket_count(const std::size_t bucket_count)
	{
		if (bucket_count > max_bucket_count)
		{
			throw std::length_error("fm::robinhood bucket_count exceeds max_bucket_count.");
		}
		return ceilui_power_of_two(size_type(bucket_count));
	}

	/**	A Robinhood hashtable of unique keys.
	 *	@details Insertion displaces richer occupants, erase shifts displaced successors back, and growth is a full
	 *	rehash into a doubled table. Shared by map and generic_map, which differ only in their info type.
	 *	@tparam PolicyType The Robinhood hashtable policy type.
	 *	@tparam Hash The hasher type. Results are folded to 32 bits.
	 *	@tparam KeyEqual The key equality comparison type.
	 *	@tparam Allocator An std::allocator-like class.
	 */
	template <typename PolicyType, typename Hash, typename KeyEqual, typename Allocator>
	class hashtable : public KeyEqual, public Hash
	{
	public:
		using hashtable_type = hashtable<PolicyType, Hash, KeyEqual, Allocator>;
		using policy_type = PolicyType;
		using hasher = Hash;
		using key_equal = KeyEqual;
		using key_type = typename policy_type::key_type;
		using mapped_type = typename policy_type::mapped_type;
		using value_type = typename policy_type::value_type;
		using info_type = typename policy_type::info_type;
		using distance_type = typename info_type::distance_type;
		using size_type = robinhood::size_type;
		using buckets_type = buckets<policy_type, Allocator>;
		using allocator_type = typename buckets_type::allocator_type;
		using const_iterator = robinhood::const_iterator<buckets_type>;
		using iterator = const_iterator;

		// Required by do_place (swap loop) and transfer (moves out of the old table).
		static_assert(std::is_nothrow_move_constructible_v<value_type>, "value_type expected to have noexcept move constructor.");
		static_assert(std::is_nothrow_swappable_v<value_type>, "value_type expected to have noexcept swap operation.");

		/**	Construct with a given bucket count, load factor, hasher, key equality & allocator.
		 *	@param bucket_count The initial capacity, rounded up to a power of two.
		 *	@param load_factor The max load factor in (0, 1].
		 */
		hashtable(const std::size_t bucket_count, const float load_factor, const hasher& hash, const key_equal& equal, const allocator_type& alloc)
			: key_equal{ equal }
			, hasher{ hash }
			, m_buckets{ alloc }
			, m_load_factor{ checked_load_factor(load_factor) }
		{
			const size_type capacity = checked_bucket_count(bucket_count);
			buckets_type initial{ capacity, probe_limiter::max_psl(capacity, m_load_factor), alloc };
			m_buckets.swap(initial);
		}
		hashtable(const hashtable& other)
			: key_equal{ static_cast<const key_equal&>(other) }
			, hasher{ static_cast<const hasher&>(other) }
			, m_buckets{ other.m_buckets }
			, m_load_factor{ other.m_load_factor }
		{ }
		hashtable(hashtable&& other) noexcept
			: key_equal{ std::move(static_cast<key_equal&>(other)) }
			, hasher{ std::move(static_cast<hasher&>(other)) }
			, m_buckets{ std::move(other.m_buckets) }
			, m_load_factor{ other.m_load_factor }
		{ }
		hashtable& operator=(const hashtable& other)
		{
			if (this != &other)
			{
				hashtable copy{ other };
				swap(copy);
			}
			return *this;
		}
		hashtable& operator=(hashtable&& other) noexcept
		{
			if (this != &other)
			{
				hashtable moved{ std::move(other) };
				swap(moved);
			}
			return *this;
		}
		~hashtable() = default;

		void swap(hashtable& other) noexcept
		{
			static_assert(std::is_nothrow_swappable_v<hasher>, "hasher expected to have noexcept swap operation.");
			static_assert(std::is_nothrow_swappable_v<key_equal>, "key_equal expected to have noexcept swap operation.");
			using std::swap;
			swap(static_cast<key_equal&>(*this), static_cast<key_equal&>(other));
			swap(static_cast<hasher&>(*this), static_cast<hasher&>(other));
			m_buckets.swap(other.m_buckets);
			swap(m_load_factor, other.m_load_factor);
		}

		/**	Insert a key & value if the key is not already present.
		 *	@param key The key to insert.
		 *	@param value The value to associate with key.
		 *	@return True if inserted, false if key was present (its value is left untouched).
		 */
		template <typename KeyArg, typename ValueArg>
		bool insert(KeyArg&& key, ValueArg&& value)
		{
			const hash_result hash = do_hash(key);
			if (do_find(hash, key) != npos)
			{
				return false;
			}
			while FM_ROBINHOOD_UNLIKELY(load_exceeded(m_buckets.get_count() + 1))
			{
				grow();
			}
			value_type candidate{ std::forward<KeyArg>(key), std::forward<ValueArg>(value) };
			do_place(hash, candidate);
			return true;
		}

		/**	Copy the value associated with a key.
		 *	@param key The key to find.
		 *	@param value Assigned the associated value, if found.
		 *	@return True if found.
		 */
		bool get(const key_type& key, mapped_type& value) const
		{
			const size_type index = do_find(do_hash(key), key);
			if (index == npos)
			{
				return false;
			}
			value = m_buckets.get_value(index).second;
			return true;
		}

		/**	Overwrite the value associated with a key in place.
		 *	@param key The key to find.
		 *	@param value The new value.
		 *	@return True if found and updated, false if key is absent.
		 */
		template <typename ValueArg>
		bool update(const key_type& key, ValueArg&& value)
		{
			const size_type index = do_find(do_hash(key), key);
			if (index == npos)
			{
				return false;
			}
			m_buckets.get_value(index).second = std::forward<ValueArg>(value);
			return true;
		}

		/**	Remove a key and its value.
		 *	@param key The key to remove.
		 *	@return True if removed, false if key is absent.
		 */
		bool erase(const key_type& key)
		{
			const size_type index = do_find(do_hash(key), key);
			if (index == npos)
			{
				return false;
			}
			do_erase(index);
			return true;
		}

		bool contains(const key_type& key) const
		{
			return do_find(do_hash(key), key) != npos;
		}
		size_type count(const key_type& key) const
		{
			return contains(key) ? 1 : 0;
		}
		const_iterator find(const key_type& key) const
		{
			const size_type index = do_find(do_hash(key), key);
			return index == npos ? end() : const_iterator{ m_buckets, index };
		}

		/**	Return the value associated with a key.
		 *	@param key The key to find.
		 *	@return A reference to the associated value.
		 *	@throws std::out_of_range if key is absent.
		 */
		mapped_type& at(const key_type& key)
		{
			const size_type index = do_find(do_hash(key), key);
			if (index == npos)
			{
				throw std::out_of_range("fm::robinhood::hashtable::at key not found.");
			}
			return m_buckets.get_value(index).second;
		}
		const mapped_type& at(const key_type& key) const
		{
			return const_cast<hashtable&>(*this).at(key);
		}

		/**	Remove every entry. Capacity and probe limit are retained.
		 */
		void clear() noexcept
		{
			m_buckets.clear();
		}

		/**	Grow so that count entries may be held without exceeding the max load factor.
		 *	@param count The number of entries to prepare for.
		 */
		void reserve(const std::size_t count)
		{
			const double required = std::ceil(double(count) / double(m_load_factor));
			if (required > double(robinhood::max_bucket_count))
			{
				throw std::length_error("fm::robinhood::hashtable::reserve exceeds max_bucket_count.");
			}
			const size_type capacity = ceilui_power_of_two(size_type(required));
			if (capacity > m_buckets.get_capacity())
			{
				grow_to(capacity);
			}
		}

		constexpr size_type size() const noexcept
		{
			return m_buckets.get_count();
		}
		constexpr bool empty() const noexcept
		{
			return size() == 0;
		}
		constexpr size_type bucket_count() const noexcept
		{
			return m_buckets.get_capacity();
		}
		constexpr static size_type max_bucket_count() noexcept
		{
			return robinhood::max_bucket_count;
		}
		float load_factor() const noexcept
		{
			return bucket_count() == 0 ? 0.0f : float(size()) / float(bucket_count());
		}
		constexpr float max_load_factor() const noexcept
		{
			return m_load_factor;
		}
		/**	Return the home bucket of a key.
		 */
		size_type bucket(const key_type& key) const
		{
			return m_buckets.home(do_hash(key));
		}

		const_iterator begin() const noexcept
		{
			return const_iterator{ m_buckets, m_buckets.next_occupied(0) };
		}
		const_iterator end() const noexcept
		{
			return const_iterator{ m_buckets, m_buckets.get_slot_count() };
		}
		const_iterator cbegin() const noexcept
		{
			return begin();
		}
		const_iterator cend() const noexcept
		{
			return end();
		}

		/**	Return the number of slots, including those past bucket_count absorbing displaced entries.
		 */
		constexpr size_type slot_count() const noexcept
		{
			return m_buckets.get_slot_count();
		}
		/**	Return the PSL of the entry at a slot.
		 *	@param slot An index less than slot_count().
		 *	@return The distance of the entry from its home bucket, or -1 if the slot is empty.
		 */
		int probe_length(const size_type slot) const noexcept
		{
			FM_ROBINHOOD_ASSERT(slot < slot_count(), "robinhood::hashtable::probe_length expects a slot less than slot_count.");
			return int(m_buckets.get_info()[slot].get_distance()) - 1;
		}
		/**	Return the slot index an iterator refers to.
		 */
		constexpr size_type index_of(const const_iterator& it) const noexcept
		{
			return it.get_index();
		}
		/**	Return the greatest PSL stored since the last clear.
		 */
		size_type max_probe_length() const noexcept
		{
			const distance_type distance = m_buckets.get_max_distance();
			return distance == 0 ? 0 : size_type(distance - 1);
		}
		/**	Return the PSL at which insertion grows the table.
		 */
		constexpr size_type probe_limit() const noexcept
		{
			return m_buckets.get_probe_limit();
		}

		hasher hash_function() const
		{
			return static_cast<const hasher&>(*this);
		}
		key_equal key_eq() const
		{
			return static_cast<const key_equal&>(*this);
		}
		allocator_type get_allocator() const
		{
			return m_buckets.get_allocator();
		}

	protected:
		/**	The index returned by do_find when a key is not found.
		 */
		constexpr static size_type npos = std::numeric_limits<size_type>::max();

		/**	Hash a key and fold the result.
		 */
		hash_result do_hash(const key_type& key) const
		{
			return fold_hash(static_cast<const hasher&>(*this)(key));
		}

		/**	Find the slot of a key.
		 *	@details Scans from home until the running max distance, stopping early at an empty or richer slot.
		 *	An entry can only match where its distance equals the probe distance, that is, where it shares the home.
		 *	@param hash The folded hash of key.
		 *	@param key The key to find.
		 *	@return The slot index, or npos if not found.
		 */
		size_type do_find(const hash_result hash, const key_type& key) const
		{
			const info_type* const info = m_buckets.get_info();
			const size_type max_distance = m_buckets.get_max_distance();
			size_type index = m_buckets.home(hash);
			for (size_type distance = 1; distance <= max_distance; ++distance, ++index)
			{
				const size_type current = info[index].get_distance();
				if (current < distance)
				{
					break;
				}
				if (current == distance
					&& info[index].cached_hash_equal(hash)
					&& static_cast<const key_equal&>(*this)(m_buckets.get_value(index).first, key))
				{
					return index;
				}
			}
			return npos;
		}

		/**	Place a candidate by Robinhood displacement.
		 *	@details An empty slot takes the candidate. A slot whose occupant is richer (smaller distance) is taken by
		 *	swapping, and the evicted occupant continues probing from the next slot. Reaching the probe limit grows
		 *	the table and restarts the entry currently held from its new home.
		 *	@param hash The folded hash of candidate's key.
		 *	@param candidate The entry to place. Left in a moved-from state.
		 */
		void do_place(hash_result hash, value_type& candidate)
		{
			info_type* info = m_buckets.get_info();
			info_type held{ 1, hash };
			size_type index = m_buckets.home(hash);
			for (;;)
			{
				if (info[index].empty())
				{
					m_buckets.emplace(index, held, std::move(candidate));
					return;
				}
				if (info[index].get_distance() < held.get_distance())
				{
					// Steal from the rich.
					using std::swap;
					m_buckets.note_distance(held.get_distance());
					swap(info[index], held);
					swap(m_buckets.get_value(index), candidate);
				}
				++index;
				held.push_forward();
				if FM_ROBINHOOD_UNLIKELY(size_type(held.get_distance()) > m_buckets.get_probe_limit())
				{
					grow();
					hash = do_hash(candidate.first);
					info = m_buckets.get_info();
					held = info_type{ 1, hash };
					index = m_buckets.home(hash);
				}
			}
		}

		/**	Remove the entry at an occupied slot by backward shift.
		 *	@details Each following entry that is not at its home moves one slot back, until an empty slot or an
		 *	entry at its home is reached.
		 *	@param index The occupied slot.
		 */
		void do_erase(size_type index) noexcept
		{
			m_buckets.erase(index);
			const info_type* const info = m_buckets.get_info();
			while (info[index + 1].get_distance() > 1)
			{
				m_buckets.move_back(index, index + 1);
				++index;
			}
		}

		/**	Return true if holding count entries would exceed the max load factor.
		 */
		bool load_exceeded(const size_type count) const noexcept
		{
			return double(count) > double(m_load_factor) * double(m_buckets.get_capacity());
		}

		/**	Grow to the next power of two.
		 *	@throws std::length_error if already at max_bucket_count.
		 */
		void grow()
		{
			const size_type capacity = m_buckets.get_capacity();
			if (capacity >= robinhood::max_bucket_count)
			{
				throw std::length_error("fm::robinhood::hashtable::grow exceeds max_bucket_count.");
			}
			grow_to(ceilui_power_of_two(size_type(capacity + 1)));
		}

		/**	Rehash every entry into a new table of a given capacity.
		 *	@details Allocates before any entry moves, so std::bad_alloc from the allocation leaves the table intact.
		 *	Entries are reinserted in slot order through do_place, which may itself grow again.
		 *	@param capacity The new power-of-two capacity.
		 */
		void grow_to(const size_type capacity)
		{
			const size_type limit = probe_limiter::grown(capacity, m_load_factor, m_buckets.get_probe_limit());
			buckets_type former{ capacity, limit, m_buckets.get_allocator() };
			former.swap(m_buckets);
			const info_type* const info = former.get_info();
			for (size_type index = 0; index < former.get_slot_count(); ++index)
			{
				if (!info[index].empty())
				{
					value_type candidate{ std::move(former.get_value(index)) };
					former.erase(index);
					do_place(do_hash(candidate.first), candidate);
				}
			}
		}

		constexpr const buckets_type& get_buckets() const noexcept
		{
			return m_buckets;
		}

	private:
		buckets_type m_buckets;
		float m_load_factor;
	};

} // namespace fm::robinhood

#endif
