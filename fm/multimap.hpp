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

#ifndef INC_FM__MULTIMAP_HPP
#define INC_FM__MULTIMAP_HPP

/**	@file
 *	A Robinhood-style open addressing hash map holding several values per key.
 *
 *	Entries sharing a hash form a contiguous "group" in probe order, kept in
 *	insertion order, so that first-match and all-matches scans stop at the
 *	group boundary. To keep groups whole, insertion shifts the run of entries
 *	after the insertion point forward by one slot rather than swapping a
 *	candidate through the table. The probe limit then applies to the first
 *	entry ("head") of each group, and each group holds at most
 *	multimap_group_limit entries; the tail of every table has room for one
 *	full group past the probe limit.
 *
 *	Each info carries the full 32-bit hash, so growth reinserts without
 *	rehashing keys.
 */

#include "hash.hpp"
#include "robinhood.hpp"

#include <functional>
#include <memory>
#include <stdexcept>
#include <utility>

namespace fm::robinhood
{
	/**	The greatest number of entries sharing one hash in a multimap.
	 */
	constexpr size_type multimap_group_limit = probe_limiter::max_limit;

	/**	Default max load factor for multi-value tables.
	 */
	constexpr float default_multi_load_factor = 0.5f;

	/**	A Robinhood hashtable where a key may be associated with several distinct values.
	 *	@tparam PolicyType The Robinhood hashtable policy type. Its info type must be hashed_info.
	 *	@tparam Hash The hasher type. Results are folded to 32 bits.
	 *	@tparam KeyEqual The key equality comparison type.
	 *	@tparam ValueEqual The mapped value equality comparison type.
	 *	@tparam Allocator An std::allocator-like class.
	 */
	template <typename PolicyType, typename Hash, typename KeyEqual, typename ValueEqual, typename Allocator>
	class multi_hashtable : public KeyEqual, public Hash
	{
	public:
		using policy_type = PolicyType;
		using hasher = Hash;
		using key_equal = KeyEqual;
		using value_equal = ValueEqual;
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

		static_assert(policy_type::group_tail >= multimap_group_limit, "multi_hashtable requires a group tail of multimap_group_limit slots.");
		static_assert(std::is_nothrow_move_constructible_v<value_type>, "value_type expected to have noexcept move constructor.");

		multi_hashtable(const std::size_t bucket_count, const float load_factor, const hasher& hash, const key_equal& equal, const value_equal& value_eq, const allocator_type& alloc)
			: key_equal{ equal }
			, hasher{ hash }
			, m_value_equal{ value_eq }
			, m_buckets{ alloc }
			, m_load_factor{ checked_load_factor(load_factor) }
		{
			const size_type capacity = checked_bucket_count(bucket_count);
			buckets_type initial{ capacity, probe_limiter::max_psl(capacity, m_load_factor), alloc };
			m_buckets.swap(initial);
		}
		multi_hashtable(const multi_hashtable& other)
			: key_equal{ static_cast<const key_equal&>(other) }
			, hasher{ static_cast<const hasher&>(other) }
			, m_value_equal{ other.m_value_equal }
			, m_buckets{ other.m_buckets }
			, m_load_factor{ other.m_load_factor }
		{ }
		multi_hashtable(multi_hashtable&& other) noexcept
			: key_equal{ std::move(static_cast<key_equal&>(other)) }
			, hasher{ std::move(static_cast<hasher&>(other)) }
			, m_value_equal{ std::move(other.m_value_equal) }
			, m_buckets{ std::move(other.m_buckets) }
			, m_load_factor{ other.m_load_factor }
		{ }
		multi_hashtable& operator=(const multi_hashtable& other)
		{
			if (this != &other)
			{
				multi_hashtable copy{ other };
				swap(copy);
			}
			return *this;
		}
		multi_hashtable& operator=(multi_hashtable&& other) noexcept
		{
			if (this != &other)
			{
				multi_hashtable moved{ std::move(other) };
				swap(moved);
			}
			return *this;
		}
		~multi_hashtable() = default;

		void swap(multi_hashtable& other) noexcept
		{
			using std::swap;
			swap(static_cast<key_equal&>(*this), static_cast<key_equal&>(other));
			swap(static_cast<hasher&>(*this), static_cast<hasher&>(other));
			swap(m_value_equal, other.m_value_equal);
			m_buckets.swap(other.m_buckets);
			swap(m_load_factor, other.m_load_factor);
		}

		/**	Associate a value with a key unless that exact key/value pair is already present.
		 *	@details The value is appended to the key's hash group, after every value inserted before it.
		 *	@return True if inserted, false if the pair was already present.
		 *	@throws std::length_error if multimap_group_limit entries already share the key's hash.
		 */
		template <typename KeyArg, typename ValueArg>
		bool insert(KeyArg&& key, ValueArg&& value)
		{
			const hash_result hash = do_hash(key);
			const key_type& key_ref = key;
			const mapped_type& value_ref = value;
			const insert_plan plan = do_plan(hash, key_ref, &value_ref);
			if (plan.m_duplicate)
			{
				return false;
			}
			if FM_ROBINHOOD_UNLIKELY(plan.m_group_size >= multimap_group_limit)
			{
				throw std::length_error("fm::multimap::insert exceeds the number of entries one hash may hold.");
			}
			while FM_ROBINHOOD_UNLIKELY(load_exceeded(m_buckets.get_count() + 1))
			{
				grow();
			}
			value_type candidate{ std::forward<KeyArg>(key), std::forward<ValueArg>(value) };
			do_place(hash, candidate);
			return true;
		}

		/**	Insert every pair of another table that this one lacks.
		 *	@details Values of a key keep their relative order and land after the values already present.
		 *	@return The number of pairs inserted.
		 *	@throws std::length_error as insert, leaving the pairs merged so far in place.
		 */
		size_type merge(const multi_hashtable& other)
		{
			if (&other == this)
			{
				return 0;
			}
			size_type inserted = 0;
			for (const value_type& entry : other)
			{
				inserted += insert(entry.first, entry.second) ? 1 : 0;
			}
			return inserted;
		}

		/**	Copy the first (oldest) value associated with a key.
		 *	@return True if found.
		 */
		bool get(const key_type& key, mapped_type& value) const
		{
			const size_type index = do_find(do_hash(key), key, nullptr);
			if (index == npos)
			{
				return false;
			}
			value = m_buckets.get_value(index).second;
			return true;
		}

		/**	Copy every value associated with a key, oldest first.
		 *	@param key The key to find.
		 *	@param out An output iterator to which values are assigned.
		 *	@return The output iterator past the last value written.
		 */
		template <typename OutputIt>
		OutputIt get_all(const key_type& key, OutputIt out) const
		{
			for_each_in_group(do_hash(key), [this, &key, &out](const size_type index)
			{
				const value_type& entry = m_buckets.get_value(index);
				if (static_cast<const key_equal&>(*this)(entry.first, key))
				{
					*out = entry.second;
					++out;
				}
				return true;
			});
			return out;
		}

		/**	Return the number of values associated with a key.
		 */
		size_type count(const key_type& key) const
		{
			size_type result = 0;
			for_each_in_group(do_hash(key), [this, &key, &result](const size_type index)
			{
				result += static_cast<const key_equal&>(*this)(m_buckets.get_value(index).first, key) ? 1 : 0;
				return true;
			});
			return result;
		}

		bool contains(const key_type& key) const
		{
			return do_find(do_hash(key), key, nullptr) != npos;
		}
		bool contains(const key_type& key, const mapped_type& value) const
		{
			return do_find(do_hash(key), key, &value) != npos;
		}

		/**	Replace one value of a key by the result of a function of it.
		 *	@param key The key to find.
		 *	@param old_value The value to replace.
		 *	@param func Called with the stored value, returning its replacement.
		 *	@return True if replaced. False if the pair is absent, or if the replacement is already associated with key.
		 */
		template <typename Func>
		bool update(const key_type& key, const mapped_type& old_value, Func&& func)
		{
			const hash_result hash = do_hash(key);
			const size_type index = do_find(hash, key, &old_value);
			if (index == npos)
			{
				return false;
			}
			mapped_type& stored = m_buckets.get_value(index).second;
			mapped_type replacement = std::forward<Func>(func)(static_cast<const mapped_type&>(stored));
			return do_assign(hash, key, stored, std::move(replacement));
		}

		/**	Replace one value of a key by another.
		 *	@return True if replaced. False if the pair is absent, or if new_value is already associated with key.
		 */
		template <typename ValueArg>
		bool replace(const key_type& key, const mapped_type& old_value, ValueArg&& new_value)
		{
			const hash_result hash = do_hash(key);
			const size_type index = do_find(hash, key, &old_value);
			if (index == npos)
			{
				return false;
			}
			mapped_type& stored = m_buckets.get_value(index).second;
			return do_assign(hash, key, stored, mapped_type(std::forward<ValueArg>(new_value)));
		}

		/**	Remove every value associated with a key.
		 *	@return The number of entries removed.
		 */
		size_type erase(const key_type& key)
		{
			const hash_result hash = do_hash(key);
			size_type removed = 0;
			for (size_type index = do_find(hash, key, nullptr); index != npos; index = do_find(hash, key, nullptr))
			{
				do_erase(index);
				++removed;
			}
			return removed;
		}
		/**	Remove one key/value pair.
		 *	@return True if removed.
		 */
		bool erase(const key_type& key, const mapped_type& value)
		{
			const size_type index = do_find(do_hash(key), key, &value);
			if (index == npos)
			{
				return false;
			}
			do_erase(index);
			return true;
		}

		void clear() noexcept
		{
			m_buckets.clear();
		}

		void reserve(const std::size_t count)
		{
			const double required = std::ceil(double(count) / double(m_load_factor));
			if (required > double(robinhood::max_bucket_count))
			{
				throw std::length_error("fm::multimap::reserve exceeds max_bucket_count.");
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

		constexpr size_type slot_count() const noexcept
		{
			return m_buckets.get_slot_count();
		}
		int probe_length(const size_type slot) const noexcept
		{
			FM_ROBINHOOD_ASSERT(slot < slot_count(), "robinhood::multi_hashtable::probe_length expects a slot less than slot_count.");
			return int(m_buckets.get_info()[slot].get_distance()) - 1;
		}
		/**	Return the full hash stored at an occupied slot.
		 */
		hash_result hash_at(const size_type slot) const noexcept
		{
			FM_ROBINHOOD_ASSERT(probe_length(slot) >= 0, "robinhood::multi_hashtable::hash_at expects an occupied slot.");
			return m_buckets.get_info()[slot].get_hash();
		}
		constexpr size_type index_of(const const_iterator& it) const noexcept
		{
			return it.get_index();
		}
		size_type max_probe_length() const noexcept
		{
			const distance_type distance = m_buckets.get_max_distance();
			return distance == 0 ? 0 : size_type(distance - 1);
		}
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
		value_equal value_eq() const
		{
			return m_value_equal;
		}
		allocator_type get_allocator() const
		{
			return m_buckets.get_allocator();
		}

	protected:
		constexpr static size_type npos = std::numeric_limits<size_type>::max();

		/**	Where and how an entry would be inserted.
		 */
		struct insert_plan final
		{
			/**	The slot the entry would take: the end of its group, or of its home's run if it has no group.
			 */
			size_type m_position;
			/**	The first empty slot at or after m_position. Entries in [m_position, m_end) shift forward.
			 */
			size_type m_end;
			/**	The number of entries already sharing the hash.
			 */
			size_type m_group_size;
			/**	The PSL of the first entry of the entry's group, once inserted.
			 */
			size_type m_head_psl;
			/**	True if the key/value pair is already present.
			 */
			bool m_duplicate;
		};

		hash_result do_hash(const key_type& key) const
		{
			return fold_hash(static_cast<const hasher&>(*this)(key));
		}

		/**	Call a visitor with each slot of a hash's group, in order, until it returns false.
		 *	@param hash The folded hash.
		 *	@param visitor Called with each slot index holding hash.
		 */
		template <typename Visitor>
		void for_each_in_group(const hash_result hash, Visitor&& visitor) const
		{
			const info_type* const info = m_buckets.get_info();
			const size_type max_distance = m_buckets.get_max_distance();
			size_type index = m_buckets.home(hash);
			bool in_group = false;
			for (size_type distance = 1; distance <= max_distance; ++distance, ++index)
			{
				const size_type current = info[index].get_distance();
				if (current < distance)
				{
					break;
				}
				if (current == distance && info[index].cached_hash_equal(hash))
				{
					in_group = true;
					if (!visitor(index))
					{
						break;
					}
				}
				else if (in_group)
				{
					break;
				}
			}
		}

		/**	Find the first slot holding key, and value if given.
		 *	@param hash The folded hash of key.
		 *	@param key The key to find.
		 *	@param value The value to find, or nullptr for any value.
		 *	@return The slot index, or npos if not found.
		 */
		size_type do_find(const hash_result hash, const key_type& key, const mapped_type* const value) const
		{
			size_type result = npos;
			for_each_in_group(hash, [this, &key, value, &result](const size_type index)
			{
				const value_type& entry = m_buckets.get_value(index);
				if (static_cast<const key_equal&>(*this)(entry.first, key)
					&& (value == nullptr || m_value_equal(entry.second, *value)))
				{
					result = index;
					return false;
				}
				return true;
			});
			return result;
		}

		/**	Assign a replacement value unless it would duplicate another of the key's values.
		 *	@param hash The folded hash of key.
		 *	@param key The key of stored.
		 *	@param stored The value to overwrite.
		 *	@param replacement The replacement value.
		 *	@return True if assigned.
		 */
		bool do_assign(const hash_result hash, const key_type& key, mapped_type& stored, mapped_type&& replacement)
		{
			if (!m_value_equal(stored, replacement) && do_find(hash, key, &replacement) != npos)
			{
				return false;
			}
			stored = std::move(replacement);
			return true;
		}

		/**	Plan the insertion of an entry.
		 *	@details Walks from home over every entry whose home is not after it, stopping at the end of the
		 *	entry's group when it has one. Then finds the empty slot ending the run that must shift.
		 *	@param hash The folded hash of key.
		 *	@param key The key to place.
		 *	@param value If not nullptr, the group is also checked for this key/value pair.
		 */
		insert_plan do_plan(const hash_result hash, const key_type& key, const mapped_type* const value) const
		{
			const info_type* const info = m_buckets.get_info();
			const size_type home = m_buckets.home(hash);
			insert_plan plan{ home, home, 0, 0, false };
			size_type group_start = home;
			size_type index = home;
			for (size_type distance = 1; ; ++distance, ++index)
			{
				const size_type current = info[index].get_distance();
				if (current < distance)
				{
					break;
				}
				if (current == distance && info[index].cached_hash_equal(hash))
				{
					if (plan.m_group_size == 0)
					{
						group_start = index;
					}
					++plan.m_group_size;
					if (value != nullptr && !plan.m_duplicate)
					{
						const value_type& entry = m_buckets.get_value(index);
						plan.m_duplicate = static_cast<const key_equal&>(*this)(entry.first, key)
							&& m_value_equal(entry.second, *value);
					}
				}
				else if (plan.m_group_size > 0)
				{
					break;
				}
			}
			plan.m_position = index;
			plan.m_head_psl = (plan.m_group_size > 0 ? group_start : index) - home;
			while (!info[index].empty())
			{
				++index;
			}
			plan.m_end = index;
			return plan;
		}

		/**	Return true if a plan may be carried out without breaking the probe limit or leaving the table.
		 *	@details The inserted entry's group head and every group head shifted forward must stay below the limit.
		 */
		bool fits(const insert_plan& plan) const noexcept
		{
			const size_type limit = m_buckets.get_probe_limit();
			if (plan.m_head_psl >= limit || size_type(plan.m_end + 2) > m_buckets.get_slot_count())
			{
				return false;
			}
			const info_type* const info = m_buckets.get_info();
			for (size_type index = plan.m_position; index < plan.m_end; ++index)
			{
				const bool head = index == plan.m_position || !info[index].cached_hash_equal(info[index - 1].get_hash());
				// Once shifted, a head's PSL equals its current distance.
				if (head && info[index].get_distance() >= limit)
				{
					return false;
				}
			}
			return true;
		}

		/**	Place a candidate at the end of its group, shifting the following run forward by one slot.
		 *	@details Grows until the plan fits.
		 *	@param hash The folded hash of candidate's key.
		 *	@param candidate The entry to place. Left in a moved-from state.
		 */
		void do_place(const hash_result hash, value_type& candidate)
		{
			for (;;)
			{
				const insert_plan plan = do_plan(hash, candidate.first, nullptr);
				FM_ROBINHOOD_ASSERT(plan.m_group_size < multimap_group_limit, "robinhood::multi_hashtable::do_place expects room in the group.");
				if FM_ROBINHOOD_LIKELY(fits(plan))
				{
					for (size_type index = plan.m_end; index > plan.m_position; --index)
					{
						m_buckets.move_forward(index - 1);
					}
					const size_type home = m_buckets.home(hash);
					m_buckets.emplace(plan.m_position, info_type{ distance_type(plan.m_position - home + 1), hash }, std::move(candidate));
					return;
				}
				grow();
			}
		}

		/**	Remove the entry at an occupied slot by backward shift.
		 *	@details Groups stay contiguous and ordered, since every following entry not at its home moves back together.
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

		bool load_exceeded(const size_type count) const noexcept
		{
			return double(count) > double(m_load_factor) * double(m_buckets.get_capacity());
		}

		void grow()
		{
			const size_type capacity = m_buckets.get_capacity();
			if (capacity >= robinhood::max_bucket_count)
			{
				throw std::length_error("fm::multimap::grow exceeds max_bucket_count.");
			}
			grow_to(ceilui_power_of_two(size_type(capacity + 1)));
		}

		/**	Reinsert every entry into a new table of a given capacity, in slot order.
		 *	@details Slot order is group order, so each group keeps its insertion order. Stored hashes are reused.
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
					const hash_result hash = info[index].get_hash();
					value_type candidate{ std::move(former.get_value(index)) };
					former.erase(index);
					do_place(hash, candidate);
				}
			}
		}

	private:
		value_equal m_value_equal;
		buckets_type m_buckets;
		float m_load_factor;
	};

} // namespace fm::robinhood

namespace fm
{

/**	A Robinhood-style open addressing hash map associating each key with a set of distinct values.
 *	@details Values of a key are kept in insertion order; get returns the oldest. At most
 *	robinhood::multimap_group_limit entries may share a hash, beyond which insert throws std::length_error.
 *	@tparam Key The key type.
 *	@tparam T The mapped type.
 *	@tparam Hash The hasher type. Must not throw.
 *	@tparam KeyEqual The key equality comparison type.
 *	@tparam ValueEqual The mapped value equality comparison type, distinguishing a key's values.
 *	@tparam Allocator An std::allocator-like class, rebound internally.
 */
template <
	typename Key,
	typename T,
	typename Hash = fm::hash<Key>,
	typename KeyEqual = std::equal_to<Key>,
	typename ValueEqual = std::equal_to<T>,
	typename Allocator = std::allocator<std::pair<const Key, T>>>
class multimap
	: private robinhood::multi_hashtable<
		robinhood::policy<Key, T, robinhood::hashed_info<robinhood::distance_type>, robinhood::multimap_group_limit>,
		Hash,
		KeyEqual,
		ValueEqual,
		Allocator>
{
private:
	using hashtable_type = robinhood::multi_hashtable<
		robinhood::policy<Key, T, robinhood::hashed_info<robinhood::distance_type>, robinhood::multimap_group_limit>,
		Hash,
		KeyEqual,
		ValueEqual,
		Allocator>;

public:
	using key_type = typename hashtable_type::key_type;
	using mapped_type = typename hashtable_type::mapped_type;
	using value_type = typename hashtable_type::value_type;
	using size_type = typename hashtable_type::size_type;
	using difference_type = std::ptrdiff_t;
	using hasher = typename hashtable_type::hasher;
	using key_equal = typename hashtable_type::key_equal;
	using value_equal = typename hashtable_type::value_equal;
	using allocator_type = typename hashtable_type::allocator_type;
	using reference = const value_type&;
	using const_reference = const value_type&;
	using iterator = typename hashtable_type::iterator;
	using const_iterator = typename hashtable_type::const_iterator;

	constexpr static float default_load_factor = robinhood::default_multi_load_factor;
	constexpr static size_type group_limit = robinhood::multimap_group_limit;

	multimap();
	explicit multimap(const size_type bucket_count,
		const float load_factor = default_load_factor,
		const hasher& hash = hasher(),
		const key_equal& equal = key_equal(),
		const value_equal& value_eq = value_equal(),
		const allocator_type& alloc = allocator_type());
	multimap(const size_type bucket_count, const float load_factor, const allocator_type& alloc);
	multimap(const multimap& other);
	multimap(multimap&& other) noexcept;
	~multimap() = default;

	multimap& operator=(const multimap& other);
	multimap& operator=(multimap&& other) noexcept;

	void swap(multimap& other) noexcept;
	friend void swap(multimap& lhs, multimap& rhs) noexcept
	{
		lhs.swap(rhs);
	}

	using hashtable_type::begin;
	using hashtable_type::end;
	using hashtable_type::cbegin;
	using hashtable_type::cend;

	using hashtable_type::empty;
	using hashtable_type::size;
	using hashtable_type::clear;
	using hashtable_type::insert;
	size_type merge(const multimap& other);
	using hashtable_type::get;
	using hashtable_type::get_all;
	using hashtable_type::update;
	using hashtable_type::replace;
	using hashtable_type::erase;
	using hashtable_type::count;
	using hashtable_type::contains;

	using hashtable_type::bucket_count;
	using hashtable_type::max_bucket_count;
	using hashtable_type::bucket;
	using hashtable_type::load_factor;
	using hashtable_type::max_load_factor;
	using hashtable_type::reserve;

	using hashtable_type::slot_count;
	using hashtable_type::probe_length;
	using hashtable_type::probe_limit;
	using hashtable_type::max_probe_length;
	using hashtable_type::index_of;
	using hashtable_type::hash_at;

	using hashtable_type::hash_function;
	using hashtable_type::key_eq;
	using hashtable_type::value_eq;
	using hashtable_type::get_allocator;
};

template <typename Key, typename T, typename Hash, typename KeyEqual, typename ValueEqual, typename Allocator>
multimap<Key, T, Hash, KeyEqual, ValueEqual, Allocator>::multimap()
	: multimap{ robinhood::default_bucket_count }
{ }
template <typename Key, typename T, typename Hash, typename KeyEqual, typename ValueEqual, typename Allocator>
multimap<Key, T, Hash, KeyEqual, ValueEqual, Allocator>::multimap(const size_type bucket_count, const float load_factor, const hasher& hash, const key_equal& equal, const value_equal& value_eq, const allocator_type& alloc)
	: hashtable_type{ bucket_count, load_factor, hash, equal, value_eq, alloc }
{ }
template <typename Key, typename T, typename Hash, typename KeyEqual, typename ValueEqual, typename Allocator>
multimap<Key, T, Hash, KeyEqual, ValueEqual, Allocator>::multimap(const size_type bucket_count, const float load_factor, const allocator_type& alloc)
	: hashtable_type{ bucket_count, load_factor, hasher(), key_equal(), value_equal(), alloc }
{ }
template <typename Key, typename T, typename Hash, typename KeyEqual, typename ValueEqual, typename Allocator>
multimap<Key, T, Hash, KeyEqual, ValueEqual, Allocator>::multimap(const multimap& other)
	: hashtable_type{ other }
{ }
template <typename Key, typename T, typename Hash, typename KeyEqual, typename ValueEqual, typename Allocator>
multimap<Key, T, Hash, KeyEqual, ValueEqual, Allocator>::multimap(multimap&& other) noexcept
	: hashtable_type{ std::move(other) }
{ }

template <typename Key, typename T, typename Hash, typename KeyEqual, typename ValueEqual, typename Allocator>
auto multimap<Key, T, Hash, KeyEqual, ValueEqual, Allocator>::operator=(const multimap& other) -> multimap&
{
	this->hashtable_type::operator=(other);
	return *this;
}
template <typename Key, typename T, typename Hash, typename KeyEqual, typename ValueEqual, typename Allocator>
auto multimap<Key, T, Hash, KeyEqual, ValueEqual, Allocator>::operator=(multimap&& other) noexcept -> multimap&
{
	this->hashtable_type::operator=(std::move(other));
	return *this;
}

template <typename Key, typename T, typename Hash, typename KeyEqual, typename ValueEqual, typename Allocator>
void multimap<Key, T, Hash, KeyEqual, ValueEqual, Allocator>::swap(multimap& other) noexcept
{
	this->hashtable_type::swap(other);
}

template <typename Key, typename T, typename Hash, typename KeyEqual, typename ValueEqual, typename Allocator>
auto multimap<Key, T, Hash, KeyEqual, ValueEqual, Allocator>::merge(const multimap& other) -> size_type
{
	return this->hashtable_type::merge(other);
}

} // namespace fm

#endif
